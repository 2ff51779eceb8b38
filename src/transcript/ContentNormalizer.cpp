/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ContentNormalizer.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace TranscriptLens
{

namespace
{

QString compactJson(const QJsonValue &value)
{
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    if (value.isBool()) {
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    }
    return QStringLiteral("null");
}

} // namespace

QVector<ContentBlock> ContentNormalizer::normalize(const QJsonValue &content)
{
    QVector<ContentBlock> blocks;

    if (content.isString()) {
        blocks.append(ContentBlock::makeText(content.toString()));
        return blocks;
    }

    if (!content.isArray()) {
        return blocks;
    }

    const QJsonArray array = content.toArray();
    blocks.reserve(array.size());
    for (const QJsonValue &rawBlock : array) {
        blocks.append(normalizeBlock(rawBlock));
    }
    return blocks;
}

ContentBlock ContentNormalizer::normalizeBlock(const QJsonValue &rawBlock)
{
    const QJsonObject obj = rawBlock.toObject();
    const QString type = obj.value(QStringLiteral("type")).toString();

    ContentBlock block;
    if (type == QLatin1String("text")) {
        block.type = ContentBlock::Text;
        block.text = obj.value(QStringLiteral("text")).toString();
    } else if (type == QLatin1String("tool_use")) {
        block.type = ContentBlock::ToolUse;
        block.id = obj.value(QStringLiteral("id")).toString();
        block.name = obj.value(QStringLiteral("name")).toString();
        block.input = obj.value(QStringLiteral("input")).toObject();
    } else if (type == QLatin1String("tool_result")) {
        block.type = ContentBlock::ToolResult;
        block.toolUseId = obj.value(QStringLiteral("tool_use_id")).toString();
        block.content = obj.value(QStringLiteral("content"));
        block.isError = obj.value(QStringLiteral("is_error")).toBool(false);
    } else if (type == QLatin1String("thinking")) {
        block.type = ContentBlock::Thinking;
        block.text = obj.value(QStringLiteral("thinking")).toString();
    } else if (type == QLatin1String("image")) {
        block.type = ContentBlock::Image;
        block.source = obj.value(QStringLiteral("source")).toObject();
    } else {
        block = ContentBlock::makeText(compactJson(rawBlock));
    }
    return block;
}

} // namespace TranscriptLens
