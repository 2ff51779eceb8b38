/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LineDecoder.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>

namespace TranscriptLens
{

namespace
{

quint64 tokenCount(const QJsonObject &usage, const QString &key)
{
    const qint64 value = usage.value(key).toInteger();
    return value > 0 ? static_cast<quint64>(value) : 0;
}

bool decodeMessageEntry(const QJsonObject &obj, RawEntry &entry)
{
    const QJsonValue messageValue = obj.value(QStringLiteral("message"));
    if (!messageValue.isObject()) {
        return false;
    }
    const QJsonObject message = messageValue.toObject();

    entry.uuid = obj.value(QStringLiteral("uuid")).toString();
    entry.timestamp = obj.value(QStringLiteral("timestamp")).toString();
    entry.role = message.value(QStringLiteral("role")).toString();
    entry.content = message.value(QStringLiteral("content"));
    entry.model = message.value(QStringLiteral("model")).toString();

    const QJsonValue usageValue = message.value(QStringLiteral("usage"));
    if (usageValue.isObject()) {
        const QJsonObject usage = usageValue.toObject();
        entry.hasUsage = true;
        entry.usage.inputTokens = tokenCount(usage, QStringLiteral("input_tokens"));
        entry.usage.outputTokens = tokenCount(usage, QStringLiteral("output_tokens"));
        entry.usage.cacheCreationTokens = tokenCount(usage, QStringLiteral("cache_creation_input_tokens"));
        entry.usage.cacheReadTokens = tokenCount(usage, QStringLiteral("cache_read_input_tokens"));
    }

    // Older CLI versions wrote the cost inline on the record
    const QJsonValue cost = obj.value(QStringLiteral("costUsd"));
    if (cost.isDouble()) {
        entry.hasInlineCost = true;
        entry.inlineCostUsd = qMax(0.0, cost.toDouble());
    }
    return true;
}

} // namespace

QVector<RawEntry> LineDecoder::decode(const QByteArray &text)
{
    QVector<RawEntry> entries;
    int skipped = 0;

    const QList<QByteArray> lines = text.split('\n');
    for (const QByteArray &rawLine : lines) {
        const QByteArray line = rawLine.trimmed();
        if (line.isEmpty()) {
            continue;
        }

        RawEntry entry;
        if (decodeLine(line, entry)) {
            entries.append(entry);
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        qDebug() << "LineDecoder: Skipped" << skipped << "unusable lines, kept" << entries.size();
    }
    return entries;
}

bool LineDecoder::decodeLine(const QByteArray &line, RawEntry &entry)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }

    const QJsonObject obj = doc.object();
    const QString type = obj.value(QStringLiteral("type")).toString();
    entry.record = obj;

    if (type == QLatin1String("summary")) {
        const QJsonValue summary = obj.value(QStringLiteral("summary"));
        if (!summary.isString()) {
            return false;
        }
        entry.kind = RawEntry::Summary;
        entry.summary = summary.toString();
        return true;
    }

    if (type == QLatin1String("user") || type == QLatin1String("assistant")) {
        entry.kind = (type == QLatin1String("user")) ? RawEntry::User : RawEntry::Assistant;
        return decodeMessageEntry(obj, entry);
    }

    if (type == QLatin1String("progress")) {
        const QJsonValue data = obj.value(QStringLiteral("data"));
        if (!data.isObject()) {
            return false;
        }
        entry.data = data.toObject();
        entry.uuid = obj.value(QStringLiteral("uuid")).toString();
        entry.timestamp = obj.value(QStringLiteral("timestamp")).toString();
        // Hook runs share the progress record type but have their own payload
        entry.kind = (entry.data.value(QStringLiteral("type")).toString() == QLatin1String("hook_progress")) ? RawEntry::Hook : RawEntry::Progress;
        return true;
    }

    return false;
}

} // namespace TranscriptLens
