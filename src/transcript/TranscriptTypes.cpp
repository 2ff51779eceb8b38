/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptTypes.h"

namespace TranscriptLens
{

QJsonObject TokenUsage::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("inputTokens")] = static_cast<qint64>(inputTokens);
    obj[QStringLiteral("outputTokens")] = static_cast<qint64>(outputTokens);
    obj[QStringLiteral("cacheCreationTokens")] = static_cast<qint64>(cacheCreationTokens);
    obj[QStringLiteral("cacheReadTokens")] = static_cast<qint64>(cacheReadTokens);
    obj[QStringLiteral("totalTokens")] = static_cast<qint64>(totalTokens());
    obj[QStringLiteral("costUsd")] = costUsd;
    return obj;
}

QJsonObject AgentProgress::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("uuid")] = uuid;
    obj[QStringLiteral("timestamp")] = timestamp;
    obj[QStringLiteral("type")] = type;
    obj[QStringLiteral("prompt")] = prompt;
    obj[QStringLiteral("agentId")] = agentId;
    obj[QStringLiteral("toolUseID")] = toolUseId;
    obj[QStringLiteral("parentToolUseID")] = parentToolUseId;
    // Payload keys override the named fields
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        obj.insert(it.key(), it.value());
    }
    return obj;
}

ContentBlock ContentBlock::makeText(const QString &text)
{
    ContentBlock block;
    block.type = Text;
    block.text = text;
    return block;
}

QString ContentBlock::typeName(Type type)
{
    switch (type) {
    case Text:
        return QStringLiteral("text");
    case ToolUse:
        return QStringLiteral("tool_use");
    case ToolResult:
        return QStringLiteral("tool_result");
    case Thinking:
        return QStringLiteral("thinking");
    case Image:
        return QStringLiteral("image");
    case Progress:
        return QStringLiteral("progress");
    case Hook:
        return QStringLiteral("hook");
    }
    return QString();
}

QJsonObject ContentBlock::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("type")] = typeName(type);

    switch (type) {
    case Text:
        obj[QStringLiteral("text")] = text;
        break;
    case ToolUse: {
        obj[QStringLiteral("id")] = id;
        obj[QStringLiteral("name")] = name;
        obj[QStringLiteral("input")] = input;
        if (hasResult()) {
            obj[QStringLiteral("result")] = result;
        }
        if (!progress.isEmpty()) {
            QJsonArray list;
            for (const AgentProgress &p : progress) {
                list.append(p.toJson());
            }
            obj[QStringLiteral("progress")] = list;
        }
        if (!agentId.isEmpty()) {
            obj[QStringLiteral("agentId")] = agentId;
        }
        break;
    }
    case ToolResult:
        obj[QStringLiteral("tool_use_id")] = toolUseId;
        obj[QStringLiteral("content")] = content.isUndefined() ? QJsonValue() : content;
        obj[QStringLiteral("is_error")] = isError;
        break;
    case Thinking:
        obj[QStringLiteral("thinking")] = text;
        break;
    case Image:
        obj[QStringLiteral("source")] = source;
        break;
    case Progress:
        obj[QStringLiteral("text")] = text;
        obj[QStringLiteral("agentId")] = agentId;
        obj[QStringLiteral("toolUseID")] = toolUseId;
        obj[QStringLiteral("timestamp")] = timestamp;
        break;
    case Hook:
        obj[QStringLiteral("hookEvent")] = hookEvent;
        obj[QStringLiteral("hookName")] = hookName;
        obj[QStringLiteral("command")] = command;
        obj[QStringLiteral("timestamp")] = timestamp;
        break;
    }
    return obj;
}

QString Message::kindName(Kind kind)
{
    switch (kind) {
    case User:
        return QStringLiteral("user");
    case Assistant:
        return QStringLiteral("assistant");
    case Progress:
        return QStringLiteral("progress");
    case Hook:
        return QStringLiteral("hook");
    }
    return QString();
}

QJsonObject Message::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("uuid")] = uuid;
    obj[QStringLiteral("type")] = kindName(kind);
    obj[QStringLiteral("timestamp")] = timestamp;

    QJsonArray content;
    for (const ContentBlock &block : blocks) {
        content.append(block.toJson());
    }
    obj[QStringLiteral("content")] = content;

    if (!model.isEmpty()) {
        obj[QStringLiteral("model")] = model;
    }
    if (hasUsage) {
        obj[QStringLiteral("usage")] = usage.toJson();
    }
    return obj;
}

QJsonObject SessionStats::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("promptCount")] = promptCount;
    obj[QStringLiteral("messageCount")] = messageCount;
    obj[QStringLiteral("toolCallCount")] = toolCallCount;
    obj[QStringLiteral("totalCostUsd")] = totalCostUsd;
    obj[QStringLiteral("totalPages")] = totalPages;
    obj[QStringLiteral("durationMs")] = durationMs;
    if (!startTimestamp.isEmpty()) {
        obj[QStringLiteral("startTimestamp")] = startTimestamp;
    }
    if (!endTimestamp.isEmpty()) {
        obj[QStringLiteral("endTimestamp")] = endTimestamp;
    }
    return obj;
}

QJsonObject PaginatedMessages::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("messages")] = messagesToJson(messages);
    obj[QStringLiteral("totalPages")] = totalPages;
    obj[QStringLiteral("currentPage")] = currentPage;
    obj[QStringLiteral("totalMessages")] = totalMessages;
    obj[QStringLiteral("hasMore")] = hasMore;
    return obj;
}

QJsonObject ParsedSession::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("messages")] = messagesToJson(messages);
    obj[QStringLiteral("stats")] = stats.toJson();
    obj[QStringLiteral("summary")] = summary;
    return obj;
}

QJsonObject SessionDetails::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("lastModified")] = lastModified.toMSecsSinceEpoch();
    obj[QStringLiteral("messageCount")] = messageCount;
    obj[QStringLiteral("summary")] = summary;
    obj[QStringLiteral("stats")] = stats.toJson();
    obj[QStringLiteral("pagination")] = page.toJson();
    return obj;
}

QJsonObject ProjectStats::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("totalCost")] = totalCost;
    obj[QStringLiteral("linesWritten")] = linesWritten;
    obj[QStringLiteral("timeSpentMs")] = timeSpentMs;
    obj[QStringLiteral("sessionCount")] = sessionCount;
    obj[QStringLiteral("totalMessages")] = totalMessages;
    obj[QStringLiteral("totalToolCalls")] = totalToolCalls;
    obj[QStringLiteral("firstSession")] = firstSession.isValid() ? QJsonValue(firstSession.toString(Qt::ISODateWithMs)) : QJsonValue();
    obj[QStringLiteral("lastSession")] = lastSession.isValid() ? QJsonValue(lastSession.toString(Qt::ISODateWithMs)) : QJsonValue();
    return obj;
}

QJsonArray messagesToJson(const QVector<Message> &messages)
{
    QJsonArray list;
    for (const Message &message : messages) {
        list.append(message.toJson());
    }
    return list;
}

} // namespace TranscriptLens
