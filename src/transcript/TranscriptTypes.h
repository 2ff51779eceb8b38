/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTTYPES_H
#define TRANSCRIPTTYPES_H

#include "transcriptlens_export.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>

namespace TranscriptLens
{

/**
 * Per-message token usage counters
 */
struct TRANSCRIPTLENS_EXPORT TokenUsage {
    quint64 inputTokens = 0;
    quint64 outputTokens = 0;
    quint64 cacheCreationTokens = 0;
    quint64 cacheReadTokens = 0;
    double costUsd = 0.0;

    quint64 totalTokens() const
    {
        return inputTokens + outputTokens + cacheCreationTokens + cacheReadTokens;
    }

    QJsonObject toJson() const;
};

/**
 * One progress update from a sub-agent, attached to the tool use that spawned it
 */
struct TRANSCRIPTLENS_EXPORT AgentProgress {
    QString uuid;
    QString timestamp;
    QString type; // "agent_progress" in current logs
    QString prompt;
    QString agentId; // as written in the record, not normalized
    QString toolUseId;
    QString parentToolUseId;
    QJsonObject data; // full progress payload

    QJsonObject toJson() const;
};

/**
 * A canonical content block.
 *
 * Only the fields relevant to the block's type are populated.
 */
struct TRANSCRIPTLENS_EXPORT ContentBlock {
    enum Type {
        Text,
        ToolUse,
        ToolResult,
        Thinking,
        Image,
        Progress,
        Hook
    };
    Type type = Text;

    // Text, Thinking (thinking text), Progress (prompt)
    QString text;

    // ToolUse
    QString id;
    QString name;
    QJsonObject input;
    QJsonValue result = QJsonValue(QJsonValue::Undefined);
    QVector<AgentProgress> progress;

    // ToolUse (resolved sub-agent), Progress
    QString agentId;

    // ToolResult (referenced tool use), Progress (correlation id)
    QString toolUseId;

    // ToolResult
    QJsonValue content = QJsonValue(QJsonValue::Undefined);
    bool isError = false;

    // Image
    QJsonObject source;

    // Hook
    QString hookEvent;
    QString hookName;
    QString command;

    // Progress, Hook
    QString timestamp;

    bool hasResult() const
    {
        return !result.isUndefined();
    }

    static ContentBlock makeText(const QString &text);

    static QString typeName(Type type);

    QJsonObject toJson() const;
};

/**
 * A conversation message built from one log record
 */
struct TRANSCRIPTLENS_EXPORT Message {
    enum Kind {
        User,
        Assistant,
        Progress,
        Hook
    };

    QString uuid;
    Kind kind = User;
    QString timestamp;
    QVector<ContentBlock> blocks;
    QString model; // empty when the record has none
    bool hasUsage = false;
    TokenUsage usage;

    static QString kindName(Kind kind);

    QJsonObject toJson() const;
};

/**
 * Per-session counters derived on every parse
 */
struct TRANSCRIPTLENS_EXPORT SessionStats {
    int promptCount = 0;
    int messageCount = 0;
    int toolCallCount = 0;
    double totalCostUsd = 0.0;
    int totalPages = 0;
    qint64 durationMs = 0;
    QString startTimestamp; // empty when the session has no counted entries
    QString endTimestamp;

    QJsonObject toJson() const;
};

/**
 * One newest-first page of a message sequence
 */
struct TRANSCRIPTLENS_EXPORT PaginatedMessages {
    QVector<Message> messages;
    int totalPages = 1;
    int currentPage = 1;
    int totalMessages = 0;
    bool hasMore = false;

    QJsonObject toJson() const;
};

/**
 * Result of a full parse of one transcript
 */
struct TRANSCRIPTLENS_EXPORT ParsedSession {
    QVector<Message> messages;
    SessionStats stats;
    QString summary;

    QJsonObject toJson() const;
};

/**
 * A session paired with its file metadata and the requested page
 */
struct TRANSCRIPTLENS_EXPORT SessionDetails {
    QString id;
    QDateTime lastModified;
    int messageCount = 0;
    QString summary;
    SessionStats stats;
    PaginatedMessages page;

    QJsonObject toJson() const;
};

/**
 * Totals across all sessions of one project
 */
struct TRANSCRIPTLENS_EXPORT ProjectStats {
    double totalCost = 0.0;
    qint64 linesWritten = 0;
    qint64 timeSpentMs = 0;
    int sessionCount = 0;
    int totalMessages = 0;
    int totalToolCalls = 0;
    QDateTime firstSession;
    QDateTime lastSession;

    QJsonObject toJson() const;
};

TRANSCRIPTLENS_EXPORT QJsonArray messagesToJson(const QVector<Message> &messages);

} // namespace TranscriptLens

#endif // TRANSCRIPTTYPES_H
