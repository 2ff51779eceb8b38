/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONAGGREGATOR_H
#define SESSIONAGGREGATOR_H

#include "transcriptlens_export.h"

#include "TranscriptTypes.h"

#include <QMap>
#include <QString>
#include <QVector>

namespace TranscriptLens
{

struct RawEntry;

/**
 * SessionAggregator keeps the running session totals while messages are built.
 *
 * Only user and assistant records are counted. Progress and hook records never
 * contribute to counts, cost or the session time span.
 */
class TRANSCRIPTLENS_EXPORT SessionAggregator
{
public:
    static const QString EmptySessionSummary;
    static constexpr int DefaultSummaryLength = 100;

    /**
     * Count a user/assistant record and the message built from it
     */
    void addMessage(const RawEntry &entry, const Message &message);

    /**
     * Remember an explicit summary record. The last non-empty one wins.
     */
    void addSummary(const QString &summary);

    /**
     * Totals so far.
     *
     * totalCostUsd prefers the sum of computed message costs and falls back to
     * costs written inline on the records when that sum is zero.
     */
    SessionStats stats(int pageSize) const;

    /**
     * Explicit summary if one was seen, otherwise generateSummary()
     */
    QString summary(const QVector<Message> &messages, int maxLength = DefaultSummaryLength) const;

    static QString generateSummary(const QVector<Message> &messages, int maxLength = DefaultSummaryLength);

    /**
     * Milliseconds between two ISO 8601 timestamps, never negative.
     * Unparseable timestamps give 0.
     */
    static qint64 durationMs(const QString &first, const QString &last);

    /**
     * Tool name -> number of tool_use blocks calling it
     */
    static QMap<QString, int> toolBreakdown(const QVector<Message> &messages);

    /**
     * Text blocks of a message joined by newlines
     */
    static QString messageText(const Message &message);

    /**
     * True if the message holds nothing but tool uses and tool results
     */
    static bool isToolOnly(const Message &message);

private:
    int m_promptCount = 0;
    int m_messageCount = 0;
    int m_toolCallCount = 0;
    double m_calculatedCostUsd = 0.0;
    double m_inlineCostUsd = 0.0;
    bool m_hasTimestamps = false;
    QString m_firstTimestamp;
    QString m_lastTimestamp;
    QString m_explicitSummary;
};

} // namespace TranscriptLens

#endif // SESSIONAGGREGATOR_H
