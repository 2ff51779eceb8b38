/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionAggregator.h"
#include "LineDecoder.h"
#include "Paginator.h"

#include <QDateTime>
#include <QStringList>

namespace TranscriptLens
{

const QString SessionAggregator::EmptySessionSummary = QStringLiteral("Empty session");

void SessionAggregator::addMessage(const RawEntry &entry, const Message &message)
{
    // Entries without a timestamp neither open nor close the session
    if (!entry.timestamp.isEmpty()) {
        if (!m_hasTimestamps) {
            m_firstTimestamp = entry.timestamp;
            m_hasTimestamps = true;
        }
        m_lastTimestamp = entry.timestamp;
    }

    if (entry.kind == RawEntry::User) {
        ++m_promptCount;
    }
    ++m_messageCount;

    if (entry.hasInlineCost) {
        m_inlineCostUsd += entry.inlineCostUsd;
    }
    if (message.hasUsage) {
        m_calculatedCostUsd += message.usage.costUsd;
    }

    for (const ContentBlock &block : message.blocks) {
        if (block.type == ContentBlock::ToolUse) {
            ++m_toolCallCount;
        }
    }
}

void SessionAggregator::addSummary(const QString &summary)
{
    if (!summary.isEmpty()) {
        m_explicitSummary = summary;
    }
}

SessionStats SessionAggregator::stats(int pageSize) const
{
    SessionStats stats;
    stats.promptCount = m_promptCount;
    stats.messageCount = m_messageCount;
    stats.toolCallCount = m_toolCallCount;
    stats.totalCostUsd = (m_calculatedCostUsd != 0.0) ? m_calculatedCostUsd : m_inlineCostUsd;

    stats.totalPages = Paginator::pageCount(m_messageCount, pageSize);

    if (m_hasTimestamps) {
        stats.startTimestamp = m_firstTimestamp;
        stats.endTimestamp = m_lastTimestamp;
        stats.durationMs = durationMs(m_firstTimestamp, m_lastTimestamp);
    }
    return stats;
}

QString SessionAggregator::summary(const QVector<Message> &messages, int maxLength) const
{
    if (!m_explicitSummary.isEmpty()) {
        return m_explicitSummary;
    }
    return generateSummary(messages, maxLength);
}

QString SessionAggregator::generateSummary(const QVector<Message> &messages, int maxLength)
{
    for (const Message &message : messages) {
        if (message.kind != Message::User) {
            continue;
        }

        QStringList parts;
        for (const ContentBlock &block : message.blocks) {
            if (block.type == ContentBlock::Text) {
                parts.append(block.text);
            }
        }
        const QString text = parts.join(QLatin1Char(' '));

        if (text.length() <= maxLength) {
            return text;
        }
        return text.left(qMax(0, maxLength - 3)) + QStringLiteral("...");
    }
    return EmptySessionSummary;
}

qint64 SessionAggregator::durationMs(const QString &first, const QString &last)
{
    const QDateTime start = QDateTime::fromString(first, Qt::ISODateWithMs);
    const QDateTime end = QDateTime::fromString(last, Qt::ISODateWithMs);
    if (!start.isValid() || !end.isValid()) {
        return 0;
    }
    return qMax<qint64>(0, start.msecsTo(end));
}

QMap<QString, int> SessionAggregator::toolBreakdown(const QVector<Message> &messages)
{
    QMap<QString, int> counts;
    for (const Message &message : messages) {
        for (const ContentBlock &block : message.blocks) {
            if (block.type == ContentBlock::ToolUse && !block.name.isEmpty()) {
                ++counts[block.name];
            }
        }
    }
    return counts;
}

QString SessionAggregator::messageText(const Message &message)
{
    QStringList parts;
    for (const ContentBlock &block : message.blocks) {
        if (block.type == ContentBlock::Text) {
            parts.append(block.text);
        }
    }
    return parts.join(QLatin1Char('\n'));
}

bool SessionAggregator::isToolOnly(const Message &message)
{
    for (const ContentBlock &block : message.blocks) {
        if (block.type != ContentBlock::ToolUse && block.type != ContentBlock::ToolResult) {
            return false;
        }
    }
    return true;
}

} // namespace TranscriptLens
