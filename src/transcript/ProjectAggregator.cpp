/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProjectAggregator.h"

#include <QDebug>
#include <QFuture>
#include <QtConcurrent/QtConcurrentRun>

namespace TranscriptLens
{

namespace
{
struct SessionRollup {
    SessionStats stats;
    qint64 linesWritten = 0;
};

qint64 countLines(const QString &text)
{
    if (text.isEmpty()) {
        return 0;
    }
    return text.count(QLatin1Char('\n')) + 1;
}
}

ProjectAggregator::ProjectAggregator(const PricingLookup &pricing, int maxThreads, const ParserOptions &options)
    : m_parser(pricing, options)
{
    m_workerPool.setMaxThreadCount(qMax(1, maxThreads));
}

qint64 ProjectAggregator::linesWritten(const QVector<Message> &messages)
{
    qint64 lines = 0;
    for (const Message &message : messages) {
        for (const ContentBlock &block : message.blocks) {
            if (block.type != ContentBlock::ToolUse) {
                continue;
            }
            if (block.name == QLatin1String("Write")) {
                lines += countLines(block.input.value(QStringLiteral("content")).toString());
            } else if (block.name == QLatin1String("Edit")) {
                lines += countLines(block.input.value(QStringLiteral("new_string")).toString());
            }
        }
    }
    return lines;
}

ProjectStats ProjectAggregator::aggregate(const QVector<TranscriptFile> &sessions)
{
    ProjectStats project;

    QVector<QFuture<SessionRollup>> pending;
    pending.reserve(sessions.size());

    for (const TranscriptFile &file : sessions) {
        if (file.rawText.isEmpty()) {
            continue;
        }

        ++project.sessionCount;
        if (file.lastModified.isValid()) {
            if (!project.firstSession.isValid() || file.lastModified < project.firstSession) {
                project.firstSession = file.lastModified;
            }
            if (!project.lastSession.isValid() || file.lastModified > project.lastSession) {
                project.lastSession = file.lastModified;
            }
        }

        const QByteArray rawText = file.rawText;
        pending.append(QtConcurrent::run(&m_workerPool, [this, rawText]() {
            const ParsedSession parsed = m_parser.parse(rawText);
            SessionRollup rollup;
            rollup.stats = parsed.stats;
            rollup.linesWritten = linesWritten(parsed.messages);
            return rollup;
        }));
    }

    for (QFuture<SessionRollup> &future : pending) {
        const SessionRollup rollup = future.result();
        project.totalCost += rollup.stats.totalCostUsd;
        project.linesWritten += rollup.linesWritten;
        project.timeSpentMs += rollup.stats.durationMs;
        project.totalMessages += rollup.stats.messageCount;
        project.totalToolCalls += rollup.stats.toolCallCount;
    }

    qDebug() << "ProjectAggregator: Aggregated" << project.sessionCount << "sessions," << project.totalMessages << "messages";
    return project;
}

} // namespace TranscriptLens
