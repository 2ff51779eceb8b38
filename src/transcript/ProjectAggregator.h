/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROJECTAGGREGATOR_H
#define PROJECTAGGREGATOR_H

#include "transcriptlens_export.h"

#include "TranscriptParser.h"
#include "TranscriptSource.h"
#include "TranscriptTypes.h"

#include <QThreadPool>
#include <QVector>

namespace TranscriptLens
{

class PricingLookup;

/**
 * ProjectAggregator rolls up the sessions of one project into ProjectStats.
 *
 * Sessions are parsed independently on a private thread pool; results are
 * reduced in input order so the totals don't depend on scheduling.
 */
class TRANSCRIPTLENS_EXPORT ProjectAggregator
{
public:
    ProjectAggregator(const PricingLookup &pricing, int maxThreads, const ParserOptions &options = ParserOptions());

    ProjectStats aggregate(const QVector<TranscriptFile> &sessions);

    /**
     * Lines added by Write (input.content) and Edit (input.new_string) tool uses
     */
    static qint64 linesWritten(const QVector<Message> &messages);

    int maxThreads() const
    {
        return m_workerPool.maxThreadCount();
    }

private:
    TranscriptParser m_parser;
    QThreadPool m_workerPool;
};

} // namespace TranscriptLens

#endif // PROJECTAGGREGATOR_H
