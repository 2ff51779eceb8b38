/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTSOURCE_H
#define TRANSCRIPTSOURCE_H

#include "transcriptlens_export.h"

#include <QByteArray>
#include <QDateTime>
#include <QString>

namespace TranscriptLens
{

/**
 * Raw contents of one transcript file
 */
struct TRANSCRIPTLENS_EXPORT TranscriptFile {
    QByteArray rawText;
    QDateTime lastModified;
};

/**
 * Supplies transcript files by id.
 *
 * Implemented by whatever knows where transcripts live (usually
 * ~/.claude/projects/<project>/); the parser itself never does I/O.
 */
class TRANSCRIPTLENS_EXPORT TranscriptSource
{
public:
    virtual ~TranscriptSource() = default;

    /**
     * @return false if the session's transcript is missing or unreadable
     */
    virtual bool readSession(const QString &sessionId, TranscriptFile &file) const = 0;

    /**
     * Transcript of a sub-agent spawned from a session
     *
     * @param agentId normalized "agent-<hex>" id
     * @return false if the sub-agent's transcript is missing or unreadable
     */
    virtual bool readAgent(const QString &sessionId, const QString &agentId, TranscriptFile &file) const = 0;
};

} // namespace TranscriptLens

#endif // TRANSCRIPTSOURCE_H
