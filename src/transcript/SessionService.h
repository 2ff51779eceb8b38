/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSERVICE_H
#define SESSIONSERVICE_H

#include "transcriptlens_export.h"

#include "TranscriptParser.h"
#include "TranscriptTypes.h"

#include <QString>

#include <optional>

namespace TranscriptLens
{

class PricingLookup;
class TranscriptSource;

/**
 * SessionService answers the two requests the transcript viewer makes:
 * one page of a session, and one page of a sub-agent's own transcript.
 *
 * Both go through the same TranscriptParser pipeline with their own options
 * (the sub-agent view uses a smaller page). The source and pricing lookup
 * must outlive the service.
 */
class TRANSCRIPTLENS_EXPORT SessionService
{
public:
    SessionService(const TranscriptSource &source,
                   const PricingLookup &pricing,
                   const ParserOptions &sessionOptions = ParserOptions(),
                   const ParserOptions &agentOptions = defaultAgentOptions());

    static ParserOptions defaultAgentOptions();

    /**
     * @return std::nullopt if the session's transcript can't be read
     */
    std::optional<SessionDetails> sessionDetails(const QString &sessionId, int page = 1) const;

    /**
     * @param agentId sub-agent id, with or without the "agent-" prefix
     * @return std::nullopt if the sub-agent's transcript can't be read
     */
    std::optional<PaginatedMessages> agentTranscript(const QString &sessionId, const QString &agentId, int page = 1) const;

private:
    const TranscriptSource &m_source;
    TranscriptParser m_sessionParser;
    TranscriptParser m_agentParser;
};

} // namespace TranscriptLens

#endif // SESSIONSERVICE_H
