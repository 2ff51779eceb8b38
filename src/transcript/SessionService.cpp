/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionService.h"

#include "CorrelationFields.h"
#include "TranscriptSource.h"

#include <QDebug>

namespace TranscriptLens
{

SessionService::SessionService(const TranscriptSource &source,
                               const PricingLookup &pricing,
                               const ParserOptions &sessionOptions,
                               const ParserOptions &agentOptions)
    : m_source(source)
    , m_sessionParser(pricing, sessionOptions)
    , m_agentParser(pricing, agentOptions)
{
}

ParserOptions SessionService::defaultAgentOptions()
{
    ParserOptions options;
    options.pageSize = 5;
    return options;
}

std::optional<SessionDetails> SessionService::sessionDetails(const QString &sessionId, int page) const
{
    TranscriptFile file;
    if (!m_source.readSession(sessionId, file)) {
        qWarning() << "SessionService: Session transcript not available:" << sessionId;
        return std::nullopt;
    }

    const ParsedSession parsed = m_sessionParser.parse(file.rawText);

    SessionDetails details;
    details.id = sessionId;
    details.lastModified = file.lastModified;
    details.messageCount = parsed.stats.messageCount;
    details.summary = parsed.summary;
    details.stats = parsed.stats;
    details.page = m_sessionParser.page(parsed, page);
    return details;
}

std::optional<PaginatedMessages> SessionService::agentTranscript(const QString &sessionId, const QString &agentId, int page) const
{
    const QString normalizedId = CorrelationFields::normalizeAgentId(agentId);
    if (normalizedId.isEmpty()) {
        return std::nullopt;
    }

    TranscriptFile file;
    if (!m_source.readAgent(sessionId, normalizedId, file)) {
        qWarning() << "SessionService: Sub-agent transcript not available:" << sessionId << normalizedId;
        return std::nullopt;
    }

    const ParsedSession parsed = m_agentParser.parse(file.rawText);
    qDebug() << "SessionService: Loaded sub-agent" << normalizedId << "with" << parsed.messages.size() << "messages";
    return m_agentParser.page(parsed, page);
}

} // namespace TranscriptLens
