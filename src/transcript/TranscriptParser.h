/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTPARSER_H
#define TRANSCRIPTPARSER_H

#include "transcriptlens_export.h"

#include "AgentIdRecovery.h"
#include "SessionAggregator.h"
#include "TranscriptTypes.h"

#include <QByteArray>
#include <QVector>

namespace TranscriptLens
{

class PricingLookup;
struct RawEntry;

/**
 * Options for one parse
 */
struct TRANSCRIPTLENS_EXPORT ParserOptions {
    int pageSize = 20; // SessionStats::totalPages is computed against this
    int summaryMaxLength = SessionAggregator::DefaultSummaryLength;
    AgentIdRecovery::Mode agentIdRecovery = AgentIdRecovery::Mode::BestEffort;
};

/**
 * TranscriptParser turns the text of one session transcript into messages,
 * session stats and a summary.
 *
 * Pipeline:
 * 1. LineDecoder splits the text into raw records
 * 2. user/assistant records become messages (ContentNormalizer, CostCalculator),
 *    tool uses and tool results are registered with the CorrelationEngine and
 *    SessionAggregator keeps running totals
 * 3. progress records are linked to their tool use, or kept as standalone
 *    messages; hook records always become their own messages
 * 4. correlations are merged onto the messages, standalone messages are put
 *    back in file order
 *
 * Parsing never fails. Unusable lines are dropped and unresolved references
 * are left unlinked. The parser keeps no state between calls; the pricing
 * lookup must outlive the parser.
 */
class TRANSCRIPTLENS_EXPORT TranscriptParser
{
public:
    explicit TranscriptParser(const PricingLookup &pricing, const ParserOptions &options = ParserOptions());

    ParsedSession parse(const QByteArray &rawText) const;

    ParsedSession parseEntries(const QVector<RawEntry> &entries) const;

    /**
     * Newest-first page of a parsed session, using the configured page size
     */
    PaginatedMessages page(const ParsedSession &session, int page) const;

    const ParserOptions &options() const
    {
        return m_options;
    }

private:
    Message buildMessage(const RawEntry &entry) const;
    static Message standaloneProgressMessage(const RawEntry &entry);
    static Message hookMessage(const RawEntry &entry);

    const PricingLookup &m_pricing;
    ParserOptions m_options;
};

} // namespace TranscriptLens

#endif // TRANSCRIPTPARSER_H
