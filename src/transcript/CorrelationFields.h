/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CORRELATIONFIELDS_H
#define CORRELATIONFIELDS_H

#include "transcriptlens_export.h"

#include <QString>

namespace TranscriptLens
{

struct RawEntry;

/**
 * Reads correlation ids out of raw records.
 *
 * Different CLI versions spell the same field differently (top-level vs.
 * inside the progress payload, "ID" vs. "Id", camelCase vs. snake_case).
 * Each accessor tries the known spellings in a fixed order and returns the
 * first non-empty value, or an empty string.
 */
class TRANSCRIPTLENS_EXPORT CorrelationFields
{
public:
    /**
     * Tool use that spawned a progress record:
     * parentToolUseID, data.parentToolUseID, data.toolUseId
     */
    static QString parentToolUseId(const RawEntry &entry);

    /**
     * Tool use id reported by the progress payload itself:
     * data.toolUseID, data.toolUseId
     */
    static QString progressToolUseId(const RawEntry &entry);

    /**
     * Sub-agent id on a progress record:
     * data.agentId, agentId, data.agentID, data.agent_id
     */
    static QString progressAgentId(const RawEntry &entry);

    /**
     * Sub-agent id recorded next to a tool result: toolUseResult.agentId
     */
    static QString toolResultAgentId(const RawEntry &entry);

    /**
     * Prefix "agent-" unless already present. Empty stays empty.
     */
    static QString normalizeAgentId(const QString &agentId);

private:
    CorrelationFields() = default;
};

} // namespace TranscriptLens

#endif // CORRELATIONFIELDS_H
