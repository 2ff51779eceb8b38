/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTIDRECOVERY_H
#define AGENTIDRECOVERY_H

#include "transcriptlens_export.h"

#include <QJsonValue>
#include <QString>

namespace TranscriptLens
{

/**
 * Best-effort recovery of a sub-agent id from free text.
 *
 * Transcripts written before the CLI recorded toolUseResult.agentId only
 * mention the id in the Task tool's result text. Patterns, tried in order
 * and matched case-insensitively:
 *   agent-<hex>
 *   Agent ID: <hex>
 *   agentId: <hex>
 */
class TRANSCRIPTLENS_EXPORT AgentIdRecovery
{
public:
    enum class Mode {
        StructuredOnly, // only ids from structured fields
        BestEffort, // fall back to scanning result text
    };

    /**
     * First id found in @p text, normalized to the "agent-" form, or empty
     */
    static QString fromText(const QString &text);

    /**
     * Scan a tool result's content. Strings are scanned as-is, anything else
     * as its compact JSON.
     */
    static QString fromResultContent(const QJsonValue &content);

private:
    AgentIdRecovery() = default;
};

} // namespace TranscriptLens

#endif // AGENTIDRECOVERY_H
