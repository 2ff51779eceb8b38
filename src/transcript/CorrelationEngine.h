/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CORRELATIONENGINE_H
#define CORRELATIONENGINE_H

#include "transcriptlens_export.h"

#include "AgentIdRecovery.h"
#include "TranscriptTypes.h"

#include <QHash>
#include <QJsonValue>
#include <QPair>
#include <QString>
#include <QVector>

namespace TranscriptLens
{

struct RawEntry;

/**
 * CorrelationEngine links tool results and sub-agent progress back to the
 * tool_use blocks they belong to.
 *
 * The engine never touches messages while they are being built. Pass 1
 * records where each tool_use block lives (message index, block index) and
 * collects results against that location; pass 2 collects progress records
 * and sub-agent ids. applyTo() writes everything onto the finished messages
 * in one step.
 *
 * A tool_use id maps to the most recently registered block with that id.
 * Results only resolve against tool uses registered before them.
 */
class TRANSCRIPTLENS_EXPORT CorrelationEngine
{
public:
    explicit CorrelationEngine(AgentIdRecovery::Mode recoveryMode = AgentIdRecovery::Mode::BestEffort);

    // Pass 1
    void registerToolUse(const ContentBlock &toolUse, int messageIndex, int blockIndex);

    /**
     * Record a tool_result against the tool use it references.
     *
     * @param entry the raw record the result came from (for toolUseResult.agentId)
     * @return false if the referenced tool use is unknown; nothing is recorded
     */
    bool attachResult(const ContentBlock &toolResult, const RawEntry &entry);

    // Pass 2

    /**
     * Append a progress record to its parent tool use.
     *
     * @return false if the record has no parent id or the parent is unknown
     */
    bool linkProgress(const RawEntry &entry);

    /**
     * Write collected results, progress lists and sub-agent ids onto the messages
     * the locations were registered against.
     */
    void applyTo(QVector<Message> &messages) const;

    bool contains(const QString &toolUseId) const;
    int toolUseCount() const;

private:
    using BlockLocation = QPair<int, int>;

    struct ToolUseOverlay {
        QJsonValue result = QJsonValue(QJsonValue::Undefined);
        QVector<AgentProgress> progress;
        QString agentId;
    };

    AgentIdRecovery::Mode m_recoveryMode;
    QHash<QString, BlockLocation> m_index;
    QHash<BlockLocation, ToolUseOverlay> m_overlay;
};

} // namespace TranscriptLens

#endif // CORRELATIONENGINE_H
