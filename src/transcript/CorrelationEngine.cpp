/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CorrelationEngine.h"
#include "CorrelationFields.h"
#include "LineDecoder.h"

namespace TranscriptLens
{

CorrelationEngine::CorrelationEngine(AgentIdRecovery::Mode recoveryMode)
    : m_recoveryMode(recoveryMode)
{
}

void CorrelationEngine::registerToolUse(const ContentBlock &toolUse, int messageIndex, int blockIndex)
{
    const BlockLocation location(messageIndex, blockIndex);
    m_index.insert(toolUse.id, location);

    ToolUseOverlay overlay;
    // Some CLI versions put the spawned agent's id straight into the Task input
    if (toolUse.name == QLatin1String("Task")) {
        overlay.agentId = CorrelationFields::normalizeAgentId(toolUse.input.value(QStringLiteral("agentId")).toString());
    }
    m_overlay.insert(location, overlay);
}

bool CorrelationEngine::attachResult(const ContentBlock &toolResult, const RawEntry &entry)
{
    auto it = m_index.constFind(toolResult.toolUseId);
    if (it == m_index.constEnd()) {
        return false;
    }

    ToolUseOverlay &overlay = m_overlay[it.value()];
    overlay.result = toolResult.content.isUndefined() ? QJsonValue() : toolResult.content;

    const QString structuredId = CorrelationFields::toolResultAgentId(entry);
    if (!structuredId.isEmpty()) {
        overlay.agentId = CorrelationFields::normalizeAgentId(structuredId);
    }

    if (overlay.agentId.isEmpty() && m_recoveryMode == AgentIdRecovery::Mode::BestEffort) {
        overlay.agentId = AgentIdRecovery::fromResultContent(toolResult.content);
    }
    return true;
}

bool CorrelationEngine::linkProgress(const RawEntry &entry)
{
    const QString parentId = CorrelationFields::parentToolUseId(entry);
    if (parentId.isEmpty()) {
        return false;
    }

    auto it = m_index.constFind(parentId);
    if (it == m_index.constEnd()) {
        return false;
    }

    ToolUseOverlay &overlay = m_overlay[it.value()];

    const QString agentId = CorrelationFields::progressAgentId(entry);
    if (!agentId.isEmpty() && overlay.agentId.isEmpty()) {
        overlay.agentId = CorrelationFields::normalizeAgentId(agentId);
    }

    AgentProgress progress;
    progress.uuid = entry.uuid;
    progress.timestamp = entry.timestamp;
    progress.type = entry.data.value(QStringLiteral("type")).toString();
    progress.prompt = entry.data.value(QStringLiteral("prompt")).toString();
    progress.agentId = entry.data.value(QStringLiteral("agentId")).toString();
    progress.toolUseId = CorrelationFields::progressToolUseId(entry);
    if (progress.toolUseId.isEmpty()) {
        progress.toolUseId = parentId;
    }
    progress.parentToolUseId = parentId;
    progress.data = entry.data;
    overlay.progress.append(progress);
    return true;
}

void CorrelationEngine::applyTo(QVector<Message> &messages) const
{
    for (auto it = m_overlay.constBegin(); it != m_overlay.constEnd(); ++it) {
        const BlockLocation &location = it.key();
        if (location.first < 0 || location.first >= messages.size()) {
            continue;
        }
        QVector<ContentBlock> &blocks = messages[location.first].blocks;
        if (location.second < 0 || location.second >= blocks.size()) {
            continue;
        }

        ContentBlock &block = blocks[location.second];
        const ToolUseOverlay &overlay = it.value();
        if (!overlay.result.isUndefined()) {
            block.result = overlay.result;
        }
        block.progress += overlay.progress;
        if (block.agentId.isEmpty()) {
            block.agentId = overlay.agentId;
        }
    }
}

bool CorrelationEngine::contains(const QString &toolUseId) const
{
    return m_index.contains(toolUseId);
}

int CorrelationEngine::toolUseCount() const
{
    return m_index.size();
}

} // namespace TranscriptLens
