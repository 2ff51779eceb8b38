/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CorrelationFields.h"
#include "LineDecoder.h"

#include <QJsonObject>

#include <initializer_list>

namespace TranscriptLens
{

namespace
{

QString firstString(std::initializer_list<QJsonValue> candidates)
{
    for (const QJsonValue &value : candidates) {
        if (value.isString() && !value.toString().isEmpty()) {
            return value.toString();
        }
    }
    return QString();
}

const QString AgentPrefix = QStringLiteral("agent-");

} // namespace

QString CorrelationFields::parentToolUseId(const RawEntry &entry)
{
    return firstString({
        entry.record.value(QStringLiteral("parentToolUseID")),
        entry.data.value(QStringLiteral("parentToolUseID")),
        entry.data.value(QStringLiteral("toolUseId")),
    });
}

QString CorrelationFields::progressToolUseId(const RawEntry &entry)
{
    return firstString({
        entry.data.value(QStringLiteral("toolUseID")),
        entry.data.value(QStringLiteral("toolUseId")),
    });
}

QString CorrelationFields::progressAgentId(const RawEntry &entry)
{
    return firstString({
        entry.data.value(QStringLiteral("agentId")),
        entry.record.value(QStringLiteral("agentId")),
        entry.data.value(QStringLiteral("agentID")),
        entry.data.value(QStringLiteral("agent_id")),
    });
}

QString CorrelationFields::toolResultAgentId(const RawEntry &entry)
{
    const QJsonObject toolUseResult = entry.record.value(QStringLiteral("toolUseResult")).toObject();
    return firstString({toolUseResult.value(QStringLiteral("agentId"))});
}

QString CorrelationFields::normalizeAgentId(const QString &agentId)
{
    if (agentId.isEmpty() || agentId.startsWith(AgentPrefix)) {
        return agentId;
    }
    return AgentPrefix + agentId;
}

} // namespace TranscriptLens
