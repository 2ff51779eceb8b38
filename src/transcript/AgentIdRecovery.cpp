/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentIdRecovery.h"
#include "CorrelationFields.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

#include <initializer_list>

namespace TranscriptLens
{

QString AgentIdRecovery::fromText(const QString &text)
{
    static const QRegularExpression prefixedRx(QStringLiteral(R"(agent-([a-f0-9]+))"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression labelledRx(QStringLiteral(R"(Agent ID[:\s]+([a-f0-9]+))"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression fieldRx(QStringLiteral(R"(agentId[:\s]+([a-f0-9]+))"), QRegularExpression::CaseInsensitiveOption);

    for (const QRegularExpression *rx : {&prefixedRx, &labelledRx, &fieldRx}) {
        const QRegularExpressionMatch match = rx->match(text);
        if (match.hasMatch()) {
            return CorrelationFields::normalizeAgentId(match.captured(1));
        }
    }
    return QString();
}

QString AgentIdRecovery::fromResultContent(const QJsonValue &content)
{
    if (content.isString()) {
        return fromText(content.toString());
    }
    if (content.isArray()) {
        return fromText(QString::fromUtf8(QJsonDocument(content.toArray()).toJson(QJsonDocument::Compact)));
    }
    if (content.isObject()) {
        return fromText(QString::fromUtf8(QJsonDocument(content.toObject()).toJson(QJsonDocument::Compact)));
    }
    return QString();
}

} // namespace TranscriptLens
