/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptParser.h"

#include "ContentNormalizer.h"
#include "CorrelationEngine.h"
#include "CorrelationFields.h"
#include "LineDecoder.h"
#include "Paginator.h"
#include "PricingTable.h"

#include <QDebug>

namespace TranscriptLens
{

TranscriptParser::TranscriptParser(const PricingLookup &pricing, const ParserOptions &options)
    : m_pricing(pricing)
    , m_options(options)
{
}

ParsedSession TranscriptParser::parse(const QByteArray &rawText) const
{
    return parseEntries(LineDecoder::decode(rawText));
}

ParsedSession TranscriptParser::parseEntries(const QVector<RawEntry> &entries) const
{
    CorrelationEngine engine(m_options.agentIdRecovery);
    SessionAggregator aggregator;

    // Pass 1: conversation messages, tool use registration, running totals
    QVector<Message> conversation;
    QVector<int> conversationOrder;
    int unresolvedResults = 0;

    for (int i = 0; i < entries.size(); ++i) {
        const RawEntry &entry = entries.at(i);

        if (entry.kind == RawEntry::Summary) {
            aggregator.addSummary(entry.summary);
            continue;
        }
        if (entry.kind != RawEntry::User && entry.kind != RawEntry::Assistant) {
            continue;
        }

        const Message message = buildMessage(entry);
        const int messageIndex = conversation.size();

        for (int b = 0; b < message.blocks.size(); ++b) {
            const ContentBlock &block = message.blocks.at(b);
            if (block.type == ContentBlock::ToolUse && !block.id.isEmpty()) {
                engine.registerToolUse(block, messageIndex, b);
            } else if (block.type == ContentBlock::ToolResult && !block.toolUseId.isEmpty()) {
                if (!engine.attachResult(block, entry)) {
                    ++unresolvedResults;
                }
            }
        }

        aggregator.addMessage(entry, message);
        conversation.append(message);
        conversationOrder.append(i);
    }

    // Pass 2: progress linking; what doesn't link stays visible on its own
    QVector<Message> standalone;
    QVector<int> standaloneOrder;

    for (int i = 0; i < entries.size(); ++i) {
        const RawEntry &entry = entries.at(i);

        if (entry.kind == RawEntry::Progress) {
            if (!engine.linkProgress(entry)) {
                standalone.append(standaloneProgressMessage(entry));
                standaloneOrder.append(i);
            }
        } else if (entry.kind == RawEntry::Hook) {
            standalone.append(hookMessage(entry));
            standaloneOrder.append(i);
        }
    }

    if (unresolvedResults > 0 || !standalone.isEmpty()) {
        qDebug() << "TranscriptParser: Unresolved tool results:" << unresolvedResults << "standalone progress/hook messages:" << standalone.size();
    }

    engine.applyTo(conversation);

    ParsedSession session;
    session.stats = aggregator.stats(m_options.pageSize);
    session.summary = aggregator.summary(conversation, m_options.summaryMaxLength);

    // Merge both sequences back into file order
    session.messages.reserve(conversation.size() + standalone.size());
    int c = 0;
    int s = 0;
    while (c < conversation.size() || s < standalone.size()) {
        const bool takeConversation = s >= standalone.size() || (c < conversation.size() && conversationOrder.at(c) < standaloneOrder.at(s));
        if (takeConversation) {
            session.messages.append(conversation.at(c++));
        } else {
            session.messages.append(standalone.at(s++));
        }
    }

    return session;
}

PaginatedMessages TranscriptParser::page(const ParsedSession &session, int page) const
{
    return Paginator::paginate(session.messages, page, m_options.pageSize);
}

Message TranscriptParser::buildMessage(const RawEntry &entry) const
{
    Message message;
    message.uuid = entry.uuid;
    message.kind = (entry.kind == RawEntry::User) ? Message::User : Message::Assistant;
    message.timestamp = entry.timestamp;
    message.blocks = ContentNormalizer::normalize(entry.content);
    message.model = entry.model;

    if (entry.hasUsage) {
        message.hasUsage = true;
        message.usage.inputTokens = entry.usage.inputTokens;
        message.usage.outputTokens = entry.usage.outputTokens;
        message.usage.cacheCreationTokens = entry.usage.cacheCreationTokens;
        message.usage.cacheReadTokens = entry.usage.cacheReadTokens;
        message.usage.costUsd = CostCalculator::cost(m_pricing, entry.model, message.usage);
    }
    return message;
}

Message TranscriptParser::standaloneProgressMessage(const RawEntry &entry)
{
    ContentBlock block;
    block.type = ContentBlock::Progress;
    block.text = entry.data.value(QStringLiteral("prompt")).toString();
    block.agentId = CorrelationFields::progressAgentId(entry);
    block.toolUseId = CorrelationFields::progressToolUseId(entry);
    block.timestamp = entry.timestamp;

    Message message;
    message.uuid = entry.uuid;
    message.kind = Message::Progress;
    message.timestamp = entry.timestamp;
    message.blocks.append(block);
    return message;
}

Message TranscriptParser::hookMessage(const RawEntry &entry)
{
    ContentBlock block;
    block.type = ContentBlock::Hook;
    block.hookEvent = entry.data.value(QStringLiteral("hookEvent")).toString();
    block.hookName = entry.data.value(QStringLiteral("hookName")).toString();
    block.command = entry.data.value(QStringLiteral("command")).toString();
    block.timestamp = entry.timestamp;

    Message message;
    message.uuid = entry.uuid;
    message.kind = Message::Hook;
    message.timestamp = entry.timestamp;
    message.blocks.append(block);
    return message;
}

} // namespace TranscriptLens
