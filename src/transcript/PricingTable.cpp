/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PricingTable.h"

#include <algorithm>

namespace TranscriptLens
{

const QString PricingTable::DefaultModel = QStringLiteral("default");

PricingTable::PricingTable(const ModelPricing &fallback)
    : m_fallback(fallback)
{
}

PricingTable PricingTable::builtin()
{
    const ModelPricing opus{5.0, 25.0, 6.25, 0.5};
    const ModelPricing sonnet{3.0, 15.0, 3.75, 0.3};
    const ModelPricing haiku{1.0, 5.0, 1.25, 0.1};

    PricingTable table(sonnet);
    table.setPricing(QStringLiteral("claude-opus-4-5-20251101"), opus);
    table.setPricing(QStringLiteral("claude-sonnet-4-5-20241022"), sonnet);
    table.setPricing(QStringLiteral("claude-sonnet-4-20250514"), sonnet);
    table.setPricing(QStringLiteral("claude-3-5-sonnet-20241022"), sonnet);
    table.setPricing(QStringLiteral("claude-haiku-4-5-20241022"), haiku);
    table.setPricing(QStringLiteral("claude-haiku-4-5-20251001"), haiku);
    table.setPricing(QStringLiteral("claude-3-5-haiku-20241022"), haiku);
    return table;
}

ModelPricing PricingTable::resolve(const QString &modelId) const
{
    auto it = m_entries.constFind(modelId);
    if (it == m_entries.constEnd()) {
        return m_fallback;
    }
    return it.value();
}

void PricingTable::setPricing(const QString &modelId, const ModelPricing &pricing)
{
    if (modelId == DefaultModel) {
        m_fallback = pricing;
        return;
    }
    m_entries.insert(modelId, pricing);
}

bool PricingTable::contains(const QString &modelId) const
{
    return modelId == DefaultModel || m_entries.contains(modelId);
}

QStringList PricingTable::models() const
{
    QStringList list = m_entries.keys();
    std::sort(list.begin(), list.end());
    return list;
}

double CostCalculator::cost(const ModelPricing &pricing, const TokenUsage &usage)
{
    const double inputCost = (usage.inputTokens / 1000000.0) * pricing.input;
    const double outputCost = (usage.outputTokens / 1000000.0) * pricing.output;
    const double cacheWriteCost = (usage.cacheCreationTokens / 1000000.0) * pricing.cacheWrite;
    const double cacheReadCost = (usage.cacheReadTokens / 1000000.0) * pricing.cacheRead;
    return inputCost + outputCost + cacheWriteCost + cacheReadCost;
}

double CostCalculator::cost(const PricingLookup &pricing, const QString &modelId, const TokenUsage &usage)
{
    return cost(pricing.resolve(modelId), usage);
}

} // namespace TranscriptLens
