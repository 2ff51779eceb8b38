/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PRICINGTABLE_H
#define PRICINGTABLE_H

#include "transcriptlens_export.h"

#include "TranscriptTypes.h"

#include <QHash>
#include <QString>
#include <QStringList>

namespace TranscriptLens
{

/**
 * USD rates per million tokens for one model
 */
struct TRANSCRIPTLENS_EXPORT ModelPricing {
    double input = 0.0;
    double output = 0.0;
    double cacheWrite = 0.0;
    double cacheRead = 0.0;

    bool operator==(const ModelPricing &other) const
    {
        return input == other.input && output == other.output && cacheWrite == other.cacheWrite && cacheRead == other.cacheRead;
    }
};

/**
 * Resolves the rates to bill a model id at.
 */
class TRANSCRIPTLENS_EXPORT PricingLookup
{
public:
    virtual ~PricingLookup() = default;

    virtual ModelPricing resolve(const QString &modelId) const = 0;
};

/**
 * Table of model rates with a fallback entry.
 *
 * Lookups match the model id exactly; any other id, including an empty one,
 * is billed at the "default" entry.
 */
class TRANSCRIPTLENS_EXPORT PricingTable : public PricingLookup
{
public:
    static const QString DefaultModel;

    /**
     * Table with only a default entry
     */
    explicit PricingTable(const ModelPricing &fallback);

    /**
     * Anthropic list prices (Dec 2025), default billed as Sonnet
     */
    static PricingTable builtin();

    ModelPricing resolve(const QString &modelId) const override;

    /**
     * Add or replace the rates for a model. Passing DefaultModel replaces the fallback.
     */
    void setPricing(const QString &modelId, const ModelPricing &pricing);

    bool contains(const QString &modelId) const;
    QStringList models() const;

private:
    QHash<QString, ModelPricing> m_entries;
    ModelPricing m_fallback;
};

/**
 * Cost of token usage at given rates
 */
class TRANSCRIPTLENS_EXPORT CostCalculator
{
public:
    static double cost(const ModelPricing &pricing, const TokenUsage &usage);
    static double cost(const PricingLookup &pricing, const QString &modelId, const TokenUsage &usage);

private:
    CostCalculator() = default;
};

} // namespace TranscriptLens

#endif // PRICINGTABLE_H
