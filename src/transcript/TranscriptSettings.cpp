/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptSettings.h"

#include <KConfigGroup>
#include <QDebug>
#include <QDir>

namespace TranscriptLens
{

TranscriptSettings *TranscriptSettings::s_instance = nullptr;

TranscriptSettings *TranscriptSettings::instance()
{
    return s_instance;
}

TranscriptSettings::TranscriptSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    // Load config from ~/.config/transcriptlensrc unless given a full path
    if (QDir::isAbsolutePath(configName)) {
        m_config = KSharedConfig::openConfig(configName, KConfig::SimpleConfig);
    } else {
        m_config = KSharedConfig::openConfig(configName);
    }
}

TranscriptSettings::~TranscriptSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

int TranscriptSettings::sessionPageSize() const
{
    KConfigGroup group(m_config, QStringLiteral("Pagination"));
    return qMax(1, group.readEntry("SessionPageSize", 20));
}

void TranscriptSettings::setSessionPageSize(int size)
{
    KConfigGroup group(m_config, QStringLiteral("Pagination"));
    group.writeEntry("SessionPageSize", size);
    Q_EMIT settingsChanged();
}

int TranscriptSettings::agentPageSize() const
{
    KConfigGroup group(m_config, QStringLiteral("Pagination"));
    return qMax(1, group.readEntry("AgentPageSize", 5));
}

void TranscriptSettings::setAgentPageSize(int size)
{
    KConfigGroup group(m_config, QStringLiteral("Pagination"));
    group.writeEntry("AgentPageSize", size);
    Q_EMIT settingsChanged();
}

int TranscriptSettings::summaryMaxLength() const
{
    KConfigGroup group(m_config, QStringLiteral("Summary"));
    // Shorter than the ellipsis makes no sense
    return qMax(3, group.readEntry("MaxLength", static_cast<int>(SessionAggregator::DefaultSummaryLength)));
}

void TranscriptSettings::setSummaryMaxLength(int length)
{
    KConfigGroup group(m_config, QStringLiteral("Summary"));
    group.writeEntry("MaxLength", length);
    Q_EMIT settingsChanged();
}

bool TranscriptSettings::heuristicAgentIdRecovery() const
{
    KConfigGroup group(m_config, QStringLiteral("Correlation"));
    return group.readEntry("HeuristicAgentIdRecovery", true);
}

void TranscriptSettings::setHeuristicAgentIdRecovery(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Correlation"));
    group.writeEntry("HeuristicAgentIdRecovery", enabled);
    Q_EMIT settingsChanged();
}

int TranscriptSettings::maxThreads() const
{
    KConfigGroup group(m_config, QStringLiteral("Workers"));
    return qMax(1, group.readEntry("MaxThreads", 4));
}

void TranscriptSettings::setMaxThreads(int threads)
{
    KConfigGroup group(m_config, QStringLiteral("Workers"));
    group.writeEntry("MaxThreads", threads);
    Q_EMIT settingsChanged();
}

PricingTable TranscriptSettings::pricingTable() const
{
    PricingTable table = PricingTable::builtin();

    KConfigGroup pricingGroup(m_config, QStringLiteral("Pricing"));
    const QStringList models = pricingGroup.groupList();
    for (const QString &model : models) {
        const KConfigGroup group = pricingGroup.group(model);
        const ModelPricing base = table.resolve(model);

        ModelPricing pricing;
        pricing.input = group.readEntry("Input", base.input);
        pricing.output = group.readEntry("Output", base.output);
        pricing.cacheWrite = group.readEntry("CacheWrite", base.cacheWrite);
        pricing.cacheRead = group.readEntry("CacheRead", base.cacheRead);

        if (pricing.input < 0.0 || pricing.output < 0.0 || pricing.cacheWrite < 0.0 || pricing.cacheRead < 0.0) {
            qWarning() << "TranscriptSettings: Ignoring negative pricing for" << model;
            continue;
        }
        table.setPricing(model, pricing);
    }
    return table;
}

void TranscriptSettings::setModelPricing(const QString &modelId, const ModelPricing &pricing)
{
    KConfigGroup pricingGroup(m_config, QStringLiteral("Pricing"));
    KConfigGroup group = pricingGroup.group(modelId);
    group.writeEntry("Input", pricing.input);
    group.writeEntry("Output", pricing.output);
    group.writeEntry("CacheWrite", pricing.cacheWrite);
    group.writeEntry("CacheRead", pricing.cacheRead);
    Q_EMIT settingsChanged();
}

void TranscriptSettings::removeModelPricing(const QString &modelId)
{
    KConfigGroup pricingGroup(m_config, QStringLiteral("Pricing"));
    KConfigGroup group = pricingGroup.group(modelId);
    group.deleteGroup();
    Q_EMIT settingsChanged();
}

ParserOptions TranscriptSettings::parserOptions() const
{
    ParserOptions options;
    options.pageSize = sessionPageSize();
    options.summaryMaxLength = summaryMaxLength();
    options.agentIdRecovery = heuristicAgentIdRecovery() ? AgentIdRecovery::Mode::BestEffort : AgentIdRecovery::Mode::StructuredOnly;
    return options;
}

ParserOptions TranscriptSettings::agentParserOptions() const
{
    ParserOptions options = parserOptions();
    options.pageSize = agentPageSize();
    return options;
}

void TranscriptSettings::save()
{
    m_config->sync();
}

} // namespace TranscriptLens

#include "moc_TranscriptSettings.cpp"
