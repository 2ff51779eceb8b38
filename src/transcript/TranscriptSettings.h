/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPT_SETTINGS_H
#define TRANSCRIPT_SETTINGS_H

#include "transcriptlens_export.h"

#include "PricingTable.h"
#include "TranscriptParser.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace TranscriptLens
{

/**
 * TranscriptSettings manages application-wide settings.
 *
 * Settings include:
 * - Page sizes for the session view and the embedded sub-agent view
 * - Summary length
 * - Whether sub-agent ids may be recovered from tool result text
 * - Per-model pricing overrides, one [Pricing][<model id>] group each
 * - Worker thread limit for project aggregation
 */
class TRANSCRIPTLENS_EXPORT TranscriptSettings : public QObject
{
    Q_OBJECT

public:
    static TranscriptSettings *instance();

    /**
     * @param configName file name under the config location, or an absolute path
     */
    explicit TranscriptSettings(const QString &configName = QStringLiteral("transcriptlensrc"), QObject *parent = nullptr);
    ~TranscriptSettings() override;

    /**
     * Messages per page in the session view (default: 20)
     */
    int sessionPageSize() const;
    void setSessionPageSize(int size);

    /**
     * Messages per page in the sub-agent view (default: 5)
     */
    int agentPageSize() const;
    void setAgentPageSize(int size);

    /**
     * Maximum length of a generated summary (default: 100)
     */
    int summaryMaxLength() const;
    void setSummaryMaxLength(int length);

    bool heuristicAgentIdRecovery() const;
    void setHeuristicAgentIdRecovery(bool enabled);

    /**
     * Worker threads used to parse a project's sessions (default: 4)
     */
    int maxThreads() const;
    void setMaxThreads(int threads);

    /**
     * Built-in prices with the configured overrides applied
     */
    PricingTable pricingTable() const;
    void setModelPricing(const QString &modelId, const ModelPricing &pricing);
    void removeModelPricing(const QString &modelId);

    ParserOptions parserOptions() const;
    ParserOptions agentParserOptions() const;

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static TranscriptSettings *s_instance;

    KSharedConfig::Ptr m_config;
};

} // namespace TranscriptLens

#endif // TRANSCRIPT_SETTINGS_H
