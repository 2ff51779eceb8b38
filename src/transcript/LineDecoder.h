/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LINEDECODER_H
#define LINEDECODER_H

#include "transcriptlens_export.h"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>

namespace TranscriptLens
{

/**
 * Token counters as written in a record's message.usage
 */
struct TRANSCRIPTLENS_EXPORT RawUsage {
    quint64 inputTokens = 0;
    quint64 outputTokens = 0;
    quint64 cacheCreationTokens = 0;
    quint64 cacheReadTokens = 0;
};

/**
 * One decoded transcript line.
 *
 * User/Assistant entries carry the nested message fields, Progress and Hook
 * entries carry the data payload, Summary entries carry only the summary text.
 * The whole record is kept in `record` so the correlation-field adapter can
 * look at whichever spelling a given CLI version wrote.
 */
struct TRANSCRIPTLENS_EXPORT RawEntry {
    enum Kind {
        User,
        Assistant,
        Summary,
        Progress,
        Hook
    };
    Kind kind = User;

    QString uuid;
    QString timestamp;

    // User, Assistant
    QString role;
    QJsonValue content;
    QString model;
    bool hasUsage = false;
    RawUsage usage;
    bool hasInlineCost = false;
    double inlineCostUsd = 0.0;

    // Summary
    QString summary;

    // Progress, Hook
    QJsonObject data;

    QJsonObject record;
};

/**
 * LineDecoder splits raw transcript text into records.
 *
 * Lines that are blank, not JSON objects, of an unknown type, or missing the
 * fields their type requires are skipped. Nothing is reported to the caller;
 * a transcript may have been truncated mid-write or edited by hand.
 */
class TRANSCRIPTLENS_EXPORT LineDecoder
{
public:
    static QVector<RawEntry> decode(const QByteArray &text);

    /**
     * Decode a single line.
     *
     * @return false if the line should be skipped
     */
    static bool decodeLine(const QByteArray &line, RawEntry &entry);

private:
    LineDecoder() = default;
};

} // namespace TranscriptLens

#endif // LINEDECODER_H
