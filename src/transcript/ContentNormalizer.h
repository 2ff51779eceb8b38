/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONTENTNORMALIZER_H
#define CONTENTNORMALIZER_H

#include "transcriptlens_export.h"

#include "TranscriptTypes.h"

#include <QJsonValue>
#include <QVector>

namespace TranscriptLens
{

/**
 * Maps the content field of a message record onto canonical blocks.
 *
 * A plain string becomes a single text block. Array elements are mapped by
 * their "type" tag; an element with an unknown tag is kept as a text block
 * holding its compact JSON, so newer block kinds stay visible.
 */
class TRANSCRIPTLENS_EXPORT ContentNormalizer
{
public:
    static QVector<ContentBlock> normalize(const QJsonValue &content);

    static ContentBlock normalizeBlock(const QJsonValue &rawBlock);

private:
    ContentNormalizer() = default;
};

} // namespace TranscriptLens

#endif // CONTENTNORMALIZER_H
