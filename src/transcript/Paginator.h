/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PAGINATOR_H
#define PAGINATOR_H

#include "transcriptlens_export.h"

#include "TranscriptTypes.h"

namespace TranscriptLens
{

/**
 * Slices a chronological message list into newest-first pages.
 *
 * There is always at least one page, and the requested page is clamped into
 * [1, totalPages]. A page size below 1 is treated as 1.
 */
class TRANSCRIPTLENS_EXPORT Paginator
{
public:
    static PaginatedMessages paginate(const QVector<Message> &messages, int page, int pageSize);

    static int pageCount(int messageCount, int pageSize);

private:
    Paginator() = default;
};

} // namespace TranscriptLens

#endif // PAGINATOR_H
