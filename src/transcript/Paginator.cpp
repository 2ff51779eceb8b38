/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Paginator.h"

namespace TranscriptLens
{

int Paginator::pageCount(int messageCount, int pageSize)
{
    const int perPage = qMax(1, pageSize);
    // Must not overflow for page sizes near INT_MAX
    return qMax(1, messageCount / perPage + (messageCount % perPage != 0 ? 1 : 0));
}

PaginatedMessages Paginator::paginate(const QVector<Message> &messages, int page, int pageSize)
{
    const int perPage = qMax(1, pageSize);
    const int total = messages.size();

    PaginatedMessages result;
    result.totalMessages = total;
    result.totalPages = pageCount(total, perPage);
    result.currentPage = qBound(1, page, result.totalPages);
    result.hasMore = result.currentPage < result.totalPages;

    // Index into the reversed list without copying it
    const int start = (result.currentPage - 1) * perPage;
    const int end = start + qMin(perPage, total - start);
    result.messages.reserve(qMax(0, end - start));
    for (int i = start; i < end; ++i) {
        result.messages.append(messages.at(total - 1 - i));
    }
    return result;
}

} // namespace TranscriptLens
