/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "PaginatorTest.h"

// Qt
#include <QJsonArray>
#include <QJsonObject>
#include <QTest>

#include <climits>

// TranscriptLens
#include "../transcript/Paginator.h"

using namespace TranscriptLens;

namespace
{
// Messages m0..m(n-1) in file order
QVector<Message> numberedMessages(int count)
{
    QVector<Message> messages;
    for (int i = 0; i < count; ++i) {
        Message message;
        message.uuid = QStringLiteral("m%1").arg(i);
        messages.append(message);
    }
    return messages;
}
}

void PaginatorTest::testPageCount_data()
{
    QTest::addColumn<int>("messageCount");
    QTest::addColumn<int>("pageSize");
    QTest::addColumn<int>("expected");

    QTest::newRow("empty") << 0 << 20 << 1;
    QTest::newRow("one") << 1 << 20 << 1;
    QTest::newRow("exact") << 40 << 20 << 2;
    QTest::newRow("partial") << 47 << 20 << 3;
    QTest::newRow("agent view") << 12 << 5 << 3;
    QTest::newRow("huge page size") << 47 << INT_MAX << 1;
    QTest::newRow("huge count") << INT_MAX << INT_MAX - 1 << 2;
}

void PaginatorTest::testPageCount()
{
    QFETCH(int, messageCount);
    QFETCH(int, pageSize);
    QFETCH(int, expected);

    QCOMPARE(Paginator::pageCount(messageCount, pageSize), expected);
}

void PaginatorTest::testNewestFirstPages()
{
    const QVector<Message> messages = numberedMessages(47);

    const PaginatedMessages first = Paginator::paginate(messages, 1, 20);
    QCOMPARE(first.totalPages, 3);
    QCOMPARE(first.currentPage, 1);
    QCOMPARE(first.totalMessages, 47);
    QVERIFY(first.hasMore);
    QCOMPARE(first.messages.size(), 20);
    QCOMPARE(first.messages.first().uuid, QStringLiteral("m46"));
    QCOMPARE(first.messages.last().uuid, QStringLiteral("m27"));

    const PaginatedMessages second = Paginator::paginate(messages, 2, 20);
    QCOMPARE(second.messages.size(), 20);
    QCOMPARE(second.messages.first().uuid, QStringLiteral("m26"));
    QVERIFY(second.hasMore);
}

void PaginatorTest::testLastPagePartial()
{
    const PaginatedMessages last = Paginator::paginate(numberedMessages(47), 3, 20);

    QCOMPARE(last.messages.size(), 7);
    QCOMPARE(last.messages.first().uuid, QStringLiteral("m6"));
    QCOMPARE(last.messages.last().uuid, QStringLiteral("m0"));
    QVERIFY(!last.hasMore);
}

void PaginatorTest::testPageClamped_data()
{
    QTest::addColumn<int>("requested");
    QTest::addColumn<int>("expected");

    QTest::newRow("zero") << 0 << 1;
    QTest::newRow("negative") << -4 << 1;
    QTest::newRow("past end") << 99 << 3;
}

void PaginatorTest::testPageClamped()
{
    QFETCH(int, requested);
    QFETCH(int, expected);

    const PaginatedMessages page = Paginator::paginate(numberedMessages(47), requested, 20);
    QCOMPARE(page.currentPage, expected);
    QVERIFY(!page.messages.isEmpty());
}

void PaginatorTest::testEmptyList()
{
    const PaginatedMessages page = Paginator::paginate(QVector<Message>(), 5, 20);

    QCOMPARE(page.totalPages, 1);
    QCOMPARE(page.currentPage, 1);
    QCOMPARE(page.totalMessages, 0);
    QVERIFY(!page.hasMore);
    QVERIFY(page.messages.isEmpty());
}

void PaginatorTest::testNonPositivePageSize()
{
    const PaginatedMessages page = Paginator::paginate(numberedMessages(3), 2, 0);

    // Treated as one message per page
    QCOMPARE(page.totalPages, 3);
    QCOMPARE(page.messages.size(), 1);
    QCOMPARE(page.messages.first().uuid, QStringLiteral("m1"));
}

void PaginatorTest::testHugePageSize()
{
    const PaginatedMessages page = Paginator::paginate(numberedMessages(47), 1, INT_MAX);

    QCOMPARE(page.totalPages, 1);
    QCOMPARE(page.messages.size(), 47);
    QCOMPARE(page.messages.first().uuid, QStringLiteral("m46"));
    QVERIFY(!page.hasMore);
}

void PaginatorTest::testPageJson()
{
    const QJsonObject json = Paginator::paginate(numberedMessages(6), 2, 5).toJson();

    QCOMPARE(json.value(QStringLiteral("totalPages")).toInt(), 2);
    QCOMPARE(json.value(QStringLiteral("currentPage")).toInt(), 2);
    QCOMPARE(json.value(QStringLiteral("totalMessages")).toInt(), 6);
    QCOMPARE(json.value(QStringLiteral("hasMore")).toBool(), false);
    QCOMPARE(json.value(QStringLiteral("messages")).toArray().size(), 1);
}

QTEST_GUILESS_MAIN(PaginatorTest)

#include "moc_PaginatorTest.cpp"
