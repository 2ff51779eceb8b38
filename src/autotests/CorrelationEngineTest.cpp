/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "CorrelationEngineTest.h"

// Qt
#include <QJsonArray>
#include <QJsonObject>
#include <QTest>

// TranscriptLens
#include "../transcript/AgentIdRecovery.h"
#include "../transcript/CorrelationEngine.h"
#include "../transcript/CorrelationFields.h"
#include "../transcript/LineDecoder.h"
#include "../transcript/PricingTable.h"
#include "../transcript/TranscriptParser.h"

using namespace TranscriptLens;

namespace
{
const QByteArray TaskUse = R"({"type":"assistant","uuid":"a1","timestamp":"2025-01-15T10:00:01.000Z","message":{"role":"assistant",)"
                           R"("content":[{"type":"text","text":"Delegating"},{"type":"tool_use","id":"t1","name":"Task","input":{"prompt":"Find usages"}}]}})";

ParsedSession parseLines(const QList<QByteArray> &lines, AgentIdRecovery::Mode mode = AgentIdRecovery::Mode::BestEffort)
{
    const PricingTable pricing = PricingTable::builtin();
    ParserOptions options;
    options.agentIdRecovery = mode;
    const TranscriptParser parser(pricing, options);
    QByteArray text;
    for (const QByteArray &line : lines) {
        text += line + '\n';
    }
    return parser.parse(text);
}

const ContentBlock &taskBlock(const ParsedSession &session)
{
    return session.messages.at(0).blocks.at(1);
}
}

void CorrelationEngineTest::testResultAttached()
{
    const ParsedSession session =
        parseLines({TaskUse, R"({"type":"user","uuid":"u2","message":{"role":"user","content":[{"type":"tool_result","tool_use_id":"t1","content":"done"}]}})"});

    QCOMPARE(session.messages.size(), 2);
    const ContentBlock &block = taskBlock(session);
    QVERIFY(block.hasResult());
    QCOMPARE(block.result.toString(), QStringLiteral("done"));
    // The tool_result block itself is left as it was
    QCOMPARE(session.messages.at(1).blocks.at(0).type, ContentBlock::ToolResult);
}

void CorrelationEngineTest::testMissingResultReference()
{
    const ParsedSession session =
        parseLines({TaskUse, R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t_missing","content":"orphan"}]}})"});

    QCOMPARE(session.messages.size(), 2);
    QVERIFY(!taskBlock(session).hasResult());
    QCOMPARE(session.messages.at(1).blocks.at(0).toolUseId, QStringLiteral("t_missing"));
}

void CorrelationEngineTest::testLastResultWins()
{
    const ParsedSession session = parseLines({TaskUse,
                                              R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"first"}]}})",
                                              R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"second"}]}})"});

    QCOMPARE(taskBlock(session).result.toString(), QStringLiteral("second"));
}

void CorrelationEngineTest::testParentIdSpellings_data()
{
    QTest::addColumn<QByteArray>("progressLine");

    QTest::newRow("record parentToolUseID") << QByteArray(R"({"type":"progress","uuid":"p1","parentToolUseID":"t1","data":{"type":"agent_progress"}})");
    QTest::newRow("data parentToolUseID") << QByteArray(R"({"type":"progress","uuid":"p1","data":{"type":"agent_progress","parentToolUseID":"t1"}})");
    QTest::newRow("data toolUseId") << QByteArray(R"({"type":"progress","uuid":"p1","data":{"type":"agent_progress","toolUseId":"t1"}})");
}

void CorrelationEngineTest::testParentIdSpellings()
{
    QFETCH(QByteArray, progressLine);

    const ParsedSession session = parseLines({TaskUse, progressLine});

    // Linked progress is not repeated as its own message
    QCOMPARE(session.messages.size(), 1);
    const ContentBlock &block = taskBlock(session);
    QCOMPARE(block.progress.size(), 1);
    QCOMPARE(block.progress.at(0).uuid, QStringLiteral("p1"));
    QCOMPARE(block.progress.at(0).parentToolUseId, QStringLiteral("t1"));
}

void CorrelationEngineTest::testProgressOrderPreserved()
{
    const ParsedSession session = parseLines({TaskUse,
                                              R"({"type":"progress","uuid":"p1","parentToolUseID":"t1","data":{"prompt":"step one"}})",
                                              R"({"type":"progress","uuid":"p2","parentToolUseID":"t1","data":{"prompt":"step two"}})",
                                              R"({"type":"progress","uuid":"p3","parentToolUseID":"t1","data":{"prompt":"step three"}})"});

    const ContentBlock &block = taskBlock(session);
    QCOMPARE(block.progress.size(), 3);
    QCOMPARE(block.progress.at(0).prompt, QStringLiteral("step one"));
    QCOMPARE(block.progress.at(2).prompt, QStringLiteral("step three"));
    QCOMPARE(block.progress.at(1).toJson().value(QStringLiteral("prompt")).toString(), QStringLiteral("step two"));
}

void CorrelationEngineTest::testProgressPayloadOverridesFields()
{
    AgentProgress progress;
    progress.uuid = QStringLiteral("p1");
    progress.type = QStringLiteral("progress");
    progress.prompt = QStringLiteral("named prompt");
    progress.agentId = QStringLiteral("a1b2");
    progress.parentToolUseId = QStringLiteral("t1");
    progress.data = QJsonObject{{QStringLiteral("prompt"), QStringLiteral("payload prompt")},
                                {QStringLiteral("type"), QStringLiteral("agent_progress")},
                                {QStringLiteral("step"), 3}};

    const QJsonObject json = progress.toJson();
    QCOMPARE(json.value(QStringLiteral("prompt")).toString(), QStringLiteral("payload prompt"));
    QCOMPARE(json.value(QStringLiteral("type")).toString(), QStringLiteral("agent_progress"));
    QCOMPARE(json.value(QStringLiteral("step")).toInt(), 3);
    QCOMPARE(json.value(QStringLiteral("uuid")).toString(), QStringLiteral("p1"));
    QCOMPARE(json.value(QStringLiteral("agentId")).toString(), QStringLiteral("a1b2"));
    QCOMPARE(json.value(QStringLiteral("parentToolUseID")).toString(), QStringLiteral("t1"));
}

void CorrelationEngineTest::testProgressWithoutParent()
{
    const ParsedSession session = parseLines(
        {TaskUse, R"({"type":"progress","uuid":"p9","timestamp":"2025-01-15T10:00:02.000Z","data":{"type":"agent_progress","prompt":"loose","agentId":"abc"}})"});

    QCOMPARE(session.messages.size(), 2);
    const Message &standalone = session.messages.at(1);
    QCOMPARE(standalone.kind, Message::Progress);
    QCOMPARE(standalone.uuid, QStringLiteral("p9"));
    QCOMPARE(standalone.blocks.at(0).type, ContentBlock::Progress);
    QCOMPARE(standalone.blocks.at(0).text, QStringLiteral("loose"));
    QCOMPARE(standalone.blocks.at(0).agentId, QStringLiteral("abc"));
    QVERIFY(taskBlock(session).progress.isEmpty());
}

void CorrelationEngineTest::testProgressUnknownParent()
{
    const ParsedSession session = parseLines({R"({"type":"progress","uuid":"p1","parentToolUseID":"t_gone","data":{"prompt":"early"}})", TaskUse});

    // Standalone messages keep their file position
    QCOMPARE(session.messages.size(), 2);
    QCOMPARE(session.messages.at(0).kind, Message::Progress);
    QCOMPARE(session.messages.at(1).kind, Message::Assistant);
    // Progress never counts toward session stats
    QCOMPARE(session.stats.messageCount, 1);
}

void CorrelationEngineTest::testHookNotLinked()
{
    const ParsedSession session = parseLines(
        {TaskUse,
         R"({"type":"progress","uuid":"h1","parentToolUseID":"t1","data":{"type":"hook_progress","hookEvent":"PostToolUse","hookName":"lint","command":"make lint"}})"});

    QCOMPARE(session.messages.size(), 2);
    QVERIFY(taskBlock(session).progress.isEmpty());
    const Message &hook = session.messages.at(1);
    QCOMPARE(hook.kind, Message::Hook);
    QCOMPARE(hook.blocks.at(0).hookEvent, QStringLiteral("PostToolUse"));
    QCOMPARE(hook.blocks.at(0).hookName, QStringLiteral("lint"));
    QCOMPARE(hook.blocks.at(0).command, QStringLiteral("make lint"));
}

void CorrelationEngineTest::testAgentIdFromProgress()
{
    const ParsedSession session = parseLines({TaskUse, R"({"type":"progress","parentToolUseID":"t1","data":{"agentId":"abc123"}})"});

    QCOMPARE(taskBlock(session).agentId, QStringLiteral("agent-abc123"));
    // Progress entries keep the id as written
    QCOMPARE(taskBlock(session).progress.at(0).agentId, QStringLiteral("abc123"));
}

void CorrelationEngineTest::testStructuredResultIdWins()
{
    const ParsedSession session =
        parseLines({TaskUse,
                    R"({"type":"progress","parentToolUseID":"t1","data":{"agentId":"111aaa"}})",
                    R"({"type":"user","toolUseResult":{"agentId":"222bbb"},"message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"agentId: 333ccc"}]}})"});

    QCOMPARE(taskBlock(session).agentId, QStringLiteral("agent-222bbb"));
}

void CorrelationEngineTest::testTaskInputAgentId()
{
    const QByteArray use = R"({"type":"assistant","message":{"content":[{"type":"text","text":""},{"type":"tool_use","id":"t1","name":"Task","input":{"agentId":"feed01"}}]}})";

    const ParsedSession session = parseLines({use, R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"agent-beef02 finished"}]}})"});

    // Text recovery only fills a missing id
    QCOMPARE(taskBlock(session).agentId, QStringLiteral("agent-feed01"));
}

void CorrelationEngineTest::testAgentIdRecoveredFromText()
{
    const ParsedSession session = parseLines(
        {TaskUse, R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":[{"type":"text","text":"Done.\nagentId: a1b2c3"}]}]}})"});

    QCOMPARE(taskBlock(session).agentId, QStringLiteral("agent-a1b2c3"));
}

void CorrelationEngineTest::testStructuredOnlyMode()
{
    const ParsedSession session =
        parseLines({TaskUse, R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"agentId: a1b2c3"}]}})"},
                   AgentIdRecovery::Mode::StructuredOnly);

    QVERIFY(taskBlock(session).hasResult());
    QVERIFY(taskBlock(session).agentId.isEmpty());
}

void CorrelationEngineTest::testRecoveryPatterns_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<QString>("expected");

    QTest::newRow("prefixed") << QStringLiteral("spawned agent-9f8e7d") << QStringLiteral("agent-9f8e7d");
    QTest::newRow("labelled") << QStringLiteral("Agent ID: 0a1b") << QStringLiteral("agent-0a1b");
    QTest::newRow("field") << QStringLiteral("{\"agentId\": 12cd}") << QString();
    QTest::newRow("field plain") << QStringLiteral("agentId 12cd") << QStringLiteral("agent-12cd");
    QTest::newRow("case insensitive") << QStringLiteral("AGENT-ABCD") << QStringLiteral("agent-ABCD");
    QTest::newRow("none") << QStringLiteral("No agent here") << QString();
}

void CorrelationEngineTest::testRecoveryPatterns()
{
    QFETCH(QString, text);
    QFETCH(QString, expected);

    QCOMPARE(AgentIdRecovery::fromText(text), expected);
}

void CorrelationEngineTest::testNormalizeAgentId()
{
    QCOMPARE(CorrelationFields::normalizeAgentId(QStringLiteral("abc")), QStringLiteral("agent-abc"));
    QCOMPARE(CorrelationFields::normalizeAgentId(QStringLiteral("agent-abc")), QStringLiteral("agent-abc"));
    QVERIFY(CorrelationFields::normalizeAgentId(QString()).isEmpty());
}

void CorrelationEngineTest::testEngineDirect()
{
    CorrelationEngine engine;

    ContentBlock use;
    use.type = ContentBlock::ToolUse;
    use.id = QStringLiteral("t7");
    use.name = QStringLiteral("Bash");
    engine.registerToolUse(use, 0, 0);

    QVERIFY(engine.contains(QStringLiteral("t7")));
    QCOMPARE(engine.toolUseCount(), 1);

    ContentBlock result;
    result.type = ContentBlock::ToolResult;
    result.toolUseId = QStringLiteral("t7");
    QVERIFY(engine.attachResult(result, RawEntry()));

    result.toolUseId = QStringLiteral("t8");
    QVERIFY(!engine.attachResult(result, RawEntry()));

    Message message;
    message.blocks.append(use);
    QVector<Message> messages{message};
    engine.applyTo(messages);

    // A result without content still counts as present, as null
    QVERIFY(messages.at(0).blocks.at(0).hasResult());
    QVERIFY(messages.at(0).blocks.at(0).result.isNull());
}

void CorrelationEngineTest::testApplyOutOfRange()
{
    CorrelationEngine engine;

    ContentBlock use;
    use.type = ContentBlock::ToolUse;
    use.id = QStringLiteral("t1");
    engine.registerToolUse(use, 3, 1);

    QVector<Message> messages(1);
    engine.applyTo(messages);
    QVERIFY(messages.at(0).blocks.isEmpty());
}

QTEST_GUILESS_MAIN(CorrelationEngineTest)

#include "moc_CorrelationEngineTest.cpp"
