/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "StreamAssemblerTest.h"

// Qt
#include <QJsonArray>
#include <QJsonDocument>
#include <QSignalSpy>
#include <QTest>

// CodingBridge
#include "../bridge/StreamAssembler.h"

using namespace CodingBridge;

namespace
{
QString frameText(const QJsonObject &frame)
{
    return QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact));
}

QString responseFrame(const QJsonObject &data)
{
    return frameText(QJsonObject{{QStringLiteral("type"), QStringLiteral("claude-response")}, {QStringLiteral("data"), data}});
}

QString assistantFrame(const QJsonArray &blocks)
{
    const QJsonObject message{{QStringLiteral("role"), QStringLiteral("assistant")}, {QStringLiteral("content"), blocks}};
    return responseFrame(QJsonObject{{QStringLiteral("type"), QStringLiteral("assistant")}, {QStringLiteral("message"), message}});
}

QJsonObject textBlock(const QString &text)
{
    return QJsonObject{{QStringLiteral("type"), QStringLiteral("text")}, {QStringLiteral("text"), text}};
}

QJsonObject toolBlock(const QString &name, const QJsonObject &input)
{
    return QJsonObject{{QStringLiteral("type"), QStringLiteral("tool_use")},
                       {QStringLiteral("id"), QStringLiteral("toolu_01")},
                       {QStringLiteral("name"), name},
                       {QStringLiteral("input"), input}};
}

// Synchronous assembler bound to generation 1
void prepare(StreamAssembler &assembler)
{
    assembler.setSynchronousDecoding(true);
    assembler.setCurrentGeneration(1);
}
}

void StreamAssemblerTest::testSessionCreated()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy spy(&assembler, &StreamAssembler::sessionCreated);

    assembler.submitFrame(QStringLiteral(R"({"type":"session-created","sessionId":"3f2b8c1a-5d4e-4f6a-9b7c-0123456789ab"})"), 1);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QStringLiteral("3f2b8c1a-5d4e-4f6a-9b7c-0123456789ab"));
}

void StreamAssemblerTest::testTokenBudget()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy spy(&assembler, &StreamAssembler::tokenBudget);

    assembler.submitFrame(QStringLiteral(R"({"type":"token-budget","data":{"used":42,"total":100}})"), 1);
    // A budget without a total carries no information
    assembler.submitFrame(QStringLiteral(R"({"type":"token-budget","data":{"used":7}})"), 1);

    QCOMPARE(spy.count(), 1);
    const TokenUsage usage = spy.at(0).at(0).value<TokenUsage>();
    QCOMPARE(usage.used, 42);
    QCOMPARE(usage.total, 100);
}

void StreamAssemblerTest::testSystemInit()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy spy(&assembler, &StreamAssembler::systemInit);

    assembler.submitFrame(responseFrame(QJsonObject{{QStringLiteral("type"), QStringLiteral("system")},
                                                    {QStringLiteral("subtype"), QStringLiteral("init")},
                                                    {QStringLiteral("session_id"), QStringLiteral("abc")},
                                                    {QStringLiteral("model"), QStringLiteral("claude-opus-4-1")}}),
                          1);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QStringLiteral("abc"));
    QCOMPARE(spy.at(0).at(1).toString(), QStringLiteral("claude-opus-4-1"));
}

void StreamAssemblerTest::testMalformedFrame()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy failedSpy(&assembler, &StreamAssembler::decodeFailed);
    QSignalSpy createdSpy(&assembler, &StreamAssembler::sessionCreated);

    assembler.submitFrame(QStringLiteral("{oops"), 1);
    assembler.submitFrame(QStringLiteral(R"({"type":"session-created","sessionId":"s1"})"), 1);

    // A bad frame is dropped and decoding carries on
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(assembler.malformedFrameCount(), 1);
    QCOMPARE(createdSpy.count(), 1);
}

void StreamAssemblerTest::testPermissionRequest()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy spy(&assembler, &StreamAssembler::permissionRequested);

    assembler.submitFrame(QStringLiteral(R"({"type":"permission-request","data":{"requestId":"r1","toolName":"Bash","input":{"command":"ls -la"}}})"), 1);
    assembler.submitFrame(QStringLiteral(R"({"type":"permission-request","data":{"toolName":"Bash"}})"), 1);

    QCOMPARE(spy.count(), 1);
    const ApprovalRequest request = spy.at(0).at(0).value<ApprovalRequest>();
    QCOMPARE(request.requestId, QStringLiteral("r1"));
    QCOMPARE(request.displayDescription(), QStringLiteral("ls -la"));
}

void StreamAssemblerTest::testSessionsUpdated()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy sessionsSpy(&assembler, &StreamAssembler::sessionsUpdated);
    QSignalSpy projectsSpy(&assembler, &StreamAssembler::projectsUpdated);

    assembler.submitFrame(QStringLiteral(R"({"type":"sessions-updated","data":{"projectName":"demo","sessionId":"s1","action":"created"}})"), 1);
    assembler.submitFrame(QStringLiteral(R"({"type":"projects_updated"})"), 1);
    assembler.submitFrame(QStringLiteral(R"({"type":"brand-new-frame"})"), 1);

    QCOMPARE(sessionsSpy.count(), 1);
    QCOMPARE(sessionsSpy.at(0).at(0).toString(), QStringLiteral("demo"));
    QCOMPARE(sessionsSpy.at(0).at(2).toString(), QStringLiteral("created"));
    QCOMPARE(projectsSpy.count(), 1);
    QCOMPARE(assembler.malformedFrameCount(), 0);
}

void StreamAssemblerTest::testTextCommittedBeforeTool()
{
    StreamAssembler assembler;
    prepare(assembler);

    QStringList events;
    connect(&assembler, &StreamAssembler::textCommitted, this, [&events](const QString &text) {
        events << QStringLiteral("commit:") + text;
    });
    connect(&assembler, &StreamAssembler::toolUse, this, [&events](const QString &name, const QString &summary) {
        events << QStringLiteral("tool:") + name + QLatin1Char('|') + summary;
    });

    QJsonArray blocks;
    blocks << textBlock(QStringLiteral("Let me look."));
    blocks << toolBlock(QStringLiteral("Bash"), QJsonObject{{QStringLiteral("command"), QStringLiteral("ls")}});
    assembler.submitFrame(assistantFrame(blocks), 1);

    QCOMPARE(events, (QStringList{QStringLiteral("commit:Let me look."), QStringLiteral("tool:Bash|command: ls")}));
    QCOMPARE(assembler.lastToolName(), QStringLiteral("Bash"));

    // The next segment starts empty
    QVERIFY(assembler.currentText().isEmpty());
    QVERIFY(assembler.bufferedText().isEmpty());
}

void StreamAssemblerTest::testStringContent()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy deltaSpy(&assembler, &StreamAssembler::textDelta);
    QSignalSpy contentSpy(&assembler, &StreamAssembler::contentReceived);

    assembler.submitFrame(responseFrame(QJsonObject{{QStringLiteral("content"), QStringLiteral("plain")}}), 1);

    QCOMPARE(contentSpy.count(), 1);
    QCOMPARE(deltaSpy.count(), 1);
    QCOMPARE(assembler.bufferedText(), QStringLiteral("plain"));
}

void StreamAssemblerTest::testThinkingAndToolResult()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy thinkingSpy(&assembler, &StreamAssembler::thinking);
    QSignalSpy resultSpy(&assembler, &StreamAssembler::toolResult);

    QJsonArray blocks;
    blocks << QJsonObject{{QStringLiteral("type"), QStringLiteral("thinking")}, {QStringLiteral("thinking"), QStringLiteral("hmm")}};
    assembler.submitFrame(assistantFrame(blocks), 1);

    const QJsonArray resultContent{QJsonObject{{QStringLiteral("type"), QStringLiteral("text")}, {QStringLiteral("text"), QStringLiteral("a")}},
                                   QJsonObject{{QStringLiteral("type"), QStringLiteral("text")}, {QStringLiteral("text"), QStringLiteral("b")}}};
    const QJsonArray userBlocks{QJsonObject{{QStringLiteral("type"), QStringLiteral("tool_result")}, {QStringLiteral("content"), resultContent}}};
    const QJsonObject userMessage{{QStringLiteral("role"), QStringLiteral("user")}, {QStringLiteral("content"), userBlocks}};
    assembler.submitFrame(responseFrame(QJsonObject{{QStringLiteral("type"), QStringLiteral("user")}, {QStringLiteral("message"), userMessage}}), 1);

    QCOMPARE(thinkingSpy.count(), 1);
    QCOMPARE(thinkingSpy.at(0).at(0).toString(), QStringLiteral("hmm"));
    QCOMPARE(resultSpy.count(), 1);
    QCOMPARE(resultSpy.at(0).at(0).toString(), QStringLiteral("a\nb"));
}

void StreamAssemblerTest::testQuestionTool()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy questionSpy(&assembler, &StreamAssembler::questionAsked);
    QSignalSpy toolSpy(&assembler, &StreamAssembler::toolUse);

    const QJsonArray options{QJsonObject{{QStringLiteral("label"), QStringLiteral("Yes")}}, QJsonObject{{QStringLiteral("label"), QStringLiteral("No")}}};
    const QJsonArray questions{QJsonObject{{QStringLiteral("question"), QStringLiteral("Proceed?")}, {QStringLiteral("options"), options}}};
    assembler.submitFrame(assistantFrame(QJsonArray{toolBlock(StreamAssembler::questionToolName(), QJsonObject{{QStringLiteral("questions"), questions}})}), 1);

    QCOMPARE(questionSpy.count(), 1);
    QCOMPARE(toolSpy.count(), 0);

    const AskUserQuestionData data = questionSpy.at(0).at(0).value<AskUserQuestionData>();
    QCOMPARE(data.toolUseId, QStringLiteral("toolu_01"));
    QCOMPARE(data.questions.first().options.size(), 2);

    // Without usable questions it is reported as an ordinary tool call
    assembler.submitFrame(assistantFrame(QJsonArray{toolBlock(StreamAssembler::questionToolName(), QJsonObject())}), 1);
    QCOMPARE(questionSpy.count(), 1);
    QCOMPARE(toolSpy.count(), 1);
}

void StreamAssemblerTest::testDebouncedFlush()
{
    StreamAssembler assembler;
    prepare(assembler);
    assembler.setFlushIntervalMs(20);
    QSignalSpy updatedSpy(&assembler, &StreamAssembler::textUpdated);

    assembler.submitFrame(assistantFrame(QJsonArray{textBlock(QStringLiteral("Hel"))}), 1);
    assembler.submitFrame(assistantFrame(QJsonArray{textBlock(QStringLiteral("lo"))}), 1);

    // Nothing is published until the stream goes quiet
    QCOMPARE(updatedSpy.count(), 0);
    QCOMPARE(assembler.bufferedText(), QStringLiteral("Hello"));
    QVERIFY(assembler.currentText().isEmpty());

    QTRY_COMPARE(updatedSpy.count(), 1);
    QCOMPARE(updatedSpy.at(0).at(0).toString(), QStringLiteral("Hello"));
    QCOMPARE(assembler.currentText(), QStringLiteral("Hello"));
}

void StreamAssemblerTest::testCompleteFlushesBuffer()
{
    StreamAssembler assembler;
    prepare(assembler);
    assembler.setFlushIntervalMs(10000);
    QSignalSpy completedSpy(&assembler, &StreamAssembler::turnCompleted);

    assembler.submitFrame(assistantFrame(QJsonArray{textBlock(QStringLiteral("Done."))}), 1);
    assembler.submitFrame(QStringLiteral(R"({"type":"claude-complete","sessionId":"s1","exitCode":0})"), 1);

    QCOMPARE(completedSpy.count(), 1);
    QCOMPARE(completedSpy.at(0).at(0).toString(), QStringLiteral("s1"));
    QCOMPARE(completedSpy.at(0).at(1).toString(), QStringLiteral("Done."));
}

void StreamAssemblerTest::testErrorWithoutMessage()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy errorSpy(&assembler, &StreamAssembler::errorFrame);

    assembler.submitFrame(QStringLiteral(R"({"type":"claude-error","code":"SESSION_EXPIRED"})"), 1);

    QCOMPARE(errorSpy.count(), 1);
    QCOMPARE(errorSpy.at(0).at(0).toString(), QStringLiteral("Unknown error"));
    QCOMPARE(errorSpy.at(0).at(1).toString(), QStringLiteral("SESSION_EXPIRED"));
}

void StreamAssemblerTest::testReset()
{
    StreamAssembler assembler;
    prepare(assembler);
    QSignalSpy updatedSpy(&assembler, &StreamAssembler::textUpdated);

    assembler.submitFrame(assistantFrame(QJsonArray{textBlock(QStringLiteral("partial"))}), 1);
    assembler.reset();

    QVERIFY(assembler.bufferedText().isEmpty());
    QVERIFY(assembler.currentText().isEmpty());

    // The pending flush was cancelled too
    QTest::qWait(2 * StreamAssembler::DefaultFlushIntervalMs);
    QCOMPARE(updatedSpy.count(), 0);
}

void StreamAssemblerTest::testAsyncDecodingKeepsOrder()
{
    StreamAssembler assembler;
    assembler.setCurrentGeneration(1);
    QVERIFY(!assembler.synchronousDecoding());

    QStringList deltas;
    connect(&assembler, &StreamAssembler::textDelta, this, [&deltas](const QString &text) {
        deltas << text;
    });

    QStringList expected;
    for (int i = 0; i < 200; ++i) {
        const QString text = QString::number(i);
        expected << text;
        assembler.submitFrame(assistantFrame(QJsonArray{textBlock(text)}), 1);
    }

    // Decoding happens off the calling thread; nothing is applied yet
    QVERIFY(deltas.isEmpty());

    QTRY_COMPARE(deltas.size(), expected.size());
    QCOMPARE(deltas, expected);
    QCOMPARE(assembler.pendingFrameCount(), 0);
}

void StreamAssemblerTest::testStaleGenerationDropped()
{
    StreamAssembler assembler;
    assembler.setCurrentGeneration(1);
    QSignalSpy createdSpy(&assembler, &StreamAssembler::sessionCreated);

    assembler.submitFrame(QStringLiteral(R"({"type":"session-created","sessionId":"old"})"), 1);

    // The connection is replaced before the decoded frame comes back
    assembler.setCurrentGeneration(2);
    assembler.submitFrame(QStringLiteral(R"({"type":"session-created","sessionId":"new"})"), 2);

    QTRY_COMPARE(assembler.pendingFrameCount(), 0);
    QCOMPARE(assembler.staleFrameCount(), 1);
    QCOMPARE(createdSpy.count(), 1);
    QCOMPARE(createdSpy.at(0).at(0).toString(), QStringLiteral("new"));
}

void StreamAssemblerTest::testSummarizeToolInput()
{
    QJsonObject input;
    input[QStringLiteral("command")] = QStringLiteral("ls");
    input[QStringLiteral("timeout")] = 30;

    QCOMPARE(StreamAssembler::summarizeToolInput(input), QStringLiteral("command: ls, timeout: 30"));
    QVERIFY(StreamAssembler::summarizeToolInput(QJsonObject()).isEmpty());
}

void StreamAssemblerTest::testToolResultText()
{
    QCOMPARE(StreamAssembler::toolResultText(QJsonValue(QStringLiteral("ok"))), QStringLiteral("ok"));
    QVERIFY(StreamAssembler::toolResultText(QJsonValue(42)).isEmpty());
}

QTEST_GUILESS_MAIN(StreamAssemblerTest)

#include "moc_StreamAssemblerTest.cpp"
