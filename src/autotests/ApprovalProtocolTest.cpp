/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ApprovalProtocolTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// CodingBridge
#include "../bridge/ApprovalProtocol.h"
#include "../bridge/BridgeSettings.h"
#include "../bridge/ConnectionSupervisor.h"
#include "MockTransport.h"

using namespace CodingBridge;

namespace
{
ApprovalRequest makeRequest(const QString &id, const QString &command = QStringLiteral("ls -la"))
{
    ApprovalRequest request;
    request.requestId = id;
    request.toolName = QStringLiteral("Bash");
    request.input[QStringLiteral("command")] = command;
    return request;
}

struct Fixture {
    Fixture()
        : settings(QStringLiteral("codingbridge-approvaltestrc"))
        , supervisor(&settings, network.factory())
        , approvals(&supervisor)
    {
        settings.setPersistent(false);
        settings.setServerUrl(QStringLiteral("http://agent.test:3100"));
    }

    bool connect()
    {
        supervisor.connectToServer();
        return QTest::qWaitFor([this]() {
            return supervisor.state().isConnected();
        });
    }

    MockNetwork network;
    BridgeSettings settings;
    ConnectionSupervisor supervisor;
    ApprovalProtocol approvals;
};
}

void ApprovalProtocolTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void ApprovalProtocolTest::testOfferRejectsInvalid()
{
    Fixture f;
    QVERIFY(!f.approvals.offer(ApprovalRequest()));
    QVERIFY(!f.approvals.hasPending());
    QCOMPARE(f.approvals.droppedCount(), 0);
}

void ApprovalProtocolTest::testSecondRequestDropped()
{
    Fixture f;
    QSignalSpy pendingSpy(&f.approvals, &ApprovalProtocol::requestPending);
    QSignalSpy droppedSpy(&f.approvals, &ApprovalProtocol::requestDropped);

    QVERIFY(f.approvals.offer(makeRequest(QStringLiteral("R1"))));
    QVERIFY(!f.approvals.offer(makeRequest(QStringLiteral("R2"), QStringLiteral("rm -rf build"))));

    // The first request stays the one being asked about
    QCOMPARE(f.approvals.pending().requestId, QStringLiteral("R1"));
    QCOMPARE(pendingSpy.count(), 1);
    QCOMPARE(droppedSpy.count(), 1);
    QCOMPARE(droppedSpy.at(0).at(0).value<ApprovalRequest>().requestId, QStringLiteral("R2"));
    QCOMPARE(f.approvals.droppedCount(), 1);
}

void ApprovalProtocolTest::testApproveSendsResponse()
{
    Fixture f;
    QVERIFY(f.connect());
    QSignalSpy sentSpy(&f.approvals, &ApprovalProtocol::responseSent);

    f.approvals.offer(makeRequest(QStringLiteral("R1")));
    QVERIFY(f.approvals.approve());
    QVERIFY(!f.approvals.hasPending());

    QTRY_COMPARE(sentSpy.count(), 1);
    QCOMPARE(sentSpy.at(0).at(0).toString(), QStringLiteral("R1"));
    QCOMPARE(sentSpy.at(0).at(1).toBool(), true);

    const QJsonObject frame = f.network.allSentFrames().first();
    QCOMPARE(frame.value(QStringLiteral("type")).toString(), QStringLiteral("permission-response"));
    QCOMPARE(frame.value(QStringLiteral("requestId")).toString(), QStringLiteral("R1"));
    QCOMPARE(frame.value(QStringLiteral("decision")).toString(), QStringLiteral("allow"));
    QCOMPARE(frame.value(QStringLiteral("alwaysAllow")).toBool(), false);

    // The next request can now be offered
    QVERIFY(f.approvals.offer(makeRequest(QStringLiteral("R2"))));
}

void ApprovalProtocolTest::testDenySendsResponse()
{
    Fixture f;
    QVERIFY(f.connect());

    f.approvals.offer(makeRequest(QStringLiteral("R1")));
    QVERIFY(f.approvals.deny());

    QTRY_COMPARE(f.network.allSentFrames().size(), 1);
    QCOMPARE(f.network.allSentFrames().first().value(QStringLiteral("decision")).toString(), QStringLiteral("deny"));
}

void ApprovalProtocolTest::testAlwaysAllowOnlyWithAllow()
{
    Fixture f;
    QVERIFY(f.connect());

    f.approvals.offer(makeRequest(QStringLiteral("R1")));
    QVERIFY(f.approvals.respond(true, true));
    f.approvals.offer(makeRequest(QStringLiteral("R2")));
    QVERIFY(f.approvals.respond(false, true));

    QTRY_COMPARE(f.network.allSentFrames().size(), 2);
    QCOMPARE(f.network.allSentFrames().at(0).value(QStringLiteral("alwaysAllow")).toBool(), true);
    QCOMPARE(f.network.allSentFrames().at(1).value(QStringLiteral("alwaysAllow")).toBool(), false);
}

void ApprovalProtocolTest::testFailedSendStillClears()
{
    Fixture f;
    QVERIFY(f.connect());
    f.network.failSends = true;
    QSignalSpy failedSpy(&f.approvals, &ApprovalProtocol::responseFailed);
    QSignalSpy clearedSpy(&f.approvals, &ApprovalProtocol::pendingCleared);

    f.approvals.offer(makeRequest(QStringLiteral("R1")));
    QVERIFY(f.approvals.approve());

    QTRY_COMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), QStringLiteral("R1"));
    QCOMPARE(clearedSpy.count(), 1);
    QVERIFY(!f.approvals.hasPending());
}

void ApprovalProtocolTest::testRespondWithoutPending()
{
    Fixture f;
    QVERIFY(f.connect());

    QVERIFY(!f.approvals.approve());
    QVERIFY(!f.approvals.deny());
    QTest::qWait(20);
    QVERIFY(f.network.allSentFrames().isEmpty());
}

void ApprovalProtocolTest::testClear()
{
    Fixture f;
    QSignalSpy clearedSpy(&f.approvals, &ApprovalProtocol::pendingCleared);

    f.approvals.offer(makeRequest(QStringLiteral("R1")));
    f.approvals.clear();
    QVERIFY(!f.approvals.hasPending());
    QCOMPARE(clearedSpy.count(), 1);

    // Clearing nothing is silent
    f.approvals.clear();
    QCOMPARE(clearedSpy.count(), 1);
}

QTEST_GUILESS_MAIN(ApprovalProtocolTest)

#include "moc_ApprovalProtocolTest.cpp"
