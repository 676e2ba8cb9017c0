/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionRecoveryTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// CodingBridge
#include "../bridge/BridgeSettings.h"
#include "../bridge/ConnectionSupervisor.h"
#include "../bridge/SessionRecoveryCoordinator.h"
#include "MockTransport.h"

using namespace CodingBridge;

namespace
{
const QString SessionUuid = QStringLiteral("3f2b8c1a-5d4e-4f6a-9b7c-0123456789ab");
const QString ProjectPath = QStringLiteral("/home/user/project");

struct Fixture {
    Fixture()
        : settings(QStringLiteral("codingbridge-recoverytestrc"))
        , supervisor(&settings, network.factory())
        , recovery(&supervisor)
    {
        settings.setPersistent(false);
        settings.setServerUrl(QStringLiteral("http://agent.test:3100"));
        recovery.setSettleDelayMs(10);
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
    SessionRecoveryCoordinator recovery;
};
}

void SessionRecoveryTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void SessionRecoveryTest::testAttachRequiresConnection()
{
    Fixture f;
    QSignalSpy startedSpy(&f.recovery, &SessionRecoveryCoordinator::reattachStarted);

    QVERIFY(!f.recovery.attachToSession(SessionUuid, ProjectPath));
    QVERIFY(!f.recovery.isReattaching());
    QCOMPARE(startedSpy.count(), 0);
    QCOMPARE(f.network.transportCount(), 0);
}

void SessionRecoveryTest::testAttachRejectsInvalidId()
{
    Fixture f;
    QVERIFY(f.connect());

    QVERIFY(!f.recovery.attachToSession(QStringLiteral("not-a-session"), ProjectPath));
    QVERIFY(!f.recovery.attachToSession(QString(), ProjectPath));
    QVERIFY(!f.recovery.isReattaching());
    QVERIFY(f.network.allSentFrames().isEmpty());
}

void SessionRecoveryTest::testAttachSendsStatusCommand()
{
    Fixture f;
    QVERIFY(f.connect());
    QSignalSpy startedSpy(&f.recovery, &SessionRecoveryCoordinator::reattachStarted);

    QVERIFY(f.recovery.attachToSession(SessionUuid, ProjectPath));
    QVERIFY(f.recovery.isReattaching());
    QCOMPARE(f.recovery.reattachingSessionId(), SessionUuid);
    QCOMPARE(startedSpy.count(), 1);
    QCOMPARE(startedSpy.at(0).at(1).toString(), ProjectPath);

    QCOMPARE(f.network.allSentFrames().size(), 1);
    const QJsonObject frame = f.network.allSentFrames().first();
    QCOMPARE(frame.value(QStringLiteral("command")).toString(), QStringLiteral("/status"));

    const QJsonObject options = frame.value(QStringLiteral("options")).toObject();
    QCOMPARE(options.value(QStringLiteral("sessionId")).toString(), SessionUuid);
    QCOMPARE(options.value(QStringLiteral("cwd")).toString(), ProjectPath);
}

void SessionRecoveryTest::testFirstContentCompletesAttach()
{
    Fixture f;
    QVERIFY(f.connect());
    QSignalSpy attachedSpy(&f.recovery, &SessionRecoveryCoordinator::attached);

    QVERIFY(f.recovery.attachToSession(SessionUuid, ProjectPath));
    f.recovery.contentReceived();

    QVERIFY(!f.recovery.isReattaching());
    QCOMPARE(attachedSpy.count(), 1);
    QCOMPARE(attachedSpy.at(0).at(0).toString(), SessionUuid);

    // Later content is ordinary streaming
    f.recovery.contentReceived();
    f.recovery.turnCompleted();
    QCOMPARE(attachedSpy.count(), 1);
}

void SessionRecoveryTest::testSendFailureReportsReattachFailed()
{
    Fixture f;
    QVERIFY(f.connect());
    f.network.failSends = true;
    QSignalSpy failedSpy(&f.recovery, &SessionRecoveryCoordinator::reattachFailed);

    QVERIFY(f.recovery.attachToSession(SessionUuid, ProjectPath));
    QTRY_COMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), SessionUuid);
    QCOMPARE(failedSpy.at(0).at(1).toString(), QStringLiteral("Send failed"));
    QVERIFY(!f.recovery.isReattaching());
}

void SessionRecoveryTest::testRecoverFromBackgroundWaitsForConnection()
{
    Fixture f;
    QSignalSpy startedSpy(&f.recovery, &SessionRecoveryCoordinator::reattachStarted);

    f.recovery.recoverFromBackground(SessionUuid, ProjectPath);
    QVERIFY(f.recovery.hasPendingRecovery());
    QCOMPARE(f.recovery.pendingSessionId(), SessionUuid);
    QCOMPARE(f.network.transportCount(), 1);
    QCOMPARE(startedSpy.count(), 0);

    // Connection confirmed, then the settle delay, then the reattach
    QTRY_COMPARE(startedSpy.count(), 1);
    QVERIFY(!f.recovery.hasPendingRecovery());
    QVERIFY(f.recovery.isReattaching());
    QCOMPARE(f.network.allSentFrames().first().value(QStringLiteral("command")).toString(), QStringLiteral("/status"));
}

void SessionRecoveryTest::testConnectionLostKeepsPendingTarget()
{
    Fixture f;
    f.network.autoPong = false;

    f.recovery.recoverFromBackground(SessionUuid, ProjectPath);
    f.recovery.connectionLost();
    QVERIFY(f.recovery.hasPendingRecovery());

    f.network.current()->completePings();
    QTRY_VERIFY(f.recovery.isReattaching());
}

void SessionRecoveryTest::testCancel()
{
    Fixture f;
    f.network.autoPong = false;

    f.recovery.recoverFromBackground(SessionUuid, ProjectPath);
    f.recovery.cancel();
    QVERIFY(!f.recovery.hasPendingRecovery());

    f.network.current()->completePings();
    QTRY_VERIFY(f.supervisor.state().isConnected());
    QTest::qWait(50);
    QVERIFY(!f.recovery.isReattaching());
    QVERIFY(f.network.allSentFrames().isEmpty());
}

QTEST_GUILESS_MAIN(SessionRecoveryTest)

#include "moc_SessionRecoveryTest.cpp"
