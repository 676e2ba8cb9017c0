/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTSESSIONTEST_H
#define AGENTSESSIONTEST_H

#include <QObject>

namespace CodingBridge
{

class AgentSessionTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Session binding
    void testSessionBoundFromSessionCreated();
    void testClearSessionStartsFresh();
    void testResumeSessionOverridesBound();
    void testSessionErrorStartsFresh();
    void testServerErrorReported();
    void testTokenUsage();

    // Turn lifecycle
    void testTurnCompletionAdvancesQueue();
    void testDisconnectClearsInFlightState();
    void testReceiveFailureClearsInFlightState();
    void testDisconnectStopsRetries();
    void testRetryStatusNamesNextAttempt();
    void testWatchdogStallEndsTurn();

    // Turns started outside the queue
    void testReattachHoldsQueuedCommands();
    void testModelSwitchHoldsQueuedCommands();

    // Abort
    void testAbortWithoutSession();
    void testAbortConfirmedByServer();
    void testAbortTimesOut();

    // Interactive protocols
    void testApprovalForwarded();
    void testModelSwitch();
};

}

#endif // AGENTSESSIONTEST_H
