/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONNECTIONSUPERVISORTEST_H
#define CONNECTIONSUPERVISORTEST_H

#include <QObject>

namespace CodingBridge
{

class ConnectionSupervisorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Backoff
    void testBackoffSchedule();
    void testJitterBounds();

    // Connecting
    void testInitialState();
    void testConnectConfirmedByPing();
    void testFrameConfirmsConnection();
    void testInvalidUrl();

    // Failures and reconnection
    void testReceiveFailureSchedulesOneReconnect();
    void testReconnectAfterFailure();
    void testDisconnectIsTerminal();

    // Generations
    void testStaleCallbacksDropped();
    void testSendWithoutConnection();
};

}

#endif // CONNECTIONSUPERVISORTEST_H
