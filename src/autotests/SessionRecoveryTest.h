/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONRECOVERYTEST_H
#define SESSIONRECOVERYTEST_H

#include <QObject>

namespace CodingBridge
{

class SessionRecoveryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testAttachRequiresConnection();
    void testAttachRejectsInvalidId();
    void testAttachSendsStatusCommand();
    void testFirstContentCompletesAttach();
    void testSendFailureReportsReattachFailed();
    void testRecoverFromBackgroundWaitsForConnection();
    void testConnectionLostKeepsPendingTarget();
    void testCancel();
};

}

#endif // SESSIONRECOVERYTEST_H
