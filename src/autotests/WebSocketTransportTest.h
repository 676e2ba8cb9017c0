/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WEBSOCKETTRANSPORTTEST_H
#define WEBSOCKETTRANSPORTTEST_H

#include <QObject>

namespace CodingBridge
{

class WebSocketTransportTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testSendBeforeHandshake();
    void testReceive();
    void testPing();
    void testSendWhenNotOpen();
    void testCloseFailsPending();
    void testServerDisconnect();
    void testConnectionRefused();
};

}

#endif // WEBSOCKETTRANSPORTTEST_H
