/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WEBSOCKETTRANSPORT_H
#define WEBSOCKETTRANSPORT_H

#include "AgentTransport.h"

#include <QAbstractSocket>
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>

class QWebSocket;

namespace CodingBridge
{

/**
 * AgentTransport over a QWebSocket.
 *
 * Messages sent and pings issued while the socket is still opening are held
 * back and go out once the handshake completes. Liveness probes use
 * WebSocket ping/pong control frames.
 */
class CODINGBRIDGE_EXPORT WebSocketTransport : public AgentTransport
{
    Q_OBJECT

public:
    explicit WebSocketTransport(QObject *parent = nullptr);
    ~WebSocketTransport() override;

    void open(const QUrl &url) override;
    void close() override;
    void ping(Completion completion) override;
    void sendTextMessage(const QString &message, Completion completion) override;

    bool isOpen() const;

    static TransportFactory factory();

private Q_SLOTS:
    void onConnected();
    void onDisconnected();
    void onError(QAbstractSocket::SocketError error);
    void onPong(quint64 elapsedTime, const QByteArray &payload);

private:
    void writeMessage(const QString &message, const Completion &completion);
    void writePing(const Completion &completion);
    void fail(const QString &error, bool notify);
    void complete(const Completion &completion, const QString &error);

    QWebSocket *m_socket = nullptr;
    QList<QPair<QString, Completion>> m_outbox;
    QList<Completion> m_deferredPings;
    QHash<QByteArray, Completion> m_pingsInFlight;
    quint64 m_pingCounter = 0;
    bool m_closing = false;
    bool m_failed = false;
};

} // namespace CodingBridge

#endif // WEBSOCKETTRANSPORT_H
