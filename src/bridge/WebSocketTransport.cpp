/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WebSocketTransport.h"

#include <QDebug>
#include <QMetaObject>
#include <QWebSocket>

#include <utility>

namespace CodingBridge
{

WebSocketTransport::WebSocketTransport(QObject *parent)
    : AgentTransport(parent)
    , m_socket(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
{
    connect(m_socket, &QWebSocket::connected, this, &WebSocketTransport::onConnected);
    connect(m_socket, &QWebSocket::disconnected, this, &WebSocketTransport::onDisconnected);
    connect(m_socket, &QWebSocket::errorOccurred, this, &WebSocketTransport::onError);
    connect(m_socket, &QWebSocket::pong, this, &WebSocketTransport::onPong);
    connect(m_socket, &QWebSocket::textMessageReceived, this, &WebSocketTransport::textMessageReceived);
}

WebSocketTransport::~WebSocketTransport()
{
    // Signals first, so tearing down the socket cannot report a failure
    m_socket->disconnect(this);
    m_socket->abort();
}

TransportFactory WebSocketTransport::factory()
{
    return []() -> AgentTransport * {
        return new WebSocketTransport();
    };
}

bool WebSocketTransport::isOpen() const
{
    return m_socket->state() == QAbstractSocket::ConnectedState;
}

void WebSocketTransport::open(const QUrl &url)
{
    qDebug() << "WebSocketTransport: Opening" << url.toDisplayString(QUrl::RemoveQuery);
    m_closing = false;
    m_failed = false;
    m_socket->open(url);
}

void WebSocketTransport::close()
{
    m_closing = true;
    fail(QStringLiteral("Connection closed"), false);
    m_socket->close();
}

void WebSocketTransport::ping(Completion completion)
{
    if (isOpen()) {
        writePing(completion);
    } else if (!m_failed && !m_closing && m_socket->state() != QAbstractSocket::UnconnectedState) {
        m_deferredPings.append(completion);
    } else {
        complete(completion, QStringLiteral("Socket is not open"));
    }
}

void WebSocketTransport::sendTextMessage(const QString &message, Completion completion)
{
    if (isOpen()) {
        writeMessage(message, completion);
    } else if (!m_failed && !m_closing && m_socket->state() != QAbstractSocket::UnconnectedState) {
        m_outbox.append(qMakePair(message, completion));
    } else {
        complete(completion, QStringLiteral("Socket is not open"));
    }
}

void WebSocketTransport::onConnected()
{
    qDebug() << "WebSocketTransport: Connected," << m_outbox.size() << "queued message(s)";

    const QList<QPair<QString, Completion>> outbox = std::move(m_outbox);
    m_outbox.clear();
    for (const auto &entry : outbox) {
        writeMessage(entry.first, entry.second);
    }

    const QList<Completion> pings = std::move(m_deferredPings);
    m_deferredPings.clear();
    for (const Completion &completion : pings) {
        writePing(completion);
    }
}

void WebSocketTransport::onDisconnected()
{
    if (m_closing) {
        return;
    }
    const QString reason = m_socket->closeReason();
    fail(reason.isEmpty() ? QStringLiteral("Connection closed by server") : reason, true);
}

void WebSocketTransport::onError(QAbstractSocket::SocketError error)
{
    if (m_closing) {
        return;
    }
    qWarning() << "WebSocketTransport: Socket error" << error << m_socket->errorString();
    fail(m_socket->errorString(), true);
}

void WebSocketTransport::onPong(quint64 elapsedTime, const QByteArray &payload)
{
    const Completion completion = m_pingsInFlight.take(payload);
    if (!completion) {
        qDebug() << "WebSocketTransport: Unsolicited pong" << payload;
        return;
    }
    qDebug() << "WebSocketTransport: Pong after" << elapsedTime << "ms";
    complete(completion, QString());
}

void WebSocketTransport::writeMessage(const QString &message, const Completion &completion)
{
    const qint64 written = m_socket->sendTextMessage(message);
    if (written <= 0 && !message.isEmpty()) {
        complete(completion, m_socket->errorString().isEmpty() ? QStringLiteral("Send failed") : m_socket->errorString());
        return;
    }
    complete(completion, QString());
}

void WebSocketTransport::writePing(const Completion &completion)
{
    const QByteArray payload = QByteArray::number(++m_pingCounter);
    m_pingsInFlight.insert(payload, completion);
    m_socket->ping(payload);
}

void WebSocketTransport::fail(const QString &error, bool notify)
{
    if (m_failed) {
        return;
    }
    m_failed = true;

    for (const auto &entry : std::as_const(m_outbox)) {
        complete(entry.second, error);
    }
    m_outbox.clear();

    for (const Completion &completion : std::as_const(m_deferredPings)) {
        complete(completion, error);
    }
    m_deferredPings.clear();

    for (const Completion &completion : std::as_const(m_pingsInFlight)) {
        complete(completion, error);
    }
    m_pingsInFlight.clear();

    if (notify) {
        Q_EMIT receiveFailed(error);
    }
}

void WebSocketTransport::complete(const Completion &completion, const QString &error)
{
    if (!completion) {
        return;
    }
    QMetaObject::invokeMethod(
        this,
        [completion, error]() {
            completion(error);
        },
        Qt::QueuedConnection);
}

} // namespace CodingBridge

#include "moc_WebSocketTransport.cpp"
