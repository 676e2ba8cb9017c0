/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ConnectionSupervisor.h"
#include "BridgeSettings.h"
#include "ProtocolTypes.h"

#include <QDebug>
#include <QMetaObject>
#include <QRandomGenerator>

namespace CodingBridge
{

ConnectionSupervisor::ConnectionSupervisor(BridgeSettings *settings, TransportFactory factory, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_factory(std::move(factory))
{
    m_reconnectTimer.setSingleShot(true);
    connect(&m_reconnectTimer, &QTimer::timeout, this, [this]() {
        // A manual connect may have got there first
        if (!m_state.isConnected()) {
            qDebug() << "ConnectionSupervisor: Reconnect attempt" << m_reconnectAttempt;
            connectToServer();
        }
    });
}

ConnectionSupervisor::~ConnectionSupervisor()
{
    releaseTransport();
}

int ConnectionSupervisor::nominalReconnectDelayMs(int attempt)
{
    const int exponent = qMin(qMax(attempt, 1) - 1, MaxBackoffExponent);
    return BaseReconnectDelayMs * (1 << exponent);
}

int ConnectionSupervisor::reconnectDelayMs(int attempt, int jitterMs)
{
    return nominalReconnectDelayMs(attempt) + qBound(0, jitterMs, MaxJitterMs - 1);
}

void ConnectionSupervisor::connectToServer()
{
    const QUrl url = m_settings->webSocketUrl();
    if (!url.isValid() || url.host().isEmpty()) {
        qWarning() << "ConnectionSupervisor: Invalid WebSocket URL" << m_settings->serverUrl();
        m_lastError = QStringLiteral("Invalid WebSocket URL");
        cancelReconnect();
        releaseTransport();
        setState(ConnectionState::disconnected());
        Q_EMIT errorOccurred(m_lastError);
        return;
    }

    cancelReconnect();
    releaseTransport();

    const quint64 generation = ++m_generation;
    Q_EMIT generationChanged(generation);

    // Keep the attempt counter visible while a reconnect is in progress
    if (m_state.kind() != ConnectionState::Kind::Reconnecting) {
        setState(ConnectionState::connecting());
    }

    m_transport = m_factory();
    m_transport->setParent(this);

    connect(m_transport, &AgentTransport::textMessageReceived, this, [this, generation](const QString &text) {
        handleTextMessage(generation, text);
    });
    connect(m_transport, &AgentTransport::receiveFailed, this, [this, generation](const QString &error) {
        handleReceiveFailure(generation, error);
    });

    qDebug() << "ConnectionSupervisor: Connecting, generation" << generation;
    m_transport->open(url);

    m_transport->ping([this, generation](const QString &error) {
        if (!isCurrent(generation)) {
            return;
        }
        if (!error.isEmpty()) {
            // The receive path reports the failure and schedules the reconnect
            qDebug() << "ConnectionSupervisor: Liveness probe failed:" << error;
            return;
        }
        markConnected();
    });
}

void ConnectionSupervisor::disconnectFromServer()
{
    qDebug() << "ConnectionSupervisor: Disconnecting";
    cancelReconnect();
    m_reconnectAttempt = 0;
    releaseTransport();

    Q_EMIT generationChanged(++m_generation);
    setState(ConnectionState::disconnected());
}

void ConnectionSupervisor::sendText(const QString &text, AgentTransport::Completion completion)
{
    if (!m_transport) {
        QMetaObject::invokeMethod(
            this,
            [completion]() {
                if (completion) {
                    completion(QStringLiteral("Not connected"));
                }
            },
            Qt::QueuedConnection);
        return;
    }

    qDebug() << "ConnectionSupervisor: Sending" << truncatedForLog(text, OutboundLogLimit);

    const quint64 generation = m_generation;
    m_transport->sendTextMessage(text, [this, generation, completion](const QString &error) {
        if (!isCurrent(generation)) {
            return;
        }
        if (completion) {
            completion(error);
        }
    });
}

void ConnectionSupervisor::setState(const ConnectionState &state)
{
    if (m_state == state) {
        return;
    }
    qDebug() << "ConnectionSupervisor: State" << m_state.displayText() << "->" << state.displayText();
    m_state = state;
    Q_EMIT stateChanged(m_state);
}

bool ConnectionSupervisor::isCurrent(quint64 generation)
{
    if (generation != m_generation) {
        ++m_staleCallbackCount;
        qDebug() << "ConnectionSupervisor: Dropping callback from generation" << generation << "current is" << m_generation;
        return false;
    }
    return true;
}

void ConnectionSupervisor::markConnected()
{
    if (m_state.isConnected()) {
        return;
    }
    m_reconnectAttempt = 0;
    m_lastError.clear();
    setState(ConnectionState::connected());
    Q_EMIT connectionConfirmed();
}

void ConnectionSupervisor::handleTextMessage(quint64 generation, const QString &text)
{
    if (!isCurrent(generation) || m_state.isDisconnected()) {
        return;
    }

    // Any payload proves liveness as well as a pong does
    if (!m_state.isConnected()) {
        markConnected();
    }

    qDebug() << "ConnectionSupervisor: Received" << truncatedForLog(text, InboundLogLimit);
    Q_EMIT frameReceived(text, generation);
}

void ConnectionSupervisor::handleReceiveFailure(quint64 generation, const QString &error)
{
    if (m_state.isDisconnected() || !isCurrent(generation)) {
        return;
    }

    qWarning() << "ConnectionSupervisor: Receive failed:" << error;
    m_lastError = error;
    Q_EMIT receiveFailed(error);
    scheduleReconnect();
}

void ConnectionSupervisor::scheduleReconnect()
{
    // Only one reconnect may be pending
    if (m_reconnectTimer.isActive()) {
        return;
    }

    ++m_reconnectAttempt;
    const int jitter = static_cast<int>(QRandomGenerator::global()->bounded(MaxJitterMs));
    m_lastScheduledDelayMs = reconnectDelayMs(m_reconnectAttempt, jitter);

    setState(ConnectionState::reconnecting(m_reconnectAttempt));
    qDebug() << "ConnectionSupervisor: Reconnecting in" << m_lastScheduledDelayMs << "ms (attempt" << m_reconnectAttempt << ")";

    m_reconnectTimer.start(m_lastScheduledDelayMs);
    Q_EMIT reconnectScheduled(m_reconnectAttempt, m_lastScheduledDelayMs);
}

void ConnectionSupervisor::cancelReconnect()
{
    m_reconnectTimer.stop();
}

void ConnectionSupervisor::releaseTransport()
{
    if (!m_transport) {
        return;
    }
    AgentTransport *transport = m_transport;
    m_transport = nullptr;

    transport->disconnect(this);
    transport->close();
    transport->deleteLater();
}

} // namespace CodingBridge

#include "moc_ConnectionSupervisor.cpp"
