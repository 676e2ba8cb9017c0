/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OutboundQueue.h"
#include "ConnectionSupervisor.h"
#include "ProtocolTypes.h"

#include <QDebug>

namespace CodingBridge
{

OutboundQueue::OutboundQueue(ConnectionSupervisor *supervisor, QObject *parent)
    : QObject(parent)
    , m_supervisor(supervisor)
{
    m_graceTimer.setSingleShot(true);
    connect(&m_graceTimer, &QTimer::timeout, this, [this]() {
        if (m_queue.isEmpty()) {
            return;
        }
        const ConnectionState state = m_supervisor->state();
        if (state.isConnected() || state.isConnecting()) {
            transmitHead();
            return;
        }
        // Not a delivery attempt; the command waits for the next confirmed connection
        qDebug() << "OutboundQueue: Still not connected, holding" << m_queue.first().id;
        m_waitingForConnection = true;
        Q_EMIT commandFailed(m_queue.first().id, QStringLiteral("Not connected"), false);
    });

    m_retryTimer.setSingleShot(true);
    connect(&m_retryTimer, &QTimer::timeout, this, [this]() {
        const ConnectionState state = m_supervisor->state();
        if (!state.isConnected() && !state.isConnecting()) {
            m_supervisor->connectToServer();
        }
        m_resendTimer.start(scaled(PostReconnectDelayMs));
    });

    m_resendTimer.setSingleShot(true);
    connect(&m_resendTimer, &QTimer::timeout, this, &OutboundQueue::sendNext);
}

OutboundQueue::~OutboundQueue() = default;

int OutboundQueue::retryDelayMs(int attempts)
{
    static const int delays[MaxAttempts] = {1000, 2000, 4000};
    return delays[qBound(1, attempts, MaxAttempts) - 1];
}

void OutboundQueue::setTimeScale(double scale)
{
    m_timeScale = qMax(0.0, scale);
}

int OutboundQueue::scaled(int ms) const
{
    return qRound(ms * m_timeScale);
}

QUuid OutboundQueue::submit(const PendingCommand &command)
{
    PendingCommand pending = command;
    if (pending.id.isNull()) {
        pending.id = QUuid::createUuid();
    }
    if (!pending.createdAt.isValid()) {
        pending.createdAt = QDateTime::currentDateTime();
    }
    pending.attempts = 0;

    m_queue.append(pending);
    qDebug() << "OutboundQueue: Queued" << pending.id << "depth" << m_queue.size();

    if (m_queue.size() == 1) {
        sendNext();
    }
    return pending.id;
}

void OutboundQueue::turnFinished()
{
    m_turnOpen = false;
    m_externalTurn = false;
    sendNext();
}

void OutboundQueue::connectionLost()
{
    m_turnOpen = false;
    m_externalTurn = false;
}

void OutboundQueue::connectionClosed()
{
    m_graceTimer.stop();
    m_retryTimer.stop();
    m_resendTimer.stop();
    m_sendInFlight = false;
    m_turnOpen = false;
    m_externalTurn = false;
    m_waitingForConnection = !m_queue.isEmpty();

    if (m_waitingForConnection) {
        qDebug() << "OutboundQueue: Connection closed, holding" << m_queue.first().id;
    }
}

void OutboundQueue::beginExternalTurn()
{
    m_turnOpen = true;
    m_externalTurn = true;
}

void OutboundQueue::abandonExternalTurn()
{
    if (!m_externalTurn) {
        return;
    }
    turnFinished();
}

void OutboundQueue::connectionConfirmed()
{
    // A send issued on a superseded connection will never report back
    if (m_sendInFlight && m_sendGeneration != m_supervisor->generation()) {
        m_sendInFlight = false;
    }

    if (m_waitingForConnection || (!m_turnOpen && !m_queue.isEmpty() && !isRetryScheduled())) {
        sendNext();
    }
}

void OutboundQueue::clear()
{
    if (!m_queue.isEmpty()) {
        qDebug() << "OutboundQueue: Dropping" << m_queue.size() << "queued command(s)";
    }
    m_queue.clear();
    m_graceTimer.stop();
    m_retryTimer.stop();
    m_resendTimer.stop();
    m_waitingForConnection = false;
    m_turnOpen = false;
    m_externalTurn = false;
}

bool OutboundQueue::isSendPending() const
{
    return m_sendInFlight && m_sendGeneration == m_supervisor->generation();
}

void OutboundQueue::sendNext()
{
    if (m_queue.isEmpty()) {
        m_retryTimer.stop();
        m_resendTimer.stop();
        return;
    }

    // One turn at a time
    if (m_turnOpen || isSendPending() || m_graceTimer.isActive()) {
        return;
    }

    const ConnectionState state = m_supervisor->state();
    if (!state.isConnected() && !state.isConnecting()) {
        qDebug() << "OutboundQueue: Not connected, connecting before send";
        m_supervisor->connectToServer();
        m_graceTimer.start(scaled(ConnectGraceMs));
        return;
    }

    transmitHead();
}

void OutboundQueue::transmitHead()
{
    if (m_queue.isEmpty()) {
        return;
    }
    m_waitingForConnection = false;

    const PendingCommand head = m_queue.first();

    CommandFrame frame;
    frame.command = head.command;
    frame.projectPath = head.projectPath;
    frame.sessionId = head.sessionId;
    frame.model = head.model;
    frame.permissionMode = head.permissionMode;
    frame.imageData = head.imageData;

    Q_EMIT commandSending(head);

    m_sendInFlight = true;
    m_sendGeneration = m_supervisor->generation();

    const QUuid id = head.id;
    m_supervisor->sendText(frame.toWireText(), [this, id](const QString &error) {
        m_sendInFlight = false;

        if (m_queue.isEmpty() || m_queue.first().id != id) {
            qDebug() << "OutboundQueue: Send result for a command that is no longer queued" << id;
            return;
        }

        if (!error.isEmpty()) {
            handleSendFailure(error);
            return;
        }

        m_queue.removeFirst();
        m_retryTimer.stop();
        m_resendTimer.stop();
        m_turnOpen = true;
        qDebug() << "OutboundQueue: Sent" << id;
        Q_EMIT commandSent(id);
    });
}

void OutboundQueue::handleSendFailure(const QString &error)
{
    if (m_queue.isEmpty()) {
        Q_EMIT commandFailed(QUuid(), error, true);
        return;
    }

    const int attempts = ++m_queue.first().attempts;
    const QUuid id = m_queue.first().id;
    qWarning() << "OutboundQueue: Send failed for" << id << "attempt" << attempts << ":" << error;

    if (attempts >= MaxAttempts) {
        m_queue.removeFirst();
        Q_EMIT commandFailed(id, QStringLiteral("Message failed after %1 attempts. Please try again.").arg(MaxAttempts), true);
        sendNext();
        return;
    }

    const int delay = retryDelayMs(attempts);
    m_retryTimer.start(scaled(delay));
    Q_EMIT retryScheduled(id, attempts, delay);
}

} // namespace CodingBridge

#include "moc_OutboundQueue.cpp"
