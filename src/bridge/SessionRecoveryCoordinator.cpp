/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRecoveryCoordinator.h"
#include "ConnectionSupervisor.h"
#include "ProtocolTypes.h"

#include <QDebug>

namespace CodingBridge
{

SessionRecoveryCoordinator::SessionRecoveryCoordinator(ConnectionSupervisor *supervisor, QObject *parent)
    : QObject(parent)
    , m_supervisor(supervisor)
{
    m_settleTimer.setSingleShot(true);
    m_settleTimer.setInterval(DefaultSettleDelayMs);
    connect(&m_settleTimer, &QTimer::timeout, this, [this]() {
        const QString sessionId = m_pendingSessionId;
        const QString projectPath = m_pendingProjectPath;
        m_pendingSessionId.clear();
        m_pendingProjectPath.clear();
        if (!sessionId.isEmpty()) {
            attachToSession(sessionId, projectPath);
        }
    });

    connect(m_supervisor, &ConnectionSupervisor::connectionConfirmed, this, &SessionRecoveryCoordinator::completePendingRecovery);
}

SessionRecoveryCoordinator::~SessionRecoveryCoordinator() = default;

QString SessionRecoveryCoordinator::reattachCommand()
{
    return QStringLiteral("/status");
}

void SessionRecoveryCoordinator::setSettleDelayMs(int ms)
{
    m_settleTimer.setInterval(qMax(0, ms));
}

bool SessionRecoveryCoordinator::attachToSession(const QString &sessionId, const QString &projectPath)
{
    const ConnectionState state = m_supervisor->state();
    if (!state.isConnected() && !state.isConnecting()) {
        qWarning() << "SessionRecoveryCoordinator: Cannot reattach while" << state.displayText();
        return false;
    }

    const QString validId = SessionId::validated(sessionId);
    if (validId.isEmpty()) {
        qWarning() << "SessionRecoveryCoordinator: Refusing to reattach to invalid session id" << sessionId;
        return false;
    }

    qDebug() << "SessionRecoveryCoordinator: Reattaching to" << SessionId::shortForm(validId);
    m_reattaching = true;
    m_sessionId = validId;
    Q_EMIT reattachStarted(validId, projectPath);

    CommandFrame frame;
    frame.command = reattachCommand();
    frame.projectPath = projectPath;
    frame.sessionId = validId;

    m_supervisor->sendText(frame.toWireText(), [this, validId](const QString &error) {
        if (error.isEmpty() || !m_reattaching || m_sessionId != validId) {
            return;
        }
        qWarning() << "SessionRecoveryCoordinator: Reattach send failed:" << error;
        finish();
        Q_EMIT reattachFailed(validId, error);
    });
    return true;
}

void SessionRecoveryCoordinator::recoverFromBackground(const QString &sessionId, const QString &projectPath)
{
    if (m_supervisor->state().isConnected()) {
        attachToSession(sessionId, projectPath);
        return;
    }

    qDebug() << "SessionRecoveryCoordinator: Deferring reattach to" << SessionId::shortForm(sessionId) << "until connected";
    m_pendingSessionId = sessionId;
    m_pendingProjectPath = projectPath;
    m_supervisor->connectToServer();
}

void SessionRecoveryCoordinator::completePendingRecovery()
{
    if (m_pendingSessionId.isEmpty()) {
        return;
    }
    m_settleTimer.start();
}

void SessionRecoveryCoordinator::contentReceived()
{
    if (!m_reattaching) {
        return;
    }
    const QString sessionId = m_sessionId;
    finish();
    Q_EMIT attached(sessionId);
}

void SessionRecoveryCoordinator::turnCompleted()
{
    contentReceived();
}

void SessionRecoveryCoordinator::connectionLost()
{
    if (m_reattaching) {
        qDebug() << "SessionRecoveryCoordinator: Connection lost while reattaching to" << SessionId::shortForm(m_sessionId);
    }
    finish();
}

void SessionRecoveryCoordinator::cancel()
{
    finish();
    m_settleTimer.stop();
    m_pendingSessionId.clear();
    m_pendingProjectPath.clear();
}

void SessionRecoveryCoordinator::finish()
{
    m_reattaching = false;
    m_sessionId.clear();
}

} // namespace CodingBridge

#include "moc_SessionRecoveryCoordinator.cpp"
