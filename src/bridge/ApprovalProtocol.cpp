/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ApprovalProtocol.h"
#include "ConnectionSupervisor.h"

#include <QDebug>

namespace CodingBridge
{

ApprovalProtocol::ApprovalProtocol(ConnectionSupervisor *supervisor, QObject *parent)
    : QObject(parent)
    , m_supervisor(supervisor)
{
}

ApprovalProtocol::~ApprovalProtocol() = default;

bool ApprovalProtocol::offer(const ApprovalRequest &request)
{
    if (!request.isValid()) {
        return false;
    }

    if (m_pending.isValid()) {
        ++m_droppedCount;
        qWarning() << "ApprovalProtocol: Dropping request" << request.requestId << "while" << m_pending.requestId << "is pending";
        Q_EMIT requestDropped(request);
        return false;
    }

    qDebug() << "ApprovalProtocol: Permission requested for" << request.toolName << "-" << request.displayDescription();
    m_pending = request;
    Q_EMIT requestPending(m_pending);
    return true;
}

bool ApprovalProtocol::respond(bool allow, bool alwaysAllow)
{
    if (!m_pending.isValid()) {
        qWarning() << "ApprovalProtocol: No pending request to answer";
        return false;
    }

    ApprovalResponse response;
    response.requestId = m_pending.requestId;
    response.allow = allow;
    response.alwaysAllow = allow && alwaysAllow;

    // Cleared up front; a failed send must not leave the request stuck
    m_pending = ApprovalRequest();
    Q_EMIT pendingCleared();

    const QString requestId = response.requestId;
    m_supervisor->sendText(response.toWireText(), [this, requestId, allow](const QString &error) {
        if (!error.isEmpty()) {
            qWarning() << "ApprovalProtocol: Failed to send response for" << requestId << ":" << error;
            Q_EMIT responseFailed(requestId, error);
            return;
        }
        Q_EMIT responseSent(requestId, allow);
    });
    return true;
}

void ApprovalProtocol::clear()
{
    if (!m_pending.isValid()) {
        return;
    }
    m_pending = ApprovalRequest();
    Q_EMIT pendingCleared();
}

} // namespace CodingBridge

#include "moc_ApprovalProtocol.cpp"
