/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef APPROVALPROTOCOL_H
#define APPROVALPROTOCOL_H

#include "ProtocolTypes.h"
#include "codingbridge_export.h"

#include <QObject>

namespace CodingBridge
{

class ConnectionSupervisor;

/**
 * ApprovalProtocol tracks the tool permission request awaiting an answer.
 *
 * At most one request is pending. The server is not supposed to issue a
 * second one before the first is answered; if it does, the newcomer is
 * dropped. Answering clears the pending request whether or not the
 * response made it onto the wire.
 */
class CODINGBRIDGE_EXPORT ApprovalProtocol : public QObject
{
    Q_OBJECT

public:
    explicit ApprovalProtocol(ConnectionSupervisor *supervisor, QObject *parent = nullptr);
    ~ApprovalProtocol() override;

    bool hasPending() const { return m_pending.isValid(); }
    ApprovalRequest pending() const { return m_pending; }

    int droppedCount() const { return m_droppedCount; }

    /**
     * @return false if another request is already pending and @p request was dropped
     */
    bool offer(const ApprovalRequest &request);

    /**
     * Answer the pending request
     *
     * @return false if nothing was pending
     */
    bool respond(bool allow, bool alwaysAllow = false);

    bool approve(bool alwaysAllow = false) { return respond(true, alwaysAllow); }
    bool deny() { return respond(false, false); }

public Q_SLOTS:
    void clear();

Q_SIGNALS:
    void requestPending(const CodingBridge::ApprovalRequest &request);
    void requestDropped(const CodingBridge::ApprovalRequest &request);
    void pendingCleared();
    void responseSent(const QString &requestId, bool allow);
    void responseFailed(const QString &requestId, const QString &error);

private:
    ConnectionSupervisor *m_supervisor;
    ApprovalRequest m_pending;
    int m_droppedCount = 0;
};

} // namespace CodingBridge

#endif // APPROVALPROTOCOL_H
