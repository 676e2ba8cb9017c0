/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONRECOVERYCOORDINATOR_H
#define SESSIONRECOVERYCOORDINATOR_H

#include "codingbridge_export.h"

#include <QObject>
#include <QString>
#include <QTimer>

namespace CodingBridge
{

class ConnectionSupervisor;

/**
 * SessionRecoveryCoordinator reattaches to a session that kept running on
 * the server while this client was unreachable.
 *
 * Reattaching sends a "/status" command scoped to the session, which makes
 * the server flush whatever output it produced in the meantime. The first
 * content frame or the completion frame ends the reattachment.
 */
class CODINGBRIDGE_EXPORT SessionRecoveryCoordinator : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultSettleDelayMs = 200;

    explicit SessionRecoveryCoordinator(ConnectionSupervisor *supervisor, QObject *parent = nullptr);
    ~SessionRecoveryCoordinator() override;

    static QString reattachCommand();

    bool isReattaching() const { return m_reattaching; }
    QString reattachingSessionId() const { return m_sessionId; }

    bool hasPendingRecovery() const { return !m_pendingSessionId.isEmpty(); }
    QString pendingSessionId() const { return m_pendingSessionId; }

    void setSettleDelayMs(int ms);

    /**
     * Reattach now. Only possible while connected or connecting.
     *
     * @return false if the connection or the session id rules it out
     */
    bool attachToSession(const QString &sessionId, const QString &projectPath);

    /**
     * Reattach after the app comes back to the foreground, connecting first if needed
     */
    void recoverFromBackground(const QString &sessionId, const QString &projectPath);

public Q_SLOTS:
    /**
     * Content arrived for the session; reattachment succeeded
     */
    void contentReceived();

    void turnCompleted();

    /**
     * The connection dropped; a running reattachment is abandoned but a
     * pending target is kept for the next confirmed connection
     */
    void connectionLost();

    /**
     * Forget both the running reattachment and any pending target
     */
    void cancel();

Q_SIGNALS:
    /**
     * The "/status" command is about to be sent; the session should look busy
     */
    void reattachStarted(const QString &sessionId, const QString &projectPath);

    void attached(const QString &sessionId);

    void reattachFailed(const QString &sessionId, const QString &error);

private:
    void completePendingRecovery();
    void finish();

    ConnectionSupervisor *m_supervisor;
    QTimer m_settleTimer;

    bool m_reattaching = false;
    QString m_sessionId;
    QString m_pendingSessionId;
    QString m_pendingProjectPath;
};

} // namespace CodingBridge

#endif // SESSIONRECOVERYCOORDINATOR_H
