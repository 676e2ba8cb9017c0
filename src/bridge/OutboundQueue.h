/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OUTBOUNDQUEUE_H
#define OUTBOUNDQUEUE_H

#include "codingbridge_export.h"

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUuid>

namespace CodingBridge
{

class ConnectionSupervisor;

/**
 * A command waiting to be delivered
 */
struct CODINGBRIDGE_EXPORT PendingCommand {
    QUuid id;
    QString command;
    QString projectPath;
    QString sessionId;
    QString permissionMode;
    QByteArray imageData;
    QString model;
    int attempts = 0;
    QDateTime createdAt;
};

/**
 * OutboundQueue delivers commands one agent turn at a time.
 *
 * Only the head of the queue is ever on the wire. A successful send removes
 * it from the queue, but the next command waits until the turn it started
 * has ended (turnFinished()). Failed sends are retried after 1s, 2s and 4s;
 * the third failure drops the command.
 */
class CODINGBRIDGE_EXPORT OutboundQueue : public QObject
{
    Q_OBJECT

public:
    static constexpr int MaxAttempts = 3;
    static constexpr int ConnectGraceMs = 500;
    static constexpr int PostReconnectDelayMs = 300;

    explicit OutboundQueue(ConnectionSupervisor *supervisor, QObject *parent = nullptr);
    ~OutboundQueue() override;

    /**
     * Retry delay after the given number of failed attempts (1 based)
     */
    static int retryDelayMs(int attempts);

    /**
     * Append a command; it goes out right away if nothing is ahead of it
     */
    QUuid submit(const PendingCommand &command);

    int size() const { return m_queue.size(); }
    bool isEmpty() const { return m_queue.isEmpty(); }
    QList<PendingCommand> pending() const { return m_queue; }

    /**
     * A sent command's turn is still open
     */
    bool isTurnOpen() const { return m_turnOpen; }

    bool isRetryScheduled() const { return m_retryTimer.isActive() || m_resendTimer.isActive(); }

    /**
     * Waiting for the connection before the head can be sent
     */
    bool isWaitingForConnection() const { return m_waitingForConnection; }

    /**
     * Scale all delays, for tests
     */
    void setTimeScale(double scale);

public Q_SLOTS:
    /**
     * The current turn ended (complete, error, abort or timeout); send the next command
     */
    void turnFinished();

    /**
     * The connection was lost; whatever was open will not finish
     */
    void connectionLost();

    /**
     * The connection was confirmed; resume delivery
     */
    void connectionConfirmed();

    /**
     * The user closed the connection. Pending retries stop and the head
     * waits for the next confirmed connection.
     */
    void connectionClosed();

    /**
     * A turn was started without going through the queue (reattach, model switch)
     */
    void beginExternalTurn();

    /**
     * The external turn never got going; release the queue
     */
    void abandonExternalTurn();

    /**
     * Drop every queued command and cancel the retry
     */
    void clear();

Q_SIGNALS:
    /**
     * The head command is about to go on the wire
     */
    void commandSending(const CodingBridge::PendingCommand &command);

    void commandSent(const QUuid &id);

    void retryScheduled(const QUuid &id, int attempt, int delayMs);

    /**
     * @param terminal true when the command was dropped
     */
    void commandFailed(const QUuid &id, const QString &message, bool terminal);

private:
    void sendNext();
    void transmitHead();
    void handleSendFailure(const QString &error);
    bool isSendPending() const;
    int scaled(int ms) const;

    ConnectionSupervisor *m_supervisor;
    QList<PendingCommand> m_queue;

    QTimer m_graceTimer;
    QTimer m_retryTimer;
    QTimer m_resendTimer;

    quint64 m_sendGeneration = 0;
    double m_timeScale = 1.0;
    bool m_sendInFlight = false;
    bool m_turnOpen = false;
    bool m_externalTurn = false;
    bool m_waitingForConnection = false;
};

} // namespace CodingBridge

Q_DECLARE_METATYPE(CodingBridge::PendingCommand)

#endif // OUTBOUNDQUEUE_H
