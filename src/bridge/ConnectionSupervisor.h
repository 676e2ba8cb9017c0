/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONNECTIONSUPERVISOR_H
#define CONNECTIONSUPERVISOR_H

#include "AgentTransport.h"
#include "ConnectionState.h"
#include "codingbridge_export.h"

#include <QObject>
#include <QPointer>
#include <QTimer>

namespace CodingBridge
{

class BridgeSettings;

/**
 * ConnectionSupervisor owns the single logical connection to the agent server.
 *
 * Every physical connection attempt gets a fresh transport and a new
 * generation number. Callbacks and transport signals carry the generation
 * they were created under; anything arriving for an older generation is
 * counted and dropped without touching state.
 *
 * When the connection breaks unexpectedly a reconnect is scheduled with
 * exponential backoff (1s, 2s, 4s, 8s, 8s, ...) plus up to 500ms of jitter.
 * Only disconnectFromServer() stops reconnecting.
 */
class CODINGBRIDGE_EXPORT ConnectionSupervisor : public QObject
{
    Q_OBJECT

public:
    static constexpr int BaseReconnectDelayMs = 1000;
    static constexpr int MaxBackoffExponent = 3;
    static constexpr int MaxJitterMs = 500;

    ConnectionSupervisor(BridgeSettings *settings, TransportFactory factory, QObject *parent = nullptr);
    ~ConnectionSupervisor() override;

    ConnectionState state() const { return m_state; }

    /**
     * Current connection generation. Changes on every connect and disconnect.
     */
    quint64 generation() const { return m_generation; }

    /**
     * Number of callbacks and signals dropped because their generation was superseded
     */
    int staleCallbackCount() const { return m_staleCallbackCount; }

    int reconnectAttempt() const { return m_reconnectAttempt; }
    bool isReconnectScheduled() const { return m_reconnectTimer.isActive(); }
    int lastScheduledDelayMs() const { return m_lastScheduledDelayMs; }

    QString lastError() const { return m_lastError; }

    /**
     * Delay without jitter for the given reconnect attempt (1 based)
     */
    static int nominalReconnectDelayMs(int attempt);

    /**
     * Full delay for the given attempt; @p jitterMs is clamped to [0, MaxJitterMs)
     */
    static int reconnectDelayMs(int attempt, int jitterMs);

    /**
     * Send one text frame over the current connection.
     *
     * The completion only runs if the connection it was sent on is still the
     * current one.
     */
    void sendText(const QString &text, AgentTransport::Completion completion);

public Q_SLOTS:
    /**
     * Start or restart the connection. Cancels any scheduled reconnect.
     */
    void connectToServer();

    /**
     * Close the connection for good. No reconnect follows.
     */
    void disconnectFromServer();

Q_SIGNALS:
    void stateChanged(const CodingBridge::ConnectionState &state);

    /**
     * A new connection generation was minted
     */
    void generationChanged(quint64 generation);

    /**
     * The server answered the liveness probe or sent the first frame
     */
    void connectionConfirmed();

    void frameReceived(const QString &text, quint64 generation);

    /**
     * The current connection broke; a reconnect has been scheduled
     */
    void receiveFailed(const QString &error);

    void reconnectScheduled(int attempt, int delayMs);

    void errorOccurred(const QString &message);

private:
    void setState(const ConnectionState &state);
    bool isCurrent(quint64 generation);
    void markConnected();
    void handleTextMessage(quint64 generation, const QString &text);
    void handleReceiveFailure(quint64 generation, const QString &error);
    void scheduleReconnect();
    void cancelReconnect();
    void releaseTransport();

    BridgeSettings *m_settings;
    TransportFactory m_factory;
    QPointer<AgentTransport> m_transport;
    QTimer m_reconnectTimer;

    ConnectionState m_state;
    quint64 m_generation = 0;
    int m_staleCallbackCount = 0;
    int m_reconnectAttempt = 0;
    int m_lastScheduledDelayMs = 0;
    QString m_lastError;
};

} // namespace CodingBridge

#endif // CONNECTIONSUPERVISOR_H
