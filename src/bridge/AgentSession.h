/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTSESSION_H
#define AGENTSESSION_H

#include "AgentTransport.h"
#include "ConnectionState.h"
#include "ProtocolTypes.h"
#include "codingbridge_export.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUuid>

namespace CodingBridge
{

class ApprovalProtocol;
class BridgeSettings;
class ConnectionSupervisor;
class ModelSwitchProtocol;
class NotificationManager;
class OutboundQueue;
class ProcessWatchdog;
class SessionRecoveryCoordinator;
class SessionStore;
class StreamAssembler;
struct PendingCommand;

/**
 * AgentSession is the client side of one conversation with the agent server.
 *
 * It wires the connection supervisor, stream assembler, outbound queue,
 * watchdog, recovery coordinator and the two interactive sub-protocols
 * together and is the only place where session state changes. Everything
 * runs on the thread that owns the session; only frame decoding happens on
 * a worker thread.
 *
 * Notifications and persistence are optional collaborators.
 */
class CODINGBRIDGE_EXPORT AgentSession : public QObject
{
    Q_OBJECT

public:
    /**
     * Kinds of errors reported through errorOccurred()
     */
    enum class ErrorKind {
        Transport,          // Connection or send failure
        Protocol,           // Malformed inbound frame, dropped
        Timeout,            // Watchdog declared a stall
        DeliveryExhausted,  // Command dropped after all send attempts
        Server              // Error reported by the server for the turn
    };
    Q_ENUM(ErrorKind)

    static constexpr int AbortTimeoutMs = 3000;

    AgentSession(BridgeSettings *settings, TransportFactory transportFactory, QObject *parent = nullptr);
    ~AgentSession() override;

    void setNotificationManager(NotificationManager *notifications);
    void setSessionStore(SessionStore *store);

    // ========== Connection ==========

    ConnectionState connectionState() const;

    // ========== Session state ==========

    QString projectPath() const { return m_projectPath; }
    void setProjectPath(const QString &path);

    /**
     * Bound server session; empty until the server mints one
     */
    QString sessionId() const { return m_sessionId; }

    TokenUsage tokenUsage() const { return m_tokenUsage; }

    AgentModel::Alias currentModel() const { return m_currentModel; }
    QString currentModelId() const { return m_currentModelId; }

    bool isProcessing() const { return m_processing; }
    bool isAborting() const { return m_aborting; }
    bool isReattaching() const;
    bool isSwitchingModel() const;

    QString lastError() const { return m_lastError; }

    /**
     * Visible text of the open assistant segment
     */
    QString currentText() const;

    QString lastActiveToolName() const;

    bool hasPendingApproval() const;
    ApprovalRequest pendingApproval() const;

    // ========== Commands ==========

    /**
     * Queue a command for the agent
     *
     * @param resumeSessionId Session to continue instead of the bound one
     * @return Id of the queued command
     */
    QUuid sendCommand(const QString &command, const QByteArray &imageData = QByteArray(), const QString &resumeSessionId = QString());

    /**
     * Ask the server to stop the running turn
     */
    void abortSession();

    /**
     * Forget the bound session; the next command starts a new one
     */
    void clearSession();

    /**
     * Drop queued commands and stop retrying
     */
    void cancelPendingCommands();

    bool attachToSession(const QString &sessionId);
    void recoverFromBackground(const QString &sessionId);

    bool approvePending(bool alwaysAllow = false);
    bool denyPending();

    /**
     * @param aliasOrModelId "opus", "sonnet", "haiku" or a full model id
     */
    bool switchModel(const QString &aliasOrModelId);

    /**
     * Whether the host application is in the foreground; notifications are only shown when it is not
     */
    void setApplicationActive(bool active);

    // ========== Components ==========

    ConnectionSupervisor *supervisor() const { return m_supervisor; }
    StreamAssembler *assembler() const { return m_assembler; }
    OutboundQueue *queue() const { return m_queue; }
    ProcessWatchdog *watchdog() const { return m_watchdog; }
    SessionRecoveryCoordinator *recovery() const { return m_recovery; }
    ApprovalProtocol *approvals() const { return m_approvals; }
    ModelSwitchProtocol *modelSwitch() const { return m_modelSwitch; }

public Q_SLOTS:
    void connectToServer();
    void disconnectFromServer();

Q_SIGNALS:
    void connectionStateChanged(const CodingBridge::ConnectionState &state);
    void processingChanged(bool processing);
    void lastErrorChanged(const QString &error);

    void sessionIdChanged(const QString &sessionId);
    void sessionCreated(const QString &sessionId);

    /**
     * The server dropped the session; the next command starts a fresh one
     */
    void sessionRecovered();

    void sessionAttached(const QString &sessionId);

    void textUpdated(const QString &text);
    void textCommitted(const QString &text);
    void toolUse(const QString &toolName, const QString &inputSummary);
    void toolResult(const QString &content);
    void thinking(const QString &content);
    void questionAsked(const CodingBridge::AskUserQuestionData &question);
    void tokenUsageChanged(const CodingBridge::TokenUsage &usage);
    void approvalRequested(const CodingBridge::ApprovalRequest &request);
    void modelChanged(CodingBridge::AgentModel::Alias alias, const QString &modelId);

    void turnCompleted(const QString &sessionId, const QString &finalText);
    void aborted();
    void errorOccurred(CodingBridge::AgentSession::ErrorKind kind, const QString &message);

    void sessionsUpdated(const QString &projectName, const QString &sessionId, const QString &action);
    void projectsUpdated();

private:
    void wireConnection();
    void wireAssembler();
    void wireQueue();
    void wireRecovery();

    void handleConnectionStateChanged(const ConnectionState &state);
    void handleReceiveFailed(const QString &error);
    void handleTurnCompleted(const QString &sessionId, const QString &finalText);
    void handleErrorFrame(const QString &message, const QString &code);
    void handleStall(const QString &message, qint64 elapsedSeconds);
    void handleCommandSending(const PendingCommand &command);
    void handleCommandFailed(const QUuid &id, const QString &message, bool terminal);

    void endTurn();
    void resetInFlightState();
    void resetProcessingState();
    void bindSessionId(const QString &sessionId);
    void setProcessing(bool processing);
    void setLastError(const QString &error);

    BridgeSettings *m_settings;
    NotificationManager *m_notifications = nullptr;
    SessionStore *m_store = nullptr;

    ConnectionSupervisor *m_supervisor;
    StreamAssembler *m_assembler;
    OutboundQueue *m_queue;
    ProcessWatchdog *m_watchdog;
    SessionRecoveryCoordinator *m_recovery;
    ApprovalProtocol *m_approvals;
    ModelSwitchProtocol *m_modelSwitch;

    QTimer m_abortTimer;

    QString m_projectPath;
    QString m_sessionId;
    TokenUsage m_tokenUsage;
    AgentModel::Alias m_currentModel = AgentModel::Alias::Default;
    QString m_currentModelId;
    QString m_lastError;
    bool m_processing = false;
    bool m_aborting = false;
    ConnectionState m_lastState;
};

} // namespace CodingBridge

#endif // AGENTSESSION_H
