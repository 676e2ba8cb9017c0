/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentSession.h"
#include "ApprovalProtocol.h"
#include "BridgeSettings.h"
#include "ConnectionSupervisor.h"
#include "ModelSwitchProtocol.h"
#include "NotificationManager.h"
#include "OutboundQueue.h"
#include "ProcessWatchdog.h"
#include "SessionRecoveryCoordinator.h"
#include "SessionStore.h"
#include "StreamAssembler.h"

#include <QDebug>

#include <utility>

namespace CodingBridge
{

AgentSession::AgentSession(BridgeSettings *settings, TransportFactory transportFactory, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_supervisor(new ConnectionSupervisor(settings, std::move(transportFactory), this))
    , m_assembler(new StreamAssembler(this))
    , m_queue(new OutboundQueue(m_supervisor, this))
    , m_watchdog(new ProcessWatchdog(this))
    , m_recovery(new SessionRecoveryCoordinator(m_supervisor, this))
    , m_approvals(new ApprovalProtocol(m_supervisor, this))
    , m_modelSwitch(new ModelSwitchProtocol(m_supervisor, this))
{
    m_watchdog->setTimeoutSeconds(m_settings->processingTimeoutSeconds());
    connect(m_settings, &BridgeSettings::settingsChanged, this, [this]() {
        m_watchdog->setTimeoutSeconds(m_settings->processingTimeoutSeconds());
    });

    m_abortTimer.setSingleShot(true);
    m_abortTimer.setInterval(AbortTimeoutMs);
    connect(&m_abortTimer, &QTimer::timeout, this, [this]() {
        if (!m_aborting) {
            return;
        }
        qWarning() << "AgentSession: Abort not confirmed by server, resetting locally";
        resetProcessingState();
        Q_EMIT aborted();
    });

    wireConnection();
    wireAssembler();
    wireQueue();
    wireRecovery();
}

AgentSession::~AgentSession() = default;

void AgentSession::setNotificationManager(NotificationManager *notifications)
{
    m_notifications = notifications;
}

void AgentSession::setSessionStore(SessionStore *store)
{
    m_store = store;
}

void AgentSession::wireConnection()
{
    connect(m_supervisor, &ConnectionSupervisor::stateChanged, this, &AgentSession::handleConnectionStateChanged);
    connect(m_supervisor, &ConnectionSupervisor::generationChanged, m_assembler, &StreamAssembler::setCurrentGeneration);
    connect(m_supervisor, &ConnectionSupervisor::frameReceived, this, [this](const QString &text, quint64 generation) {
        m_watchdog->recordActivity();
        m_assembler->submitFrame(text, generation);
    });
    connect(m_supervisor, &ConnectionSupervisor::receiveFailed, this, &AgentSession::handleReceiveFailed);
    connect(m_supervisor, &ConnectionSupervisor::connectionConfirmed, m_queue, &OutboundQueue::connectionConfirmed);
    connect(m_supervisor, &ConnectionSupervisor::errorOccurred, this, [this](const QString &message) {
        setLastError(message);
        Q_EMIT errorOccurred(ErrorKind::Transport, message);
    });

    connect(m_watchdog, &ProcessWatchdog::stalled, this, &AgentSession::handleStall);
}

void AgentSession::wireAssembler()
{
    connect(m_assembler, &StreamAssembler::sessionCreated, this, [this](const QString &sessionId) {
        bindSessionId(sessionId);
        Q_EMIT sessionCreated(sessionId);
    });
    connect(m_assembler, &StreamAssembler::systemInit, this, [this](const QString &sessionId, const QString &model) {
        if (m_sessionId.isEmpty() && !sessionId.isEmpty()) {
            bindSessionId(sessionId);
        }
        if (!model.isEmpty() && model != m_currentModelId) {
            m_currentModelId = model;
            m_currentModel = AgentModel::parseAlias(model);
            Q_EMIT modelChanged(m_currentModel, m_currentModelId);
        }
    });
    connect(m_assembler, &StreamAssembler::contentReceived, m_recovery, &SessionRecoveryCoordinator::contentReceived);
    connect(m_assembler, &StreamAssembler::textDelta, m_modelSwitch, &ModelSwitchProtocol::handleText);
    connect(m_assembler, &StreamAssembler::textUpdated, this, &AgentSession::textUpdated);
    connect(m_assembler, &StreamAssembler::textCommitted, this, &AgentSession::textCommitted);
    connect(m_assembler, &StreamAssembler::toolUse, this, [this](const QString &toolName, const QString &inputSummary) {
        m_watchdog->setActiveTool(toolName);
        Q_EMIT toolUse(toolName, inputSummary);
    });
    connect(m_assembler, &StreamAssembler::toolResult, this, &AgentSession::toolResult);
    connect(m_assembler, &StreamAssembler::thinking, this, &AgentSession::thinking);
    connect(m_assembler, &StreamAssembler::questionAsked, this, [this](const AskUserQuestionData &question) {
        m_watchdog->setActiveTool(StreamAssembler::questionToolName());
        if (m_notifications) {
            m_notifications->notifyQuestion(question);
        }
        Q_EMIT questionAsked(question);
    });
    connect(m_assembler, &StreamAssembler::tokenBudget, this, [this](const TokenUsage &usage) {
        m_tokenUsage = usage;
        Q_EMIT tokenUsageChanged(m_tokenUsage);
    });
    connect(m_assembler, &StreamAssembler::turnCompleted, this, &AgentSession::handleTurnCompleted);
    connect(m_assembler, &StreamAssembler::errorFrame, this, &AgentSession::handleErrorFrame);
    connect(m_assembler, &StreamAssembler::abortedFrame, this, [this]() {
        resetProcessingState();
        Q_EMIT aborted();
    });
    connect(m_assembler, &StreamAssembler::permissionRequested, this, [this](const ApprovalRequest &request) {
        if (!m_approvals->offer(request)) {
            return;
        }
        if (m_notifications) {
            m_notifications->notifyApprovalRequest(request);
        }
        Q_EMIT approvalRequested(request);
    });
    connect(m_assembler, &StreamAssembler::sessionsUpdated, this, &AgentSession::sessionsUpdated);
    connect(m_assembler, &StreamAssembler::projectsUpdated, this, &AgentSession::projectsUpdated);
    connect(m_assembler, &StreamAssembler::decodeFailed, this, [this](const QString &error) {
        Q_EMIT errorOccurred(ErrorKind::Protocol, error);
    });
}

void AgentSession::wireQueue()
{
    connect(m_queue, &OutboundQueue::commandSending, this, &AgentSession::handleCommandSending);
    connect(m_queue, &OutboundQueue::retryScheduled, this, [this](const QUuid &, int attempt, int) {
        // The attempt about to run, not the one that failed
        setLastError(QStringLiteral("Retrying... (attempt %1/%2)").arg(attempt + 1).arg(OutboundQueue::MaxAttempts));
    });
    connect(m_queue, &OutboundQueue::commandFailed, this, &AgentSession::handleCommandFailed);
}

void AgentSession::wireRecovery()
{
    connect(m_recovery, &SessionRecoveryCoordinator::reattachStarted, this, [this](const QString &sessionId) {
        bindSessionId(sessionId);
        m_queue->beginExternalTurn();
        setProcessing(true);
        m_watchdog->arm();
    });
    connect(m_recovery, &SessionRecoveryCoordinator::attached, this, &AgentSession::sessionAttached);
    connect(m_recovery, &SessionRecoveryCoordinator::reattachFailed, this, [this](const QString &, const QString &error) {
        m_watchdog->disarm();
        setProcessing(false);
        setLastError(error);
        m_queue->abandonExternalTurn();
    });

    connect(m_modelSwitch, &ModelSwitchProtocol::modelChanged, this, [this](AgentModel::Alias alias, const QString &modelId) {
        m_currentModel = alias;
        m_currentModelId = modelId;
        if (m_store) {
            m_store->recordSession(m_projectPath, m_sessionId, m_currentModelId);
        }
        Q_EMIT modelChanged(m_currentModel, m_currentModelId);
    });
    connect(m_modelSwitch, &ModelSwitchProtocol::switchFailed, this, [this](const QString &error) {
        setLastError(error);
        m_queue->abandonExternalTurn();
    });
}

// ========== State accessors ==========

ConnectionState AgentSession::connectionState() const
{
    return m_supervisor->state();
}

void AgentSession::setProjectPath(const QString &path)
{
    m_projectPath = path;
}

bool AgentSession::isReattaching() const
{
    return m_recovery->isReattaching();
}

bool AgentSession::isSwitchingModel() const
{
    return m_modelSwitch->isSwitching();
}

QString AgentSession::currentText() const
{
    return m_assembler->currentText();
}

QString AgentSession::lastActiveToolName() const
{
    return m_watchdog->activeTool();
}

bool AgentSession::hasPendingApproval() const
{
    return m_approvals->hasPending();
}

ApprovalRequest AgentSession::pendingApproval() const
{
    return m_approvals->pending();
}

// ========== Operations ==========

void AgentSession::connectToServer()
{
    m_supervisor->connectToServer();
}

void AgentSession::disconnectFromServer()
{
    m_supervisor->disconnectFromServer();
    resetInFlightState();
    m_queue->connectionClosed();
}

QUuid AgentSession::sendCommand(const QString &command, const QByteArray &imageData, const QString &resumeSessionId)
{
    PendingCommand pending;
    pending.command = command;
    pending.projectPath = m_projectPath;
    pending.sessionId = resumeSessionId.isEmpty() ? m_sessionId : resumeSessionId;
    pending.permissionMode = m_settings->permissionMode();
    pending.model = m_settings->defaultModel();
    pending.imageData = imageData;
    return m_queue->submit(pending);
}

void AgentSession::abortSession()
{
    if (m_aborting) {
        qDebug() << "AgentSession: Abort already in progress";
        return;
    }

    const QString sessionId = SessionId::validated(m_sessionId);
    if (sessionId.isEmpty()) {
        // Nothing the server could abort
        resetProcessingState();
        Q_EMIT aborted();
        return;
    }

    qDebug() << "AgentSession: Aborting session" << SessionId::shortForm(sessionId);
    m_aborting = true;
    m_abortTimer.start();

    AbortFrame frame;
    frame.sessionId = sessionId;
    m_supervisor->sendText(frame.toWireText(), [this](const QString &error) {
        if (error.isEmpty() || !m_aborting) {
            return;
        }
        qWarning() << "AgentSession: Abort request failed:" << error;
        resetProcessingState();
        Q_EMIT aborted();
    });
}

void AgentSession::clearSession()
{
    qDebug() << "AgentSession: Clearing session" << SessionId::shortForm(m_sessionId);
    bindSessionId(QString());
    if (m_tokenUsage != TokenUsage()) {
        m_tokenUsage = TokenUsage();
        Q_EMIT tokenUsageChanged(m_tokenUsage);
    }
}

void AgentSession::cancelPendingCommands()
{
    m_queue->clear();
}

bool AgentSession::attachToSession(const QString &sessionId)
{
    return m_recovery->attachToSession(sessionId, m_projectPath);
}

void AgentSession::recoverFromBackground(const QString &sessionId)
{
    m_recovery->recoverFromBackground(sessionId, m_projectPath);
}

bool AgentSession::approvePending(bool alwaysAllow)
{
    return m_approvals->approve(alwaysAllow);
}

bool AgentSession::denyPending()
{
    return m_approvals->deny();
}

bool AgentSession::switchModel(const QString &aliasOrModelId)
{
    if (!m_modelSwitch->switchModel(aliasOrModelId, m_projectPath, m_sessionId)) {
        return false;
    }
    // The confirmation arrives as an ordinary turn
    m_queue->beginExternalTurn();
    return true;
}

void AgentSession::setApplicationActive(bool active)
{
    if (m_notifications) {
        m_notifications->setApplicationActive(active);
    }
}

// ========== Event handling ==========

void AgentSession::handleConnectionStateChanged(const ConnectionState &state)
{
    const bool wasConnected = m_lastState.isConnected();
    m_lastState = state;

    // A response cannot still be arriving over a connection that is gone
    if (wasConnected && !state.isConnected()) {
        resetInFlightState();
    }

    Q_EMIT connectionStateChanged(state);
}

void AgentSession::handleReceiveFailed(const QString &error)
{
    resetInFlightState();
    setLastError(error);
}

void AgentSession::handleCommandSending(const PendingCommand &command)
{
    Q_UNUSED(command);

    m_assembler->reset();
    setLastError(QString());
    setProcessing(true);
    m_watchdog->arm();

    if (m_store) {
        m_store->recordProcessing(m_projectPath, true);
    }
}

void AgentSession::handleCommandFailed(const QUuid &id, const QString &message, bool terminal)
{
    if (!terminal) {
        setLastError(message);
        return;
    }

    qWarning() << "AgentSession: Command" << id << "dropped:" << message;
    m_watchdog->disarm();
    setProcessing(false);
    setLastError(QStringLiteral("Message failed after %1 attempts").arg(OutboundQueue::MaxAttempts));

    if (m_store) {
        m_store->recordProcessing(m_projectPath, false);
    }
    Q_EMIT errorOccurred(ErrorKind::DeliveryExhausted, message);
}

void AgentSession::handleTurnCompleted(const QString &sessionId, const QString &finalText)
{
    m_recovery->turnCompleted();
    m_watchdog->disarm();

    if (!sessionId.isEmpty()) {
        bindSessionId(sessionId);
    }

    m_modelSwitch->handleTurnCompleted(finalText);
    setProcessing(false);

    if (m_notifications) {
        m_notifications->notifyTaskComplete(finalText);
    }

    Q_EMIT turnCompleted(m_sessionId, finalText);
    endTurn();
}

void AgentSession::handleErrorFrame(const QString &message, const QString &code)
{
    m_recovery->cancel();
    m_modelSwitch->cancel();
    m_watchdog->disarm();
    setProcessing(false);

    if (!m_sessionId.isEmpty() && SessionErrorClassifier::isSessionError(message, code)) {
        qDebug() << "AgentSession: Session" << SessionId::shortForm(m_sessionId) << "is gone, starting fresh:" << message;
        bindSessionId(QString());
        setLastError(QStringLiteral("Session expired, starting fresh..."));
        Q_EMIT sessionRecovered();
    } else {
        qWarning() << "AgentSession: Server error:" << message;
        setLastError(message);
        if (m_notifications) {
            m_notifications->notifyError(message);
        }
        Q_EMIT errorOccurred(ErrorKind::Server, message);
    }

    endTurn();
}

void AgentSession::handleStall(const QString &message, qint64 elapsedSeconds)
{
    Q_UNUSED(elapsedSeconds);

    m_recovery->cancel();
    m_modelSwitch->cancel();
    m_assembler->flush();
    setProcessing(false);
    setLastError(message + QStringLiteral(". Long operations may need an increased timeout in the settings."));

    if (m_notifications) {
        m_notifications->notifyError(message);
    }
    Q_EMIT errorOccurred(ErrorKind::Timeout, message);

    endTurn();
}

void AgentSession::endTurn()
{
    m_aborting = false;
    m_abortTimer.stop();
    m_assembler->reset();

    if (m_store) {
        m_store->recordProcessing(m_projectPath, false);
    }

    m_queue->turnFinished();
}

void AgentSession::resetInFlightState()
{
    m_watchdog->disarm();
    m_assembler->reset();
    m_queue->connectionLost();
    m_recovery->connectionLost();
    setProcessing(false);
}

void AgentSession::resetProcessingState()
{
    m_aborting = false;
    m_abortTimer.stop();
    m_assembler->reset();
    m_modelSwitch->cancel();
    m_watchdog->disarm();
    m_queue->clear();
    m_approvals->clear();
    m_recovery->cancel();
    setProcessing(false);
    setLastError(QString());

    if (m_store) {
        m_store->recordProcessing(m_projectPath, false);
    }
}

void AgentSession::bindSessionId(const QString &sessionId)
{
    if (m_sessionId == sessionId) {
        return;
    }

    qDebug() << "AgentSession: Session" << SessionId::shortForm(m_sessionId) << "->" << SessionId::shortForm(sessionId);
    m_sessionId = sessionId;

    if (m_store) {
        m_store->recordSession(m_projectPath, m_sessionId, m_currentModelId);
    }
    Q_EMIT sessionIdChanged(m_sessionId);
}

void AgentSession::setProcessing(bool processing)
{
    if (m_processing == processing) {
        return;
    }
    m_processing = processing;
    Q_EMIT processingChanged(m_processing);
}

void AgentSession::setLastError(const QString &error)
{
    if (m_lastError == error) {
        return;
    }
    m_lastError = error;
    Q_EMIT lastErrorChanged(m_lastError);
}

} // namespace CodingBridge

#include "moc_AgentSession.cpp"
