/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MODELSWITCHPROTOCOL_H
#define MODELSWITCHPROTOCOL_H

#include "ProtocolTypes.h"
#include "codingbridge_export.h"

#include <QObject>
#include <QTimer>

namespace CodingBridge
{

class ConnectionSupervisor;

/**
 * ModelSwitchProtocol changes the model of the bound session.
 *
 * The switch is a "/model <name>" command sent outside the command queue.
 * The server confirms it in plain text ("Set model to sonnet (claude-...)")
 * inside the turn that follows. If no confirmation shows up within five
 * seconds the switching flag is dropped anyway.
 */
class CODINGBRIDGE_EXPORT ModelSwitchProtocol : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultTimeoutMs = 5000;

    explicit ModelSwitchProtocol(ConnectionSupervisor *supervisor, QObject *parent = nullptr);
    ~ModelSwitchProtocol() override;

    bool isSwitching() const { return m_switching; }

    void setTimeoutMs(int ms);

    /**
     * Argument of the "/model" command for an alias or a custom model id
     */
    static QString commandArgument(const QString &aliasOrModelId);

    /**
     * @param aliasOrModelId "opus", "sonnet", "haiku" or a full model id
     * @return false if the argument is empty
     */
    bool switchModel(const QString &aliasOrModelId, const QString &projectPath, const QString &sessionId);

    /**
     * Check one inbound text block for the confirmation
     *
     * @return true if it confirmed the switch
     */
    bool handleText(const QString &text);

    /**
     * The turn ended; parse its final text if a switch is still open
     */
    void handleTurnCompleted(const QString &finalText);

public Q_SLOTS:
    void cancel();

Q_SIGNALS:
    void switchingChanged(bool switching);
    void modelChanged(CodingBridge::AgentModel::Alias alias, const QString &modelId);
    void switchFailed(const QString &error);

private:
    void setSwitching(bool switching);
    bool applyConfirmation(const QString &text);

    ConnectionSupervisor *m_supervisor;
    QTimer m_timeoutTimer;
    bool m_switching = false;
};

} // namespace CodingBridge

#endif // MODELSWITCHPROTOCOL_H
