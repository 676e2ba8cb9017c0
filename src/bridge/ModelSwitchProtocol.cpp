/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ModelSwitchProtocol.h"
#include "ConnectionSupervisor.h"

#include <QDebug>

namespace CodingBridge
{

ModelSwitchProtocol::ModelSwitchProtocol(ConnectionSupervisor *supervisor, QObject *parent)
    : QObject(parent)
    , m_supervisor(supervisor)
{
    m_timeoutTimer.setSingleShot(true);
    m_timeoutTimer.setInterval(DefaultTimeoutMs);
    connect(&m_timeoutTimer, &QTimer::timeout, this, [this]() {
        if (m_switching) {
            qWarning() << "ModelSwitchProtocol: No confirmation received, giving up";
            setSwitching(false);
        }
    });
}

ModelSwitchProtocol::~ModelSwitchProtocol() = default;

void ModelSwitchProtocol::setTimeoutMs(int ms)
{
    m_timeoutTimer.setInterval(qMax(0, ms));
}

QString ModelSwitchProtocol::commandArgument(const QString &aliasOrModelId)
{
    const QString trimmed = aliasOrModelId.trimmed();
    const QString lower = trimmed.toLower();
    const AgentModel::Alias alias = AgentModel::parseAlias(lower);

    // Bare aliases go out lower case, anything else verbatim
    if (alias != AgentModel::Alias::Custom && alias != AgentModel::Alias::Default && lower == AgentModel::aliasName(alias)) {
        return lower;
    }
    return trimmed;
}

bool ModelSwitchProtocol::switchModel(const QString &aliasOrModelId, const QString &projectPath, const QString &sessionId)
{
    const QString argument = commandArgument(aliasOrModelId);
    if (argument.isEmpty()) {
        return false;
    }

    CommandFrame frame;
    frame.command = QStringLiteral("/model %1").arg(argument);
    frame.projectPath = projectPath;
    frame.sessionId = sessionId;

    qDebug() << "ModelSwitchProtocol: Switching to" << argument;
    setSwitching(true);
    m_timeoutTimer.start();

    m_supervisor->sendText(frame.toWireText(), [this](const QString &error) {
        if (error.isEmpty()) {
            return;
        }
        qWarning() << "ModelSwitchProtocol: Send failed:" << error;
        m_timeoutTimer.stop();
        setSwitching(false);
        Q_EMIT switchFailed(QStringLiteral("Failed to switch model"));
    });
    return true;
}

bool ModelSwitchProtocol::handleText(const QString &text)
{
    if (!m_switching || !AgentModel::isSwitchConfirmation(text)) {
        return false;
    }
    return applyConfirmation(text);
}

void ModelSwitchProtocol::handleTurnCompleted(const QString &finalText)
{
    if (!m_switching) {
        return;
    }
    if (AgentModel::isSwitchConfirmation(finalText)) {
        applyConfirmation(finalText);
        return;
    }
    m_timeoutTimer.stop();
    setSwitching(false);
}

bool ModelSwitchProtocol::applyConfirmation(const QString &text)
{
    m_timeoutTimer.stop();

    AgentModel::Alias alias = AgentModel::Alias::Default;
    QString modelId;
    if (!AgentModel::parseSwitchConfirmation(text, &alias, &modelId)) {
        qWarning() << "ModelSwitchProtocol: Could not parse model id from" << text;
        setSwitching(false);
        return false;
    }

    qDebug() << "ModelSwitchProtocol: Model is now" << modelId;
    setSwitching(false);
    Q_EMIT modelChanged(alias, modelId);
    return true;
}

void ModelSwitchProtocol::cancel()
{
    m_timeoutTimer.stop();
    setSwitching(false);
}

void ModelSwitchProtocol::setSwitching(bool switching)
{
    if (m_switching == switching) {
        return;
    }
    m_switching = switching;
    Q_EMIT switchingChanged(m_switching);
}

} // namespace CodingBridge

#include "moc_ModelSwitchProtocol.cpp"
