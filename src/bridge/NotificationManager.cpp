/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "NotificationManager.h"
#include "BridgeSettings.h"

#include <KLocalizedString>
#include <KNotification>

#include <QDebug>

namespace CodingBridge
{

NotificationManager::NotificationManager(BridgeSettings *settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
{
}

NotificationManager::~NotificationManager() = default;

void NotificationManager::setApplicationActive(bool active)
{
    m_applicationActive = active;
}

bool NotificationManager::notify(NotificationType type, const QString &title, const QString &message)
{
    if (m_applicationActive || (m_settings && !m_settings->notificationsEnabled())) {
        Q_EMIT notificationSuppressed(type);
        return false;
    }

    showDesktopNotification(type, title, message);
    Q_EMIT notificationShown(type, title, message);
    return true;
}

void NotificationManager::notifyTaskComplete(const QString &finalText)
{
    notify(NotificationType::TaskComplete, i18n("Claude Code"), completionBody(finalText));
}

void NotificationManager::notifyApprovalRequest(const ApprovalRequest &request)
{
    notify(NotificationType::Permission, i18n("Approval Needed: %1", request.toolName), request.displayDescription());
}

void NotificationManager::notifyQuestion(const AskUserQuestionData &question)
{
    const QString text = question.questions.isEmpty() ? QString() : question.questions.first().question;
    notify(NotificationType::Question, i18n("Claude has a question"), text);
}

void NotificationManager::notifyError(const QString &message)
{
    notify(NotificationType::Error, i18n("Claude Code"), message);
}

QString NotificationManager::completionBody(const QString &finalText)
{
    const QString trimmed = finalText.trimmed();
    if (trimmed.isEmpty()) {
        return i18n("Task completed");
    }
    return trimmed.left(100);
}

QString NotificationManager::eventId(NotificationType type)
{
    switch (type) {
    case NotificationType::Permission:
        return QStringLiteral("permissionRequired");
    case NotificationType::Question:
        return QStringLiteral("question");
    case NotificationType::Error:
        return QStringLiteral("error");
    case NotificationType::TaskComplete:
    default:
        return QStringLiteral("taskComplete");
    }
}

QString NotificationManager::iconName(NotificationType type)
{
    switch (type) {
    case NotificationType::Permission:
        return QStringLiteral("dialog-password");
    case NotificationType::Question:
        return QStringLiteral("dialog-question");
    case NotificationType::Error:
        return QStringLiteral("dialog-error");
    case NotificationType::TaskComplete:
    default:
        return QStringLiteral("dialog-ok");
    }
}

void NotificationManager::showDesktopNotification(NotificationType type, const QString &title, const QString &message)
{
    qDebug() << "NotificationManager: Notifying" << eventId(type) << title;

    KNotification *notification = new KNotification(eventId(type), KNotification::CloseOnTimeout);
    notification->setTitle(title);
    notification->setText(message);
    notification->setIconName(iconName(type));
    notification->setComponentName(QStringLiteral("codingbridge"));

    notification->sendEvent();
}

} // namespace CodingBridge

#include "moc_NotificationManager.cpp"
