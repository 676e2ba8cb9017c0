/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NOTIFICATIONMANAGER_H
#define NOTIFICATIONMANAGER_H

#include "ProtocolTypes.h"
#include "codingbridge_export.h"

#include <QObject>
#include <QString>

namespace CodingBridge
{

class BridgeSettings;

/**
 * NotificationManager alerts the user about agent events while the host
 * application is not in the foreground.
 *
 * Desktop popups go through the KNotification framework. While the
 * application is active, or notifications are disabled in the settings,
 * nothing is shown and notificationSuppressed() is emitted instead.
 *
 * Notification types:
 * - Task complete
 * - Permission required
 * - Question from the agent
 * - Error
 */
class CODINGBRIDGE_EXPORT NotificationManager : public QObject
{
    Q_OBJECT

public:
    enum class NotificationType {
        TaskComplete,   // A turn finished
        Permission,     // A tool needs approval
        Question,       // The agent asked the user something
        Error           // The turn failed
    };
    Q_ENUM(NotificationType)

    explicit NotificationManager(BridgeSettings *settings, QObject *parent = nullptr);
    ~NotificationManager() override;

    bool isApplicationActive() const { return m_applicationActive; }
    void setApplicationActive(bool active);

    /**
     * Show a notification unless the application is active
     *
     * @return true if a notification was sent
     */
    bool notify(NotificationType type, const QString &title, const QString &message);

    void notifyTaskComplete(const QString &finalText);
    void notifyApprovalRequest(const ApprovalRequest &request);
    void notifyQuestion(const AskUserQuestionData &question);
    void notifyError(const QString &message);

    /**
     * First 100 characters of the final text, or a generic line if it is empty
     */
    static QString completionBody(const QString &finalText);

    /**
     * KNotification event id for a notification type
     */
    static QString eventId(NotificationType type);

    /**
     * Get icon name for notification type
     */
    static QString iconName(NotificationType type);

Q_SIGNALS:
    void notificationShown(NotificationType type, const QString &title, const QString &message);
    void notificationSuppressed(NotificationType type);

private:
    void showDesktopNotification(NotificationType type, const QString &title, const QString &message);

    BridgeSettings *m_settings;
    bool m_applicationActive = true;
};

} // namespace CodingBridge

#endif // NOTIFICATIONMANAGER_H
