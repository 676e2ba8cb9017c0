/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef BRIDGESETTINGS_H
#define BRIDGESETTINGS_H

#include "codingbridge_export.h"

#include <QObject>
#include <QString>
#include <QUrl>

#include <KSharedConfig>

namespace CodingBridge
{

/**
 * BridgeSettings holds the client configuration.
 *
 * Settings include:
 * - Server URL and auth token (the WebSocket endpoint is derived from them)
 * - Processing timeout for the stall watchdog
 * - Default model and permission mode sent with each command
 * - Whether desktop notifications are shown
 *
 * Stored in ~/.config/codingbridgerc unless another config name is given.
 */
class CODINGBRIDGE_EXPORT BridgeSettings : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultProcessingTimeoutSeconds = 300;

    explicit BridgeSettings(const QString &configName = QStringLiteral("codingbridgerc"), QObject *parent = nullptr);
    ~BridgeSettings() override;

    /**
     * When false, changes made through the setters only last for this process
     */
    void setPersistent(bool persistent);

    /**
     * HTTP(S) base URL of the agent server (default: http://localhost:3100)
     */
    QString serverUrl() const;
    void setServerUrl(const QString &url);

    /**
     * Token appended to the WebSocket URL as ?token=
     */
    QString authToken() const;
    void setAuthToken(const QString &token);

    /**
     * Explicit ws:// or wss:// endpoint; overrides the derived one when set
     */
    QString webSocketUrlOverride() const;
    void setWebSocketUrlOverride(const QString &url);

    /**
     * Endpoint the connection supervisor opens
     */
    QUrl webSocketUrl() const;

    /**
     * Seconds without inbound activity before an in-flight command is declared stalled
     */
    int processingTimeoutSeconds() const;
    void setProcessingTimeoutSeconds(int seconds);

    /**
     * Model sent with each command; empty means the server default
     */
    QString defaultModel() const;
    void setDefaultModel(const QString &model);

    /**
     * Permission mode sent with each command; empty means the server default
     */
    QString permissionMode() const;
    void setPermissionMode(const QString &mode);

    bool notificationsEnabled() const;
    void setNotificationsEnabled(bool enabled);

    /**
     * Build the WebSocket endpoint for an HTTP(S) or WS(S) server URL
     */
    static QUrl deriveWebSocketUrl(const QString &serverUrl, const QString &token);

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfig::Ptr m_config;
    KConfigBase::WriteConfigFlags m_writeFlags = KConfigBase::Normal;
};

} // namespace CodingBridge

#endif // BRIDGESETTINGS_H
