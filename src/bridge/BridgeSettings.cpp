/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "BridgeSettings.h"

#include <KConfigGroup>
#include <QUrlQuery>

namespace CodingBridge
{

BridgeSettings::BridgeSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    m_config = KSharedConfig::openConfig(configName);
}

void BridgeSettings::setPersistent(bool persistent)
{
    m_writeFlags = persistent ? KConfigBase::Normal : KConfigBase::WriteConfigFlags();
}

BridgeSettings::~BridgeSettings()
{
    save();
}

QString BridgeSettings::serverUrl() const
{
    KConfigGroup group(m_config, QStringLiteral("Server"));
    return group.readEntry("Url", QStringLiteral("http://localhost:3100"));
}

void BridgeSettings::setServerUrl(const QString &url)
{
    KConfigGroup group(m_config, QStringLiteral("Server"));
    group.writeEntry("Url", url.trimmed(), m_writeFlags);
    Q_EMIT settingsChanged();
}

QString BridgeSettings::authToken() const
{
    KConfigGroup group(m_config, QStringLiteral("Server"));
    return group.readEntry("AuthToken", QString());
}

void BridgeSettings::setAuthToken(const QString &token)
{
    KConfigGroup group(m_config, QStringLiteral("Server"));
    group.writeEntry("AuthToken", token, m_writeFlags);
    Q_EMIT settingsChanged();
}

QString BridgeSettings::webSocketUrlOverride() const
{
    KConfigGroup group(m_config, QStringLiteral("Server"));
    return group.readEntry("WebSocketUrl", QString());
}

void BridgeSettings::setWebSocketUrlOverride(const QString &url)
{
    KConfigGroup group(m_config, QStringLiteral("Server"));
    group.writeEntry("WebSocketUrl", url.trimmed(), m_writeFlags);
    Q_EMIT settingsChanged();
}

QUrl BridgeSettings::webSocketUrl() const
{
    const QString explicitUrl = webSocketUrlOverride();
    return deriveWebSocketUrl(explicitUrl.isEmpty() ? serverUrl() : explicitUrl, authToken());
}

int BridgeSettings::processingTimeoutSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return qMax(1, group.readEntry("ProcessingTimeout", DefaultProcessingTimeoutSeconds));
}

void BridgeSettings::setProcessingTimeoutSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("ProcessingTimeout", qMax(1, seconds), m_writeFlags);
    Q_EMIT settingsChanged();
}

QString BridgeSettings::defaultModel() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("DefaultModel", QString());
}

void BridgeSettings::setDefaultModel(const QString &model)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("DefaultModel", model, m_writeFlags);
    Q_EMIT settingsChanged();
}

QString BridgeSettings::permissionMode() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("PermissionMode", QString());
}

void BridgeSettings::setPermissionMode(const QString &mode)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("PermissionMode", mode, m_writeFlags);
    Q_EMIT settingsChanged();
}

bool BridgeSettings::notificationsEnabled() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("Enabled", true);
}

void BridgeSettings::setNotificationsEnabled(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("Enabled", enabled, m_writeFlags);
    Q_EMIT settingsChanged();
}

QUrl BridgeSettings::deriveWebSocketUrl(const QString &serverUrl, const QString &token)
{
    QUrl url(serverUrl.trimmed());
    if (!url.isValid() || url.host().isEmpty()) {
        return QUrl();
    }

    const QString scheme = url.scheme().toLower();
    if (scheme == QLatin1String("http") || scheme == QLatin1String("https")) {
        url.setScheme(scheme == QLatin1String("https") ? QStringLiteral("wss") : QStringLiteral("ws"));

        QString path = url.path();
        while (path.endsWith(QLatin1Char('/'))) {
            path.chop(1);
        }
        if (!path.endsWith(QLatin1String("/ws"))) {
            path += QStringLiteral("/ws");
        }
        url.setPath(path);
    } else if (scheme != QLatin1String("ws") && scheme != QLatin1String("wss")) {
        return QUrl();
    }

    if (!token.isEmpty()) {
        QUrlQuery query(url);
        if (!query.hasQueryItem(QStringLiteral("token"))) {
            query.addQueryItem(QStringLiteral("token"), token);
            url.setQuery(query);
        }
    }

    return url;
}

void BridgeSettings::save()
{
    m_config->sync();
}

} // namespace CodingBridge

#include "moc_BridgeSettings.cpp"
