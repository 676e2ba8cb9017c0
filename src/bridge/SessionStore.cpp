/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>

#include <utility>

namespace CodingBridge
{

QJsonObject SessionSnapshot::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("projectPath")] = projectPath;
    obj[QStringLiteral("sessionId")] = sessionId;
    if (!model.isEmpty()) {
        obj[QStringLiteral("model")] = model;
    }
    obj[QStringLiteral("lastActivity")] = lastActivity.toString(Qt::ISODate);
    obj[QStringLiteral("wasProcessing")] = wasProcessing;
    if (!draft.isEmpty()) {
        obj[QStringLiteral("draft")] = draft;
    }
    return obj;
}

SessionSnapshot SessionSnapshot::fromJson(const QJsonObject &obj)
{
    SessionSnapshot snapshot;
    snapshot.projectPath = obj.value(QStringLiteral("projectPath")).toString();
    snapshot.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    snapshot.model = obj.value(QStringLiteral("model")).toString();
    snapshot.lastActivity = QDateTime::fromString(obj.value(QStringLiteral("lastActivity")).toString(), Qt::ISODate);
    snapshot.wasProcessing = obj.value(QStringLiteral("wasProcessing")).toBool();
    snapshot.draft = obj.value(QStringLiteral("draft")).toString();
    return snapshot;
}

SessionStore::SessionStore(const QString &filePath, QObject *parent)
    : QObject(parent)
    , m_filePath(filePath)
{
    load();
}

SessionStore::~SessionStore() = default;

QString SessionStore::defaultFilePath()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return dataDir + QStringLiteral("/codingbridge/sessions.json");
}

SessionSnapshot SessionStore::snapshot(const QString &projectPath) const
{
    return m_snapshots.value(projectPath);
}

QList<SessionSnapshot> SessionStore::snapshots() const
{
    return m_snapshots.values();
}

SessionSnapshot &SessionStore::entry(const QString &projectPath)
{
    SessionSnapshot &snapshot = m_snapshots[projectPath];
    snapshot.projectPath = projectPath;
    return snapshot;
}

void SessionStore::touch(const QString &projectPath)
{
    entry(projectPath).lastActivity = QDateTime::currentDateTimeUtc();
    save();
    Q_EMIT snapshotChanged(projectPath);
}

void SessionStore::recordSession(const QString &projectPath, const QString &sessionId, const QString &model)
{
    if (projectPath.isEmpty()) {
        return;
    }
    SessionSnapshot &snapshot = entry(projectPath);
    snapshot.sessionId = sessionId;
    if (!model.isEmpty()) {
        snapshot.model = model;
    }
    touch(projectPath);
}

void SessionStore::recordProcessing(const QString &projectPath, bool processing)
{
    if (projectPath.isEmpty()) {
        return;
    }
    entry(projectPath).wasProcessing = processing;
    touch(projectPath);
}

void SessionStore::saveDraft(const QString &projectPath, const QString &draft)
{
    if (projectPath.isEmpty()) {
        return;
    }
    entry(projectPath).draft = draft;
    touch(projectPath);
}

void SessionStore::remove(const QString &projectPath)
{
    if (m_snapshots.remove(projectPath) > 0) {
        save();
        Q_EMIT snapshotChanged(projectPath);
    }
}

bool SessionStore::load()
{
    QFile file(m_filePath);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "SessionStore: Ignoring unreadable" << m_filePath << error.errorString();
        return false;
    }

    m_snapshots.clear();
    const QJsonArray sessions = doc.object().value(QStringLiteral("sessions")).toArray();
    for (const QJsonValue &value : sessions) {
        const SessionSnapshot snapshot = SessionSnapshot::fromJson(value.toObject());
        if (snapshot.isValid()) {
            m_snapshots.insert(snapshot.projectPath, snapshot);
        }
    }
    return true;
}

bool SessionStore::save()
{
    QFileInfo fileInfo(m_filePath);
    QDir().mkpath(fileInfo.absolutePath());

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "SessionStore: Cannot write" << m_filePath << file.errorString();
        return false;
    }

    QJsonArray sessions;
    for (const SessionSnapshot &snapshot : std::as_const(m_snapshots)) {
        sessions.append(snapshot.toJson());
    }

    QJsonObject root;
    root[QStringLiteral("version")] = 1;
    root[QStringLiteral("sessions")] = sessions;

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

} // namespace CodingBridge

#include "moc_SessionStore.cpp"
