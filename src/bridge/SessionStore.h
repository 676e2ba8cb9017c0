/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSTORE_H
#define SESSIONSTORE_H

#include "codingbridge_export.h"

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>

namespace CodingBridge
{

/**
 * Last known agent session for one project.
 *
 * Used to resume a project's conversation after a restart and to keep an
 * unsent draft around.
 */
struct CODINGBRIDGE_EXPORT SessionSnapshot {
    QString projectPath;        // Key; the command working directory
    QString sessionId;          // Server session, empty if none was bound
    QString model;              // Full model id last reported
    QDateTime lastActivity;
    bool wasProcessing = false; // A turn was open when the snapshot was written
    QString draft;              // Unsent command text

    bool isValid() const { return !projectPath.isEmpty(); }

    /**
     * Serialize to JSON
     */
    QJsonObject toJson() const;

    /**
     * Deserialize from JSON
     */
    static SessionSnapshot fromJson(const QJsonObject &obj);
};

/**
 * SessionStore persists one SessionSnapshot per project in
 * ~/.local/share/codingbridge/sessions.json.
 */
class CODINGBRIDGE_EXPORT SessionStore : public QObject
{
    Q_OBJECT

public:
    explicit SessionStore(const QString &filePath = defaultFilePath(), QObject *parent = nullptr);
    ~SessionStore() override;

    static QString defaultFilePath();

    QString filePath() const { return m_filePath; }

    SessionSnapshot snapshot(const QString &projectPath) const;
    QList<SessionSnapshot> snapshots() const;

    /**
     * Remember the session bound for a project (empty clears it)
     */
    void recordSession(const QString &projectPath, const QString &sessionId, const QString &model = QString());

    void recordProcessing(const QString &projectPath, bool processing);

    void saveDraft(const QString &projectPath, const QString &draft);

    void remove(const QString &projectPath);

    bool load();
    bool save();

Q_SIGNALS:
    void snapshotChanged(const QString &projectPath);

private:
    SessionSnapshot &entry(const QString &projectPath);
    void touch(const QString &projectPath);

    QString m_filePath;
    QHash<QString, SessionSnapshot> m_snapshots;
};

} // namespace CodingBridge

#endif // SESSIONSTORE_H
