/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSWATCHDOG_H
#define PROCESSWATCHDOG_H

#include "codingbridge_export.h"

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QTimer>

namespace CodingBridge
{

/**
 * ProcessWatchdog detects a stalled command.
 *
 * While armed it polls the time since the last inbound frame. When that
 * exceeds the timeout it disarms itself and emits stalled() with a message
 * naming the elapsed time and the last tool the agent was running.
 */
class CODINGBRIDGE_EXPORT ProcessWatchdog : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultPollIntervalMs = 5000;

    explicit ProcessWatchdog(QObject *parent = nullptr);
    ~ProcessWatchdog() override;

    int timeoutSeconds() const { return m_timeoutSeconds; }
    void setTimeoutSeconds(int seconds);

    int pollIntervalMs() const { return m_pollTimer.interval(); }
    void setPollIntervalMs(int ms);

    bool isArmed() const { return m_armed; }

    /**
     * Milliseconds since the last recorded activity, 0 while disarmed
     */
    qint64 idleMs() const;

    QString activeTool() const { return m_activeTool; }
    void setActiveTool(const QString &toolName);

    /**
     * "5m 0s" for 300, "45s" for 45
     */
    static QString formatElapsed(qint64 seconds);

    static QString stallMessage(qint64 elapsedSeconds, const QString &toolName);

public Q_SLOTS:
    /**
     * Start watching a command that was just sent
     */
    void arm();

    void disarm();

    /**
     * Reset the idle clock; called for every inbound frame
     */
    void recordActivity();

Q_SIGNALS:
    void stalled(const QString &message, qint64 elapsedSeconds);

private:
    void poll();

    QTimer m_pollTimer;
    QElapsedTimer m_lastActivity;
    QString m_activeTool;
    int m_timeoutSeconds = 300;
    bool m_armed = false;
};

} // namespace CodingBridge

#endif // PROCESSWATCHDOG_H
