/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProcessWatchdog.h"

#include <QDebug>

namespace CodingBridge
{

ProcessWatchdog::ProcessWatchdog(QObject *parent)
    : QObject(parent)
{
    m_pollTimer.setInterval(DefaultPollIntervalMs);
    connect(&m_pollTimer, &QTimer::timeout, this, &ProcessWatchdog::poll);
}

ProcessWatchdog::~ProcessWatchdog() = default;

void ProcessWatchdog::setTimeoutSeconds(int seconds)
{
    m_timeoutSeconds = qMax(1, seconds);
}

void ProcessWatchdog::setPollIntervalMs(int ms)
{
    m_pollTimer.setInterval(qMax(1, ms));
}

qint64 ProcessWatchdog::idleMs() const
{
    if (!m_armed || !m_lastActivity.isValid()) {
        return 0;
    }
    return m_lastActivity.elapsed();
}

void ProcessWatchdog::setActiveTool(const QString &toolName)
{
    m_activeTool = toolName;
}

QString ProcessWatchdog::formatElapsed(qint64 seconds)
{
    if (seconds >= 60) {
        return QStringLiteral("%1m %2s").arg(seconds / 60).arg(seconds % 60);
    }
    return QStringLiteral("%1s").arg(seconds);
}

QString ProcessWatchdog::stallMessage(qint64 elapsedSeconds, const QString &toolName)
{
    return QStringLiteral("Processing timeout - no response for %1 (last tool: %2)")
        .arg(formatElapsed(elapsedSeconds), toolName.isEmpty() ? QStringLiteral("unknown") : toolName);
}

void ProcessWatchdog::arm()
{
    m_armed = true;
    m_activeTool.clear();
    m_lastActivity.start();
    m_pollTimer.start();
}

void ProcessWatchdog::disarm()
{
    m_armed = false;
    m_pollTimer.stop();
}

void ProcessWatchdog::recordActivity()
{
    m_lastActivity.start();
}

void ProcessWatchdog::poll()
{
    if (!m_armed) {
        m_pollTimer.stop();
        return;
    }

    const qint64 elapsedSeconds = m_lastActivity.elapsed() / 1000;
    if (elapsedSeconds < m_timeoutSeconds) {
        return;
    }

    const QString message = stallMessage(elapsedSeconds, m_activeTool);
    qWarning() << "ProcessWatchdog:" << message;

    disarm();
    Q_EMIT stalled(message, elapsedSeconds);
}

} // namespace CodingBridge

#include "moc_ProcessWatchdog.cpp"
