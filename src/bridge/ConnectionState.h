/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONNECTIONSTATE_H
#define CONNECTIONSTATE_H

#include "codingbridge_export.h"

#include <QMetaType>
#include <QObject>
#include <QString>

namespace CodingBridge
{

/**
 * ConnectionState describes the single logical connection to the agent server.
 *
 * Only ConnectionSupervisor assigns it; everything else reads it.
 * The reconnect attempt number is meaningful only in the Reconnecting state.
 */
class CODINGBRIDGE_EXPORT ConnectionState
{
    Q_GADGET

public:
    enum class Kind {
        Disconnected,   // Idle, no connection wanted
        Connecting,     // Channel opened, liveness not yet confirmed
        Connected,      // Liveness confirmed
        Reconnecting    // Waiting for a scheduled reconnection
    };
    Q_ENUM(Kind)

    ConnectionState() = default;

    static ConnectionState disconnected();
    static ConnectionState connecting();
    static ConnectionState connected();
    static ConnectionState reconnecting(int attempt);

    Kind kind() const { return m_kind; }
    int attempt() const { return m_attempt; }

    bool isConnected() const { return m_kind == Kind::Connected; }

    /**
     * True while a connection is being established, including reconnection
     */
    bool isConnecting() const { return m_kind == Kind::Connecting || m_kind == Kind::Reconnecting; }

    bool isDisconnected() const { return m_kind == Kind::Disconnected; }

    /**
     * Short human readable label, e.g. "Reconnecting (2)..."
     */
    QString displayText() const;

    bool operator==(const ConnectionState &other) const
    {
        return m_kind == other.m_kind && m_attempt == other.m_attempt;
    }
    bool operator!=(const ConnectionState &other) const
    {
        return !(*this == other);
    }

private:
    ConnectionState(Kind kind, int attempt);

    Kind m_kind = Kind::Disconnected;
    int m_attempt = 0;
};

} // namespace CodingBridge

Q_DECLARE_METATYPE(CodingBridge::ConnectionState)

#endif // CONNECTIONSTATE_H
