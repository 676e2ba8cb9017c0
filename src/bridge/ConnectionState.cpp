/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ConnectionState.h"

namespace CodingBridge
{

ConnectionState::ConnectionState(Kind kind, int attempt)
    : m_kind(kind)
    , m_attempt(attempt)
{
}

ConnectionState ConnectionState::disconnected()
{
    return ConnectionState(Kind::Disconnected, 0);
}

ConnectionState ConnectionState::connecting()
{
    return ConnectionState(Kind::Connecting, 0);
}

ConnectionState ConnectionState::connected()
{
    return ConnectionState(Kind::Connected, 0);
}

ConnectionState ConnectionState::reconnecting(int attempt)
{
    return ConnectionState(Kind::Reconnecting, qMax(attempt, 1));
}

QString ConnectionState::displayText() const
{
    switch (m_kind) {
    case Kind::Connecting:
        return QStringLiteral("Connecting...");
    case Kind::Connected:
        return QStringLiteral("Connected");
    case Kind::Reconnecting:
        return QStringLiteral("Reconnecting (%1)...").arg(m_attempt);
    case Kind::Disconnected:
    default:
        return QStringLiteral("Disconnected");
    }
}

} // namespace CodingBridge

#include "moc_ConnectionState.cpp"
