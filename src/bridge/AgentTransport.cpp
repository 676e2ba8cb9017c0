/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentTransport.h"

namespace CodingBridge
{

AgentTransport::AgentTransport(QObject *parent)
    : QObject(parent)
{
}

AgentTransport::~AgentTransport() = default;

} // namespace CodingBridge

#include "moc_AgentTransport.cpp"
