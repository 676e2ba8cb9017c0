/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTTRANSPORT_H
#define AGENTTRANSPORT_H

#include "codingbridge_export.h"

#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

namespace CodingBridge
{

/**
 * AgentTransport is one physical, message oriented connection to the server.
 *
 * A transport is used for exactly one connection attempt. ConnectionSupervisor
 * creates a fresh one for every attempt and discards the old one.
 *
 * Completion callbacks receive an empty string on success and an error
 * description on failure. They are always invoked from the event loop,
 * never from inside the call that registered them.
 */
class CODINGBRIDGE_EXPORT AgentTransport : public QObject
{
    Q_OBJECT

public:
    using Completion = std::function<void(const QString &error)>;

    explicit AgentTransport(QObject *parent = nullptr);
    ~AgentTransport() override;

    virtual void open(const QUrl &url) = 0;

    /**
     * Close without reporting a receive failure
     */
    virtual void close() = 0;

    /**
     * Liveness probe. Completes once the server has answered.
     */
    virtual void ping(Completion completion) = 0;

    virtual void sendTextMessage(const QString &message, Completion completion) = 0;

Q_SIGNALS:
    void textMessageReceived(const QString &message);

    /**
     * The connection broke. Emitted at most once per transport.
     */
    void receiveFailed(const QString &error);
};

/**
 * Creates a new, unopened transport for each connection attempt
 */
using TransportFactory = std::function<AgentTransport *()>;

} // namespace CodingBridge

#endif // AGENTTRANSPORT_H
