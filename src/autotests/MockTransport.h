/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MOCKTRANSPORT_H
#define MOCKTRANSPORT_H

#include "../bridge/AgentTransport.h"

#include <QJsonObject>
#include <QList>
#include <QPointer>
#include <QStringList>

namespace CodingBridge
{

class MockNetwork;

/**
 * In-memory transport driven by the test. Sent frames are recorded and
 * completions are either automatic or released by the test.
 */
class MockTransport : public AgentTransport
{
    Q_OBJECT

public:
    explicit MockTransport(MockNetwork *network);

    void open(const QUrl &url) override;
    void close() override;
    void ping(Completion completion) override;
    void sendTextMessage(const QString &message, Completion completion) override;

    QUrl url() const { return m_url; }
    bool isOpen() const { return m_open; }
    bool isClosed() const { return m_closed; }
    QStringList sentMessages() const { return m_sent; }
    QList<QJsonObject> sentFrames() const;

    int pendingPingCount() const { return m_pendingPings.size(); }
    int pendingSendCount() const { return m_pendingSends.size(); }

    void completePings(const QString &error = QString());
    void completeSends(const QString &error = QString());

    void deliver(const QString &text);
    void deliver(const QJsonObject &frame);

    /**
     * Break the connection: pending sends fail, then receiveFailed is emitted
     */
    void failReceive(const QString &error = QStringLiteral("Connection reset"));

private:
    void completeLater(Completion completion, const QString &error);

    MockNetwork *m_network;
    QUrl m_url;
    bool m_open = false;
    bool m_closed = false;
    QStringList m_sent;
    QList<Completion> m_pendingPings;
    QList<Completion> m_pendingSends;
};

/**
 * Hands out MockTransports and remembers them for inspection
 */
class MockNetwork : public QObject
{
    Q_OBJECT

public:
    explicit MockNetwork(QObject *parent = nullptr);

    bool autoPong = true;
    bool autoCompleteSends = true;
    bool failSends = false;

    TransportFactory factory();

    int transportCount() const { return m_transports.size(); }
    MockTransport *transport(int index) const;

    /**
     * Most recently created transport, or nullptr
     */
    MockTransport *current() const;

    /**
     * Frames sent over every transport so far, oldest first
     */
    QList<QJsonObject> allSentFrames() const;

private:
    QList<QPointer<MockTransport>> m_transports;
    QList<QJsonObject> m_sentFrames;

    friend class MockTransport;
};

} // namespace CodingBridge

#endif // MOCKTRANSPORT_H
