/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MockTransport.h"

#include <QJsonDocument>
#include <QMetaObject>

#include <utility>

namespace CodingBridge
{

MockTransport::MockTransport(MockNetwork *network)
    : m_network(network)
{
}

void MockTransport::open(const QUrl &url)
{
    m_url = url;
    m_open = true;
}

void MockTransport::close()
{
    m_open = false;
    m_closed = true;
    completePings(QStringLiteral("Connection closed"));
    completeSends(QStringLiteral("Connection closed"));
}

void MockTransport::ping(Completion completion)
{
    if (m_network && m_network->autoPong) {
        completeLater(std::move(completion), QString());
        return;
    }
    m_pendingPings.append(std::move(completion));
}

void MockTransport::sendTextMessage(const QString &message, Completion completion)
{
    m_sent.append(message);
    if (m_network) {
        m_network->m_sentFrames.append(QJsonDocument::fromJson(message.toUtf8()).object());
    }

    if (m_network && m_network->failSends) {
        completeLater(std::move(completion), QStringLiteral("Send failed"));
        return;
    }
    if (m_network && m_network->autoCompleteSends) {
        completeLater(std::move(completion), QString());
        return;
    }
    m_pendingSends.append(std::move(completion));
}

QList<QJsonObject> MockTransport::sentFrames() const
{
    QList<QJsonObject> frames;
    for (const QString &message : m_sent) {
        frames.append(QJsonDocument::fromJson(message.toUtf8()).object());
    }
    return frames;
}

void MockTransport::completePings(const QString &error)
{
    const QList<Completion> pings = std::exchange(m_pendingPings, {});
    for (const Completion &completion : pings) {
        completeLater(completion, error);
    }
}

void MockTransport::completeSends(const QString &error)
{
    const QList<Completion> sends = std::exchange(m_pendingSends, {});
    for (const Completion &completion : sends) {
        completeLater(completion, error);
    }
}

void MockTransport::deliver(const QString &text)
{
    Q_EMIT textMessageReceived(text);
}

void MockTransport::deliver(const QJsonObject &frame)
{
    deliver(QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact)));
}

void MockTransport::failReceive(const QString &error)
{
    m_open = false;
    completeSends(error);
    Q_EMIT receiveFailed(error);
}

void MockTransport::completeLater(Completion completion, const QString &error)
{
    if (!completion) {
        return;
    }
    QMetaObject::invokeMethod(
        this,
        [completion, error]() {
            completion(error);
        },
        Qt::QueuedConnection);
}

MockNetwork::MockNetwork(QObject *parent)
    : QObject(parent)
{
}

TransportFactory MockNetwork::factory()
{
    return [this]() -> AgentTransport * {
        auto *transport = new MockTransport(this);
        m_transports.append(transport);
        return transport;
    };
}

MockTransport *MockNetwork::transport(int index) const
{
    if (index < 0 || index >= m_transports.size()) {
        return nullptr;
    }
    return m_transports.at(index);
}

MockTransport *MockNetwork::current() const
{
    return m_transports.isEmpty() ? nullptr : m_transports.last().data();
}

QList<QJsonObject> MockNetwork::allSentFrames() const
{
    return m_sentFrames;
}

} // namespace CodingBridge

#include "moc_MockTransport.cpp"
