/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StreamAssembler.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMetaObject>
#include <QStringList>

namespace CodingBridge
{

QString StreamAssembler::questionToolName()
{
    return QStringLiteral("AskUserQuestion");
}

StreamAssembler::StreamAssembler(QObject *parent)
    : QObject(parent)
{
    m_decodePool.setMaxThreadCount(1);

    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(DefaultFlushIntervalMs);
    connect(&m_flushTimer, &QTimer::timeout, this, &StreamAssembler::flush);
}

StreamAssembler::~StreamAssembler()
{
    // Workers capture this; queued joins die with the object
    m_decodePool.waitForDone();
}

void StreamAssembler::setSynchronousDecoding(bool synchronous)
{
    m_synchronous = synchronous;
}

void StreamAssembler::setFlushIntervalMs(int ms)
{
    m_flushTimer.setInterval(qMax(0, ms));
}

void StreamAssembler::setCurrentGeneration(quint64 generation)
{
    m_generation = generation;
}

int StreamAssembler::pendingFrameCount() const
{
    return static_cast<int>(m_nextSequence - m_nextToApply);
}

void StreamAssembler::submitFrame(const QString &text, quint64 generation)
{
    const quint64 sequence = m_nextSequence++;

    if (m_synchronous) {
        join(sequence, decode(text, generation));
        return;
    }

    m_decodePool.start([this, text, sequence, generation]() {
        const DecodedFrame decoded = decode(text, generation);
        QMetaObject::invokeMethod(
            this,
            [this, sequence, decoded]() {
                join(sequence, decoded);
            },
            Qt::QueuedConnection);
    });
}

StreamAssembler::DecodedFrame StreamAssembler::decode(const QString &text, quint64 generation)
{
    DecodedFrame decoded;
    decoded.generation = generation;
    decoded.frame = InboundFrame::parse(text.toUtf8(), &decoded.error);
    return decoded;
}

void StreamAssembler::join(quint64 sequence, const DecodedFrame &decoded)
{
    m_decoded.insert(sequence, decoded);

    // Apply strictly in arrival order
    while (!m_decoded.isEmpty() && m_decoded.firstKey() == m_nextToApply) {
        const DecodedFrame next = m_decoded.take(m_nextToApply);
        ++m_nextToApply;
        apply(next);
    }
}

void StreamAssembler::apply(const DecodedFrame &decoded)
{
    if (decoded.generation != m_generation) {
        ++m_staleFrameCount;
        qDebug() << "StreamAssembler: Dropping frame from generation" << decoded.generation;
        return;
    }

    if (!decoded.frame.isValid()) {
        ++m_malformedFrameCount;
        qWarning() << "StreamAssembler:" << decoded.error;
        Q_EMIT decodeFailed(decoded.error);
        return;
    }

    const InboundFrame &frame = decoded.frame;
    const QJsonObject data = frame.data.toObject();

    switch (frame.type) {
    case InboundFrame::Type::SessionCreated:
        if (!frame.sessionId.isEmpty()) {
            Q_EMIT sessionCreated(frame.sessionId);
        }
        break;
    case InboundFrame::Type::Response:
        Q_EMIT contentReceived();
        handleResponse(data);
        break;
    case InboundFrame::Type::TokenBudget: {
        const TokenUsage usage = TokenUsage::fromJson(data);
        if (usage.isValid()) {
            Q_EMIT tokenBudget(usage);
        }
        break;
    }
    case InboundFrame::Type::Complete:
        flush();
        Q_EMIT turnCompleted(frame.sessionId, m_currentText);
        break;
    case InboundFrame::Type::Error:
        flush();
        Q_EMIT errorFrame(frame.error.isEmpty() ? QStringLiteral("Unknown error") : frame.error, frame.code);
        break;
    case InboundFrame::Type::Aborted:
        flush();
        Q_EMIT abortedFrame();
        break;
    case InboundFrame::Type::PermissionRequest: {
        const ApprovalRequest request = ApprovalRequest::fromJson(data);
        if (request.isValid()) {
            Q_EMIT permissionRequested(request);
        } else {
            qWarning() << "StreamAssembler: Ignoring permission request without id or tool";
        }
        break;
    }
    case InboundFrame::Type::SessionsUpdated:
        Q_EMIT sessionsUpdated(data.value(QStringLiteral("projectName")).toString(),
                               data.value(QStringLiteral("sessionId")).toString(),
                               data.value(QStringLiteral("action")).toString());
        break;
    case InboundFrame::Type::ProjectsUpdated:
        Q_EMIT projectsUpdated();
        break;
    case InboundFrame::Type::Unknown:
    case InboundFrame::Type::Invalid:
    default:
        qDebug() << "StreamAssembler: Ignoring frame type" << frame.typeName;
        break;
    }
}

void StreamAssembler::handleResponse(const QJsonObject &payload)
{
    const QString type = payload.value(QStringLiteral("type")).toString();

    if (type.isEmpty()) {
        if (payload.contains(QStringLiteral("content")) || payload.contains(QStringLiteral("message"))) {
            processContent(payload);
        }
        return;
    }

    if (type == QLatin1String("assistant")) {
        const QJsonValue message = payload.value(QStringLiteral("message"));
        processContent(message.isObject() ? message.toObject() : payload);
    } else if (type == QLatin1String("system")) {
        if (payload.value(QStringLiteral("subtype")).toString() == QLatin1String("init")) {
            Q_EMIT systemInit(payload.value(QStringLiteral("session_id")).toString(), payload.value(QStringLiteral("model")).toString());
        }
    } else if (type == QLatin1String("user")) {
        handleToolResults(payload);
    } else if (type == QLatin1String("result")) {
        // Turn summary; completion arrives as its own frame
    } else {
        qDebug() << "StreamAssembler: Unhandled response type" << type;
    }
}

void StreamAssembler::processContent(const QJsonObject &message)
{
    const QJsonValue content = message.value(QStringLiteral("content"));

    if (content.isString()) {
        const QString text = content.toString();
        Q_EMIT textDelta(text);
        appendText(text);
        return;
    }

    if (content.isArray()) {
        const QJsonArray blocks = content.toArray();
        for (const QJsonValue &block : blocks) {
            if (block.isObject()) {
                processBlock(block.toObject());
            }
        }
        return;
    }

    const QJsonValue nested = message.value(QStringLiteral("message"));
    if (nested.isObject()) {
        processContent(nested.toObject());
    }
}

void StreamAssembler::processBlock(const QJsonObject &block)
{
    const QString type = block.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("text")) {
        const QString text = block.value(QStringLiteral("text")).toString();
        if (!text.isEmpty()) {
            Q_EMIT textDelta(text);
            appendText(text);
        }
    } else if (type == QLatin1String("tool_use")) {
        // A text segment never spans a tool call
        commitOpenSegment();

        QString name = block.value(QStringLiteral("name")).toString();
        if (name.isEmpty()) {
            name = QStringLiteral("tool");
        }
        m_lastToolName = name;

        const QJsonObject input = block.value(QStringLiteral("input")).toObject();
        if (name == questionToolName()) {
            const AskUserQuestionData question = AskUserQuestionData::fromToolInput(input, block.value(QStringLiteral("id")).toString());
            if (question.isValid()) {
                Q_EMIT questionAsked(question);
                return;
            }
        }
        Q_EMIT toolUse(name, summarizeToolInput(input), input);
    } else if (type == QLatin1String("tool_result")) {
        Q_EMIT toolResult(toolResultText(block.value(QStringLiteral("content"))));
    } else if (type == QLatin1String("thinking")) {
        QString text = block.value(QStringLiteral("thinking")).toString();
        if (text.isEmpty()) {
            text = block.value(QStringLiteral("text")).toString();
        }
        Q_EMIT thinking(text);
    } else {
        qDebug() << "StreamAssembler: Unhandled content block" << type;
    }
}

void StreamAssembler::handleToolResults(const QJsonObject &payload)
{
    QJsonValue content = payload.value(QStringLiteral("content"));
    const QJsonValue message = payload.value(QStringLiteral("message"));
    if (!content.isArray() && message.isObject()) {
        content = message.toObject().value(QStringLiteral("content"));
    }

    const QJsonArray blocks = content.toArray();
    for (const QJsonValue &value : blocks) {
        const QJsonObject block = value.toObject();
        if (block.value(QStringLiteral("type")).toString() == QLatin1String("tool_result")) {
            Q_EMIT toolResult(toolResultText(block.value(QStringLiteral("content"))));
        }
    }
}

void StreamAssembler::appendText(const QString &text)
{
    m_buffer += text;
    m_flushTimer.start();
}

void StreamAssembler::flush()
{
    m_flushTimer.stop();
    if (m_buffer.isEmpty() || m_buffer == m_currentText) {
        return;
    }
    m_currentText = m_buffer;
    Q_EMIT textUpdated(m_currentText);
}

void StreamAssembler::commitOpenSegment()
{
    flush();
    if (m_currentText.isEmpty()) {
        return;
    }
    const QString committed = m_currentText;
    m_currentText.clear();
    m_buffer.clear();
    Q_EMIT textCommitted(committed);
}

void StreamAssembler::reset()
{
    m_flushTimer.stop();
    m_buffer.clear();
    m_currentText.clear();
}

QString StreamAssembler::summarizeToolInput(const QJsonObject &input)
{
    QStringList parts;
    for (auto it = input.constBegin(); it != input.constEnd(); ++it) {
        const QJsonValue value = it.value();
        QString rendered;
        if (value.isString()) {
            rendered = value.toString();
        } else if (value.isObject()) {
            rendered = QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
        } else if (value.isArray()) {
            rendered = QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
        } else if (value.isBool()) {
            rendered = value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
        } else if (value.isDouble()) {
            rendered = QString::number(value.toDouble());
        }
        parts << QStringLiteral("%1: %2").arg(it.key(), rendered);
    }
    return parts.join(QStringLiteral(", "));
}

QString StreamAssembler::toolResultText(const QJsonValue &content)
{
    if (content.isString()) {
        return content.toString();
    }
    if (content.isArray()) {
        QStringList texts;
        const QJsonArray items = content.toArray();
        for (const QJsonValue &item : items) {
            const QString text = item.toObject().value(QStringLiteral("text")).toString();
            if (!text.isEmpty()) {
                texts << text;
            }
        }
        return texts.join(QLatin1Char('\n'));
    }
    return QString();
}

} // namespace CodingBridge

#include "moc_StreamAssembler.cpp"
