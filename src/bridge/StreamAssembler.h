/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STREAMASSEMBLER_H
#define STREAMASSEMBLER_H

#include "ProtocolTypes.h"
#include "codingbridge_export.h"

#include <QMap>
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <QTimer>

namespace CodingBridge
{

/**
 * StreamAssembler turns inbound text frames into structured session events.
 *
 * JSON decoding runs on a private single-worker thread pool. Decoded frames
 * come back to the owning thread through a queued call and are applied in
 * the order they arrived; frames from a superseded connection generation
 * are dropped at that point.
 *
 * Text deltas accumulate in a streaming buffer that becomes visible through
 * textUpdated() after a short quiet period, right before a tool call, or
 * when the turn ends.
 */
class CODINGBRIDGE_EXPORT StreamAssembler : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultFlushIntervalMs = 50;

    /**
     * Name of the tool the agent uses to ask the user questions
     */
    static QString questionToolName();

    explicit StreamAssembler(QObject *parent = nullptr);
    ~StreamAssembler() override;

    /**
     * Decode inline instead of on the worker pool
     */
    void setSynchronousDecoding(bool synchronous);
    bool synchronousDecoding() const { return m_synchronous; }

    void setFlushIntervalMs(int ms);

    /**
     * Frames decoded for any other generation are discarded
     */
    void setCurrentGeneration(quint64 generation);
    quint64 currentGeneration() const { return m_generation; }

    /**
     * Number of decoded frames discarded for a stale generation
     */
    int staleFrameCount() const { return m_staleFrameCount; }

    /**
     * Number of frames that failed to decode
     */
    int malformedFrameCount() const { return m_malformedFrameCount; }

    /**
     * Frames handed to the decoder but not applied yet
     */
    int pendingFrameCount() const;

    /**
     * Stable text of the open segment, as last published by textUpdated()
     */
    QString currentText() const { return m_currentText; }

    /**
     * Text received so far for the open segment, published or not
     */
    QString bufferedText() const { return m_buffer; }

    QString lastToolName() const { return m_lastToolName; }

    /**
     * Tool input rendered as "key: value" pairs, for tool events
     */
    static QString summarizeToolInput(const QJsonObject &input);

    /**
     * Text of a tool_result content value (string or list of text blocks)
     */
    static QString toolResultText(const QJsonValue &content);

public Q_SLOTS:
    void submitFrame(const QString &text, quint64 generation);

    /**
     * Publish the streaming buffer now
     */
    void flush();

    /**
     * Drop the open segment without publishing it
     */
    void reset();

Q_SIGNALS:
    void sessionCreated(const QString &sessionId);
    void systemInit(const QString &sessionId, const QString &model);

    /**
     * Any assistant content arrived
     */
    void contentReceived();

    /**
     * One raw text block, before buffering
     */
    void textDelta(const QString &text);

    /**
     * The streaming buffer was published
     */
    void textUpdated(const QString &text);

    /**
     * A text segment was closed because a tool call followed it
     */
    void textCommitted(const QString &text);

    void toolUse(const QString &toolName, const QString &inputSummary, const QJsonObject &input);
    void toolResult(const QString &content);
    void thinking(const QString &content);
    void questionAsked(const CodingBridge::AskUserQuestionData &question);
    void tokenBudget(const CodingBridge::TokenUsage &usage);

    /**
     * Terminal events; the buffer has been flushed before they are emitted
     */
    void turnCompleted(const QString &sessionId, const QString &finalText);
    void errorFrame(const QString &message, const QString &code);
    void abortedFrame();

    void permissionRequested(const CodingBridge::ApprovalRequest &request);
    void sessionsUpdated(const QString &projectName, const QString &sessionId, const QString &action);
    void projectsUpdated();

    void decodeFailed(const QString &error);

private:
    struct DecodedFrame {
        quint64 generation = 0;
        InboundFrame frame;
        QString error;
    };

    static DecodedFrame decode(const QString &text, quint64 generation);
    void join(quint64 sequence, const DecodedFrame &decoded);
    void apply(const DecodedFrame &decoded);

    void handleResponse(const QJsonObject &payload);
    void processContent(const QJsonObject &message);
    void processBlock(const QJsonObject &block);
    void handleToolResults(const QJsonObject &payload);
    void appendText(const QString &text);
    void commitOpenSegment();

    QThreadPool m_decodePool;
    QMap<quint64, DecodedFrame> m_decoded;
    quint64 m_nextSequence = 0;
    quint64 m_nextToApply = 0;
    quint64 m_generation = 0;
    int m_staleFrameCount = 0;
    int m_malformedFrameCount = 0;
    bool m_synchronous = false;

    QTimer m_flushTimer;
    QString m_buffer;
    QString m_currentText;
    QString m_lastToolName;
};

} // namespace CodingBridge

#endif // STREAMASSEMBLER_H
