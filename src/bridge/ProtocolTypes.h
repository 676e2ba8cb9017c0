/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROTOCOLTYPES_H
#define PROTOCOLTYPES_H

#include "codingbridge_export.h"

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>

namespace CodingBridge
{

/**
 * Session identifiers are UUID strings minted by the server.
 *
 * Anything that does not look like a UUID (locally generated placeholders,
 * truncated ids, stale junk from persistence) is never put on the wire.
 */
namespace SessionId
{
CODINGBRIDGE_EXPORT bool isValid(const QString &id);

/**
 * Returns @p id if it is a well formed UUID, otherwise an empty string
 */
CODINGBRIDGE_EXPORT QString validated(const QString &id);

/**
 * First 8 characters, for log output
 */
CODINGBRIDGE_EXPORT QString shortForm(const QString &id);
}

/**
 * Model selection as understood by the agent server
 */
class CODINGBRIDGE_EXPORT AgentModel
{
    Q_GADGET

public:
    enum class Alias {
        Default,    // Whatever the server is configured with
        Opus,
        Sonnet,
        Haiku,
        Custom      // A full model id we have no alias for
    };
    Q_ENUM(Alias)

    /**
     * Alias name used in "/model <alias>" commands, empty for Default and Custom
     */
    static QString aliasName(Alias alias);

    /**
     * Map a model alias or full model id to an alias by substring
     */
    static Alias parseAlias(const QString &nameOrId);

    /**
     * Parse a switch confirmation such as
     * "Set model to sonnet (claude-sonnet-4-5-20250929)".
     *
     * @return false if the text does not carry a parenthesized model id
     */
    static bool parseSwitchConfirmation(const QString &text, Alias *alias, QString *modelId);

    static bool isSwitchConfirmation(const QString &text);
};

/**
 * Last reported context budget, replaced wholesale on every report
 */
struct CODINGBRIDGE_EXPORT TokenUsage {
    int used = 0;
    int total = 0;

    bool isValid() const { return total > 0; }

    static TokenUsage fromJson(const QJsonObject &obj);

    bool operator==(const TokenUsage &other) const { return used == other.used && total == other.total; }
    bool operator!=(const TokenUsage &other) const { return !(*this == other); }
};

/**
 * Inline image payload attached to a command
 */
namespace ImageAttachment
{
/**
 * Detect the media type from the leading magic bytes, defaulting to image/jpeg
 */
CODINGBRIDGE_EXPORT QString detectMediaType(const QByteArray &data);

/**
 * {"type": "base64", "media_type": ..., "data": ...}
 */
CODINGBRIDGE_EXPORT QJsonObject toJson(const QByteArray &data);
}

/**
 * Outbound "claude-command" frame
 */
struct CODINGBRIDGE_EXPORT CommandFrame {
    QString command;
    QString projectPath;
    QString sessionId;      // Dropped from the frame unless it is a valid UUID
    QString model;
    QString permissionMode;
    QByteArray imageData;

    QJsonObject toJson() const;
    QString toWireText() const;
};

/**
 * Outbound "abort-session" frame
 */
struct CODINGBRIDGE_EXPORT AbortFrame {
    QString sessionId;

    QJsonObject toJson() const;
    QString toWireText() const;
};

/**
 * A tool permission request pushed by the server
 */
struct CODINGBRIDGE_EXPORT ApprovalRequest {
    QString requestId;
    QString toolName;
    QJsonObject input;
    QDateTime receivedAt;

    bool isValid() const { return !requestId.isEmpty() && !toolName.isEmpty(); }

    /**
     * Short preview of what the tool wants to do: the shell command, file path,
     * search pattern or description, whichever the input carries first
     */
    QString displayDescription() const;

    static ApprovalRequest fromJson(const QJsonObject &obj);

    bool operator==(const ApprovalRequest &other) const { return requestId == other.requestId; }
};

/**
 * Outbound "permission-response" frame
 */
struct CODINGBRIDGE_EXPORT ApprovalResponse {
    QString requestId;
    bool allow = false;
    bool alwaysAllow = false;

    QJsonObject toJson() const;
    QString toWireText() const;
};

struct CODINGBRIDGE_EXPORT QuestionOption {
    QString label;
    QString description;
};

struct CODINGBRIDGE_EXPORT UserQuestion {
    QString question;
    QString header;
    bool multiSelect = false;
    QList<QuestionOption> options;
};

/**
 * Input of the interactive question tool
 */
struct CODINGBRIDGE_EXPORT AskUserQuestionData {
    QString toolUseId;
    QList<UserQuestion> questions;

    bool isValid() const { return !questions.isEmpty(); }

    static AskUserQuestionData fromToolInput(const QJsonObject &input, const QString &toolUseId = QString());
};

/**
 * Decoded inbound frame envelope
 */
struct CODINGBRIDGE_EXPORT InboundFrame {
    enum class Type {
        Invalid,
        SessionCreated,
        Response,
        TokenBudget,
        Complete,
        Error,
        Aborted,
        PermissionRequest,
        SessionsUpdated,
        ProjectsUpdated,
        Unknown
    };

    Type type = Type::Invalid;
    QString typeName;
    QString sessionId;
    QJsonValue data;
    QString error;
    QString code;
    int exitCode = 0;
    bool isNewSession = false;

    bool isValid() const { return type != Type::Invalid; }

    static Type typeFromName(const QString &name);

    /**
     * Parse one text frame. On failure the returned frame is invalid and
     * @p errorString (if given) describes the problem.
     */
    static InboundFrame parse(const QByteArray &json, QString *errorString = nullptr);
};

/**
 * Decides whether a server error means the bound session is gone
 */
namespace SessionErrorClassifier
{
/**
 * A structured error code wins when present; otherwise fall back to
 * matching the well known error texts.
 */
CODINGBRIDGE_EXPORT bool isSessionError(const QString &message, const QString &code = QString());

CODINGBRIDGE_EXPORT bool isSessionErrorCode(const QString &code);
}

/**
 * Maximum frame length echoed into debug output
 */
constexpr int OutboundLogLimit = 300;
constexpr int InboundLogLimit = 200;

CODINGBRIDGE_EXPORT QString truncatedForLog(const QString &text, int limit);

} // namespace CodingBridge

Q_DECLARE_METATYPE(CodingBridge::TokenUsage)
Q_DECLARE_METATYPE(CodingBridge::ApprovalRequest)
Q_DECLARE_METATYPE(CodingBridge::AskUserQuestionData)
Q_DECLARE_METATYPE(CodingBridge::InboundFrame)

#endif // PROTOCOLTYPES_H
