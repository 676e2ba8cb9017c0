/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProtocolTypes.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QStringList>

namespace CodingBridge
{

// ========== SessionId ==========

bool SessionId::isValid(const QString &id)
{
    static const QRegularExpression uuidPattern(
        QStringLiteral("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$"),
        QRegularExpression::CaseInsensitiveOption);
    return !id.isEmpty() && uuidPattern.match(id).hasMatch();
}

QString SessionId::validated(const QString &id)
{
    return isValid(id) ? id : QString();
}

QString SessionId::shortForm(const QString &id)
{
    if (id.isEmpty()) {
        return QStringLiteral("<none>");
    }
    return id.left(8);
}

// ========== AgentModel ==========

QString AgentModel::aliasName(Alias alias)
{
    switch (alias) {
    case Alias::Opus:
        return QStringLiteral("opus");
    case Alias::Sonnet:
        return QStringLiteral("sonnet");
    case Alias::Haiku:
        return QStringLiteral("haiku");
    case Alias::Custom:
    case Alias::Default:
    default:
        return QString();
    }
}

AgentModel::Alias AgentModel::parseAlias(const QString &nameOrId)
{
    const QString lower = nameOrId.trimmed().toLower();
    if (lower.isEmpty()) {
        return Alias::Default;
    }
    if (lower.contains(QLatin1String("opus"))) {
        return Alias::Opus;
    }
    if (lower.contains(QLatin1String("sonnet"))) {
        return Alias::Sonnet;
    }
    if (lower.contains(QLatin1String("haiku"))) {
        return Alias::Haiku;
    }
    return Alias::Custom;
}

bool AgentModel::isSwitchConfirmation(const QString &text)
{
    return text.contains(QLatin1String("Set model to"));
}

bool AgentModel::parseSwitchConfirmation(const QString &text, Alias *alias, QString *modelId)
{
    const int open = text.indexOf(QLatin1Char('('));
    const int close = text.indexOf(QLatin1Char(')'));
    if (open < 0 || close < 0 || close <= open) {
        return false;
    }

    const QString id = text.mid(open + 1, close - open - 1).trimmed();
    if (id.isEmpty()) {
        return false;
    }

    if (alias) {
        *alias = parseAlias(id);
    }
    if (modelId) {
        *modelId = id;
    }
    return true;
}

// ========== TokenUsage ==========

TokenUsage TokenUsage::fromJson(const QJsonObject &obj)
{
    TokenUsage usage;
    usage.used = obj.value(QStringLiteral("used")).toInt();
    usage.total = obj.value(QStringLiteral("total")).toInt();
    return usage;
}

// ========== ImageAttachment ==========

QString ImageAttachment::detectMediaType(const QByteArray &data)
{
    if (data.size() < 4) {
        return QStringLiteral("image/jpeg");
    }

    if (data.startsWith(QByteArray::fromHex("89504e47"))) {
        return QStringLiteral("image/png");
    }
    if (data.startsWith("GIF8")) {
        return QStringLiteral("image/gif");
    }
    if (data.startsWith("RIFF") && data.size() >= 12 && data.mid(8, 4) == "WEBP") {
        return QStringLiteral("image/webp");
    }
    if (data.size() >= 12 && data.mid(4, 4) == "ftyp") {
        static const QList<QByteArray> heifBrands = {"heic", "heix", "hevc", "hevx", "mif1", "msf1"};
        if (heifBrands.contains(data.mid(8, 4))) {
            return QStringLiteral("image/heic");
        }
    }

    return QStringLiteral("image/jpeg");
}

QJsonObject ImageAttachment::toJson(const QByteArray &data)
{
    QJsonObject obj;
    obj[QStringLiteral("type")] = QStringLiteral("base64");
    obj[QStringLiteral("media_type")] = detectMediaType(data);
    obj[QStringLiteral("data")] = QString::fromLatin1(data.toBase64());
    return obj;
}

// ========== Outbound frames ==========

QJsonObject CommandFrame::toJson() const
{
    QJsonObject options;
    options[QStringLiteral("cwd")] = projectPath;

    const QString wireSessionId = SessionId::validated(sessionId);
    if (!wireSessionId.isEmpty()) {
        options[QStringLiteral("sessionId")] = wireSessionId;
    }
    if (!model.isEmpty()) {
        options[QStringLiteral("model")] = model;
    }
    if (!permissionMode.isEmpty()) {
        options[QStringLiteral("permissionMode")] = permissionMode;
    }
    if (!imageData.isEmpty()) {
        options[QStringLiteral("images")] = QJsonArray{ImageAttachment::toJson(imageData)};
    }

    QJsonObject obj;
    obj[QStringLiteral("type")] = QStringLiteral("claude-command");
    obj[QStringLiteral("command")] = command;
    obj[QStringLiteral("options")] = options;
    return obj;
}

QString CommandFrame::toWireText() const
{
    return QString::fromUtf8(QJsonDocument(toJson()).toJson(QJsonDocument::Compact));
}

QJsonObject AbortFrame::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("type")] = QStringLiteral("abort-session");
    obj[QStringLiteral("sessionId")] = sessionId;
    obj[QStringLiteral("provider")] = QStringLiteral("claude");
    return obj;
}

QString AbortFrame::toWireText() const
{
    return QString::fromUtf8(QJsonDocument(toJson()).toJson(QJsonDocument::Compact));
}

QJsonObject ApprovalResponse::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("type")] = QStringLiteral("permission-response");
    obj[QStringLiteral("requestId")] = requestId;
    obj[QStringLiteral("decision")] = allow ? QStringLiteral("allow") : QStringLiteral("deny");
    obj[QStringLiteral("alwaysAllow")] = alwaysAllow;
    return obj;
}

QString ApprovalResponse::toWireText() const
{
    return QString::fromUtf8(QJsonDocument(toJson()).toJson(QJsonDocument::Compact));
}

// ========== ApprovalRequest ==========

ApprovalRequest ApprovalRequest::fromJson(const QJsonObject &obj)
{
    ApprovalRequest request;
    request.requestId = obj.value(QStringLiteral("requestId")).toString();
    request.toolName = obj.value(QStringLiteral("toolName")).toString();
    request.input = obj.value(QStringLiteral("input")).toObject();
    request.receivedAt = QDateTime::currentDateTime();
    return request;
}

QString ApprovalRequest::displayDescription() const
{
    const QString command = input.value(QStringLiteral("command")).toString();
    if (!command.isEmpty()) {
        if (command.size() > 80) {
            return command.left(80) + QStringLiteral("...");
        }
        return command;
    }

    static const QStringList fallbackKeys = {
        QStringLiteral("file_path"),
        QStringLiteral("pattern"),
        QStringLiteral("description"),
    };
    for (const QString &key : fallbackKeys) {
        const QString value = input.value(key).toString();
        if (!value.isEmpty()) {
            return value;
        }
    }

    return QStringLiteral("Requesting permission...");
}

// ========== AskUserQuestionData ==========

AskUserQuestionData AskUserQuestionData::fromToolInput(const QJsonObject &input, const QString &toolUseId)
{
    AskUserQuestionData data;
    data.toolUseId = toolUseId;

    const QJsonArray questions = input.value(QStringLiteral("questions")).toArray();
    for (const QJsonValue &value : questions) {
        const QJsonObject obj = value.toObject();
        const QString text = obj.value(QStringLiteral("question")).toString();
        if (text.isEmpty()) {
            continue;
        }

        UserQuestion question;
        question.question = text;
        question.header = obj.value(QStringLiteral("header")).toString();
        question.multiSelect = obj.value(QStringLiteral("multiSelect")).toBool(false);

        const QJsonArray options = obj.value(QStringLiteral("options")).toArray();
        for (const QJsonValue &optionValue : options) {
            const QJsonObject optionObj = optionValue.toObject();
            const QString label = optionObj.value(QStringLiteral("label")).toString();
            if (label.isEmpty()) {
                continue;
            }
            question.options.append({label, optionObj.value(QStringLiteral("description")).toString()});
        }

        data.questions.append(question);
    }

    return data;
}

// ========== InboundFrame ==========

InboundFrame::Type InboundFrame::typeFromName(const QString &name)
{
    static const QHash<QString, Type> types = {
        {QStringLiteral("session-created"), Type::SessionCreated},
        {QStringLiteral("claude-response"), Type::Response},
        {QStringLiteral("token-budget"), Type::TokenBudget},
        {QStringLiteral("claude-complete"), Type::Complete},
        {QStringLiteral("claude-error"), Type::Error},
        {QStringLiteral("session-aborted"), Type::Aborted},
        {QStringLiteral("permission-request"), Type::PermissionRequest},
        {QStringLiteral("sessions-updated"), Type::SessionsUpdated},
        {QStringLiteral("projects_updated"), Type::ProjectsUpdated},
    };
    return types.value(name, Type::Unknown);
}

InboundFrame InboundFrame::parse(const QByteArray &json, QString *errorString)
{
    InboundFrame frame;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorString) {
            *errorString = QStringLiteral("Malformed frame: %1").arg(parseError.errorString());
        }
        return frame;
    }
    if (!doc.isObject()) {
        if (errorString) {
            *errorString = QStringLiteral("Malformed frame: not a JSON object");
        }
        return frame;
    }

    const QJsonObject obj = doc.object();
    const QJsonValue typeValue = obj.value(QStringLiteral("type"));
    if (!typeValue.isString() || typeValue.toString().isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("Malformed frame: missing type");
        }
        return frame;
    }

    frame.typeName = typeValue.toString();
    frame.type = typeFromName(frame.typeName);
    frame.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    frame.data = obj.value(QStringLiteral("data"));
    frame.error = obj.value(QStringLiteral("error")).toString();
    frame.code = obj.value(QStringLiteral("code")).toString();
    frame.exitCode = obj.value(QStringLiteral("exitCode")).toInt();
    frame.isNewSession = obj.value(QStringLiteral("isNewSession")).toBool();
    return frame;
}

// ========== SessionErrorClassifier ==========

bool SessionErrorClassifier::isSessionErrorCode(const QString &code)
{
    static const QStringList sessionCodes = {
        QStringLiteral("SESSION_NOT_FOUND"),
        QStringLiteral("SESSION_EXPIRED"),
        QStringLiteral("SESSION_INVALID"),
        QStringLiteral("RESUME_FAILED"),
    };
    return sessionCodes.contains(code.toUpper());
}

bool SessionErrorClassifier::isSessionError(const QString &message, const QString &code)
{
    if (!code.isEmpty()) {
        return isSessionErrorCode(code);
    }

    // Older servers only send free text
    static const QStringList patterns = {
        QStringLiteral("session"),
        QStringLiteral("session not found"),
        QStringLiteral("invalid session"),
        QStringLiteral("process exited with code 1"),
        QStringLiteral("failed to resume"),
        QStringLiteral("resume failed"),
    };
    const QString lower = message.toLower();
    for (const QString &pattern : patterns) {
        if (lower.contains(pattern)) {
            return true;
        }
    }
    return false;
}

QString truncatedForLog(const QString &text, int limit)
{
    if (text.size() <= limit) {
        return text;
    }
    return text.left(limit) + QStringLiteral("...");
}

} // namespace CodingBridge

#include "moc_ProtocolTypes.cpp"
