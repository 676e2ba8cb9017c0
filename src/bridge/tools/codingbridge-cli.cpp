/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    codingbridge-cli - run one agent turn from the command line

    Connects to the agent server, submits a single command for a project and
    streams the agent's output to stdout until the turn ends.

    Usage:
        codingbridge-cli --project <path> [options] <command>

    Exit codes: 0 when the turn completed, 1 on error or timeout,
    2 on usage errors.
*/

#include "AgentSession.h"
#include "BridgeSettings.h"
#include "NotificationManager.h"
#include "OutboundQueue.h"
#include "SessionStore.h"
#include "StreamAssembler.h"
#include "WebSocketTransport.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QTextStream>
#include <QTimer>

using namespace CodingBridge;

namespace
{

// How long to wait for the first connection before giving up
constexpr int ConnectDeadlineMs = 30000;

int usageError(const QString &message)
{
    QTextStream err(stderr);
    err << "Error: " << message << "\n";
    return 2;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("codingbridge-cli"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Run a coding agent command against a remote agent server"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command text to send to the agent"));

    QCommandLineOption serverOption(QStringList() << QStringLiteral("s") << QStringLiteral("server"),
                                    QStringLiteral("Agent server URL (http, https, ws or wss)"),
                                    QStringLiteral("url"));
    parser.addOption(serverOption);

    QCommandLineOption tokenOption(QStringLiteral("token"), QStringLiteral("Authentication token"), QStringLiteral("token"));
    parser.addOption(tokenOption);

    QCommandLineOption projectOption(QStringList() << QStringLiteral("p") << QStringLiteral("project"),
                                     QStringLiteral("Project directory on the server"),
                                     QStringLiteral("path"));
    parser.addOption(projectOption);

    QCommandLineOption sessionOption(QStringLiteral("session"), QStringLiteral("Session id to resume"), QStringLiteral("uuid"));
    parser.addOption(sessionOption);

    QCommandLineOption resumeLastOption(QStringLiteral("resume-last"), QStringLiteral("Resume the last session recorded for the project"));
    parser.addOption(resumeLastOption);

    QCommandLineOption modelOption(QStringList() << QStringLiteral("m") << QStringLiteral("model"),
                                   QStringLiteral("Model alias or id"),
                                   QStringLiteral("model"));
    parser.addOption(modelOption);

    QCommandLineOption permissionModeOption(QStringLiteral("permission-mode"), QStringLiteral("Permission mode sent with the command"), QStringLiteral("mode"));
    parser.addOption(permissionModeOption);

    QCommandLineOption timeoutOption(QStringList() << QStringLiteral("t") << QStringLiteral("timeout"),
                                     QStringLiteral("Seconds without server activity before the turn is abandoned"),
                                     QStringLiteral("secs"));
    parser.addOption(timeoutOption);

    QCommandLineOption yesOption(QStringList() << QStringLiteral("y") << QStringLiteral("yes"), QStringLiteral("Approve every permission request"));
    parser.addOption(yesOption);

    QCommandLineOption syncDecodeOption(QStringLiteral("sync-decode"), QStringLiteral("Decode frames on the main thread"));
    parser.addOption(syncDecodeOption);

    parser.process(app);

    if (!parser.isSet(projectOption)) {
        return usageError(QStringLiteral("--project option is required"));
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError(QStringLiteral("no command given"));
    }
    const QString command = positional.join(QLatin1Char(' '));

    int timeoutSeconds = 0;
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        timeoutSeconds = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeoutSeconds < 1) {
            return usageError(QStringLiteral("--timeout expects a positive number of seconds"));
        }
    }

    if (parser.isSet(sessionOption) && !SessionId::isValid(parser.value(sessionOption))) {
        return usageError(QStringLiteral("--session expects a UUID"));
    }

    // Command line values override the config file for this run only
    BridgeSettings settings;
    settings.setPersistent(false);
    if (parser.isSet(serverOption)) {
        settings.setServerUrl(parser.value(serverOption));
    }
    if (parser.isSet(tokenOption)) {
        settings.setAuthToken(parser.value(tokenOption));
    }
    if (parser.isSet(modelOption)) {
        settings.setDefaultModel(parser.value(modelOption));
    }
    if (parser.isSet(permissionModeOption)) {
        settings.setPermissionMode(parser.value(permissionModeOption));
    }
    if (timeoutSeconds > 0) {
        settings.setProcessingTimeoutSeconds(timeoutSeconds);
    }

    if (!settings.webSocketUrl().isValid()) {
        return usageError(QStringLiteral("unsupported server URL: %1").arg(settings.serverUrl()));
    }

    const QString projectPath = QDir::cleanPath(parser.value(projectOption));
    SessionStore store;

    QString resumeSessionId = parser.value(sessionOption);
    if (resumeSessionId.isEmpty() && parser.isSet(resumeLastOption)) {
        resumeSessionId = store.snapshot(projectPath).sessionId;
        if (resumeSessionId.isEmpty()) {
            QTextStream err(stderr);
            err << "No previous session recorded for " << projectPath << ", starting a new one\n";
        }
    }

    NotificationManager notifications(&settings);

    AgentSession session(&settings, WebSocketTransport::factory());
    session.setProjectPath(projectPath);
    session.setNotificationManager(&notifications);
    session.setSessionStore(&store);
    session.assembler()->setSynchronousDecoding(parser.isSet(syncDecodeOption));

    QTextStream out(stdout);
    QTextStream err(stderr);
    const bool autoApprove = parser.isSet(yesOption);
    bool turnStarted = false;
    bool retriedFresh = false;
    bool finished = false;

    auto finish = [&](int exitCode) {
        if (finished) {
            return;
        }
        finished = true;
        out.flush();
        err.flush();
        session.disconnectFromServer();
        QCoreApplication::exit(exitCode);
    };

    QObject::connect(&session, &AgentSession::connectionStateChanged, &app, [&](const ConnectionState &state) {
        err << "[" << state.displayText() << "]\n";
        err.flush();
        // The reply stream of a started turn does not survive a reconnect
        if (turnStarted && !state.isConnected()) {
            err << "Error: connection lost during the turn\n";
            finish(1);
        }
    });
    // Until the command is on the wire the queue's own retries apply
    QObject::connect(session.queue(), &OutboundQueue::commandSent, &app, [&]() {
        turnStarted = true;
    });
    QObject::connect(&session, &AgentSession::sessionCreated, &app, [&](const QString &sessionId) {
        err << "Session " << sessionId << "\n";
    });
    QObject::connect(&session, &AgentSession::textCommitted, &app, [&](const QString &text) {
        out << text << "\n";
        out.flush();
    });
    QObject::connect(&session, &AgentSession::toolUse, &app, [&](const QString &toolName, const QString &inputSummary) {
        out << "> " << toolName;
        if (!inputSummary.isEmpty()) {
            out << " (" << inputSummary << ")";
        }
        out << "\n";
        out.flush();
    });
    QObject::connect(&session, &AgentSession::tokenUsageChanged, &app, [&](const TokenUsage &usage) {
        err << "[tokens " << usage.used << "/" << usage.total << "]\n";
    });
    QObject::connect(&session, &AgentSession::questionAsked, &app, [&](const AskUserQuestionData &question) {
        for (const UserQuestion &q : question.questions) {
            out << "? " << q.question << "\n";
            for (const QuestionOption &option : q.options) {
                out << "    - " << option.label << "\n";
            }
        }
        out.flush();
    });
    QObject::connect(&session, &AgentSession::approvalRequested, &app, [&](const ApprovalRequest &request) {
        if (autoApprove) {
            err << "Approving " << request.toolName << ": " << request.displayDescription() << "\n";
            session.approvePending();
        } else {
            err << "Denying " << request.toolName << ": " << request.displayDescription() << " (use --yes to approve)\n";
            session.denyPending();
        }
    });
    QObject::connect(&session, &AgentSession::turnCompleted, &app, [&](const QString &sessionId, const QString &finalText) {
        if (!finalText.isEmpty()) {
            out << finalText << "\n";
        }
        if (!sessionId.isEmpty()) {
            err << "Session " << sessionId << " complete\n";
        }
        finish(0);
    });
    QObject::connect(&session, &AgentSession::aborted, &app, [&]() {
        err << "Aborted\n";
        finish(1);
    });
    QObject::connect(&session, &AgentSession::sessionRecovered, &app, [&]() {
        if (retriedFresh) {
            err << "Error: session could not be resumed\n";
            finish(1);
            return;
        }
        retriedFresh = true;
        err << session.lastError() << "\n";
        session.sendCommand(command);
    });
    QObject::connect(&session, &AgentSession::errorOccurred, &app, [&](AgentSession::ErrorKind kind, const QString &message) {
        err << "Error: " << message << "\n";
        if (kind != AgentSession::ErrorKind::Protocol) {
            finish(1);
        }
    });

    QTimer connectDeadline;
    connectDeadline.setSingleShot(true);
    QObject::connect(&connectDeadline, &QTimer::timeout, &app, [&]() {
        if (!turnStarted) {
            err << "Error: could not reach " << settings.webSocketUrl().toDisplayString(QUrl::RemoveQuery) << "\n";
            finish(1);
        }
    });
    connectDeadline.start(ConnectDeadlineMs);

    session.sendCommand(command, QByteArray(), resumeSessionId);

    return app.exec();
}
