#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QDir>
#include <QStandardPaths>

#include "logger/logger.h"
#include "../core/ReadingSyncClient.h"
#include "../core/SessionStateMachine.h"
#include "../core/LockController.h"
#include "../managers/ConfigManager.h"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printSession(const ReadingSession& session, const QString& state, qint64 elapsed)
{
    out() << "Session:  " << session.id << (session.isOffline ? " (offline)" : "") << Qt::endl;
    out() << "Entry:    " << session.libraryEntryId;
    if (!session.displayTitle.isEmpty()) {
        out() << " \"" << session.displayTitle << "\"";
    }
    out() << Qt::endl;
    out() << "State:    " << state << Qt::endl;
    out() << "Started:  " << ReadingSession::formatTimestamp(session.startTime) << Qt::endl;
    out() << "Elapsed:  " << elapsed << "s" << Qt::endl;
}

void printResult(const ReadingSessionResult& result)
{
    out() << "Session " << result.sessionId << " ended" << (result.isOffline ? " (offline estimate)" : "")
          << Qt::endl;
    out() << "Duration: " << result.durationSeconds << "s, pages read: " << result.pagesRead << Qt::endl;
    out() << "Rewards:  " << result.rewards.coinsEarned + result.rewards.bonusCoins << " coins, "
          << result.rewards.expEarned + result.rewards.bonusExp << " exp" << Qt::endl;
    if (!result.isOffline) {
        out() << "Streak:   " << result.streakDays << " day(s)" << Qt::endl;
    }
}

int reportFailure(const QString& command, SessionError error, const QString& message)
{
    err() << command << " failed: " << sessionErrorToString(error);
    if (!message.isEmpty() && message != sessionErrorToString(error)) {
        err() << " (" << message << ")";
    }
    err() << Qt::endl;
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ReadLock");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Setup command line parser
    QCommandLineParser parser;
    parser.setApplicationDescription("ReadLock reading session tool");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Directory holding readlock.conf", "dir");
    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level");
    QCommandLineOption serverOption("server", "Reading service base URL", "url");
    QCommandLineOption pageOption("page", "Start page (start) or end page (end)", "page");
    QCommandLineOption titleOption("title", "Title shown on the lock screen", "title");
    QCommandLineOption focusOption("focus", "Focus score 0-100", "score");
    QCommandLineOption entryOption("entry", "Only sessions of this library entry", "id");
    QCommandLineOption limitOption("limit", "Maximum history items", "count", "20");

    parser.addOption(configOption);
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);
    parser.addOption(serverOption);
    parser.addOption(pageOption);
    parser.addOption(titleOption);
    parser.addOption(focusOption);
    parser.addOption(entryOption);
    parser.addOption(limitOption);

    parser.addPositionalArgument("command", "start <entryId> | pause | resume | end | status | sync | history");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first().toLower();

    // Console output would interleave with the command's own output
    Logger::instance()->enableConsoleOutput(false);

    ConfigManager configManager;
    if (parser.isSet(configOption)) {
        configManager.setConfigDirectory(parser.value(configOption));
    }
    if (!configManager.initialize() || !configManager.loadLocalConfig()) {
        err() << "Could not load configuration from " << configManager.configFilePath() << Qt::endl;
        return 1;
    }

    // Command-line options override the configuration for this run only
    if (parser.isSet(logFileOption)) {
        Logger::instance()->setLogFile(parser.value(logFileOption));
    } else if (configManager.logFilePath().isEmpty()) {
        QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(logDir);
        Logger::instance()->setLogFile(logDir + "/readlockctl.log");
    }

    if (parser.isSet(logLevelOption)) {
        bool ok = false;
        Logger::LogLevel level = Logger::levelFromString(parser.value(logLevelOption), &ok);
        if (!ok) {
            err() << "Unknown log level: " << parser.value(logLevelOption) << Qt::endl;
            return 1;
        }
        Logger::instance()->setLogLevel(level);
    }

    if (parser.isSet(serverOption)) {
        QSignalBlocker blocker(&configManager);
        configManager.setServerUrl(parser.value(serverOption));
    }

    LOG_INFO("readlockctl " + command);

    LoggingLockController lockController;
    ReadingSyncClient client;
    if (!client.initialize(&configManager, &lockController)) {
        err() << "Failed to initialize the session engine, see the log for details" << Qt::endl;
        return 1;
    }

    if (command == "start") {
        if (positional.size() < 2) {
            err() << "Usage: readlockctl start <entryId> [--page N] [--title T]" << Qt::endl;
            return 1;
        }

        std::optional<int> startPage;
        if (parser.isSet(pageOption)) {
            bool ok = false;
            startPage = parser.value(pageOption).toInt(&ok);
            if (!ok) {
                err() << "Invalid page: " << parser.value(pageOption) << Qt::endl;
                return 1;
            }
        }

        SessionOutcome<ReadingSession> outcome = client.startSession(positional.at(1), startPage,
                                                                     parser.value(titleOption));
        if (!outcome.isSuccess()) {
            return reportFailure("start", outcome.error, outcome.message);
        }
        out() << "Started session " << outcome.value.id
              << (outcome.value.isOffline ? " (offline, will sync later)" : "") << Qt::endl;
        return 0;
    }

    if (command == "pause" || command == "resume") {
        SessionOutcome<bool> outcome = command == "pause" ? client.pauseSession() : client.resumeSession();
        if (!outcome.isSuccess()) {
            return reportFailure(command, outcome.error, outcome.message);
        }
        if (!outcome.value) {
            out() << "Nothing to " << command << Qt::endl;
        } else {
            out() << (command == "pause" ? "Paused" : "Resumed") << " at " << client.elapsedSeconds() << "s"
                  << Qt::endl;
        }
        return 0;
    }

    if (command == "end") {
        bool ok = false;
        int endPage = parser.value(pageOption).toInt(&ok);
        if (!parser.isSet(pageOption) || !ok) {
            err() << "Usage: readlockctl end --page N [--focus S]" << Qt::endl;
            return 1;
        }

        std::optional<int> focusScore;
        if (parser.isSet(focusOption)) {
            focusScore = parser.value(focusOption).toInt(&ok);
            if (!ok) {
                err() << "Invalid focus score: " << parser.value(focusOption) << Qt::endl;
                return 1;
            }
        }

        SessionOutcome<ReadingSessionResult> outcome = client.endSession(endPage, focusScore);
        if (!outcome.isSuccess()) {
            return reportFailure("end", outcome.error, outcome.message);
        }
        printResult(outcome.value);
        return 0;
    }

    if (command == "status") {
        SessionOutcome<std::optional<ReadingSession>> outcome = client.getActiveSession();
        if (!outcome.isSuccess()) {
            return reportFailure("status", outcome.error, outcome.message);
        }
        if (outcome.value) {
            printSession(*outcome.value,
                         SessionStateMachine::stateToString(client.stateMachine()->currentState()),
                         client.elapsedSeconds());
        } else {
            out() << "No active session" << Qt::endl;
        }
        out() << "Pending:  " << client.pendingCount() << " session(s) waiting for sync" << Qt::endl;
        out() << "Service:  " << (client.isOfflineMode() ? "offline" : "online") << Qt::endl;
        return 0;
    }

    if (command == "sync") {
        bool success = false;
        int processed = 0;
        QObject::connect(&client, &ReadingSyncClient::syncCompleted, [&](bool ok, int items) {
            success = ok;
            processed = items;
        });
        QObject::connect(&client, &ReadingSyncClient::errorOccurred, [](const QString& message) {
            err() << message << Qt::endl;
        });

        client.forceSyncNow();

        out() << "Synced " << processed << " session(s), " << client.pendingCount() << " still pending"
              << Qt::endl;
        return success || client.pendingCount() == 0 ? 0 : 2;
    }

    if (command == "history") {
        SessionHistoryFilter filter;
        filter.libraryEntryId = parser.value(entryOption);
        filter.pageSize = qMax(1, parser.value(limitOption).toInt());

        SessionOutcome<QList<SessionHistoryEntry>> outcome = client.getSessionHistory(filter);
        if (!outcome.isSuccess()) {
            return reportFailure("history", outcome.error, outcome.message);
        }

        for (const SessionHistoryEntry& entry : outcome.value) {
            const ReadingSession& session = entry.session;
            out() << ReadingSession::formatTimestamp(session.startTime) << "  " << session.id
                  << "  entry " << session.libraryEntryId
                  << "  " << session.durationSeconds() << "s"
                  << "  " << session.pagesRead() << " page(s)";
            if (session.needsSync) {
                out() << "  [pending sync]";
            }
            if (entry.result) {
                out() << "  +" << entry.result->rewards.coinsEarned + entry.result->rewards.bonusCoins
                      << " coins";
            }
            out() << Qt::endl;
        }
        if (outcome.value.isEmpty()) {
            out() << "No sessions" << Qt::endl;
        }
        return 0;
    }

    err() << "Unknown command: " << command << Qt::endl;
    parser.showHelp(1);
}
