#include <memory>
#include <stdexcept>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/change_notifier.hpp"
#include "daemon/cursor_store.hpp"
#include "daemon/ingestion_service.hpp"
#include "daemon/session_store.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tracedeck-daemon"));

    tracedeck::Config config = tracedeck::loadConfigFromEnvironment();

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Ingests AI coding agent transcripts into a session store."));
    parser.addHelpOption();
    const QCommandLineOption dataDirOption(QStringLiteral("data-dir"),
                                           QStringLiteral("Directory for the database and cursors."),
                                           QStringLiteral("dir"));
    const QCommandLineOption claudeDirOption(QStringLiteral("claude-dir"),
                                             QStringLiteral("Claude projects directory to watch."),
                                             QStringLiteral("dir"));
    const QCommandLineOption codexDirOption(QStringLiteral("codex-dir"),
                                            QStringLiteral("Codex sessions directory to watch."),
                                            QStringLiteral("dir"));
    const QCommandLineOption workersOption(QStringLiteral("workers"),
                                           QStringLiteral("Number of ingestion worker threads."),
                                           QStringLiteral("n"));
    const QCommandLineOption noClaudeOption(QStringLiteral("no-claude"),
                                            QStringLiteral("Do not watch Claude transcripts."));
    const QCommandLineOption noCodexOption(QStringLiteral("no-codex"),
                                           QStringLiteral("Do not watch Codex transcripts."));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write debug events and a trace log."));
    parser.addOptions({dataDirOption, claudeDirOption, codexDirOption, workersOption,
                       noClaudeOption, noCodexOption, traceOption});
    parser.process(app);

    if (parser.isSet(dataDirOption)) {
        config.setDataDir(parser.value(dataDirOption));
    }
    if (parser.isSet(claudeDirOption)) {
        config.claudeProjectsDir = parser.value(claudeDirOption);
    }
    if (parser.isSet(codexDirOption)) {
        config.codexSessionsDir = parser.value(codexDirOption);
    }
    if (parser.isSet(workersOption)) {
        bool ok = false;
        const int workers = parser.value(workersOption).toInt(&ok);
        if (ok && workers > 0) {
            config.workerThreads = workers;
        } else {
            qWarning() << "Tracedeck: ignoring invalid --workers value" << parser.value(workersOption);
        }
    }
    if (parser.isSet(noClaudeOption)) {
        config.enableClaude = false;
    }
    if (parser.isSet(noCodexOption)) {
        config.enableCodex = false;
    }
    if (parser.isSet(traceOption)) {
        config.traceLogging = true;
    }

    tracedeck::logging::initLogging(QStringLiteral("tracedeck-daemon"), config.traceLogging);
    qInfo() << "Tracedeck daemon starting...";
    TDLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("config_loaded"),
               tracedeck::logging::defaultWho(),
               QString(),
               nlohmann::json({{"dataDir", config.dataDir.toStdString()},
                               {"claudeDir", config.claudeProjectsDir.toStdString()},
                               {"codexDir", config.codexSessionsDir.toStdString()},
                               {"workers", config.workerThreads},
                               {"claude", config.enableClaude},
                               {"codex", config.enableCodex}}));

    // A store that cannot be opened leaves the daemon running without ingestion.
    std::unique_ptr<tracedeck::SessionStore> store;
    try {
        store = std::make_unique<tracedeck::SessionStore>(config.dbPath.toStdString());
    } catch (const std::exception &ex) {
        qWarning() << "Tracedeck: failed to open session store:" << ex.what();
        TDLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("store_open_failed"),
                    QString::fromUtf8(ex.what()),
                    QStringLiteral("ingestion_disabled"),
                    tracedeck::logging::defaultWho(),
                    QString(),
                    nlohmann::json({{"dbPath", config.dbPath.toStdString()}}));
    }

    tracedeck::CursorStore cursors(config.cursorFile);
    tracedeck::ChangeNotifier notifier(config.notifyDebounceMs, config.debounceMs);
    tracedeck::IngestionService service(config, store.get(), cursors, notifier);
    service.start();

    return app.exec();
}
