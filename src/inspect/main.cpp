#include <QCoreApplication>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "inspect/InspectCli.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    tracedeck::Config config = tracedeck::loadConfigFromEnvironment();
    bool trace = config.traceLogging;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    tracedeck::logging::initLogging(QStringLiteral("tracedeck-inspect"), trace);
    TDLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("inspect_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               tracedeck::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    tracedeck::InspectCli cli(config);
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
