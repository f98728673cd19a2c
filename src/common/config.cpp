#include "common/config.hpp"

#include <QDebug>
#include <QDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace tracedeck {

namespace {

QString homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? QStringLiteral(".") : home;
}

int intFromEnv(const char *name, int fallback, int minimum)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return fallback;
    }

    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || value < minimum) {
        qWarning() << "Tracedeck: ignoring invalid" << name << "value"
                   << qEnvironmentVariable(name);
        TDLOG_WARN(QStringLiteral("config"),
                   QStringLiteral("loadConfigFromEnvironment"),
                   QStringLiteral("invalid_env_value"),
                   QStringLiteral("not_an_integer_or_out_of_range"),
                   QStringLiteral("fallback_to_default"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"name", name},
                                   {"value", qEnvironmentVariable(name).toStdString()},
                                   {"default", fallback}}));
        return fallback;
    }
    return value;
}

bool flagFromEnv(const char *name, bool fallback)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return fallback;
    }
    const QString value = qEnvironmentVariable(name).trimmed().toLower();
    if (value == QStringLiteral("1") || value == QStringLiteral("true")
        || value == QStringLiteral("yes") || value == QStringLiteral("on")) {
        return true;
    }
    if (value == QStringLiteral("0") || value == QStringLiteral("false")
        || value == QStringLiteral("no") || value == QStringLiteral("off")) {
        return false;
    }
    return fallback;
}

QString pathFromEnv(const char *name, const QString &fallback)
{
    const QString value = qEnvironmentVariable(name);
    return value.isEmpty() ? fallback : QDir::cleanPath(value);
}

} // namespace

void Config::setDataDir(const QString &dir)
{
    dataDir = QDir::cleanPath(dir);
    dbPath = dataDir + QStringLiteral("/tracedeck.db");
    cursorFile = dataDir + QStringLiteral("/transcript-cursors.json");
    pricingFile = dataDir + QStringLiteral("/model-pricing.json");
}

Config loadConfigFromEnvironment()
{
    Config config;
    const QString home = homeDir();

    config.setDataDir(pathFromEnv("TRACEDECK_DATA_DIR",
                                  home + QStringLiteral("/.local/share/tracedeck")));
    config.claudeProjectsDir = pathFromEnv("TRACEDECK_CLAUDE_DIR",
                                           home + QStringLiteral("/.claude/projects"));
    config.codexSessionsDir = pathFromEnv("TRACEDECK_CODEX_DIR",
                                          home + QStringLiteral("/.codex/sessions"));

    config.debounceMs = intFromEnv("TRACEDECK_DEBOUNCE_MS", config.debounceMs, 0);
    config.cacheValidityMs = intFromEnv("TRACEDECK_CACHE_VALIDITY_MS", config.cacheValidityMs, 0);
    config.notifyDebounceMs = intFromEnv("TRACEDECK_NOTIFY_DEBOUNCE_MS", config.notifyDebounceMs, 0);
    config.workerThreads = intFromEnv("TRACEDECK_WORKERS", config.workerThreads, 1);
    config.sweepIntervalMs = intFromEnv("TRACEDECK_SWEEP_INTERVAL_MS", config.sweepIntervalMs, 100);
    config.sessionIdleTimeoutSec = intFromEnv("TRACEDECK_IDLE_TIMEOUT_SEC",
                                              config.sessionIdleTimeoutSec, 0);

    config.enableClaude = flagFromEnv("TRACEDECK_ENABLE_CLAUDE", config.enableClaude);
    config.enableCodex = flagFromEnv("TRACEDECK_ENABLE_CODEX", config.enableCodex);
    config.traceLogging = flagFromEnv("TRACEDECK_TRACE", config.traceLogging);

    config.usageCommand = qEnvironmentVariable("TRACEDECK_USAGE_COMMAND");
    config.usageTimeoutMs = intFromEnv("TRACEDECK_USAGE_TIMEOUT_MS", config.usageTimeoutMs, 100);

    return config;
}

} // namespace tracedeck
