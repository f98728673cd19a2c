#pragma once

#include <QString>

namespace tracedeck {

struct Config {
    QString dataDir;
    QString dbPath;
    QString cursorFile;
    QString pricingFile;
    QString claudeProjectsDir;
    QString codexSessionsDir;

    int debounceMs = 150;
    int cacheValidityMs = 100;
    int notifyDebounceMs = 100;
    int workerThreads = 2;
    int sweepIntervalMs = 5000;
    int sessionIdleTimeoutSec = 1800;

    bool enableClaude = true;
    bool enableCodex = true;
    bool traceLogging = false;

    QString usageCommand;
    int usageTimeoutMs = 3000;

    // Re-derives dbPath, cursorFile and pricingFile from dataDir.
    void setDataDir(const QString &dir);
};

// Defaults rooted at $HOME, overridden by TRACEDECK_* environment variables.
Config loadConfigFromEnvironment();

} // namespace tracedeck
