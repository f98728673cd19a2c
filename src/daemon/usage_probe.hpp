#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tracedeck {

struct UsageSnapshot {
    bool ok = false;
    // Set when a fetch failed and an older good snapshot is returned instead.
    bool stale = false;
    Timestamp fetchedAt;
    nlohmann::json payload;
    std::string error;
};

// Account usage as reported by an agent CLI. Implementations must return
// within a bounded time.
class UsageProbe {
public:
    virtual ~UsageProbe() = default;
    virtual UsageSnapshot fetchUsage() = 0;
};

/**
 * Queries usage by running a helper process that speaks line-delimited
 * JSON-RPC on stdin/stdout. One request line is written and the first
 * response line carrying the same id is taken as the answer.
 *
 * Results are cached for cacheValidity. A failed fetch falls back to the
 * last good snapshot, marked stale. Calls are serialized.
 */
class ProcessUsageProbe final : public UsageProbe {
public:
    ProcessUsageProbe(const QString &program,
                      const QStringList &arguments,
                      std::chrono::milliseconds timeout,
                      std::chrono::seconds cacheValidity = std::chrono::seconds(180));

    // Splits a shell-style command line; an empty command yields a probe
    // that always reports "disabled".
    static std::unique_ptr<ProcessUsageProbe> fromCommandLine(const QString &commandLine,
                                                              std::chrono::milliseconds timeout);

    UsageSnapshot fetchUsage() override;

private:
    UsageSnapshot runOnce() const;

    QString m_program;
    QStringList m_arguments;
    std::chrono::milliseconds m_timeout;
    std::chrono::seconds m_cacheValidity;

    std::mutex m_mutex;
    std::optional<UsageSnapshot> m_lastGood;
};

} // namespace tracedeck
