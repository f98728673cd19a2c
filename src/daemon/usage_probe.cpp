#include "daemon/usage_probe.hpp"

#include <algorithm>

#include <QDeadlineTimer>
#include <QProcess>

#include "common/logging.hpp"

namespace tracedeck {

namespace {

constexpr int kRequestId = 1;
constexpr int kKillGraceMs = 500;

nlohmann::json usageRequest()
{
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", kRequestId},
        {"method", "account/rateLimits/read"},
    };
}

void stopProcess(QProcess &process)
{
    process.closeWriteChannel();
    if (process.state() != QProcess::NotRunning) {
        process.kill();
        process.waitForFinished(kKillGraceMs);
    }
}

UsageSnapshot failure(const std::string &error)
{
    UsageSnapshot snapshot;
    snapshot.fetchedAt = std::chrono::system_clock::now();
    snapshot.error = error;
    return snapshot;
}

} // namespace

ProcessUsageProbe::ProcessUsageProbe(const QString &program,
                                     const QStringList &arguments,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::seconds cacheValidity)
    : m_program(program)
    , m_arguments(arguments)
    , m_timeout(timeout)
    , m_cacheValidity(cacheValidity)
{
}

std::unique_ptr<ProcessUsageProbe> ProcessUsageProbe::fromCommandLine(
    const QString &commandLine,
    std::chrono::milliseconds timeout)
{
    QStringList parts = QProcess::splitCommand(commandLine);
    const QString program = parts.isEmpty() ? QString() : parts.takeFirst();
    return std::make_unique<ProcessUsageProbe>(program, parts, timeout);
}

UsageSnapshot ProcessUsageProbe::fetchUsage()
{
    std::lock_guard<std::mutex> guard(m_mutex);

    const auto now = std::chrono::system_clock::now();
    if (m_lastGood && now - m_lastGood->fetchedAt < m_cacheValidity) {
        return *m_lastGood;
    }

    UsageSnapshot snapshot = runOnce();
    if (snapshot.ok) {
        m_lastGood = snapshot;
        return snapshot;
    }

    TDLOG_WARN(QStringLiteral("UsageProbe"),
               QStringLiteral("fetchUsage"),
               QStringLiteral("usage_fetch_failed"),
               QString::fromStdString(snapshot.error),
               QStringLiteral("serve_cached"),
               logging::defaultWho(),
               QString(),
               nlohmann::json({{"program", m_program.toStdString()},
                               {"hasCached", m_lastGood.has_value()}}));

    if (m_lastGood) {
        UsageSnapshot cached = *m_lastGood;
        cached.stale = true;
        cached.error = snapshot.error;
        return cached;
    }
    return snapshot;
}

UsageSnapshot ProcessUsageProbe::runOnce() const
{
    if (m_program.isEmpty()) {
        return failure("disabled");
    }

    QDeadlineTimer deadline(static_cast<qint64>(m_timeout.count()));
    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(m_program, m_arguments);
    if (!process.waitForStarted(static_cast<int>(deadline.remainingTime()))) {
        stopProcess(process);
        return failure("failed to start usage command");
    }

    const std::string request = usageRequest().dump() + "\n";
    process.write(request.data(), static_cast<qint64>(request.size()));

    while (!deadline.hasExpired()) {
        while (process.canReadLine()) {
            const QByteArray line = process.readLine().trimmed();
            const auto response = nlohmann::json::parse(line.toStdString(), nullptr, false);
            if (response.is_discarded() || !response.is_object()) {
                continue;
            }
            const auto id = response.find("id");
            if (id == response.end() || !id->is_number_integer() || id->get<int>() != kRequestId) {
                continue;
            }
            stopProcess(process);

            const auto error = response.find("error");
            if (error != response.end() && !error->is_null()) {
                const auto message = error->is_object() ? error->find("message") : error->end();
                return failure(message != error->end() && message->is_string()
                                   ? message->get<std::string>()
                                   : std::string("usage command returned an error"));
            }

            UsageSnapshot snapshot;
            snapshot.ok = true;
            snapshot.fetchedAt = std::chrono::system_clock::now();
            const auto result = response.find("result");
            snapshot.payload = result != response.end() ? *result : nlohmann::json::object();
            return snapshot;
        }

        if (process.state() == QProcess::NotRunning && !process.canReadLine()) {
            return failure("usage command exited without a response");
        }
        process.waitForReadyRead(static_cast<int>(std::max<qint64>(deadline.remainingTime(), 0)));
    }

    stopProcess(process);
    return failure("usage command timed out");
}

} // namespace tracedeck
