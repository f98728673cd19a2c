#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace tracedeck::logging {

namespace {

constexpr qint64 kDefaultRotationBytes = 5 * 1024 * 1024;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

// Open log files keyed by absolute path. Guarded by Sink::mutex.
class Sink
{
public:
    std::mutex mutex;
    QString processName;
    QString directoryOverride;
    bool traceEnabled = false;
    qint64 rotationBytes = kDefaultRotationBytes;

    QString directory() const
    {
        if (!directoryOverride.isEmpty()) {
            return directoryOverride;
        }
        const QString home = qEnvironmentVariable("HOME");
        const QString relative = QStringLiteral(".local/share/tracedeck/logs");
        return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
    }

    QString pathFor(const QString &process, const QString &suffix) const
    {
        const QString base = process.isEmpty() ? QStringLiteral("tracedeck") : process;
        return directory() + QLatin1Char('/') + base + suffix;
    }

    void append(const QString &path, const QByteArray &line)
    {
        QFile *file = fileFor(path);
        if (!file) {
            std::fprintf(stderr, "%s\n", line.constData());
            return;
        }
        if (file->size() + line.size() + 1 > rotationBytes && file->size() > 0) {
            file = rotate(path);
            if (!file) {
                std::fprintf(stderr, "%s\n", line.constData());
                return;
            }
        }
        file->write(line);
        file->write("\n");
        file->flush();
    }

    void closeAll()
    {
        m_files.clear();
    }

private:
    std::map<QString, std::unique_ptr<QFile>> m_files;

    QFile *fileFor(const QString &path)
    {
        auto it = m_files.find(path);
        if (it != m_files.end() && it->second->exists()) {
            return it->second.get();
        }
        QDir().mkpath(QFileInfo(path).absolutePath());
        auto file = std::make_unique<QFile>(path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append)) {
            m_files.erase(path);
            return nullptr;
        }
        QFile *raw = file.get();
        m_files[path] = std::move(file);
        return raw;
    }

    QFile *rotate(const QString &path)
    {
        m_files.erase(path);
        const QString rotated = path + QStringLiteral(".1");
        QFile::remove(rotated);
        QFile::rename(path, rotated);
        return fileFor(path);
    }
};

Sink &sink()
{
    static Sink instance;
    return instance;
}

thread_local QString t_corrId;

std::string threadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
        .toStdString();
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    Sink &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.traceEnabled = traceEnabled;
    s.closeAll();
}

bool isTraceEnabled()
{
    Sink &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.traceEnabled;
}

void setLogDirectory(const QString &path)
{
    Sink &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.directoryOverride = path;
    s.closeAll();
}

QString logDirectory()
{
    Sink &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.directory();
}

void setRotationLimit(qint64 bytes)
{
    Sink &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.rotationBytes = bytes > 0 ? bytes : kDefaultRotationBytes;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        Sink &s = sink();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("tracedeck");
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<qulonglong>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? t_corrId : correlationId;
    const nlohmann::json record = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", threadTag()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context.is_null() ? nlohmann::json::object() : context},
    };
    const QByteArray line = QByteArray::fromStdString(
        record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    Sink &s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    const QString process = processName.isEmpty()
        ? (s.processName.isEmpty() ? QStringLiteral("tracedeck") : s.processName)
        : processName;

    // Debug events only reach disk while tracing.
    if (level != LogLevel::Debug || s.traceEnabled) {
        s.append(s.pathFor(process, QStringLiteral(".log")), line);
    }
    if (s.traceEnabled) {
        s.append(s.pathFor(process, QStringLiteral("-trace.log")), line);
    }
}

} // namespace tracedeck::logging
