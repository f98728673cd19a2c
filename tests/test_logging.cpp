#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSkippedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testRotation();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    static QList<nlohmann::json> readEvents(const QString &path);
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/tracedeck/logs/tracedeck-test" + suffix;
}

QList<nlohmann::json> LoggingTests::readEvents(const QString &path)
{
    QList<nlohmann::json> events;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return events;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            events.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return events;
}

void LoggingTests::testLogEventWrites()
{
    tracedeck::logging::initLogging(QStringLiteral("tracedeck-test"), false);

    tracedeck::logging::logEvent(tracedeck::logging::LogLevel::Info,
                                 QStringLiteral("tracedeck-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 tracedeck::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    const auto events = readEvents(logPath(".log"));
    QVERIFY(!events.isEmpty());
    const auto &parsed = events.last();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugSkippedWithoutTrace()
{
    tracedeck::logging::initLogging(QStringLiteral("tracedeck-test"), false);
    const int before = readEvents(logPath(".log")).size();

    TDLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugSkippedWithoutTrace"),
                QStringLiteral("debug_event"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                tracedeck::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QCOMPARE(readEvents(logPath(".log")).size(), before);
}

void LoggingTests::testTraceWrites()
{
    tracedeck::logging::initLogging(QStringLiteral("tracedeck-test"), true);
    QVERIFY(tracedeck::logging::isTraceEnabled());

    TDLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testTraceWrites"),
                QStringLiteral("trace_event"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                tracedeck::logging::defaultWho(),
                QStringLiteral("corr-2"),
                nlohmann::json::object());

    const auto traceEvents = readEvents(logPath("-trace.log"));
    QVERIFY(!traceEvents.isEmpty());
    QCOMPARE(QString::fromStdString(traceEvents.last().value("what", "")),
             QStringLiteral("trace_event"));

    const auto mainEvents = readEvents(logPath(".log"));
    QVERIFY(!mainEvents.isEmpty());
    QCOMPARE(QString::fromStdString(mainEvents.last().value("level", "")), QStringLiteral("DEBUG"));

    tracedeck::logging::initLogging(QStringLiteral("tracedeck-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    tracedeck::logging::initLogging(QStringLiteral("tracedeck-test"), false);
    tracedeck::logging::setCorrelationId(QStringLiteral("outer"));
    {
        tracedeck::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(tracedeck::logging::currentCorrelationId(), QStringLiteral("inner"));

        TDLOG_WARN(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped_event"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   tracedeck::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QCOMPARE(tracedeck::logging::currentCorrelationId(), QStringLiteral("outer"));

    const auto events = readEvents(logPath(".log"));
    QVERIFY(!events.isEmpty());
    QCOMPARE(QString::fromStdString(events.last().value("corr", "")), QStringLiteral("inner"));
    tracedeck::logging::setCorrelationId(QString());
}

void LoggingTests::testRotation()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    tracedeck::logging::setLogDirectory(dir.path());
    tracedeck::logging::initLogging(QStringLiteral("rotating"), false);
    tracedeck::logging::setRotationLimit(600);

    for (int i = 0; i < 10; ++i) {
        TDLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testRotation"),
                   QStringLiteral("filler_event"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   tracedeck::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"index", i}});
    }

    const QString current = dir.filePath(QStringLiteral("rotating.log"));
    QVERIFY(QFile::exists(current));
    QVERIFY(QFile::exists(current + QStringLiteral(".1")));
    QVERIFY(QFileInfo(current).size() <= 600);
    QCOMPARE(readEvents(current).last().at("context").value("index", -1), 9);

    tracedeck::logging::setRotationLimit(0);
    tracedeck::logging::setLogDirectory(QString());
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
