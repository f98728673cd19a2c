#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>

#include "daemon/usage_probe.hpp"

class UsageProbeTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testSuccessfulFetch();
    void testResultIsCached();
    void testErrorResponse();
    void testExitWithoutResponse();
    void testTimeout();
    void testStaleFallback();
    void testDisabledWithoutCommand();

private:
    QTemporaryDir m_tempDir;
    QString writeScript(const QString &name, const QByteArray &body) const;
};

namespace {

using namespace std::chrono_literals;

const QByteArray kRespondingScript =
    "read request\n"
    "echo 'not json'\n"
    "echo '{\"jsonrpc\":\"2.0\",\"method\":\"notice\"}'\n"
    "echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"primary\":{\"used_percent\":42}}}'\n";

} // namespace

void UsageProbeTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("HOME", m_tempDir.path().toUtf8());
}

QString UsageProbeTests::writeScript(const QString &name, const QByteArray &body) const
{
    const QString path = m_tempDir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(body);
    return path;
}

void UsageProbeTests::testSuccessfulFetch()
{
    const QString script = writeScript(QStringLiteral("ok.sh"), kRespondingScript);
    tracedeck::ProcessUsageProbe probe(QStringLiteral("/bin/sh"), {script}, 5000ms);

    const auto snapshot = probe.fetchUsage();
    QVERIFY2(snapshot.ok, snapshot.error.c_str());
    QVERIFY(!snapshot.stale);
    QCOMPARE(snapshot.payload["primary"].value("used_percent", 0), 42);
}

void UsageProbeTests::testResultIsCached()
{
    const QString flag = m_tempDir.filePath(QStringLiteral("cached.flag"));
    const QString script = writeScript(
        QStringLiteral("counting.sh"),
        "read request\n"
        "echo run >> \"$1\"\n"
        "echo '{\"id\":1,\"result\":{}}'\n");
    tracedeck::ProcessUsageProbe probe(QStringLiteral("/bin/sh"), {script, flag}, 5000ms);

    QVERIFY(probe.fetchUsage().ok);
    QVERIFY(probe.fetchUsage().ok);

    QFile runs(flag);
    QVERIFY(runs.open(QIODevice::ReadOnly));
    QCOMPARE(runs.readAll().count('\n'), 1);
}

void UsageProbeTests::testErrorResponse()
{
    const QString script = writeScript(
        QStringLiteral("error.sh"),
        "read request\n"
        "echo '{\"id\":1,\"error\":{\"code\":-32000,\"message\":\"not logged in\"}}'\n");
    tracedeck::ProcessUsageProbe probe(QStringLiteral("/bin/sh"), {script}, 5000ms);

    const auto snapshot = probe.fetchUsage();
    QVERIFY(!snapshot.ok);
    QCOMPARE(QString::fromStdString(snapshot.error), QStringLiteral("not logged in"));
}

void UsageProbeTests::testExitWithoutResponse()
{
    const QString script = writeScript(QStringLiteral("exit.sh"), "exit 3\n");
    tracedeck::ProcessUsageProbe probe(QStringLiteral("/bin/sh"), {script}, 5000ms);

    const auto snapshot = probe.fetchUsage();
    QVERIFY(!snapshot.ok);
    QVERIFY(!snapshot.error.empty());

    tracedeck::ProcessUsageProbe missing(QStringLiteral("/nonexistent/usage-helper"), {}, 5000ms);
    QVERIFY(!missing.fetchUsage().ok);
}

void UsageProbeTests::testTimeout()
{
    const QString script = writeScript(QStringLiteral("slow.sh"), "read request\nsleep 10\n");
    tracedeck::ProcessUsageProbe probe(QStringLiteral("/bin/sh"), {script}, 300ms);

    QElapsedTimer timer;
    timer.start();
    const auto snapshot = probe.fetchUsage();
    QVERIFY(!snapshot.ok);
    QCOMPARE(QString::fromStdString(snapshot.error), QStringLiteral("usage command timed out"));
    QVERIFY(timer.elapsed() < 5000);
}

void UsageProbeTests::testStaleFallback()
{
    const QString flag = m_tempDir.filePath(QStringLiteral("available.flag"));
    const QString script = writeScript(
        QStringLiteral("flaky.sh"),
        "if [ ! -f \"$1\" ]; then exit 1; fi\n"
        "read request\n"
        "echo '{\"id\":1,\"result\":{\"plan\":\"pro\"}}'\n");
    {
        QFile marker(flag);
        QVERIFY(marker.open(QIODevice::WriteOnly));
    }

    tracedeck::ProcessUsageProbe probe(QStringLiteral("/bin/sh"), {script, flag}, 5000ms, 0s);
    const auto good = probe.fetchUsage();
    QVERIFY(good.ok);
    QVERIFY(!good.stale);

    QVERIFY(QFile::remove(flag));
    const auto stale = probe.fetchUsage();
    QVERIFY(stale.ok);
    QVERIFY(stale.stale);
    QVERIFY(!stale.error.empty());
    QCOMPARE(QString::fromStdString(stale.payload.value("plan", "")), QStringLiteral("pro"));
    QVERIFY(stale.fetchedAt == good.fetchedAt);
}

void UsageProbeTests::testDisabledWithoutCommand()
{
    const auto probe = tracedeck::ProcessUsageProbe::fromCommandLine(QString(), 1000ms);
    const auto snapshot = probe->fetchUsage();
    QVERIFY(!snapshot.ok);
    QCOMPARE(QString::fromStdString(snapshot.error), QStringLiteral("disabled"));

    const QString script = writeScript(QStringLiteral("split.sh"), kRespondingScript);
    const auto split = tracedeck::ProcessUsageProbe::fromCommandLine(
        QStringLiteral("/bin/sh \"%1\"").arg(script), 5000ms);
    QVERIFY(split->fetchUsage().ok);
}

QTEST_MAIN(UsageProbeTests)
#include "test_usage_probe.moc"
