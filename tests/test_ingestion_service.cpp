#include <QtTest/QtTest>

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <memory>
#include <vector>

#include "common/config.hpp"
#include "daemon/change_notifier.hpp"
#include "daemon/correlating_parser.hpp"
#include "daemon/cursor_store.hpp"
#include "daemon/ingestion_service.hpp"
#include "daemon/session_store.hpp"

class IngestionServiceTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();
    void testCodexIncrementalIngestion();
    void testClaudeIncrementalIngestion();
    void testClaudeUncorrelatedResultResyncs();
    void testPreexistingHistoryNotReplayed();
    void testIncrementalMatchesFullParse_data();
    void testIncrementalMatchesFullParse();
    void testPartialLineWaitsForNewline();
    void testSessionRestoredAfterRestart();
    void testIdleSessionsEnded();
    void testTruncatedFileRebuilt();
    void testUnknownFormatSkipped();
    void testNullStoreDisablesIngestion();
    void testChangeNotificationsEmitted();

private:
    QTemporaryDir m_tempDir;
    int m_counter = 0;
    tracedeck::Config m_config;
    std::unique_ptr<tracedeck::SessionStore> m_store;
    QString m_transcript;

    void append(const QByteArray &data) const;
    void rewrite(const QByteArray &data) const;
    std::string path() const
    {
        return m_transcript.toStdString();
    }
};

namespace {

const QByteArray kCodexHead =
    R"({"timestamp":"2025-01-01T00:00:00Z","type":"session_meta","payload":{"id":"c1","cwd":"/work/api","timestamp":"2025-01-01T00:00:00Z"}})" "\n"
    R"({"timestamp":"2025-01-01T00:00:01Z","type":"event_msg","payload":{"type":"user_message","message":"run tests"}})" "\n";

const QByteArray kCodexTurn =
    R"({"timestamp":"2025-01-01T00:00:04Z","type":"response_item","payload":{"type":"function_call","name":"exec_command","arguments":"{\"cmd\":\"make test\"}","call_id":"call_1"}})" "\n"
    R"({"timestamp":"2025-01-01T00:00:06Z","type":"response_item","payload":{"type":"function_call_output","call_id":"call_1","output":"ok"}})" "\n"
    R"({"timestamp":"2025-01-01T00:00:08Z","type":"event_msg","payload":{"type":"agent_message","message":"All green"}})" "\n";

const QByteArray kClaudeHead =
    R"({"type":"user","sessionId":"s1","cwd":"/work/app","uuid":"u1","timestamp":"2025-01-01T00:00:00Z","message":{"content":"fix bug"}})" "\n"
    R"({"type":"assistant","sessionId":"s1","uuid":"a1","timestamp":"2025-01-01T00:00:01Z","message":{"model":"claude-sonnet-4","stop_reason":"tool_use","content":[{"type":"tool_use","id":"t1","name":"Bash","input":{"command":"ls"}}]}})" "\n";

const QByteArray kClaudeResult =
    R"({"type":"user","sessionId":"s1","uuid":"u2","timestamp":"2025-01-01T00:00:03Z","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"a.txt"}]}})" "\n";

const QByteArray kClaudeReply =
    R"({"type":"assistant","sessionId":"s1","uuid":"a2","timestamp":"2025-01-01T00:00:05Z","message":{"model":"claude-sonnet-4","stop_reason":"end_turn","content":[{"type":"text","text":"Done"}],"usage":{"input_tokens":30,"output_tokens":12,"cache_read_input_tokens":100}}})" "\n";

const QByteArray kCodexOutputLater =
    R"({"timestamp":"2025-01-01T00:00:06Z","type":"response_item","payload":{"type":"function_call_output","call_id":"call_1","output":"ok"}})" "\n"
    R"({"timestamp":"2025-01-01T00:00:07Z","type":"event_msg","payload":{"type":"token_count","info":{"total_token_usage":{"input_tokens":1000,"cached_input_tokens":400,"output_tokens":50,"total_tokens":1050}}}})" "\n";

const QByteArray kCodexCallOnly =
    R"({"timestamp":"2025-01-01T00:00:04Z","type":"response_item","payload":{"type":"function_call","name":"exec_command","arguments":"{\"cmd\":\"make test\"}","call_id":"call_1"}})" "\n";

const QByteArray kCodexReply =
    R"({"timestamp":"2025-01-01T00:00:08Z","type":"event_msg","payload":{"type":"agent_message","message":"All green"}})" "\n";

} // namespace

void IngestionServiceTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void IngestionServiceTests::init()
{
    QVERIFY(m_tempDir.isValid());
    ++m_counter;
    m_config = tracedeck::Config{};
    m_config.setDataDir(m_tempDir.filePath(QStringLiteral("data-%1").arg(m_counter)));
    QVERIFY(QDir().mkpath(m_config.dataDir));
    m_config.claudeProjectsDir = m_tempDir.filePath(QStringLiteral("claude-%1").arg(m_counter));
    m_config.codexSessionsDir = m_tempDir.filePath(QStringLiteral("codex-%1").arg(m_counter));
    m_config.cacheValidityMs = 0;
    m_store = std::make_unique<tracedeck::SessionStore>(m_config.dbPath.toStdString());
    m_transcript = m_tempDir.filePath(QStringLiteral("rollout-%1.jsonl").arg(m_counter));
}

void IngestionServiceTests::cleanup()
{
    m_store.reset();
}

void IngestionServiceTests::append(const QByteArray &data) const
{
    QFile file(m_transcript);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
    QCOMPARE(file.write(data), static_cast<qint64>(data.size()));
}

void IngestionServiceTests::rewrite(const QByteArray &data) const
{
    QFile file(m_transcript);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(file.write(data), static_cast<qint64>(data.size()));
}

void IngestionServiceTests::testCodexIncrementalIngestion()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});
    QVERIFY(service.ingestionEnabled());

    append(kCodexHead);
    QVERIFY(service.processPath(path()));

    auto session = m_store->readSession("c1");
    QVERIFY(session.has_value());
    QCOMPARE(QString::fromStdString(session->projectName), QStringLiteral("api"));
    QCOMPARE(session->promptCount, 1);
    QCOMPARE(QString::fromStdString(session->transcriptPath), m_transcript);
    QCOMPARE(m_store->readMessages("c1").size(), static_cast<size_t>(1));

    append(kCodexTurn);
    QVERIFY(service.processPath(path()));

    const auto messages = m_store->readMessages("c1");
    QCOMPARE(messages.size(), static_cast<size_t>(3));
    for (size_t i = 1; i < messages.size(); ++i) {
        QVERIFY(messages[i].sequence > messages[i - 1].sequence);
    }
    QCOMPARE(messages[1].type, tracedeck::MessageType::Tool);
    QVERIFY(!messages[1].inProgress);
    QCOMPARE(QString::fromStdString(messages[1].toolOutput.value_or("")), QStringLiteral("ok"));
    QCOMPARE(messages[2].type, tracedeck::MessageType::Assistant);

    session = m_store->readSession("c1");
    QCOMPARE(session->toolCount, 1);
    QCOMPARE(session->workStatus, tracedeck::WorkStatus::Waiting);
    QCOMPARE(session->attentionReason, tracedeck::AttentionReason::AwaitingReply);

    const auto cursor = cursors.load(path());
    QVERIFY(cursor.has_value());
    QCOMPARE(cursor->byteOffset, static_cast<uint64_t>(kCodexHead.size() + kCodexTurn.size()));
    QCOMPARE(QString::fromStdString(cursor->sessionId.value_or("")), QStringLiteral("c1"));
    QCOMPARE(cursor->format, tracedeck::TranscriptFormat::Codex);

    const auto live = service.sessionForPath(path());
    QVERIFY(live.has_value());
    QCOMPARE(live->toolCount, 1);
}

void IngestionServiceTests::testClaudeIncrementalIngestion()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    append(kClaudeHead);
    QVERIFY(service.processPath(path()));
    auto messages = m_store->readMessages("s1");
    QCOMPARE(messages.size(), static_cast<size_t>(2));
    QVERIFY(messages[1].inProgress);

    // Same-size edit of already ingested bytes; only a full rescan would see it.
    QByteArray edited = kClaudeHead;
    edited.replace("fix bug", "fix bag");
    rewrite(edited);

    append(kClaudeResult);
    QVERIFY(service.processPath(path()));
    messages = m_store->readMessages("s1");
    QCOMPARE(messages.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(messages[0].content), QStringLiteral("fix bug"));
    QCOMPARE(QString::fromStdString(messages[1].id), QStringLiteral("a1-tool-0"));
    QVERIFY(!messages[1].inProgress);
    QCOMPARE(QString::fromStdString(messages[1].toolOutput.value_or("")), QStringLiteral("a.txt"));
    QCOMPARE(messages[1].toolDuration.value_or(0.0), 2.0);

    const auto session = m_store->readSession("s1");
    QVERIFY(session.has_value());
    QCOMPARE(session->toolCount, 1);
    QCOMPARE(session->promptCount, 1);
    QCOMPARE(QString::fromStdString(session->model.value_or("")), QStringLiteral("claude-sonnet-4"));
}

void IngestionServiceTests::testClaudeUncorrelatedResultResyncs()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    append(kClaudeHead);
    QVERIFY(service.processPath(path()));

    QByteArray edited = kClaudeHead;
    edited.replace("fix bug", "fix bag");
    rewrite(edited);

    append(R"({"type":"user","sessionId":"s1","uuid":"u9","timestamp":"2025-01-01T00:00:04Z","message":{"content":[{"type":"tool_result","tool_use_id":"t9","content":"?"}]}})" "\n");
    QVERIFY(service.processPath(path()));

    const auto messages = m_store->readMessages("s1");
    QCOMPARE(messages.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(messages[0].content), QStringLiteral("fix bag"));
    QVERIFY(messages[1].inProgress);
}

void IngestionServiceTests::testPreexistingHistoryNotReplayed()
{
    append(kClaudeHead);

    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    const auto startedAt = std::chrono::system_clock::now() + std::chrono::hours(1);
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier, startedAt);

    QVERIFY(service.processPath(path()));
    QVERIFY(!m_store->readSession("s1").has_value());

    append(kClaudeResult + kClaudeReply);
    QVERIFY(service.processPath(path()));

    const auto messages = m_store->readMessages("s1");
    QCOMPARE(messages.size(), static_cast<size_t>(1));
    QCOMPARE(messages[0].type, tracedeck::MessageType::Assistant);
    QCOMPARE(QString::fromStdString(messages[0].content), QStringLiteral("Done"));

    const auto session = m_store->readSession("s1");
    QVERIFY(session.has_value());
    QCOMPARE(session->promptCount, 0);
    QCOMPARE(session->toolCount, 1);
    QCOMPARE(session->workStatus, tracedeck::WorkStatus::Waiting);
}

void IngestionServiceTests::testIncrementalMatchesFullParse_data()
{
    QTest::addColumn<QString>("sessionId");
    QTest::addColumn<QList<QByteArray>>("appends");

    QTest::newRow("claude") << QStringLiteral("s1")
                            << QList<QByteArray>{kClaudeHead, kClaudeResult, kClaudeReply};
    QTest::newRow("codex") << QStringLiteral("c1")
                           << QList<QByteArray>{kCodexHead + kCodexCallOnly, kCodexOutputLater,
                                                kCodexReply};
}

void IngestionServiceTests::testIncrementalMatchesFullParse()
{
    QFETCH(QString, sessionId);
    QFETCH(QList<QByteArray>, appends);

    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});
    for (const QByteArray &chunk : appends) {
        append(chunk);
        QVERIFY(service.processPath(path()));
    }

    const tracedeck::CorrelatingParser parser;
    const tracedeck::ParseResult full = parser.parseAll(path());
    QVERIFY(full.session.has_value());
    const auto live = service.sessionForPath(path());
    QVERIFY(live.has_value());

    const tracedeck::Session &expected = *full.session;
    QCOMPARE(QString::fromStdString(live->id), sessionId);
    QVERIFY(live->id == expected.id);
    QVERIFY(live->projectPath == expected.projectPath);
    QVERIFY(live->model == expected.model);
    QCOMPARE(live->workStatus, expected.workStatus);
    QCOMPARE(live->attentionReason, expected.attentionReason);
    QVERIFY(live->firstPrompt == expected.firstPrompt);
    QVERIFY(live->customName == expected.customName);
    QVERIFY(live->lastTool == expected.lastTool);
    QCOMPARE(live->promptCount, expected.promptCount);
    QCOMPARE(live->toolCount, expected.toolCount);
    QCOMPARE(live->totalTokens, expected.totalTokens);
    QVERIFY(live->startedAt == expected.startedAt);
    QVERIFY(live->lastActivityAt == expected.lastActivityAt);

    const auto stored = m_store->readMessages(sessionId.toStdString());
    QCOMPARE(stored.size(), full.messages.size());
    for (size_t i = 0; i < stored.size(); ++i) {
        QVERIFY(stored[i].id == full.messages[i].id);
        QCOMPARE(stored[i].sequence, full.messages[i].sequence);
        QCOMPARE(stored[i].inProgress, full.messages[i].inProgress);
        QVERIFY(stored[i].toolOutput == full.messages[i].toolOutput);
    }
}

void IngestionServiceTests::testPartialLineWaitsForNewline()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    append(kCodexHead);
    QVERIFY(service.processPath(path()));

    const QByteArray turn = kCodexTurn;
    const int split = turn.indexOf('\n') + 20;
    append(turn.left(split));
    QVERIFY(service.processPath(path()));
    QCOMPARE(m_store->readMessages("c1").size(), static_cast<size_t>(2));

    append(turn.mid(split));
    QVERIFY(service.processPath(path()));
    QCOMPARE(m_store->readMessages("c1").size(), static_cast<size_t>(3));
}

void IngestionServiceTests::testSessionRestoredAfterRestart()
{
    append(kCodexHead);
    {
        tracedeck::CursorStore cursors(m_config.cursorFile);
        tracedeck::ChangeNotifier notifier;
        tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                            tracedeck::Timestamp{});
        QVERIFY(service.processPath(path()));
    }

    tracedeck::CursorStore cursors(m_config.cursorFile);
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});
    append(R"({"timestamp":"2025-01-01T00:01:00Z","type":"event_msg","payload":{"type":"user_message","message":"again"}})" "\n");
    QVERIFY(service.processPath(path()));

    const auto session = m_store->readSession("c1");
    QVERIFY(session.has_value());
    QCOMPARE(session->promptCount, 2);
    QCOMPARE(QString::fromStdString(session->firstPrompt.value_or("")), QStringLiteral("run tests"));

    const auto messages = m_store->readMessages("c1");
    QCOMPARE(messages.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(messages[1].content), QStringLiteral("again"));
    QVERIFY(messages[1].sequence > messages[0].sequence);
}

void IngestionServiceTests::testIdleSessionsEnded()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    append(kCodexHead);
    QVERIFY(service.processPath(path()));
    const auto lastActivity = m_store->readSession("c1")->lastActivityAt;

    QCOMPARE(service.endIdleSessions(lastActivity + std::chrono::minutes(10)), 0);
    const auto later = lastActivity + std::chrono::seconds(m_config.sessionIdleTimeoutSec + 1);
    QCOMPARE(service.endIdleSessions(later), 1);
    QCOMPARE(service.endIdleSessions(later), 0);

    auto session = m_store->readSession("c1");
    QVERIFY(session->endedAt.has_value());
    QCOMPARE(QString::fromStdString(session->endReason.value_or("")), QStringLiteral("timeout"));
    QCOMPARE(session->workStatus, tracedeck::WorkStatus::Unknown);

    // New activity reopens the session.
    append(R"({"timestamp":"2026-01-01T00:00:00Z","type":"event_msg","payload":{"type":"user_message","message":"back"}})" "\n");
    QVERIFY(service.processPath(path()));
    session = m_store->readSession("c1");
    QVERIFY(!session->endedAt.has_value());
    QVERIFY(!session->endReason.has_value());
    QCOMPARE(session->workStatus, tracedeck::WorkStatus::Working);
}

void IngestionServiceTests::testTruncatedFileRebuilt()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    append(kCodexHead + kCodexTurn);
    QVERIFY(service.processPath(path()));
    QCOMPARE(m_store->readMessages("c1").size(), static_cast<size_t>(3));

    rewrite(kCodexHead);
    QVERIFY(service.processPath(path()));
    QCOMPARE(m_store->readMessages("c1").size(), static_cast<size_t>(1));
    QCOMPARE(m_store->readSession("c1")->toolCount, 0);
}

void IngestionServiceTests::testUnknownFormatSkipped()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    const QByteArray noise = "{\"hello\":1}\nnot json\n";
    append(noise);
    QVERIFY(service.processPath(path()));
    QVERIFY(!service.sessionForPath(path()).has_value());
    QVERIFY(m_store->listSessions().empty());
    QCOMPARE(cursors.load(path())->byteOffset, static_cast<uint64_t>(noise.size()));
}

void IngestionServiceTests::testNullStoreDisablesIngestion()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier;
    tracedeck::IngestionService service(m_config, nullptr, cursors, notifier,
                                        tracedeck::Timestamp{});
    QVERIFY(!service.ingestionEnabled());

    append(kCodexHead);
    service.start();
    QVERIFY(!service.processPath(path()));
    QVERIFY(!service.resyncPath(path()));
    QCOMPARE(service.endIdleSessions(std::chrono::system_clock::now()), 0);
    QVERIFY(!cursors.load(path()).has_value());
}

void IngestionServiceTests::testChangeNotificationsEmitted()
{
    tracedeck::CursorStore cursors;
    tracedeck::ChangeNotifier notifier(10, 10);
    QSignalSpy sessions(&notifier, &tracedeck::ChangeNotifier::sessionChanged);
    QSignalSpy transcripts(&notifier, &tracedeck::ChangeNotifier::transcriptChanged);
    tracedeck::IngestionService service(m_config, m_store.get(), cursors, notifier,
                                        tracedeck::Timestamp{});

    append(kCodexHead);
    QVERIFY(service.processPath(path()));
    QTRY_COMPARE_WITH_TIMEOUT(sessions.count(), 1, 1000);
    QTRY_COMPARE_WITH_TIMEOUT(transcripts.count(), 1, 1000);
    QCOMPARE(sessions.at(0).at(0).toString(), QStringLiteral("c1"));
    QCOMPARE(transcripts.at(0).at(0).toString(), m_transcript);

    QVERIFY(service.resyncPath(path()));
    QTRY_COMPARE_WITH_TIMEOUT(sessions.count(), 2, 1000);
}

QTEST_MAIN(IngestionServiceTests)
#include "test_ingestion_service.moc"
