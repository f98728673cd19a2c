#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <chrono>

#include <nlohmann/json.hpp>

#include "daemon/cursor_store.hpp"
#include "daemon/file_tail_tracker.hpp"

class FileTailTrackerTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testCompleteLinesAndPartialTail();
    void testReadIsRepeatableUntilCommit();
    void testNoGrowthYieldsNothing();
    void testTruncationResetsOffset();
    void testBlankLinesAndCarriageReturns();
    void testExistingContentIgnored();
    void testCursorPersistsAcrossRestarts();
    void testRestartInsideMultibyteCharacter();
    void testCorruptCursorFileStartsEmpty();
    void testMissingFile();
    void testReadFirstLine();

private:
    QTemporaryDir m_tempDir;
    int m_counter = 0;
    QString m_transcript;
    QString m_cursorFile;

    void append(const QByteArray &data) const;
    void rewrite(const QByteArray &data) const;
    std::string path() const
    {
        return m_transcript.toStdString();
    }
};

namespace {

QStringList toList(const std::vector<std::string> &lines)
{
    QStringList out;
    for (const auto &line : lines) {
        out << QString::fromStdString(line);
    }
    return out;
}

} // namespace

void FileTailTrackerTests::init()
{
    QVERIFY(m_tempDir.isValid());
    ++m_counter;
    m_transcript = m_tempDir.filePath(QStringLiteral("transcript-%1.jsonl").arg(m_counter));
    m_cursorFile = m_tempDir.filePath(QStringLiteral("cursors-%1.json").arg(m_counter));
}

void FileTailTrackerTests::append(const QByteArray &data) const
{
    QFile file(m_transcript);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
    QCOMPARE(file.write(data), static_cast<qint64>(data.size()));
}

void FileTailTrackerTests::rewrite(const QByteArray &data) const
{
    QFile file(m_transcript);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(file.write(data), static_cast<qint64>(data.size()));
}

void FileTailTrackerTests::testCompleteLinesAndPartialTail()
{
    tracedeck::CursorStore cursors(m_cursorFile);
    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});

    append("{\"a\":1}\n{\"b\":2}\n{\"c\":");
    auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QCOMPARE(read->startOffset, static_cast<uint64_t>(0));
    QCOMPARE(read->endOffset, static_cast<uint64_t>(21));
    QCOMPARE(toList(read->lines), QStringList({"{\"a\":1}", "{\"b\":2}"}));
    QCOMPARE(QString::fromStdString(read->partialTail), QStringLiteral("{\"c\":"));
    QVERIFY(!read->truncated);
    QVERIFY(tracker.commit(*read));

    append("3}\n");
    read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QCOMPARE(read->startOffset, static_cast<uint64_t>(21));
    QCOMPARE(toList(read->lines), QStringList({"{\"c\":3}"}));
    QVERIFY(read->partialTail.empty());
    QVERIFY(tracker.commit(*read));

    const auto cursor = tracker.cursor(path());
    QVERIFY(cursor.has_value());
    QCOMPARE(cursor->byteOffset, static_cast<uint64_t>(24));
    QVERIFY(cursor->partialTail.empty());
}

void FileTailTrackerTests::testReadIsRepeatableUntilCommit()
{
    tracedeck::CursorStore cursors;
    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});

    append("{\"a\":1}\n");
    const auto first = tracker.onChangeSignal(path());
    QVERIFY(first.has_value());

    append("{\"b\":2}\n");
    const auto second = tracker.onChangeSignal(path());
    QVERIFY(second.has_value());
    QCOMPARE(second->startOffset, first->startOffset);
    QCOMPARE(toList(second->lines), QStringList({"{\"a\":1}", "{\"b\":2}"}));
}

void FileTailTrackerTests::testNoGrowthYieldsNothing()
{
    tracedeck::CursorStore cursors;
    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});

    append("{\"a\":1}\n");
    const auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QVERIFY(tracker.commit(*read));
    QVERIFY(!tracker.onChangeSignal(path()).has_value());
}

void FileTailTrackerTests::testTruncationResetsOffset()
{
    tracedeck::CursorStore cursors;
    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});

    append("{\"a\":1}\n{\"b\":2}\n{\"c\":3}\n");
    auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QVERIFY(tracker.commit(*read));

    rewrite("{\"z\":9}\n");
    read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QVERIFY(read->truncated);
    QCOMPARE(read->startOffset, static_cast<uint64_t>(0));
    QCOMPARE(toList(read->lines), QStringList({"{\"z\":9}"}));
    QVERIFY(tracker.commit(*read));
    QCOMPARE(tracker.cursor(path())->byteOffset, static_cast<uint64_t>(8));
}

void FileTailTrackerTests::testBlankLinesAndCarriageReturns()
{
    tracedeck::CursorStore cursors;
    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});

    append("{\"a\":1}\r\n\n   \n{\"b\":2}\n");
    const auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QCOMPARE(toList(read->lines), QStringList({"{\"a\":1}", "{\"b\":2}"}));
}

void FileTailTrackerTests::testExistingContentIgnored()
{
    append("{\"type\":\"session_meta\",\"payload\":{\"id\":\"s1\"}}\n{\"old\":true}\n");
    const qint64 existingSize = QFileInfo(m_transcript).size();

    tracedeck::CursorStore cursors;
    const auto later = std::chrono::system_clock::now() + std::chrono::hours(1);
    tracedeck::FileTailTracker tracker(cursors, later);

    QVERIFY(!tracker.onChangeSignal(path()).has_value());
    auto cursor = tracker.cursor(path());
    QVERIFY(cursor.has_value());
    QVERIFY(cursor->ignoreExisting);
    QCOMPARE(cursor->byteOffset, static_cast<uint64_t>(existingSize));

    append("{\"new\":true}\n");
    const auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QCOMPARE(toList(read->lines), QStringList({"{\"new\":true}"}));
    QVERIFY(read->bootstrapLine.has_value());
    QCOMPARE(QString::fromStdString(*read->bootstrapLine),
             QStringLiteral("{\"type\":\"session_meta\",\"payload\":{\"id\":\"s1\"}}"));

    tracedeck::CursorIdentity identity;
    identity.sessionId = "s1";
    identity.format = tracedeck::TranscriptFormat::Codex;
    QVERIFY(tracker.commit(*read, identity));
    cursor = tracker.cursor(path());
    QVERIFY(!cursor->ignoreExisting);
    QCOMPARE(QString::fromStdString(cursor->sessionId.value_or("")), QStringLiteral("s1"));

    append("{\"newer\":true}\n");
    const auto next = tracker.onChangeSignal(path());
    QVERIFY(next.has_value());
    QVERIFY(!next->bootstrapLine.has_value());
}

void FileTailTrackerTests::testCursorPersistsAcrossRestarts()
{
    append("{\"a\":1}\n{\"b\":");
    {
        tracedeck::CursorStore cursors(m_cursorFile);
        tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});
        const auto read = tracker.onChangeSignal(path());
        QVERIFY(read.has_value());
        tracedeck::CursorIdentity identity;
        identity.sessionId = "session-7";
        identity.projectPath = "/work/app";
        identity.model = "gpt-5";
        identity.format = tracedeck::TranscriptFormat::Codex;
        QVERIFY(tracker.commit(*read, identity));
    }
    QVERIFY(QFile::exists(m_cursorFile));

    tracedeck::CursorStore cursors(m_cursorFile);
    const auto cursor = cursors.load(path());
    QVERIFY(cursor.has_value());
    QCOMPARE(cursor->byteOffset, static_cast<uint64_t>(13));
    QCOMPARE(QString::fromStdString(cursor->partialTail), QStringLiteral("{\"b\":"));
    QCOMPARE(QString::fromStdString(cursor->sessionId.value_or("")), QStringLiteral("session-7"));
    QCOMPARE(QString::fromStdString(cursor->model.value_or("")), QStringLiteral("gpt-5"));
    QCOMPARE(cursor->format, tracedeck::TranscriptFormat::Codex);
    QCOMPARE(cursors.all().size(), static_cast<size_t>(1));

    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});
    append("2}\n");
    const auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QCOMPARE(toList(read->lines), QStringList({"{\"b\":2}"}));

    QVERIFY(tracker.forget(path()));
    QVERIFY(!tracker.cursor(path()).has_value());
    tracedeck::CursorStore reloaded(m_cursorFile);
    QVERIFY(!reloaded.load(path()).has_value());
}

void FileTailTrackerTests::testRestartInsideMultibyteCharacter()
{
    const QByteArray head = "{\"message\":{\"content\":\"caf\xC3";
    const QByteArray rest = "\xA9\"}}\n";
    append(head);
    {
        tracedeck::CursorStore cursors(m_cursorFile);
        tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});
        const auto read = tracker.onChangeSignal(path());
        QVERIFY(read.has_value());
        QVERIFY(read->lines.empty());
        QVERIFY(tracker.commit(*read, tracedeck::CursorIdentity{}));
    }

    tracedeck::CursorStore cursors(m_cursorFile);
    const auto cursor = cursors.load(path());
    QVERIFY(cursor.has_value());
    QCOMPARE(QByteArray::fromStdString(cursor->partialTail), head);

    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});
    append(rest);
    const auto read = tracker.onChangeSignal(path());
    QVERIFY(read.has_value());
    QCOMPARE(read->lines.size(), static_cast<size_t>(1));
    QCOMPARE(QByteArray::fromStdString(read->lines.front()), head + rest.chopped(1));

    const auto parsed = nlohmann::json::parse(read->lines.front(), nullptr, false);
    QVERIFY(!parsed.is_discarded());
    QCOMPARE(QString::fromStdString(parsed["message"].value("content", "")),
             QString::fromUtf8("caf\xC3\xA9"));
}

void FileTailTrackerTests::testCorruptCursorFileStartsEmpty()
{
    QFile file(m_cursorFile);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{\"version\": 1, \"files\": [");
    file.close();

    tracedeck::CursorStore cursors(m_cursorFile);
    QVERIFY(cursors.all().empty());

    tracedeck::TranscriptCursor cursor;
    cursor.path = path();
    cursor.byteOffset = 5;
    QVERIFY(cursors.save(cursor));
    tracedeck::CursorStore reloaded(m_cursorFile);
    QCOMPARE(reloaded.load(path())->byteOffset, static_cast<uint64_t>(5));
}

void FileTailTrackerTests::testMissingFile()
{
    tracedeck::CursorStore cursors;
    tracedeck::FileTailTracker tracker(cursors, tracedeck::Timestamp{});
    QVERIFY(!tracker.onChangeSignal(path()).has_value());
    QVERIFY(!tracker.cursor(path()).has_value());
}

void FileTailTrackerTests::testReadFirstLine()
{
    append("no newline yet");
    QVERIFY(!tracedeck::FileTailTracker::readFirstLine(path()).has_value());

    append("\nsecond\n");
    const auto first = tracedeck::FileTailTracker::readFirstLine(path());
    QVERIFY(first.has_value());
    QCOMPARE(QString::fromStdString(*first), QStringLiteral("no newline yet"));
    QVERIFY(!tracedeck::FileTailTracker::readFirstLine("/nonexistent/file.jsonl").has_value());
}

QTEST_MAIN(FileTailTrackerTests)
#include "test_file_tail_tracker.moc"
