#include <QtTest/QtTest>
#include <QJsonObject>

#include "models/ReadingSession.h"
#include "models/SessionResult.h"

class ReadingSessionTest : public QObject
{
    Q_OBJECT

private:
    static QDateTime at(int hour, int minute, int second = 0)
    {
        return QDateTime(QDate(2024, 5, 1), QTime(hour, minute, second), Qt::UTC);
    }

    static ReadingSession running()
    {
        ReadingSession session;
        session.id = "srv-1";
        session.libraryEntryId = "entry-7";
        session.startTime = at(8, 0);
        session.startPage = 10;
        return session;
    }

private slots:
    void testElapsedExcludesPauses() {
        ReadingSession session = running();

        // 60s read, paused for 60s, resumed
        session.totalPauseMs = 60000;
        QCOMPARE(session.elapsedMsAt(at(8, 3)), qint64(120000));

        // Open pause does not count either
        session.pausedAt = at(8, 3);
        QCOMPARE(session.elapsedMsAt(at(8, 5)), qint64(120000));
    }

    void testElapsedNegativeWhenClockMovesBack() {
        ReadingSession session = running();
        QVERIFY(session.elapsedMsAt(at(7, 59)) < 0);
    }

    void testDurationAndPages() {
        ReadingSession session = running();
        QCOMPARE(session.durationSeconds(), 0);
        QCOMPARE(session.pagesRead(), 0);

        session.endTime = at(8, 5, 30);
        session.endPage = 25;
        session.totalPauseMs = 30500;
        // 330s wall, 30.5s paused, floored
        QCOMPARE(session.durationSeconds(), 299);
        QCOMPARE(session.pagesRead(), 15);

        // Going backwards never yields negative pages
        session.endPage = 4;
        QCOMPARE(session.pagesRead(), 0);

        // Pause longer than the wall time never yields negative duration
        session.totalPauseMs = 10 * 60 * 1000;
        QCOMPARE(session.durationSeconds(), 0);
    }

    void testStorageJsonKeepsOptionals() {
        ReadingSession session = running();
        session.pausedAt = at(8, 1);
        session.isOffline = true;
        session.needsSync = true;
        session.displayTitle = "Dune";

        ReadingSession restored = ReadingSession::fromJson(session.toJson());
        QCOMPARE(restored.id, session.id);
        QCOMPARE(restored.startTime, session.startTime);
        QCOMPARE(restored.pausedAt, session.pausedAt);
        QVERIFY(!restored.hasEnded());
        QVERIFY(!restored.endPage.has_value());
        QVERIFY(!restored.focusScore.has_value());
        QVERIFY(restored.isOffline);
        QVERIFY(restored.needsSync);
        QCOMPARE(restored.displayTitle, QString("Dune"));
    }

    void testServerJsonPauseInSeconds() {
        QJsonObject json;
        json["id"] = "srv-9";
        json["user_book_id"] = "entry-1";
        json["start_time"] = "2024-05-01T08:00:00";
        json["end_time"] = "2024-05-01T08:10:00";
        json["start_page"] = 3;
        json["end_page"] = 13;
        json["total_pause_duration"] = 120;

        ReadingSession session = ReadingSession::fromServerJson(json);
        QCOMPARE(session.id, QString("srv-9"));
        QCOMPARE(session.startTime, at(8, 0));
        QCOMPARE(session.totalPauseMs, qint64(120000));
        QCOMPARE(session.durationSeconds(), 480);
        QVERIFY(!session.needsSync);
    }

    void testServerJsonPauseFromDuration() {
        QJsonObject json;
        json["session_id"] = "srv-10";
        json["started_at"] = "2024-05-01T08:00:00Z";
        json["end_time"] = "2024-05-01T08:10:00Z";
        json["duration"] = 540;

        ReadingSession session = ReadingSession::fromServerJson(json);
        QCOMPARE(session.id, QString("srv-10"));
        QCOMPARE(session.totalPauseMs, qint64(60000));
    }

    void testTimestampParsing() {
        // Naive timestamps are UTC
        QCOMPARE(ReadingSession::parseTimestamp("2024-05-01T08:00:00"), at(8, 0));
        QCOMPARE(ReadingSession::parseTimestamp("2024-05-01T10:00:00+02:00"), at(8, 0));
        QVERIFY(!ReadingSession::parseTimestamp("not a date").isValid());
        QVERIFY(!ReadingSession::parseTimestamp(QString()).isValid());

        QCOMPARE(ReadingSession::formatTimestamp(at(8, 0)), QString("2024-05-01T08:00:00.000Z"));
    }

    void testOfflineIds() {
        const QString first = ReadingSession::generateOfflineId();
        const QString second = ReadingSession::generateOfflineId();
        QVERIFY(first.startsWith("offline_"));
        QVERIFY(first != second);

        ReadingSession session = running();
        QVERIFY(!session.hasOfflineId());
        session.id = first;
        QVERIFY(session.hasOfflineId());
    }

    void testIdempotencyKeyIsStable() {
        ReadingSession session = running();
        const QString key = PendingSyncRecord::idempotencyKeyFor(session);
        QCOMPARE(key.size(), 64);

        // Later edits to the session do not change its key
        session.endTime = at(9, 0);
        session.endPage = 40;
        QCOMPARE(PendingSyncRecord::idempotencyKeyFor(session), key);

        session.id = "srv-2";
        QVERIFY(PendingSyncRecord::idempotencyKeyFor(session) != key);
    }

    void testHistoryFilter() {
        ReadingSession session = running();

        SessionHistoryFilter filter;
        QVERIFY(filter.matches(session));

        filter.libraryEntryId = "entry-8";
        QVERIFY(!filter.matches(session));

        filter.libraryEntryId = "entry-7";
        filter.from = at(8, 0);
        filter.to = at(8, 0);
        QVERIFY(filter.matches(session));

        filter.from = at(8, 1);
        QVERIFY(!filter.matches(session));
    }

    void testResultFromServerJson() {
        QJsonObject rewards;
        rewards["coins_earned"] = 12;
        rewards["exp_earned"] = 50;

        QJsonObject json;
        json["session_id"] = "srv-3";
        json["duration"] = 600;
        json["pages_read"] = 10;
        json["streak_days"] = 4;
        json["rewards"] = rewards;

        ReadingSessionResult result;
        QVERIFY(ReadingSessionResult::fromServerJson(json, result));
        QCOMPARE(result.sessionId, QString("srv-3"));
        QCOMPARE(result.durationSeconds, 600);
        QCOMPARE(result.streakDays, 4);
        QCOMPARE(result.rewards.coinsEarned, 12);
        QVERIFY(!result.isOffline);

        // A bare session is not a result
        json.remove("rewards");
        QVERIFY(!ReadingSessionResult::fromServerJson(json, result));
    }
};

QTEST_MAIN(ReadingSessionTest)
#include "ReadingSessionTest.moc"
