#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QSqlDatabase>
#include <QSqlQuery>

#include "core/SessionStore.h"

class SessionStoreTest : public QObject
{
    Q_OBJECT

private:
    static QDateTime at(int hour, int minute)
    {
        return QDateTime(QDate(2024, 5, 1), QTime(hour, minute), Qt::UTC);
    }

    static ReadingSession endedSession(const QString& id, int startHour, int startMinute = 0)
    {
        ReadingSession session;
        session.id = id;
        session.libraryEntryId = "entry-1";
        session.startTime = at(startHour, startMinute);
        session.endTime = session.startTime.addSecs(600);
        session.startPage = 1;
        session.endPage = 11;
        session.needsSync = true;
        return session;
    }

    DbConfig config() const
    {
        return DbConfig::forPath(m_tempDir->filePath("sessions.db"));
    }

private slots:
    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        m_store = new SessionStore();
        QVERIFY(m_store->initialize(config(), 3));
    }

    void cleanup() {
        delete m_store;
        m_store = nullptr;
        m_tempDir.reset();
    }

    void testActiveSlot() {
        std::optional<ReadingSession> active;
        QVERIFY(m_store->getActive(active));
        QVERIFY(!active.has_value());

        ReadingSession session = endedSession("srv-1", 8);
        session.endTime = QDateTime();
        session.endPage.reset();
        session.pausedAt = at(8, 5);
        QVERIFY(m_store->putActive(session));

        // Replaced, not duplicated
        session.totalPauseMs = 1500;
        QVERIFY(m_store->putActive(session));

        QVERIFY(m_store->getActive(active));
        QVERIFY(active.has_value());
        QCOMPARE(active->id, QString("srv-1"));
        QCOMPARE(active->pausedAt, at(8, 5));
        QCOMPARE(active->totalPauseMs, qint64(1500));

        QVERIFY(m_store->clearActive());
        QVERIFY(m_store->getActive(active));
        QVERIFY(!active.has_value());
    }

    void testActiveSlotSurvivesReopen() {
        ReadingSession session = endedSession("srv-2", 9);
        session.endTime = QDateTime();
        QVERIFY(m_store->putActive(session));

        // Simulate a process restart
        delete m_store;
        m_store = new SessionStore();
        QVERIFY(m_store->initialize(config(), 3));

        std::optional<ReadingSession> active;
        QVERIFY(m_store->getActive(active));
        QVERIFY(active.has_value());
        QCOMPARE(active->id, QString("srv-2"));
        QCOMPARE(active->startTime, at(9, 0));
    }

    void testCorruptActiveRecordIsDiscarded() {
        ReadingSession session = endedSession("srv-3", 9);
        session.endTime = QDateTime();
        QVERIFY(m_store->putActive(session));
        QVERIFY(m_store->enqueuePendingSync(endedSession("offline_q", 8)));
        delete m_store;
        m_store = nullptr;

        {
            QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", "corrupt_writer");
            db.setDatabaseName(m_tempDir->filePath("sessions.db"));
            QVERIFY(db.open());
            QSqlQuery query(db);
            QVERIFY(query.exec("UPDATE active_session SET payload = '{\"id\": 17, garbage'"));
            db.close();
        }
        QSqlDatabase::removeDatabase("corrupt_writer");

        m_store = new SessionStore();
        QVERIFY(m_store->initialize(config(), 3));

        std::optional<ReadingSession> active = session;
        QVERIFY(m_store->getActive(active));
        QVERIFY(!active.has_value());

        // The slot is usable again and the rest of the database is untouched
        QVERIFY(m_store->getActive(active));
        QVERIFY(!active.has_value());
        QCOMPARE(m_store->pendingCount(), 1);
        QVERIFY(m_store->putActive(session));
        QVERIFY(m_store->getActive(active));
        QCOMPARE(active->id, QString("srv-3"));
    }

    void testHasEndedLocally() {
        bool ended = true;
        QVERIFY(m_store->hasEndedLocally("srv-7", ended));
        QVERIFY(!ended);

        // A start snapshot in the queue is not an end
        ReadingSession running = endedSession("offline_r", 7);
        running.endTime = QDateTime();
        QVERIFY(m_store->enqueuePendingSync(running));
        QVERIFY(m_store->hasEndedLocally("offline_r", ended));
        QVERIFY(!ended);

        QVERIFY(m_store->enqueuePendingSync(endedSession("srv-7", 8)));
        QVERIFY(m_store->hasEndedLocally("srv-7", ended));
        QVERIFY(ended);

        QVERIFY(m_store->putHistory(endedSession("srv-8", 9)));
        QVERIFY(m_store->hasEndedLocally("srv-8", ended));
        QVERIFY(ended);
    }

    void testPendingQueueIsFifo() {
        QVERIFY(m_store->enqueuePendingSync(endedSession("offline_b", 10)));
        QVERIFY(m_store->enqueuePendingSync(endedSession("offline_a", 8)));
        QVERIFY(m_store->enqueuePendingSync(endedSession("srv-c", 9)));

        QList<PendingSyncRecord> records;
        QVERIFY(m_store->listPendingSync(records));
        QCOMPARE(records.size(), 3);

        // Insertion order, not start time
        QCOMPARE(records.at(0).session.id, QString("offline_b"));
        QCOMPARE(records.at(1).session.id, QString("offline_a"));
        QCOMPARE(records.at(2).session.id, QString("srv-c"));
        QVERIFY(records.at(0).sequence < records.at(1).sequence);
        QCOMPARE(records.at(0).idempotencyKey,
                 PendingSyncRecord::idempotencyKeyFor(records.at(0).session));
        QCOMPARE(m_store->pendingCount(), 3);
    }

    void testReenqueueKeepsPositionAndAttempts() {
        QVERIFY(m_store->enqueuePendingSync(endedSession("offline_a", 8)));
        QVERIFY(m_store->enqueuePendingSync(endedSession("offline_b", 9)));
        QVERIFY(m_store->recordSyncAttempt("offline_a"));

        ReadingSession updated = endedSession("offline_a", 8);
        updated.endPage = 30;
        QVERIFY(m_store->enqueuePendingSync(updated));

        QList<PendingSyncRecord> records;
        QVERIFY(m_store->listPendingSync(records));
        QCOMPARE(records.size(), 2);
        QCOMPARE(records.at(0).session.id, QString("offline_a"));
        QCOMPARE(records.at(0).session.endPage.value_or(-1), 30);
        QCOMPARE(records.at(0).attempts, 1);
    }

    void testRemovePending() {
        QVERIFY(m_store->enqueuePendingSync(endedSession("offline_a", 8)));
        QVERIFY(m_store->removePendingSync("offline_a"));
        QCOMPARE(m_store->pendingCount(), 0);

        // Removing something that is not queued is not an error
        QVERIFY(m_store->removePendingSync("missing"));
    }

    void testHistoryEvictsOldest() {
        QVERIFY(m_store->putHistory(endedSession("srv-1", 8)));
        QVERIFY(m_store->putHistory(endedSession("srv-2", 9)));
        QVERIFY(m_store->putHistory(endedSession("srv-3", 10)));
        QVERIFY(m_store->putHistory(endedSession("srv-4", 11)));

        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(SessionHistoryFilter(), entries));
        QCOMPARE(entries.size(), 3);

        // Newest first, the 08:00 session was evicted
        QCOMPARE(entries.at(0).session.id, QString("srv-4"));
        QCOMPARE(entries.at(2).session.id, QString("srv-2"));
    }

    void testHistoryFilterAndPaging() {
        ReadingSession other = endedSession("srv-x", 9, 30);
        other.libraryEntryId = "entry-2";
        QVERIFY(m_store->putHistory(endedSession("srv-1", 8)));
        QVERIFY(m_store->putHistory(other));
        QVERIFY(m_store->putHistory(endedSession("srv-2", 10)));

        SessionHistoryFilter filter;
        filter.libraryEntryId = "entry-1";
        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(filter, entries));
        QCOMPARE(entries.size(), 2);

        filter.pageSize = 1;
        filter.page = 2;
        QVERIFY(m_store->listHistory(filter, entries));
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.at(0).session.id, QString("srv-1"));

        SessionHistoryFilter window;
        window.from = at(9, 0);
        window.to = at(9, 59);
        QVERIFY(m_store->listHistory(window, entries));
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.at(0).session.id, QString("srv-x"));
    }

    void testHistoryKeepsResultWhenRewrittenWithout() {
        ReadingSessionResult result;
        result.sessionId = "srv-1";
        result.rewards.coinsEarned = 9;
        QVERIFY(m_store->putHistory(endedSession("srv-1", 8), result));
        QVERIFY(m_store->putHistory(endedSession("srv-1", 8)));

        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(SessionHistoryFilter(), entries));
        QCOMPARE(entries.size(), 1);
        QVERIFY(entries.at(0).result.has_value());
        QCOMPARE(entries.at(0).result->rewards.coinsEarned, 9);
    }

    void testCommitOfflineStart() {
        ReadingSession session = endedSession("offline_1", 8);
        session.endTime = QDateTime();
        session.isOffline = true;
        QVERIFY(m_store->commitOfflineStart(session));

        std::optional<ReadingSession> active;
        QVERIFY(m_store->getActive(active));
        QVERIFY(active.has_value());
        QCOMPARE(m_store->pendingCount(), 1);
    }

    void testCommitEnd() {
        ReadingSession ended = endedSession("offline_1", 8);
        QVERIFY(m_store->putActive(ended));

        ReadingSessionResult estimate;
        estimate.sessionId = ended.id;
        estimate.isOffline = true;
        QVERIFY(m_store->commitEnd(ended, estimate, true));

        std::optional<ReadingSession> active;
        QVERIFY(m_store->getActive(active));
        QVERIFY(!active.has_value());
        QCOMPARE(m_store->pendingCount(), 1);

        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(SessionHistoryFilter(), entries));
        QCOMPARE(entries.size(), 1);
        QVERIFY(entries.at(0).session.needsSync);
        QVERIFY(entries.at(0).result->isOffline);
    }

    void testCommitReplayRekeysOfflineId() {
        ReadingSession ended = endedSession("offline_1", 8);
        ended.isOffline = true;
        ReadingSessionResult estimate;
        estimate.sessionId = ended.id;
        estimate.isOffline = true;
        QVERIFY(m_store->commitEnd(ended, estimate, true));

        ReadingSessionResult authoritative;
        authoritative.sessionId = "srv-77";
        authoritative.rewards.coinsEarned = 15;
        QVERIFY(m_store->commitReplay(ended, authoritative));

        QCOMPARE(m_store->pendingCount(), 0);

        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(SessionHistoryFilter(), entries));
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.at(0).session.id, QString("srv-77"));
        QVERIFY(!entries.at(0).session.needsSync);
        QVERIFY(!entries.at(0).session.isOffline);
        QCOMPARE(entries.at(0).result->rewards.coinsEarned, 15);
    }

    void testCommitDuplicateKeepsResult() {
        ReadingSession ended = endedSession("srv-12", 8);
        ended.needsSync = true;
        ReadingSessionResult estimate;
        estimate.sessionId = ended.id;
        estimate.rewards.coinsEarned = 9;
        estimate.rewards.expEarned = 40;
        QVERIFY(m_store->commitEnd(ended, estimate, true));
        QVERIFY(m_store->enqueuePendingSync(endedSession("srv-13", 9)));

        QVERIFY(m_store->commitDuplicate(ended));

        QList<PendingSyncRecord> records;
        QVERIFY(m_store->listPendingSync(records));
        QCOMPARE(records.size(), 1);
        QCOMPARE(records.first().session.id, QString("srv-13"));

        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(SessionHistoryFilter(), entries));
        QCOMPARE(entries.size(), 1);
        QVERIFY(!entries.first().session.needsSync);
        QVERIFY(entries.first().result.has_value());
        QVERIFY(entries.first().result->rewards == estimate.rewards);
    }

    void testClearAll() {
        QVERIFY(m_store->putActive(endedSession("srv-1", 8)));
        QVERIFY(m_store->enqueuePendingSync(endedSession("srv-1", 8)));
        QVERIFY(m_store->putHistory(endedSession("srv-1", 8)));
        QVERIFY(m_store->clearAll());

        std::optional<ReadingSession> active;
        QVERIFY(m_store->getActive(active));
        QVERIFY(!active.has_value());
        QCOMPARE(m_store->pendingCount(), 0);
    }

private:
    SessionStore* m_store = nullptr;
    QScopedPointer<QTemporaryDir> m_tempDir;
};

QTEST_MAIN(SessionStoreTest)
#include "SessionStoreTest.moc"
