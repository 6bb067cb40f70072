#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/SyncOrchestrator.h"
#include "core/SessionStore.h"
#include "MockReadingApiClient.h"

class SyncOrchestratorTest : public QObject
{
    Q_OBJECT

private:
    ReadingSession enqueueEnded(const QString& id, int minuteOffset = 0,
                                const SessionRewards& rewards = SessionRewards())
    {
        ReadingSession session;
        session.id = id;
        session.libraryEntryId = "entry-1";
        session.startTime = QDateTime(QDate(2024, 5, 1), QTime(8, 0), Qt::UTC).addSecs(minuteOffset * 60);
        session.endTime = session.startTime.addSecs(300);
        session.startPage = 0;
        session.endPage = 10;
        session.isOffline = session.hasOfflineId();
        session.needsSync = true;

        ReadingSessionResult estimate;
        estimate.sessionId = id;
        estimate.isOffline = true;
        estimate.rewards = rewards;
        m_store->commitEnd(session, estimate, true);
        return session;
    }

    QStringList historyIds()
    {
        QList<SessionHistoryEntry> entries;
        m_store->listHistory(SessionHistoryFilter(), entries);
        QStringList ids;
        for (const SessionHistoryEntry& entry : entries) {
            ids << entry.session.id;
        }
        return ids;
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<ReadingSessionResult>("ReadingSessionResult");
    }

    void init() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());

        m_store = new SessionStore();
        QVERIFY(m_store->initialize(DbConfig::forPath(m_tempDir->filePath("sessions.db"))));

        m_api = new MockReadingApiClient();
        m_orchestrator = new SyncOrchestrator(m_store, m_api);
        QVERIFY(m_orchestrator->initialize(0));
        QVERIFY(m_orchestrator->start());
    }

    void cleanup() {
        delete m_orchestrator;
        delete m_api;
        delete m_store;
        m_tempDir.reset();
    }

    void testDrainsOldestFirst() {
        enqueueEnded("offline_a", 0);
        enqueueEnded("offline_b", 10);
        enqueueEnded("offline_c", 20);

        QSignalSpy reconciledSpy(m_orchestrator, &SyncOrchestrator::sessionReconciled);
        QSignalSpy completedSpy(m_orchestrator, &SyncOrchestrator::syncCompleted);

        QVERIFY(m_orchestrator->drainQueue());

        QCOMPARE(m_api->calls(), QStringList() << "replay:offline_a" << "replay:offline_b" << "replay:offline_c");
        QCOMPARE(m_store->pendingCount(), 0);
        QCOMPARE(reconciledSpy.count(), 3);
        QCOMPARE(reconciledSpy.at(0).at(0).toString(), QString("offline_a"));
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(completedSpy.at(0).at(0).toBool(), true);
        QCOMPARE(completedSpy.at(0).at(1).toInt(), 3);
        QVERIFY(m_orchestrator->lastSyncTime().isValid());

        // Offline ids were replaced by the ids the service assigned
        QCOMPARE(historyIds(), QStringList() << "srv-3" << "srv-2" << "srv-1");
    }

    void testRetryableStopsThePass() {
        enqueueEnded("offline_a", 0);
        enqueueEnded("offline_b", 10);
        enqueueEnded("offline_c", 20);

        m_api->queue("replay", ReadingApiClient::Ok);
        m_api->queue("replay", ReadingApiClient::Retryable);

        QSignalSpy connectionSpy(m_orchestrator, &SyncOrchestrator::connectionStateChanged);
        QVERIFY(!m_orchestrator->drainQueue());

        // The third record is never tried ahead of the second
        QCOMPARE(m_api->calls(), QStringList() << "replay:offline_a" << "replay:offline_b");
        QVERIFY(m_orchestrator->isOfflineMode());
        QCOMPARE(connectionSpy.count(), 1);
        QCOMPARE(connectionSpy.at(0).at(0).toBool(), false);

        QList<PendingSyncRecord> records;
        QVERIFY(m_store->listPendingSync(records));
        QCOMPARE(records.size(), 2);
        QCOMPARE(records.at(0).session.id, QString("offline_b"));
        QCOMPARE(records.at(0).attempts, 1);
        QCOMPARE(records.at(1).attempts, 0);
    }

    void testRetryUsesSameIdempotencyKey() {
        ReadingSession session = enqueueEnded("offline_a");
        m_api->queue("replay", ReadingApiClient::Retryable);
        QVERIFY(!m_orchestrator->drainQueue());

        m_api->setPingResult(true);
        m_orchestrator->checkConnection();

        QList<PendingSyncRecord> replayed = m_api->replayedRecords();
        QCOMPARE(replayed.size(), 2);
        QCOMPARE(replayed.at(0).idempotencyKey, PendingSyncRecord::idempotencyKeyFor(session));
        QCOMPARE(replayed.at(1).idempotencyKey, replayed.at(0).idempotencyKey);
        QCOMPARE(m_store->pendingCount(), 0);
    }

    void testDuplicateIsDiscarded() {
        SessionRewards estimated;
        estimated.coinsEarned = 9;
        estimated.expEarned = 40;
        enqueueEnded("offline_a", 0, estimated);
        m_api->queue("replay", ReadingApiClient::Duplicate);

        QSignalSpy duplicateSpy(m_orchestrator, &SyncOrchestrator::duplicateDiscarded);
        QVERIFY(m_orchestrator->drainQueue());

        QCOMPARE(duplicateSpy.count(), 1);
        QCOMPARE(m_store->pendingCount(), 0);

        QList<SessionHistoryEntry> entries;
        QVERIFY(m_store->listHistory(SessionHistoryFilter(), entries));
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries.first().session.id, QString("offline_a"));
        QVERIFY(!entries.first().session.needsSync);
        QVERIFY(entries.first().result.has_value());

        // No authoritative result came back; the estimate stays as stored
        QVERIFY(entries.first().result->rewards == estimated);
        QVERIFY(entries.first().result->isOffline);
    }

    void testOnlineSessionFinalizesFirst() {
        enqueueEnded("srv-5");
        QVERIFY(m_orchestrator->drainQueue());

        QCOMPARE(m_api->calls(), QStringList() << "finalize:srv-5");
        QCOMPARE(m_store->pendingCount(), 0);
    }

    void testExpiredSessionIsReplayed() {
        enqueueEnded("srv-5");
        m_api->queue("finalize", ReadingApiClient::NotFound);

        QVERIFY(m_orchestrator->drainQueue());
        QCOMPARE(m_api->calls(), QStringList() << "finalize:srv-5" << "replay:srv-5");
        QCOMPARE(m_store->pendingCount(), 0);
    }

    void testTerminalIsDropped() {
        enqueueEnded("offline_a", 0);
        enqueueEnded("offline_b", 10);
        m_api->queue("replay", ReadingApiClient::Terminal);

        QSignalSpy rejectedSpy(m_orchestrator, &SyncOrchestrator::recordRejected);
        QVERIFY(m_orchestrator->drainQueue());

        QCOMPARE(rejectedSpy.count(), 1);
        QCOMPARE(rejectedSpy.at(0).at(0).toString(), QString("offline_a"));
        QVERIFY(!rejectedSpy.at(0).at(1).toString().isEmpty());

        // The next record still goes through
        QCOMPARE(m_api->callCount("replay"), 2);
        QCOMPARE(m_store->pendingCount(), 0);
        QVERIFY(!m_orchestrator->isOfflineMode());
    }

    void testRunningSessionIsSkipped() {
        ReadingSession running;
        running.id = "offline_live";
        running.libraryEntryId = "entry-1";
        running.startTime = QDateTime(QDate(2024, 5, 1), QTime(7, 0), Qt::UTC);
        running.isOffline = true;
        QVERIFY(m_store->commitOfflineStart(running));
        enqueueEnded("offline_a");

        QVERIFY(m_orchestrator->drainQueue());
        QCOMPARE(m_api->calls(), QStringList() << "replay:offline_a");
        QCOMPARE(m_store->pendingCount(), 1);
    }

    void testActiveSessionIdIsSkipped() {
        enqueueEnded("offline_a");
        m_orchestrator->setActiveSessionId("offline_a");

        QVERIFY(m_orchestrator->drainQueue());
        QCOMPARE(m_api->callCount("replay"), 0);

        m_orchestrator->setActiveSessionId(QString());
        QVERIFY(m_orchestrator->drainQueue());
        QCOMPARE(m_api->callCount("replay"), 1);
    }

    void testTriggerDuringDrainRunsOneMorePass() {
        enqueueEnded("offline_a", 0);

        bool nestedResult = true;
        m_api->setReplayHook([this, &nestedResult]() {
            // A session ends while the first request is in flight
            enqueueEnded("offline_b", 10);
            nestedResult = m_orchestrator->drainQueue();
        });

        QSignalSpy completedSpy(m_orchestrator, &SyncOrchestrator::syncCompleted);
        QVERIFY(m_orchestrator->drainQueue());

        QVERIFY(!nestedResult);
        QCOMPARE(m_api->calls(), QStringList() << "replay:offline_a" << "replay:offline_b");
        QCOMPARE(m_store->pendingCount(), 0);
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(completedSpy.at(0).at(1).toInt(), 2);
    }

    void testConnectionRestoreDrains() {
        enqueueEnded("offline_a");
        m_orchestrator->noteConnectionLost();
        QVERIFY(m_orchestrator->isOfflineMode());

        m_api->setPingResult(false);
        m_orchestrator->forceSyncNow();
        QCOMPARE(m_api->callCount("replay"), 0);
        QVERIFY(m_orchestrator->isOfflineMode());

        QSignalSpy connectionSpy(m_orchestrator, &SyncOrchestrator::connectionStateChanged);
        m_api->setPingResult(true);
        m_orchestrator->onAppForeground();

        QCOMPARE(connectionSpy.count(), 1);
        QCOMPARE(connectionSpy.at(0).at(0).toBool(), true);
        QCOMPARE(m_api->callCount("replay"), 1);
        QCOMPARE(m_store->pendingCount(), 0);
    }

    void testRequestDrainIsDeferred() {
        enqueueEnded("offline_a");

        m_orchestrator->requestDrain();
        QCOMPARE(m_api->callCount("replay"), 0);
        QTRY_COMPARE(m_api->callCount("replay"), 1);
        QCOMPARE(m_store->pendingCount(), 0);
    }

    void testRequestDrainWaitsWhileOffline() {
        enqueueEnded("offline_a");
        m_orchestrator->noteConnectionLost();

        m_orchestrator->requestDrain();
        QTest::qWait(50);
        QCOMPARE(m_api->callCount("replay"), 0);
        QCOMPARE(m_orchestrator->pendingCount(), 1);
    }

private:
    QScopedPointer<QTemporaryDir> m_tempDir;
    SessionStore* m_store = nullptr;
    MockReadingApiClient* m_api = nullptr;
    SyncOrchestrator* m_orchestrator = nullptr;
};

QTEST_MAIN(SyncOrchestratorTest)
#include "SyncOrchestratorTest.moc"
