#ifndef SESSIONSTORE_H
#define SESSIONSTORE_H

#include <QObject>
#include <QList>
#include <QScopedPointer>
#include <functional>
#include <optional>

#include "dbservice/dbconfig.h"
#include "../models/ReadingSession.h"
#include "../models/SessionResult.h"

class DbService;

struct SessionHistoryEntry
{
    ReadingSession session;
    std::optional<ReadingSessionResult> result;
};

/**
 * @brief Durable local state of the sync engine
 *
 * Holds the single active-session slot, the pending-sync queue and a bounded
 * history cache in one SQLite database. Every method commits before it
 * returns; the commit* methods group several writes into one transaction.
 * All methods return false (and log) when the database rejects the write.
 */
class SessionStore : public QObject
{
    Q_OBJECT
public:
    explicit SessionStore(QObject *parent = nullptr);
    ~SessionStore();

    bool initialize(const DbConfig& config, int historyLimit = 100);
    bool isInitialized() const { return m_initialized; }

    void setHistoryLimit(int limit);
    int historyLimit() const { return m_historyLimit; }

    // Active slot. An unreadable record is discarded and reported as an empty slot.
    bool getActive(std::optional<ReadingSession>& session);
    bool putActive(const ReadingSession& session);
    bool clearActive();

    // Pending-sync queue. Enqueueing an id already queued replaces the snapshot
    // but keeps its original position and attempt count.
    bool enqueuePendingSync(const ReadingSession& session);
    bool listPendingSync(QList<PendingSyncRecord>& records);
    bool removePendingSync(const QString& sessionId);
    bool recordSyncAttempt(const QString& sessionId);
    int pendingCount();

    // History cache, newest first
    bool putHistory(const ReadingSession& session,
                    const std::optional<ReadingSessionResult>& result = std::nullopt);
    bool listHistory(const SessionHistoryFilter& filter, QList<SessionHistoryEntry>& entries);

    // True in `ended` when an ended snapshot of this session is queued or in history
    bool hasEndedLocally(const QString& sessionId, bool& ended);

    bool clearAll();

    // Offline start: fill the active slot and queue the start snapshot
    bool commitOfflineStart(const ReadingSession& session);
    // End: optionally queue the ended snapshot, clear the slot, record history
    bool commitEnd(const ReadingSession& ended, const ReadingSessionResult& result, bool enqueue);
    // Acknowledged replay: drop the queue entry, store the authoritative result
    bool commitReplay(const ReadingSession& session, const ReadingSessionResult& result);
    // Duplicate replay: drop the queue entry, mark history synced, keep the stored result
    bool commitDuplicate(const ReadingSession& session);

    QString lastError() const;

private:
    bool ensureInitialized() const;
    bool createSchema();
    bool evictHistory();
    bool inTransaction(const QString& operation, const std::function<bool()>& work);

    QScopedPointer<DbService> m_db;
    int m_historyLimit;
    bool m_initialized;
};

#endif // SESSIONSTORE_H
