#include "SessionStore.h"
#include "dbservice/dbservice.hpp"
#include "logger/logger.h"
#include <QJsonDocument>
#include <QStringList>

namespace {

QString toPayload(const QJsonObject& json)
{
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

QJsonObject fromPayload(const QVariant& value)
{
    return QJsonDocument::fromJson(value.toString().toUtf8()).object();
}

} // namespace

SessionStore::SessionStore(QObject *parent)
    : QObject(parent)
    , m_historyLimit(100)
    , m_initialized(false)
{
}

SessionStore::~SessionStore()
{
}

bool SessionStore::initialize(const DbConfig& config, int historyLimit)
{
    if (m_initialized) {
        LOG_WARNING("SessionStore already initialized");
        return true;
    }

    LOG_INFO("Initializing SessionStore at " + config.databasePath());

    DbConfig storeConfig = config;
    storeConfig.setConnectionPrefix("readlock_store");

    m_db.reset(new DbService(storeConfig));
    if (!m_db->open()) {
        LOG_ERROR("Failed to open session database: " + m_db->lastError());
        m_db.reset();
        return false;
    }

    if (!createSchema()) {
        LOG_ERROR("Failed to create session database schema: " + m_db->lastError());
        m_db.reset();
        return false;
    }

    m_historyLimit = qMax(1, historyLimit);
    m_initialized = true;

    LOG_INFO(QString("SessionStore initialized (history limit: %1)").arg(m_historyLimit));
    return true;
}

void SessionStore::setHistoryLimit(int limit)
{
    m_historyLimit = qMax(1, limit);
    if (m_initialized) {
        evictHistory();
    }
}

bool SessionStore::ensureInitialized() const
{
    if (!m_initialized || !m_db) {
        LOG_ERROR("SessionStore not initialized");
        return false;
    }
    return true;
}

bool SessionStore::createSchema()
{
    QStringList schema;
    schema << "CREATE TABLE IF NOT EXISTS active_session ("
              " slot TEXT PRIMARY KEY CHECK (slot = 'active'),"
              " payload TEXT NOT NULL,"
              " updated_at TEXT NOT NULL)"
           << "CREATE TABLE IF NOT EXISTS pending_sync ("
              " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
              " session_id TEXT NOT NULL UNIQUE,"
              " idempotency_key TEXT NOT NULL,"
              " payload TEXT NOT NULL,"
              " enqueued_at TEXT NOT NULL,"
              " attempts INTEGER NOT NULL DEFAULT 0)"
           << "CREATE TABLE IF NOT EXISTS session_history ("
              " session_id TEXT PRIMARY KEY,"
              " library_entry_id TEXT NOT NULL,"
              " start_time TEXT NOT NULL,"
              " payload TEXT NOT NULL,"
              " result TEXT)"
           << "CREATE INDEX IF NOT EXISTS idx_session_history_start ON session_history(start_time)";

    return m_db->executeScript(schema);
}

bool SessionStore::inTransaction(const QString& operation, const std::function<bool()>& work)
{
    if (!m_db->beginTransaction()) {
        LOG_ERROR(QString("%1: could not begin transaction").arg(operation));
        return false;
    }

    if (!work()) {
        LOG_ERROR(QString("%1 failed, rolling back: %2").arg(operation, m_db->lastError()));
        m_db->rollbackTransaction();
        return false;
    }

    if (!m_db->commitTransaction()) {
        LOG_ERROR(QString("%1: commit failed: %2").arg(operation, m_db->lastError()));
        m_db->rollbackTransaction();
        return false;
    }

    return true;
}

bool SessionStore::getActive(std::optional<ReadingSession>& session)
{
    session.reset();
    if (!ensureInitialized()) {
        return false;
    }

    QList<QString> rows;
    if (!m_db->executeSelectQuery<QString>(
            "SELECT payload FROM active_session WHERE slot = 'active'", QMap<QString, QVariant>(),
            [](const QSqlQuery& query) { return query.value(0).toString(); }, rows)) {
        LOG_ERROR("Failed to read active session: " + m_db->lastError());
        return false;
    }

    if (rows.isEmpty()) {
        return true;
    }

    ReadingSession stored = ReadingSession::fromJson(fromPayload(rows.first()));
    if (!stored.isValid()) {
        LOG_ERROR("Active session record is corrupt, discarding it: " + rows.first().left(512));
        if (!clearActive()) {
            LOG_ERROR("Failed to clear the corrupt active session record");
            return false;
        }
        return true;
    }

    session = stored;
    return true;
}

bool SessionStore::putActive(const ReadingSession& session)
{
    if (!ensureInitialized()) {
        return false;
    }

    QMap<QString, QVariant> params;
    params["payload"] = toPayload(session.toJson());
    params["updated_at"] = ReadingSession::formatTimestamp(QDateTime::currentDateTimeUtc());

    bool success = m_db->executeModificationQuery(
        "INSERT OR REPLACE INTO active_session (slot, payload, updated_at) "
        "VALUES ('active', :payload, :updated_at)", params);

    if (!success) {
        LOG_ERROR(QString("Failed to persist active session %1").arg(session.id));
    }
    return success;
}

bool SessionStore::clearActive()
{
    if (!ensureInitialized()) {
        return false;
    }

    return m_db->executeModificationQuery("DELETE FROM active_session");
}

bool SessionStore::enqueuePendingSync(const ReadingSession& session)
{
    if (!ensureInitialized()) {
        return false;
    }

    QMap<QString, QVariant> params;
    params["session_id"] = session.id;
    params["idempotency_key"] = PendingSyncRecord::idempotencyKeyFor(session);
    params["payload"] = toPayload(session.toJson());
    params["enqueued_at"] = ReadingSession::formatTimestamp(QDateTime::currentDateTimeUtc());

    bool success = m_db->executeModificationQuery(
        "INSERT INTO pending_sync (session_id, idempotency_key, payload, enqueued_at, attempts) "
        "VALUES (:session_id, :idempotency_key, :payload, :enqueued_at, 0) "
        "ON CONFLICT(session_id) DO UPDATE SET "
        " payload = excluded.payload,"
        " idempotency_key = excluded.idempotency_key", params);

    if (success) {
        LOG_DEBUG(QString("Queued session %1 for sync").arg(session.id));
    } else {
        LOG_ERROR(QString("Failed to queue session %1 for sync").arg(session.id));
    }
    return success;
}

bool SessionStore::listPendingSync(QList<PendingSyncRecord>& records)
{
    records.clear();
    if (!ensureInitialized()) {
        return false;
    }

    bool success = m_db->executeSelectQuery<PendingSyncRecord>(
        "SELECT seq, idempotency_key, payload, enqueued_at, attempts "
        "FROM pending_sync ORDER BY seq ASC", QMap<QString, QVariant>(),
        [](const QSqlQuery& query) {
            PendingSyncRecord record;
            record.sequence = query.value(0).toLongLong();
            record.idempotencyKey = query.value(1).toString();
            record.session = ReadingSession::fromJson(fromPayload(query.value(2)));
            record.enqueuedAt = ReadingSession::parseTimestamp(query.value(3).toString());
            record.attempts = query.value(4).toInt();
            return record;
        }, records);

    if (!success) {
        LOG_ERROR("Failed to list pending sync records: " + m_db->lastError());
    }
    return success;
}

bool SessionStore::removePendingSync(const QString& sessionId)
{
    if (!ensureInitialized()) {
        return false;
    }

    QMap<QString, QVariant> params;
    params["session_id"] = sessionId;
    return m_db->executeModificationQuery("DELETE FROM pending_sync WHERE session_id = :session_id", params);
}

bool SessionStore::recordSyncAttempt(const QString& sessionId)
{
    if (!ensureInitialized()) {
        return false;
    }

    QMap<QString, QVariant> params;
    params["session_id"] = sessionId;
    return m_db->executeModificationQuery(
        "UPDATE pending_sync SET attempts = attempts + 1 WHERE session_id = :session_id", params);
}

int SessionStore::pendingCount()
{
    if (!ensureInitialized()) {
        return -1;
    }

    std::optional<int> count = m_db->executeSingleSelectQuery<int>(
        "SELECT COUNT(*) FROM pending_sync", QMap<QString, QVariant>(),
        [](const QSqlQuery& query) { return query.value(0).toInt(); });

    return count ? *count : -1;
}

bool SessionStore::putHistory(const ReadingSession& session, const std::optional<ReadingSessionResult>& result)
{
    if (!ensureInitialized()) {
        return false;
    }

    QMap<QString, QVariant> params;
    params["session_id"] = session.id;
    params["library_entry_id"] = session.libraryEntryId;
    params["start_time"] = ReadingSession::formatTimestamp(session.startTime);
    params["payload"] = toPayload(session.toJson());
    params["result"] = result ? QVariant(toPayload(result->toJson())) : QVariant();

    // A refresh without a result (remote history) keeps the result recorded at end time
    bool success = m_db->executeModificationQuery(
        "INSERT INTO session_history (session_id, library_entry_id, start_time, payload, result) "
        "VALUES (:session_id, :library_entry_id, :start_time, :payload, :result) "
        "ON CONFLICT(session_id) DO UPDATE SET "
        " library_entry_id = excluded.library_entry_id,"
        " start_time = excluded.start_time,"
        " payload = excluded.payload,"
        " result = COALESCE(excluded.result, session_history.result)", params);

    if (!success) {
        LOG_ERROR(QString("Failed to write history for session %1").arg(session.id));
        return false;
    }

    return evictHistory();
}

bool SessionStore::evictHistory()
{
    QMap<QString, QVariant> params;
    params["keep"] = m_historyLimit;

    return m_db->executeModificationQuery(
        "DELETE FROM session_history WHERE session_id NOT IN ("
        " SELECT session_id FROM session_history ORDER BY start_time DESC LIMIT :keep)", params);
}

bool SessionStore::listHistory(const SessionHistoryFilter& filter, QList<SessionHistoryEntry>& entries)
{
    entries.clear();
    if (!ensureInitialized()) {
        return false;
    }

    QStringList conditions;
    QMap<QString, QVariant> params;

    if (!filter.libraryEntryId.isEmpty()) {
        conditions << "library_entry_id = :library_entry_id";
        params["library_entry_id"] = filter.libraryEntryId;
    }
    if (filter.from.isValid()) {
        conditions << "start_time >= :from_time";
        params["from_time"] = ReadingSession::formatTimestamp(filter.from);
    }
    if (filter.to.isValid()) {
        conditions << "start_time <= :to_time";
        params["to_time"] = ReadingSession::formatTimestamp(filter.to);
    }

    const int pageSize = qMax(1, filter.pageSize);
    const int page = qMax(1, filter.page);
    params["page_size"] = pageSize;
    params["page_offset"] = (page - 1) * pageSize;

    QString queryStr = "SELECT payload, result FROM session_history";
    if (!conditions.isEmpty()) {
        queryStr += " WHERE " + conditions.join(" AND ");
    }
    queryStr += " ORDER BY start_time DESC LIMIT :page_size OFFSET :page_offset";

    bool success = m_db->executeSelectQuery<SessionHistoryEntry>(queryStr, params,
        [](const QSqlQuery& query) {
            SessionHistoryEntry entry;
            entry.session = ReadingSession::fromJson(fromPayload(query.value(0)));
            if (!query.value(1).isNull()) {
                entry.result = ReadingSessionResult::fromJson(fromPayload(query.value(1)));
            }
            return entry;
        }, entries);

    if (!success) {
        LOG_ERROR("Failed to list history: " + m_db->lastError());
    }
    return success;
}

bool SessionStore::hasEndedLocally(const QString& sessionId, bool& ended)
{
    ended = false;
    if (!ensureInitialized()) {
        return false;
    }

    QMap<QString, QVariant> params;
    params["queued_id"] = sessionId;
    params["history_id"] = sessionId;

    QList<QJsonObject> payloads;
    if (!m_db->executeSelectQuery<QJsonObject>(
            "SELECT payload FROM pending_sync WHERE session_id = :queued_id "
            "UNION ALL SELECT payload FROM session_history WHERE session_id = :history_id", params,
            [](const QSqlQuery& query) { return fromPayload(query.value(0)); }, payloads)) {
        LOG_ERROR(QString("Failed to look up session %1: %2").arg(sessionId, m_db->lastError()));
        return false;
    }

    for (const QJsonObject& payload : payloads) {
        if (ReadingSession::fromJson(payload).hasEnded()) {
            ended = true;
            break;
        }
    }
    return true;
}

bool SessionStore::clearAll()
{
    if (!ensureInitialized()) {
        return false;
    }

    return inTransaction("clearAll", [this]() {
        return m_db->executeScript(QStringList()
                                   << "DELETE FROM active_session"
                                   << "DELETE FROM pending_sync"
                                   << "DELETE FROM session_history");
    });
}

bool SessionStore::commitOfflineStart(const ReadingSession& session)
{
    if (!ensureInitialized()) {
        return false;
    }

    return inTransaction("commitOfflineStart", [this, &session]() {
        return putActive(session) && enqueuePendingSync(session);
    });
}

bool SessionStore::commitEnd(const ReadingSession& ended, const ReadingSessionResult& result, bool enqueue)
{
    if (!ensureInitialized()) {
        return false;
    }

    return inTransaction("commitEnd", [this, &ended, &result, enqueue]() {
        if (enqueue && !enqueuePendingSync(ended)) {
            return false;
        }
        return clearActive() && putHistory(ended, result);
    });
}

bool SessionStore::commitDuplicate(const ReadingSession& session)
{
    if (!ensureInitialized()) {
        return false;
    }

    ReadingSession synced = session;
    synced.needsSync = false;

    return inTransaction("commitDuplicate", [this, &session, &synced]() {
        return removePendingSync(session.id) && putHistory(synced);
    });
}

bool SessionStore::commitReplay(const ReadingSession& session, const ReadingSessionResult& result)
{
    if (!ensureInitialized()) {
        return false;
    }

    ReadingSession synced = session;
    synced.needsSync = false;
    synced.isOffline = false;

    return inTransaction("commitReplay", [this, &session, &synced, &result]() {
        if (!removePendingSync(session.id)) {
            return false;
        }

        // An offline id is replaced by the id the reading service assigned on replay
        if (!result.sessionId.isEmpty() && result.sessionId != session.id) {
            QMap<QString, QVariant> params;
            params["session_id"] = session.id;
            if (!m_db->executeModificationQuery(
                    "DELETE FROM session_history WHERE session_id = :session_id", params)) {
                return false;
            }
            synced.id = result.sessionId;
        }

        return putHistory(synced, result);
    });
}

QString SessionStore::lastError() const
{
    return m_db ? m_db->lastError() : QString("Database not open");
}
