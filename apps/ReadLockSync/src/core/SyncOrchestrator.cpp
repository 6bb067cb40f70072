#include "SyncOrchestrator.h"
#include "SessionStore.h"
#include "logger/logger.h"

SyncOrchestrator::SyncOrchestrator(SessionStore* store, ReadingApiClient* apiClient, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_apiClient(apiClient)
    , m_offlineMode(false)
    , m_isRunning(false)
    , m_initialized(false)
    , m_draining(false)
    , m_drainRequested(false)
{
    qRegisterMetaType<ReadingSessionResult>("ReadingSessionResult");

    // Set up connection check timer
    connect(&m_connectionCheckTimer, &QTimer::timeout, this, &SyncOrchestrator::checkConnection);
    m_connectionCheckTimer.setInterval(30000);  // 30 seconds
}

SyncOrchestrator::~SyncOrchestrator()
{
    if (m_isRunning) {
        stop();
    }
}

bool SyncOrchestrator::initialize(int connectionCheckIntervalMs)
{
    LOG_INFO(QString("Initializing SyncOrchestrator (connection check interval: %1ms)")
             .arg(connectionCheckIntervalMs));

    if (!m_store || !m_apiClient) {
        LOG_ERROR("Session store or reading API client not provided");
        return false;
    }

    if (connectionCheckIntervalMs > 0) {
        m_connectionCheckTimer.setInterval(connectionCheckIntervalMs);
    } else {
        m_connectionCheckTimer.setInterval(0);
    }

    m_initialized = true;
    return true;
}

bool SyncOrchestrator::start()
{
    if (m_isRunning) {
        LOG_WARNING("SyncOrchestrator is already running");
        return true;
    }

    if (!m_initialized) {
        LOG_ERROR("SyncOrchestrator not initialized");
        return false;
    }

    LOG_INFO("Starting SyncOrchestrator");

    // 0 disables periodic probing; sync then only runs on explicit triggers
    if (m_connectionCheckTimer.interval() > 0) {
        m_connectionCheckTimer.start();
    }
    m_isRunning = true;

    LOG_INFO(QString("SyncOrchestrator started, %1 record(s) pending").arg(pendingCount()));
    return true;
}

bool SyncOrchestrator::stop()
{
    if (!m_isRunning) {
        LOG_WARNING("SyncOrchestrator is not running");
        return true;
    }

    LOG_INFO("Stopping SyncOrchestrator");
    m_connectionCheckTimer.stop();
    m_isRunning = false;
    return true;
}

int SyncOrchestrator::pendingCount() const
{
    return m_store ? m_store->pendingCount() : -1;
}

void SyncOrchestrator::setOfflineMode(bool offline)
{
    if (m_offlineMode == offline) {
        return;
    }

    m_offlineMode = offline;
    if (offline) {
        LOG_WARNING("Reading service unreachable, entering offline mode");
    } else {
        LOG_INFO("Reading service reachable, leaving offline mode");
    }
    emit connectionStateChanged(!offline);
}

void SyncOrchestrator::checkConnection()
{
    if (!m_initialized) {
        return;
    }

    LOG_DEBUG("Checking server connection");

    bool isConnected = m_apiClient->ping();
    m_lastConnectionCheck = QDateTime::currentDateTimeUtc();

    if (isConnected && m_offlineMode) {
        LOG_INFO("Server connection restored, draining pending sync queue");
        setOfflineMode(false);
        drainQueue();
    } else if (!isConnected && !m_offlineMode) {
        LOG_WARNING("Server connection lost");
        setOfflineMode(true);
    }
}

void SyncOrchestrator::forceSyncNow()
{
    LOG_INFO("Forcing immediate sync");

    if (!m_initialized) {
        LOG_ERROR("SyncOrchestrator not initialized");
        return;
    }

    if (m_offlineMode) {
        checkConnection();
        // A restored connection has already drained the queue
        return;
    }

    drainQueue();
}

void SyncOrchestrator::onAppForeground()
{
    LOG_DEBUG("Application returned to foreground");
    forceSyncNow();
}

void SyncOrchestrator::requestDrain()
{
    if (!m_initialized) {
        return;
    }

    QTimer::singleShot(0, this, [this]() {
        if (m_offlineMode) {
            LOG_DEBUG("In offline mode, queued records wait for the connection check");
            return;
        }
        drainQueue();
    });
}

void SyncOrchestrator::noteConnectionLost()
{
    setOfflineMode(true);
}

bool SyncOrchestrator::drainQueue()
{
    if (!m_initialized) {
        LOG_ERROR("SyncOrchestrator not initialized");
        return false;
    }

    if (m_draining) {
        LOG_DEBUG("Drain already running, scheduling another pass");
        m_drainRequested = true;
        return false;
    }

    m_draining = true;

    int processedTotal = 0;
    bool success = true;
    do {
        m_drainRequested = false;
        int processed = 0;
        success = drainPass(processed);
        processedTotal += processed;
    } while (success && m_drainRequested);

    m_drainRequested = false;
    m_draining = false;

    if (success) {
        m_lastSyncTime = QDateTime::currentDateTimeUtc();
    }

    emit queueSizeChanged(pendingCount());
    emit syncCompleted(success, processedTotal);
    return success;
}

bool SyncOrchestrator::drainPass(int& processed)
{
    QList<PendingSyncRecord> records;
    if (!m_store->listPendingSync(records)) {
        LOG_ERROR("Could not read the pending sync queue");
        return false;
    }

    if (records.isEmpty()) {
        return true;
    }

    LOG_INFO(QString("Processing pending sync queue (%1 record(s))").arg(records.size()));

    for (const PendingSyncRecord& record : records) {
        const ReadingSession& session = record.session;

        // Start snapshot of a session that is still running
        if (!session.hasEnded() || session.id == m_activeSessionId) {
            LOG_DEBUG(QString("Skipping session %1, it has not ended").arg(session.id));
            continue;
        }

        ReadingSessionResult result;
        ReadingApiClient::RemoteStatus status;

        if (session.isOffline || session.hasOfflineId()) {
            status = m_apiClient->replayRemote(record, result);
        } else {
            status = m_apiClient->finalizeRemote(session.id, session.endPage.value_or(session.startPage),
                                                 session.focusScore, record.idempotencyKey, result);
            if (status == ReadingApiClient::NotFound) {
                LOG_INFO(QString("Session %1 expired on the server, replaying it").arg(session.id));
                status = m_apiClient->replayRemote(record, result);
            }
        }

        switch (status) {
            case ReadingApiClient::Ok:
                if (!m_store->commitReplay(session, result)) {
                    LOG_ERROR(QString("Failed to record reconciled session %1").arg(session.id));
                    return false;
                }
                LOG_INFO(QString("Session %1 reconciled (%2 coins, %3 exp)")
                         .arg(session.id)
                         .arg(result.rewards.coinsEarned)
                         .arg(result.rewards.expEarned));
                setOfflineMode(false);
                processed++;
                emit sessionReconciled(session.id, result);
                break;

            case ReadingApiClient::Duplicate: {
                // Already recorded by an earlier request whose reply was lost
                if (!m_store->commitDuplicate(session)) {
                    LOG_ERROR(QString("Failed to discard duplicate session %1").arg(session.id));
                    return false;
                }
                LOG_INFO(QString("Session %1 was already recorded, discarding").arg(session.id));
                setOfflineMode(false);
                processed++;
                emit duplicateDiscarded(session.id);
                break;
            }

            case ReadingApiClient::Retryable:
                LOG_WARNING(QString("Sync of session %1 failed, will retry: %2")
                            .arg(session.id, m_apiClient->lastErrorMessage()));
                if (!m_store->recordSyncAttempt(session.id)) {
                    LOG_ERROR(QString("Failed to count sync attempt for session %1").arg(session.id));
                }
                setOfflineMode(true);
                return false;

            case ReadingApiClient::NotFound:
            case ReadingApiClient::Conflict:
            case ReadingApiClient::Terminal: {
                const QString reason = m_apiClient->lastErrorMessage().isEmpty()
                        ? ReadingApiClient::statusToString(status)
                        : m_apiClient->lastErrorMessage();
                LOG_ERROR(QString("Reading service rejected session %1, dropping it: %2")
                          .arg(session.id, reason));
                if (!m_store->removePendingSync(session.id)) {
                    return false;
                }
                processed++;
                emit recordRejected(session.id, reason);
                break;
            }
        }
    }

    return true;
}
