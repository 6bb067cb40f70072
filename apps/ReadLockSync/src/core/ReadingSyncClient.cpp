// ReadingSyncClient.cpp
#include "ReadingSyncClient.h"
#include "ReadingApiClient.h"
#include "RewardEstimator.h"
#include "SessionStateMachine.h"
#include "SyncOrchestrator.h"
#include "LockController.h"
#include "Clock.h"
#include "../managers/ConfigManager.h"
#include "logger/logger.h"

ReadingSyncClient::ReadingSyncClient(QObject* parent)
    : QObject(parent)
    , m_configManager(nullptr)
    , m_store(nullptr)
    , m_apiClient(nullptr)
    , m_estimator(nullptr)
    , m_stateMachine(nullptr)
    , m_syncOrchestrator(nullptr)
    , m_lockEvents(nullptr)
    , m_clock(nullptr)
    , m_ownsApiClient(false)
    , m_ownsClock(false)
    , m_isRunning(false)
{
}

ReadingSyncClient::~ReadingSyncClient()
{
    if (m_isRunning) {
        stop();
    }

    // Clean up in reverse order of construction; the state machine and the
    // orchestrator hold raw pointers to everything below them
    delete m_stateMachine;
    delete m_syncOrchestrator;
    delete m_lockEvents;
    delete m_estimator;
    delete m_store;
    if (m_ownsApiClient) {
        delete m_apiClient;
    }
    if (m_ownsClock) {
        delete m_clock;
    }
}

bool ReadingSyncClient::initialize(ConfigManager* configManager, LockController* lockController,
                                   ReadingApiClient* apiClient, Clock* clock)
{
    LOG_INFO("Initializing ReadingSyncClient");

    if (!configManager) {
        LOG_ERROR("ConfigManager not provided");
        return false;
    }
    m_configManager = configManager;

    // 1. Local store
    m_store = new SessionStore(this);
    if (!m_store->initialize(m_configManager->dbConfig(), m_configManager->historyLimit())) {
        LOG_ERROR("Failed to initialize Session Store");
        return false;
    }

    // 2. Reading service client
    if (apiClient) {
        m_apiClient = apiClient;
    } else {
        m_apiClient = new ReadingApiClient(this);
        m_ownsApiClient = true;
    }
    if (!m_apiClient->isInitialized()
        && !m_apiClient->initialize(m_configManager->serverUrl(), m_configManager->requestTimeoutMs())) {
        LOG_ERROR("Failed to initialize Reading API Client");
        return false;
    }
    if (!m_configManager->authToken().isEmpty()) {
        m_apiClient->setAuthToken(m_configManager->authToken());
    }

    // 3. Estimator and clock
    m_estimator = new RewardEstimator(m_configManager->rewardRates());
    if (clock) {
        m_clock = clock;
    } else {
        m_clock = new SystemClock();
        m_ownsClock = true;
    }

    // 4. Sync orchestrator
    m_syncOrchestrator = new SyncOrchestrator(m_store, m_apiClient, this);
    if (!m_syncOrchestrator->initialize(m_configManager->connectionCheckInterval())) {
        LOG_ERROR("Failed to initialize Sync Orchestrator");
        return false;
    }

    connect(m_syncOrchestrator, &SyncOrchestrator::connectionStateChanged,
            this, &ReadingSyncClient::connectionStateChanged);
    connect(m_syncOrchestrator, &SyncOrchestrator::syncCompleted,
            this, &ReadingSyncClient::syncCompleted);
    connect(m_syncOrchestrator, &SyncOrchestrator::sessionReconciled,
            this, &ReadingSyncClient::sessionReconciled);
    connect(m_syncOrchestrator, &SyncOrchestrator::recordRejected,
            this, &ReadingSyncClient::onRecordRejected);

    // 5. Session state machine, restored from the active slot
    m_stateMachine = new SessionStateMachine(m_store, m_apiClient, m_estimator, lockController, m_clock, this);
    m_stateMachine->setSyncOrchestrator(m_syncOrchestrator);
    if (!m_stateMachine->initialize(m_configManager->heartbeatDriftToleranceSec())) {
        LOG_ERROR("Failed to initialize Session State Machine");
        return false;
    }

    connect(m_stateMachine, &SessionStateMachine::sessionStarted,
            this, &ReadingSyncClient::sessionStarted);
    connect(m_stateMachine, &SessionStateMachine::sessionEnded,
            this, &ReadingSyncClient::sessionEnded);

    // 6. Lock service status events
    m_lockEvents = new LockEventChannel(this);
    m_stateMachine->connectLockEvents(m_lockEvents);

    connect(m_configManager, &ConfigManager::configChanged,
            this, &ReadingSyncClient::onConfigChanged);

    // 7. Pick up a session started on another device
    if (m_stateMachine->currentState() == SessionStateMachine::Idle) {
        adoptRemoteActiveSession();
    }

    LOG_INFO("ReadingSyncClient initialized successfully");
    return true;
}

void ReadingSyncClient::adoptRemoteActiveSession()
{
    std::optional<ReadingSession> remote;
    bool pausedWithoutTimestamp = false;
    ReadingApiClient::RemoteStatus status = m_apiClient->fetchActive(remote, &pausedWithoutTimestamp);

    if (status == ReadingApiClient::Retryable) {
        LOG_WARNING("Could not ask the reading service for an active session: "
                    + m_apiClient->lastErrorMessage());
        m_syncOrchestrator->noteConnectionLost();
        return;
    }
    if (status != ReadingApiClient::Ok) {
        LOG_WARNING("Active session lookup failed: " + ReadingApiClient::statusToString(status));
        return;
    }
    if (!remote) {
        return;
    }

    SessionOutcome<bool> outcome = m_stateMachine->adoptRemoteSession(*remote, pausedWithoutTimestamp);
    if (!outcome.isSuccess()) {
        LOG_WARNING("Could not adopt remote session " + remote->id + ": " + outcome.message);
    }
}

bool ReadingSyncClient::start()
{
    if (m_isRunning) {
        LOG_WARNING("ReadingSyncClient is already running");
        return true;
    }

    if (!m_syncOrchestrator) {
        LOG_ERROR("ReadingSyncClient not initialized");
        return false;
    }

    LOG_INFO("Starting ReadingSyncClient");

    if (!m_syncOrchestrator->start()) {
        LOG_ERROR("Failed to start Sync Orchestrator");
        return false;
    }

    // Anything left over from the previous run
    m_syncOrchestrator->requestDrain();

    m_isRunning = true;
    return true;
}

bool ReadingSyncClient::stop()
{
    if (!m_isRunning) {
        return true;
    }

    LOG_INFO("Stopping ReadingSyncClient");
    m_syncOrchestrator->stop();
    m_isRunning = false;
    return true;
}

SessionOutcome<ReadingSession> ReadingSyncClient::startSession(const QString& libraryEntryId,
                                                               std::optional<int> startPage,
                                                               const QString& displayTitle)
{
    if (!m_stateMachine) {
        return SessionOutcome<ReadingSession>::failure(SessionError::Storage, "Client not initialized");
    }
    return m_stateMachine->startSession(libraryEntryId, startPage, displayTitle);
}

SessionOutcome<bool> ReadingSyncClient::pauseSession()
{
    if (!m_stateMachine) {
        return SessionOutcome<bool>::failure(SessionError::Storage, "Client not initialized");
    }
    return m_stateMachine->pauseSession();
}

SessionOutcome<bool> ReadingSyncClient::resumeSession()
{
    if (!m_stateMachine) {
        return SessionOutcome<bool>::failure(SessionError::Storage, "Client not initialized");
    }
    return m_stateMachine->resumeSession();
}

SessionOutcome<ReadingSessionResult> ReadingSyncClient::endSession(int endPage, std::optional<int> focusScore)
{
    if (!m_stateMachine) {
        return SessionOutcome<ReadingSessionResult>::failure(SessionError::Storage, "Client not initialized");
    }
    return m_stateMachine->endSession(endPage, focusScore);
}

SessionOutcome<std::optional<ReadingSession>> ReadingSyncClient::getActiveSession() const
{
    if (!m_stateMachine) {
        return SessionOutcome<std::optional<ReadingSession>>::failure(SessionError::Storage,
                                                                      "Client not initialized");
    }
    return SessionOutcome<std::optional<ReadingSession>>::success(m_stateMachine->activeSession());
}

SessionOutcome<QList<SessionHistoryEntry>> ReadingSyncClient::getSessionHistory(const SessionHistoryFilter& filter)
{
    using Outcome = SessionOutcome<QList<SessionHistoryEntry>>;

    if (!m_store || !m_apiClient) {
        return Outcome::failure(SessionError::Storage, "Client not initialized");
    }

    QList<ReadingSession> remote;
    ReadingApiClient::RemoteStatus status = m_apiClient->fetchHistory(filter, remote);

    if (status == ReadingApiClient::Ok) {
        QList<SessionHistoryEntry> entries;
        for (const ReadingSession& session : remote) {
            if (!m_store->putHistory(session)) {
                LOG_WARNING("Failed to cache history for session " + session.id);
            }
            SessionHistoryEntry entry;
            entry.session = session;
            entries.append(entry);
        }
        LOG_DEBUG(QString("Fetched %1 history item(s) from the reading service").arg(entries.size()));
        return Outcome::success(entries);
    }

    if (status != ReadingApiClient::Retryable) {
        LOG_ERROR("History request rejected: " + m_apiClient->lastErrorMessage());
        return Outcome::failure(SessionError::Validation, m_apiClient->lastErrorMessage());
    }

    m_syncOrchestrator->noteConnectionLost();

    QList<SessionHistoryEntry> cached;
    if (!m_store->listHistory(filter, cached)) {
        return Outcome::failure(SessionError::Storage, m_store->lastError());
    }
    if (cached.isEmpty()) {
        return Outcome::failure(SessionError::NetworkUnavailable,
                                "Reading service unreachable and no cached history matches");
    }

    LOG_INFO(QString("Reading service unreachable, returning %1 cached history item(s)").arg(cached.size()));
    return Outcome::success(cached);
}

qint64 ReadingSyncClient::elapsedSeconds() const
{
    return m_stateMachine ? m_stateMachine->elapsedSeconds() : 0;
}

int ReadingSyncClient::pendingCount() const
{
    return m_syncOrchestrator ? m_syncOrchestrator->pendingCount() : 0;
}

bool ReadingSyncClient::isOfflineMode() const
{
    return m_syncOrchestrator ? m_syncOrchestrator->isOfflineMode() : true;
}

QDateTime ReadingSyncClient::lastSyncTime() const
{
    return m_syncOrchestrator ? m_syncOrchestrator->lastSyncTime() : QDateTime();
}

void ReadingSyncClient::onAppForeground()
{
    if (m_syncOrchestrator) {
        m_syncOrchestrator->onAppForeground();
    }
}

void ReadingSyncClient::forceSyncNow()
{
    if (m_syncOrchestrator) {
        m_syncOrchestrator->forceSyncNow();
    }
}

void ReadingSyncClient::onConfigChanged()
{
    LOG_DEBUG("Configuration changed, applying runtime settings");

    m_estimator->setRates(m_configManager->rewardRates());
    m_store->setHistoryLimit(m_configManager->historyLimit());
    m_stateMachine->setHeartbeatDriftTolerance(m_configManager->heartbeatDriftToleranceSec());
    m_apiClient->setAuthToken(m_configManager->authToken());
}

void ReadingSyncClient::onRecordRejected(const QString& sessionId, const QString& reason)
{
    emit errorOccurred(QString("Session %1 could not be synced: %2").arg(sessionId, reason));
}
