#include "SessionStateMachine.h"
#include "SessionStore.h"
#include "ReadingApiClient.h"
#include "RewardEstimator.h"
#include "SyncOrchestrator.h"
#include "Clock.h"
#include "logger/logger.h"

SessionStateMachine::SessionStateMachine(SessionStore* store, ReadingApiClient* apiClient, RewardEstimator* estimator,
                                         LockController* lockController, Clock* clock, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_apiClient(apiClient)
    , m_estimator(estimator)
    , m_lockController(lockController)
    , m_clock(clock)
    , m_orchestrator(nullptr)
    , m_currentState(State::Idle)
    , m_startInFlight(false)
    , m_initialized(false)
    , m_driftToleranceSec(5)
{
    qRegisterMetaType<ReadingSessionResult>("ReadingSessionResult");

    connect(&m_tickTimer, &QTimer::timeout, this, &SessionStateMachine::onTickTimer);
    m_tickTimer.setInterval(1000);
}

SessionStateMachine::~SessionStateMachine()
{
    m_tickTimer.stop();
}

bool SessionStateMachine::initialize(int heartbeatDriftToleranceSec)
{
    LOG_INFO("Initializing SessionStateMachine");

    if (!m_store || !m_apiClient || !m_estimator || !m_clock) {
        LOG_ERROR("SessionStateMachine is missing a collaborator");
        return false;
    }

    m_driftToleranceSec = qMax(0, heartbeatDriftToleranceSec);

    std::optional<ReadingSession> stored;
    if (!m_store->getActive(stored)) {
        LOG_ERROR("Failed to read the active session slot");
        return false;
    }

    m_initialized = true;

    if (!stored) {
        LOG_INFO("No active session, starting Idle");
        return true;
    }

    if (stored->hasEnded()) {
        // The process died between persisting the ended snapshot and finishing the end
        return recoverInterruptedEnd(*stored);
    }

    m_session = stored;
    if (m_orchestrator) {
        m_orchestrator->setActiveSessionId(m_session->id);
    }

    if (m_session->isPaused()) {
        transitionToState(State::Paused);
    } else {
        transitionToState(State::Active);
        startTick();
    }

    LOG_INFO(QString("Restored session %1 in %2 state (elapsed %3s)")
             .arg(m_session->id, stateToString(m_currentState))
             .arg(elapsedSeconds()));
    return true;
}

bool SessionStateMachine::recoverInterruptedEnd(ReadingSession ended)
{
    LOG_WARNING(QString("Session %1 was ending when the process stopped, queueing it for sync")
                .arg(ended.id));

    ended.needsSync = true;
    ended.pausedAt = QDateTime();
    ReadingSessionResult estimate = m_estimator->estimateResult(ended);

    if (!m_store->commitEnd(ended, estimate, true)) {
        LOG_ERROR(QString("Failed to recover interrupted end of session %1").arg(ended.id));
        return false;
    }

    if (m_orchestrator) {
        m_orchestrator->requestDrain();
    }
    return true;
}

void SessionStateMachine::setSyncOrchestrator(SyncOrchestrator* orchestrator)
{
    m_orchestrator = orchestrator;
    if (m_orchestrator && m_session) {
        m_orchestrator->setActiveSessionId(m_session->id);
    }
}

void SessionStateMachine::connectLockEvents(LockEventChannel* channel)
{
    if (!channel) {
        return;
    }
    connect(channel, &LockEventChannel::eventReceived, this, &SessionStateMachine::handleLockEvent);
}

qint64 SessionStateMachine::elapsedSeconds() const
{
    if (!m_session) {
        return 0;
    }

    const qint64 derivedMs = m_session->elapsedMsAt(m_clock->now());
    if (derivedMs < 0) {
        // Wall clock is behind the start time; trust the lock service until it recovers
        return m_lastHeartbeatSeconds.value_or(0);
    }
    return derivedMs / 1000;
}

SessionOutcome<ReadingSession> SessionStateMachine::startSession(const QString& libraryEntryId,
                                                                 std::optional<int> startPage,
                                                                 const QString& displayTitle)
{
    if (!m_initialized) {
        LOG_ERROR("SessionStateMachine not initialized");
        return SessionOutcome<ReadingSession>::failure(SessionError::Storage, "Session store not initialized");
    }

    if (m_currentState != State::Idle || m_startInFlight) {
        LOG_WARNING(QString("Cannot start a session while %1")
                    .arg(m_startInFlight ? QString("another start is in flight") : stateToString(m_currentState)));
        return SessionOutcome<ReadingSession>::failure(SessionError::AlreadyActive);
    }

    if (libraryEntryId.trimmed().isEmpty()) {
        return SessionOutcome<ReadingSession>::failure(SessionError::Validation, "Library entry id is required");
    }
    if (startPage && *startPage < 0) {
        return SessionOutcome<ReadingSession>::failure(SessionError::Validation, "Start page must not be negative");
    }

    // Reserve the slot; the create call below runs a nested event loop
    m_startInFlight = true;
    struct Reservation {
        bool& flag;
        ~Reservation() { flag = false; }
    } reservation{m_startInFlight};

    ReadingSession session;
    session.libraryEntryId = libraryEntryId;
    session.startTime = m_clock->now();
    session.startPage = startPage.value_or(0);
    session.displayTitle = displayTitle;

    LOG_INFO(QString("Starting session for library entry %1 at page %2")
             .arg(libraryEntryId)
             .arg(session.startPage));

    ReadingApiClient::RemoteSessionHandle handle;
    ReadingApiClient::RemoteStatus status = m_apiClient->createRemote(session, handle);

    switch (status) {
        case ReadingApiClient::Ok:
            session.id = handle.sessionId;
            if (!m_store->putActive(session)) {
                return SessionOutcome<ReadingSession>::failure(SessionError::Storage,
                                                               "Failed to persist the new session");
            }
            break;

        case ReadingApiClient::Retryable:
            LOG_WARNING("Reading service unreachable, starting session offline: "
                        + m_apiClient->lastErrorMessage());
            noteConnectionLost();
            session.id = ReadingSession::generateOfflineId();
            session.isOffline = true;
            session.needsSync = true;
            if (!m_store->commitOfflineStart(session)) {
                return SessionOutcome<ReadingSession>::failure(SessionError::Storage,
                                                               "Failed to persist the offline session");
            }
            break;

        case ReadingApiClient::Conflict:
            LOG_WARNING("Reading service already has an active session");
            return SessionOutcome<ReadingSession>::failure(SessionError::AlreadyActive,
                                                           m_apiClient->lastErrorMessage());

        case ReadingApiClient::Duplicate:
        case ReadingApiClient::NotFound:
        case ReadingApiClient::Terminal:
            LOG_ERROR("Reading service rejected the session: " + m_apiClient->lastErrorMessage());
            return SessionOutcome<ReadingSession>::failure(SessionError::Validation,
                                                           m_apiClient->lastErrorMessage());
    }

    m_session = session;
    m_lastHeartbeatSeconds.reset();
    transitionToState(State::Active);

    if (m_orchestrator) {
        m_orchestrator->setActiveSessionId(session.id);
    }
    if (m_lockController) {
        m_lockController->start(session.id, session.displayTitle);
    }
    startTick();

    LOG_INFO(QString("Session %1 started%2").arg(session.id, session.isOffline ? " (offline)" : ""));
    emit sessionStarted(session.id, session.isOffline);
    return SessionOutcome<ReadingSession>::success(session);
}

SessionOutcome<bool> SessionStateMachine::pauseSession()
{
    if (m_currentState != State::Active || !m_session) {
        LOG_DEBUG(QString("Pause ignored in %1 state").arg(stateToString(m_currentState)));
        return SessionOutcome<bool>::success(false);
    }

    m_session->pausedAt = m_clock->now();
    if (!persistActive()) {
        m_session->pausedAt = QDateTime();
        return SessionOutcome<bool>::failure(SessionError::Storage, "Failed to persist the pause");
    }

    transitionToState(State::Paused);
    stopTick();
    if (m_lockController) {
        m_lockController->pause();
    }

    const ReadingSession paused = *m_session;
    LOG_INFO(QString("Session %1 paused").arg(paused.id));

    if (!paused.isOffline) {
        ReadingApiClient::RemoteStatus status = m_apiClient->pauseRemote(paused.id);
        if (status != ReadingApiClient::Ok) {
            LOG_WARNING(QString("Remote pause of %1 failed (%2), will reconcile at sync")
                        .arg(paused.id, ReadingApiClient::statusToString(status)));
            if (status == ReadingApiClient::Retryable) {
                noteConnectionLost();
            }
            markNeedsSync(paused.id);
        }
    }

    return SessionOutcome<bool>::success(true);
}

SessionOutcome<bool> SessionStateMachine::resumeSession()
{
    if (m_currentState != State::Paused || !m_session) {
        LOG_DEBUG(QString("Resume ignored in %1 state").arg(stateToString(m_currentState)));
        return SessionOutcome<bool>::success(false);
    }

    const ReadingSession before = *m_session;
    const qint64 pauseDeltaMs = qMax<qint64>(0, m_session->pausedAt.msecsTo(m_clock->now()));

    m_session->totalPauseMs += pauseDeltaMs;
    m_session->pausedAt = QDateTime();
    if (!persistActive()) {
        m_session = before;
        return SessionOutcome<bool>::failure(SessionError::Storage, "Failed to persist the resume");
    }

    transitionToState(State::Active);
    startTick();
    if (m_lockController) {
        m_lockController->resume();
    }

    const ReadingSession resumed = *m_session;
    LOG_INFO(QString("Session %1 resumed after %2 ms pause").arg(resumed.id).arg(pauseDeltaMs));

    if (!resumed.isOffline) {
        ReadingApiClient::RemoteStatus status = m_apiClient->resumeRemote(resumed.id);
        if (status != ReadingApiClient::Ok) {
            LOG_WARNING(QString("Remote resume of %1 failed (%2), will reconcile at sync")
                        .arg(resumed.id, ReadingApiClient::statusToString(status)));
            if (status == ReadingApiClient::Retryable) {
                noteConnectionLost();
            }
            markNeedsSync(resumed.id);
        }
    }

    return SessionOutcome<bool>::success(true);
}

SessionOutcome<ReadingSessionResult> SessionStateMachine::endSession(int endPage, std::optional<int> focusScore)
{
    if (m_currentState == State::Idle || m_currentState == State::Ending || !m_session) {
        LOG_WARNING(QString("End rejected in %1 state").arg(stateToString(m_currentState)));
        return SessionOutcome<ReadingSessionResult>::failure(SessionError::NoActiveSession);
    }

    if (endPage < 0) {
        return SessionOutcome<ReadingSessionResult>::failure(SessionError::Validation,
                                                             "End page must not be negative");
    }
    if (focusScore && (*focusScore < 0 || *focusScore > 100)) {
        return SessionOutcome<ReadingSessionResult>::failure(SessionError::Validation,
                                                             "Focus score must be between 0 and 100");
    }

    const ReadingSession preEnd = *m_session;
    const State preEndState = m_currentState;
    const QDateTime now = m_clock->now();

    ReadingSession ended = preEnd;
    if (ended.isPaused()) {
        ended.totalPauseMs += qMax<qint64>(0, ended.pausedAt.msecsTo(now));
        ended.pausedAt = QDateTime();
    }
    ended.endTime = now;
    ended.endPage = endPage;
    ended.focusScore = focusScore;

    m_session = ended;
    transitionToState(State::Ending);

    if (!persistActive()) {
        m_session = preEnd;
        transitionToState(preEndState);
        return SessionOutcome<ReadingSessionResult>::failure(SessionError::Storage,
                                                             "Failed to persist the ended session");
    }

    stopTick();
    if (m_lockController) {
        m_lockController->stop();
    }

    LOG_INFO(QString("Ending session %1 at page %2 (%3s active)")
             .arg(ended.id)
             .arg(endPage)
             .arg(ended.durationSeconds()));

    if (ended.isOffline) {
        return completeOffline(ended, preEnd, preEndState);
    }

    ReadingSessionResult result;
    ReadingApiClient::RemoteStatus status = m_apiClient->finalizeRemote(
        ended.id, endPage, focusScore, PendingSyncRecord::idempotencyKeyFor(ended), result);

    switch (status) {
        case ReadingApiClient::Ok: {
            ReadingSession synced = ended;
            synced.needsSync = false;
            if (!m_store->commitEnd(synced, result, false)) {
                restorePreEnd(preEnd, preEndState);
                return SessionOutcome<ReadingSessionResult>::failure(SessionError::Storage,
                                                                     "Failed to record the session result");
            }
            finishEnd(synced, result);
            return SessionOutcome<ReadingSessionResult>::success(result);
        }

        case ReadingApiClient::Retryable:
            noteConnectionLost();
            LOG_WARNING("Reading service unreachable, ending session offline: "
                        + m_apiClient->lastErrorMessage());
            return completeOffline(ended, preEnd, preEndState);

        case ReadingApiClient::NotFound:
            LOG_WARNING(QString("Reading service no longer knows session %1, ending it offline")
                        .arg(ended.id));
            return completeOffline(ended, preEnd, preEndState);

        case ReadingApiClient::Duplicate: {
            // An earlier end request was recorded but its reply was lost
            LOG_INFO(QString("Session %1 was already finalized, keeping the local estimate").arg(ended.id));
            ReadingSession synced = ended;
            synced.needsSync = false;
            ReadingSessionResult estimate = m_estimator->estimateResult(synced);
            if (!m_store->commitEnd(synced, estimate, false)) {
                restorePreEnd(preEnd, preEndState);
                return SessionOutcome<ReadingSessionResult>::failure(SessionError::Storage,
                                                                     "Failed to record the session result");
            }
            finishEnd(synced, estimate);
            return SessionOutcome<ReadingSessionResult>::success(estimate);
        }

        case ReadingApiClient::Conflict:
        case ReadingApiClient::Terminal: {
            const QString message = m_apiClient->lastErrorMessage();
            LOG_ERROR(QString("Reading service rejected the end of %1: %2").arg(ended.id, message));
            restorePreEnd(preEnd, preEndState);
            if (!persistActive()) {
                LOG_ERROR("Failed to restore the session after a rejected end");
            }
            return SessionOutcome<ReadingSessionResult>::failure(SessionError::Validation, message);
        }
    }

    return SessionOutcome<ReadingSessionResult>::failure(SessionError::Validation, "Unexpected reply");
}

SessionOutcome<ReadingSessionResult> SessionStateMachine::completeOffline(const ReadingSession& ended,
                                                                          const ReadingSession& preEnd,
                                                                          State preEndState)
{
    ReadingSession pending = ended;
    pending.needsSync = true;
    ReadingSessionResult estimate = m_estimator->estimateResult(pending);

    if (!m_store->commitEnd(pending, estimate, true)) {
        restorePreEnd(preEnd, preEndState);
        return SessionOutcome<ReadingSessionResult>::failure(SessionError::Storage,
                                                             "Failed to queue the session for sync");
    }

    LOG_INFO(QString("Session %1 ended offline, estimated %2 coins / %3 exp")
             .arg(pending.id)
             .arg(estimate.rewards.coinsEarned)
             .arg(estimate.rewards.expEarned));

    finishEnd(pending, estimate);
    return SessionOutcome<ReadingSessionResult>::success(estimate);
}

void SessionStateMachine::finishEnd(const ReadingSession& ended, const ReadingSessionResult& result)
{
    m_session.reset();
    m_lastHeartbeatSeconds.reset();
    transitionToState(State::Idle);

    if (m_orchestrator) {
        m_orchestrator->setActiveSessionId(QString());
    }

    emit sessionEnded(ended.id, result);

    if (m_orchestrator) {
        m_orchestrator->requestDrain();
    }
}

void SessionStateMachine::restorePreEnd(const ReadingSession& preEnd, State preEndState)
{
    m_session = preEnd;
    transitionToState(preEndState);

    // The lock was told to stop; put it back the way the reader left it
    if (m_lockController) {
        m_lockController->start(preEnd.id, preEnd.displayTitle);
        if (preEndState == State::Paused) {
            m_lockController->pause();
        }
    }
    if (preEndState == State::Active) {
        startTick();
    }
}

SessionOutcome<bool> SessionStateMachine::adoptRemoteSession(const ReadingSession& remote,
                                                             bool pausedWithoutTimestamp)
{
    if (m_currentState != State::Idle || m_startInFlight || m_session) {
        return SessionOutcome<bool>::success(false);
    }

    if (!remote.isValid() || remote.hasEnded()) {
        return SessionOutcome<bool>::failure(SessionError::Validation, "Remote session is not active");
    }

    bool endedLocally = false;
    if (!m_store->hasEndedLocally(remote.id, endedLocally)) {
        return SessionOutcome<bool>::failure(SessionError::Storage, "Failed to check local session records");
    }
    if (endedLocally) {
        LOG_INFO(QString("Session %1 already ended on this device, waiting for its sync instead of adopting it")
                 .arg(remote.id));
        return SessionOutcome<bool>::success(false);
    }

    ReadingSession adopted = remote;
    adopted.isOffline = false;
    adopted.needsSync = false;
    if (pausedWithoutTimestamp && !adopted.isPaused()) {
        adopted.pausedAt = m_clock->now();
    }

    if (!m_store->putActive(adopted)) {
        return SessionOutcome<bool>::failure(SessionError::Storage, "Failed to persist the adopted session");
    }

    m_session = adopted;
    m_lastHeartbeatSeconds.reset();
    if (m_orchestrator) {
        m_orchestrator->setActiveSessionId(adopted.id);
    }

    if (adopted.isPaused()) {
        transitionToState(State::Paused);
    } else {
        transitionToState(State::Active);
        startTick();
    }

    LOG_INFO(QString("Adopted session %1 from the reading service").arg(adopted.id));
    emit sessionStarted(adopted.id, false);
    return SessionOutcome<bool>::success(true);
}

void SessionStateMachine::handleLockEvent(const LockStatusEvent& event)
{
    if (!m_session) {
        LOG_DEBUG(QString("Lock event %1 ignored, no session")
                  .arg(LockStatusEvent::statusToString(event.status)));
        return;
    }

    if (!event.sessionId.isEmpty() && event.sessionId != m_session->id) {
        LOG_DEBUG(QString("Lock event for %1 ignored, current session is %2")
                  .arg(event.sessionId, m_session->id));
        return;
    }

    switch (event.status) {
        case LockStatusEvent::Started:
            LOG_DEBUG(QString("Lock service confirmed start of %1").arg(m_session->id));
            break;

        case LockStatusEvent::Paused: {
            SessionOutcome<bool> outcome = pauseSession();
            if (!outcome.isSuccess()) {
                LOG_ERROR("Pause from lock service failed: " + outcome.message);
            }
            break;
        }

        case LockStatusEvent::Resumed: {
            SessionOutcome<bool> outcome = resumeSession();
            if (!outcome.isSuccess()) {
                LOG_ERROR("Resume from lock service failed: " + outcome.message);
            }
            break;
        }

        case LockStatusEvent::Stopped:
            LOG_INFO(QString("Lock service stopped session %1").arg(m_session->id));
            emit lockStopped(m_session->id);
            break;

        case LockStatusEvent::Heartbeat: {
            m_lastHeartbeatSeconds = event.elapsedSeconds;

            const qint64 derivedMs = m_session->elapsedMsAt(m_clock->now());
            const qint64 derivedSeconds = derivedMs / 1000;
            if (derivedMs < 0 || qAbs(event.elapsedSeconds - derivedSeconds) > m_driftToleranceSec) {
                LOG_WARNING(QString("Elapsed time drift: lock service reports %1s, derived %2s")
                            .arg(event.elapsedSeconds)
                            .arg(derivedSeconds));
                emit heartbeatDrift(event.elapsedSeconds, derivedSeconds);
            }
            break;
        }

        case LockStatusEvent::Unknown:
            break;
    }
}

void SessionStateMachine::onTickTimer()
{
    emit tick(elapsedSeconds());
}

void SessionStateMachine::startTick()
{
    if (!m_tickTimer.isActive()) {
        m_tickTimer.start();
    }
}

void SessionStateMachine::stopTick()
{
    m_tickTimer.stop();
}

bool SessionStateMachine::persistActive()
{
    if (!m_session) {
        return false;
    }
    return m_store->putActive(*m_session);
}

void SessionStateMachine::markNeedsSync(const QString& sessionId)
{
    // The remote call ran a nested event loop; the session may have ended meanwhile
    if (!m_session || m_session->id != sessionId || m_currentState == State::Idle) {
        return;
    }

    m_session->needsSync = true;
    if (!persistActive()) {
        LOG_ERROR(QString("Failed to flag session %1 for sync").arg(sessionId));
    }
}

void SessionStateMachine::noteConnectionLost()
{
    if (m_orchestrator) {
        m_orchestrator->noteConnectionLost();
    }
}

void SessionStateMachine::transitionToState(State newState)
{
    if (m_currentState != newState) {
        State oldState = m_currentState;
        m_currentState = newState;
        LOG_DEBUG(QString("State %1 -> %2").arg(stateToString(oldState), stateToString(newState)));
        emit stateChanged(static_cast<int>(newState), static_cast<int>(oldState));
    }
}

QString SessionStateMachine::stateToString(State state)
{
    switch (state) {
        case State::Idle: return "Idle";
        case State::Active: return "Active";
        case State::Paused: return "Paused";
        case State::Ending: return "Ending";
    }
    return "Unknown";
}
