#ifndef SESSIONSTATEMACHINE_H
#define SESSIONSTATEMACHINE_H

#include <QObject>
#include <QTimer>
#include <QDateTime>
#include <optional>

#include "../models/ReadingSession.h"
#include "../models/SessionResult.h"
#include "../models/SessionError.h"
#include "LockController.h"

// Forward declarations
class SessionStore;
class ReadingApiClient;
class RewardEstimator;
class SyncOrchestrator;
class Clock;

/**
 * @brief Owner of the reading session in progress
 *
 * Every transition is written to the SessionStore before the call returns, so
 * the process can die at any point without losing elapsed time. Calls that
 * reach the reading service fall back to a local path when it cannot be
 * reached. The displayed elapsed time is always derived from the persisted
 * timestamps; the one-second tick only prompts the UI to redraw.
 */
class SessionStateMachine : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle = 0,       // No session
        Active = 1,     // Reading
        Paused = 2,     // Reading paused, pause time accumulating
        Ending = 3      // End in progress, waiting for the reading service
    };
    Q_ENUM(State)

    SessionStateMachine(SessionStore* store, ReadingApiClient* apiClient, RewardEstimator* estimator,
                        LockController* lockController, Clock* clock, QObject *parent = nullptr);
    ~SessionStateMachine();

    // Reads the active slot back and resumes where the last process stopped
    bool initialize(int heartbeatDriftToleranceSec = 5);

    void setSyncOrchestrator(SyncOrchestrator* orchestrator);
    void setHeartbeatDriftTolerance(int seconds) { m_driftToleranceSec = qMax(0, seconds); }
    void connectLockEvents(LockEventChannel* channel);

    State currentState() const { return m_currentState; }
    std::optional<ReadingSession> activeSession() const { return m_session; }

    // (now - start) - closed pauses - open pause, in whole seconds
    qint64 elapsedSeconds() const;

    SessionOutcome<ReadingSession> startSession(const QString& libraryEntryId,
                                                std::optional<int> startPage = std::nullopt,
                                                const QString& displayTitle = QString());
    SessionOutcome<bool> pauseSession();
    SessionOutcome<bool> resumeSession();
    SessionOutcome<ReadingSessionResult> endSession(int endPage, std::optional<int> focusScore = std::nullopt);

    // Takes over a session the reading service reports as active when none is held
    // locally. A session already ended on this device is never taken back; its
    // queued end reaches the service through the sync queue instead.
    // pausedWithoutTimestamp marks a paused session whose pause start is unknown.
    SessionOutcome<bool> adoptRemoteSession(const ReadingSession& remote, bool pausedWithoutTimestamp = false);

    static QString stateToString(State state);

public slots:
    void handleLockEvent(const LockStatusEvent& event);

signals:
    void stateChanged(int newState, int oldState);
    void sessionStarted(const QString& sessionId, bool offline);
    void sessionEnded(const QString& sessionId, const ReadingSessionResult& result);
    void tick(qint64 elapsedSeconds);
    void heartbeatDrift(qint64 reportedSeconds, qint64 derivedSeconds);
    // The lock service stopped on its own; the UI asks the reader for the end page
    void lockStopped(const QString& sessionId);

private slots:
    void onTickTimer();

private:
    void transitionToState(State newState);
    bool persistActive();
    void markNeedsSync(const QString& sessionId);
    void noteConnectionLost();
    void startTick();
    void stopTick();
    SessionOutcome<ReadingSessionResult> completeOffline(const ReadingSession& ended, const ReadingSession& preEnd,
                                                         State preEndState);
    void finishEnd(const ReadingSession& ended, const ReadingSessionResult& result);
    void restorePreEnd(const ReadingSession& preEnd, State preEndState);
    bool recoverInterruptedEnd(ReadingSession ended);

    SessionStore* m_store;
    ReadingApiClient* m_apiClient;
    RewardEstimator* m_estimator;
    LockController* m_lockController;
    Clock* m_clock;
    SyncOrchestrator* m_orchestrator;

    State m_currentState;
    std::optional<ReadingSession> m_session;
    bool m_startInFlight;
    bool m_initialized;
    int m_driftToleranceSec;
    std::optional<qint64> m_lastHeartbeatSeconds;
    QTimer m_tickTimer;
};

#endif // SESSIONSTATEMACHINE_H
