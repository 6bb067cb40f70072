#ifndef READINGSYNCCLIENT_H
#define READINGSYNCCLIENT_H

#include <QObject>
#include <QDateTime>
#include <QList>
#include <optional>

#include "../models/ReadingSession.h"
#include "../models/SessionResult.h"
#include "../models/SessionError.h"
#include "SessionStore.h"

// Forward declarations
class ConfigManager;
class ReadingApiClient;
class RewardEstimator;
class SessionStateMachine;
class SyncOrchestrator;
class LockController;
class LockEventChannel;
class Clock;

/**
 * @brief Entry point used by the UI
 *
 * Wires the store, the reading service client, the state machine and the
 * sync orchestrator together from the configuration, and exposes the session
 * operations as SessionOutcome values.
 */
class ReadingSyncClient : public QObject
{
    Q_OBJECT
public:
    explicit ReadingSyncClient(QObject *parent = nullptr);
    ~ReadingSyncClient();

    // apiClient and clock are optional; when given they are used instead of
    // the default ones and stay owned by the caller
    bool initialize(ConfigManager* configManager, LockController* lockController,
                    ReadingApiClient* apiClient = nullptr, Clock* clock = nullptr);
    bool start();
    bool stop();
    bool isRunning() const { return m_isRunning; }

    SessionOutcome<ReadingSession> startSession(const QString& libraryEntryId,
                                                std::optional<int> startPage = std::nullopt,
                                                const QString& displayTitle = QString());
    SessionOutcome<bool> pauseSession();
    SessionOutcome<bool> resumeSession();
    SessionOutcome<ReadingSessionResult> endSession(int endPage, std::optional<int> focusScore = std::nullopt);
    SessionOutcome<std::optional<ReadingSession>> getActiveSession() const;
    SessionOutcome<QList<SessionHistoryEntry>> getSessionHistory(const SessionHistoryFilter& filter);

    qint64 elapsedSeconds() const;
    int pendingCount() const;
    bool isOfflineMode() const;
    QDateTime lastSyncTime() const;

    SessionStateMachine* stateMachine() const { return m_stateMachine; }
    SyncOrchestrator* syncOrchestrator() const { return m_syncOrchestrator; }
    LockEventChannel* lockEvents() const { return m_lockEvents; }

public slots:
    void onAppForeground();
    void forceSyncNow();

signals:
    void sessionStarted(const QString& sessionId, bool offline);
    void sessionEnded(const QString& sessionId, const ReadingSessionResult& result);
    void sessionReconciled(const QString& sessionId, const ReadingSessionResult& result);
    void connectionStateChanged(bool online);
    void syncCompleted(bool success, int itemsProcessed);
    void errorOccurred(const QString& errorMessage);

private slots:
    void onConfigChanged();
    void onRecordRejected(const QString& sessionId, const QString& reason);

private:
    void adoptRemoteActiveSession();

    ConfigManager* m_configManager;
    SessionStore* m_store;
    ReadingApiClient* m_apiClient;
    RewardEstimator* m_estimator;
    SessionStateMachine* m_stateMachine;
    SyncOrchestrator* m_syncOrchestrator;
    LockEventChannel* m_lockEvents;
    Clock* m_clock;
    bool m_ownsApiClient;
    bool m_ownsClock;
    bool m_isRunning;
};

#endif // READINGSYNCCLIENT_H
