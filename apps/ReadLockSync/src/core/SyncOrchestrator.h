#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include <QObject>
#include <QTimer>
#include <QDateTime>

#include "ReadingApiClient.h"
#include "../models/SessionResult.h"

class SessionStore;

/**
 * @brief Replays queued session snapshots to the reading service
 *
 * Drains the pending-sync queue oldest first. A retryable failure stops the
 * pass so later records never overtake earlier ones. Triggers arriving while
 * a drain is running (including from the nested event loop of a request)
 * schedule exactly one more pass instead of starting a second drain.
 */
class SyncOrchestrator : public QObject
{
    Q_OBJECT
public:
    explicit SyncOrchestrator(SessionStore* store, ReadingApiClient* apiClient, QObject *parent = nullptr);
    ~SyncOrchestrator();

    bool initialize(int connectionCheckIntervalMs = 30000);
    bool start();
    bool stop();

    // Runs one drain now; false if the pass stopped early or another drain was running
    bool drainQueue();

    bool isOfflineMode() const { return m_offlineMode; }
    bool isDraining() const { return m_draining; }
    int pendingCount() const;
    QDateTime lastSyncTime() const { return m_lastSyncTime; }

    // The record with this id belongs to the running session and is never replayed
    void setActiveSessionId(const QString& sessionId) { m_activeSessionId = sessionId; }

public slots:
    void checkConnection();
    void forceSyncNow();
    void onAppForeground();
    // Called after a session end; the drain runs once control returns to the event loop
    void requestDrain();
    // A request elsewhere failed with a retryable error
    void noteConnectionLost();

signals:
    void connectionStateChanged(bool online);
    void syncCompleted(bool success, int itemsProcessed);
    void queueSizeChanged(int newSize);
    void sessionReconciled(const QString& sessionId, const ReadingSessionResult& result);
    void duplicateDiscarded(const QString& sessionId);
    void recordRejected(const QString& sessionId, const QString& reason);

private:
    bool drainPass(int& processed);
    void setOfflineMode(bool offline);

    SessionStore* m_store;
    ReadingApiClient* m_apiClient;
    QTimer m_connectionCheckTimer;
    QString m_activeSessionId;
    bool m_offlineMode;
    bool m_isRunning;
    bool m_initialized;
    bool m_draining;
    bool m_drainRequested;
    QDateTime m_lastSyncTime;
    QDateTime m_lastConnectionCheck;
};

#endif // SYNCORCHESTRATOR_H
