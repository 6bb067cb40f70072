// ReadingApiClient.h
#ifndef READINGAPICLIENT_H
#define READINGAPICLIENT_H

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QJsonObject>
#include <QMutex>
#include <QList>
#include <optional>

#include "../models/ReadingSession.h"
#include "../models/SessionResult.h"

/**
 * @brief Request/response boundary to the reading service
 *
 * Every call blocks in a local event loop until the reply arrives or the
 * request timeout expires, and reports a RemoteStatus instead of raw HTTP
 * codes. The session calls are virtual so tests can script the service.
 */
class ReadingApiClient : public QObject
{
    Q_OBJECT
public:
    enum RemoteStatus {
        Ok = 0,
        Duplicate,      // 409 on finalize/replay: the outcome is already recorded
        Conflict,       // 409 on create: another session is already active
        NotFound,
        Retryable,      // timeout, connection failure, 5xx, 408
        Terminal        // any other 4xx, or a success body that cannot be used
    };
    Q_ENUM(RemoteStatus)

    // Which call a response belongs to; only 409 depends on it
    enum class Operation {
        Create,
        Finalize,
        Replay,
        Other
    };

    struct RemoteSessionHandle {
        QString sessionId;
        QDateTime startedAt;
    };

    explicit ReadingApiClient(QObject *parent = nullptr);
    virtual ~ReadingApiClient();

    bool initialize(const QString &serverUrl, int requestTimeoutMs = 10000);
    bool isInitialized() const { return m_initialized; }
    QString serverUrl() const { return m_serverUrl; }

    // Credentials are refreshed by an external collaborator
    QString authToken() const;
    void setAuthToken(const QString &token);

    virtual RemoteStatus createRemote(const ReadingSession &session, RemoteSessionHandle &handle);
    virtual RemoteStatus finalizeRemote(const QString &sessionId, int endPage, std::optional<int> focusScore,
                                        const QString &idempotencyKey, ReadingSessionResult &result);
    virtual RemoteStatus replayRemote(const PendingSyncRecord &record, ReadingSessionResult &result);
    virtual RemoteStatus pauseRemote(const QString &sessionId);
    virtual RemoteStatus resumeRemote(const QString &sessionId);
    // pausedWithoutTimestamp is set when the service reports a pause but not when it began;
    // pausedAt is then left invalid for the caller to fill from its own clock
    virtual RemoteStatus fetchActive(std::optional<ReadingSession> &session, bool *pausedWithoutTimestamp = nullptr);
    virtual RemoteStatus fetchHistory(const SessionHistoryFilter &filter, QList<ReadingSession> &sessions);
    virtual bool ping();

    static RemoteStatus classifyHttpStatus(int httpStatus, Operation operation);
    static QString statusToString(RemoteStatus status);

    int lastHttpStatus() const { return m_lastHttpStatus; }
    QString lastErrorMessage() const { return m_lastErrorMessage; }

protected:
    RemoteStatus sendRequest(const QString &endpoint, const QJsonObject &data, QJsonObject &responseData,
                             Operation operation, const QString &method = "POST",
                             const QString &idempotencyKey = QString());

    int m_lastHttpStatus = 0;
    QString m_lastErrorMessage;

private:
    RemoteStatus processReply(QNetworkReply *reply, QJsonObject &responseData, Operation operation);
    static bool resultFromSessionResponse(const QJsonObject &json, ReadingSessionResult &result);

    QNetworkAccessManager *m_networkManager;
    QString m_serverUrl;
    QString m_authToken;
    mutable QMutex m_mutex;
    bool m_initialized;
    int m_requestTimeoutMs;
};

#endif // READINGAPICLIENT_H
