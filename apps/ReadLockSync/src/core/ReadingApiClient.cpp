#include "ReadingApiClient.h"
#include <QNetworkRequest>
#include <QJsonDocument>
#include <QJsonArray>
#include <QEventLoop>
#include <QTimer>
#include <QUrlQuery>
#include "logger/logger.h"

ReadingApiClient::ReadingApiClient(QObject *parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_initialized(false)
    , m_requestTimeoutMs(10000)
{
}

ReadingApiClient::~ReadingApiClient()
{
}

bool ReadingApiClient::initialize(const QString &serverUrl, int requestTimeoutMs)
{
    LOG_INFO("Initializing ReadingApiClient with server URL: " + serverUrl);

    if (serverUrl.isEmpty()) {
        LOG_ERROR("Server URL is empty");
        return false;
    }

    m_serverUrl = serverUrl;

    // Ensure server URL ends with a slash
    if (!m_serverUrl.endsWith('/')) {
        m_serverUrl += '/';
    }

    m_requestTimeoutMs = qMax(1, requestTimeoutMs);
    m_initialized = true;
    return true;
}

QString ReadingApiClient::authToken() const
{
    QMutexLocker locker(&m_mutex);
    return m_authToken;
}

void ReadingApiClient::setAuthToken(const QString &token)
{
    QMutexLocker locker(&m_mutex);
    m_authToken = token;
}

ReadingApiClient::RemoteStatus ReadingApiClient::createRemote(const ReadingSession &session, RemoteSessionHandle &handle)
{
    LOG_INFO(QString("Creating remote session for library entry %1").arg(session.libraryEntryId));

    QJsonObject data;
    data["user_book_id"] = session.libraryEntryId;
    data["start_page"] = session.startPage;

    QJsonObject responseData;
    RemoteStatus status = sendRequest("reading/sessions", data, responseData, Operation::Create);
    if (status != Ok) {
        return status;
    }

    handle.sessionId = responseData.contains("session_id") ? responseData["session_id"].toString()
                                                           : responseData["id"].toString();
    handle.startedAt = ReadingSession::parseTimestamp(
        responseData.contains("started_at") ? responseData["started_at"].toString()
                                            : responseData["start_time"].toString());

    if (handle.sessionId.isEmpty()) {
        m_lastErrorMessage = "Create response carries no session id";
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    LOG_INFO(QString("Remote session created: %1").arg(handle.sessionId));
    return Ok;
}

ReadingApiClient::RemoteStatus ReadingApiClient::finalizeRemote(const QString &sessionId, int endPage,
                                                                std::optional<int> focusScore,
                                                                const QString &idempotencyKey,
                                                                ReadingSessionResult &result)
{
    LOG_INFO(QString("Finalizing remote session: %1").arg(sessionId));

    QJsonObject data;
    data["end_page"] = endPage;
    if (focusScore) {
        data["focus_score"] = *focusScore;
    }
    data["idempotency_key"] = idempotencyKey;

    QJsonObject responseData;
    RemoteStatus status = sendRequest("reading/sessions/" + sessionId + "/end", data, responseData,
                                      Operation::Finalize, "POST", idempotencyKey);
    if (status != Ok) {
        return status;
    }

    if (!ReadingSessionResult::fromServerJson(responseData, result)) {
        m_lastErrorMessage = "End response is not a session result";
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    return Ok;
}

ReadingApiClient::RemoteStatus ReadingApiClient::replayRemote(const PendingSyncRecord &record, ReadingSessionResult &result)
{
    const ReadingSession &session = record.session;

    if (!session.hasEnded() || !session.endPage) {
        m_lastErrorMessage = QString("Session %1 has not ended, nothing to replay").arg(session.id);
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    LOG_INFO(QString("Replaying session %1 (attempt %2)").arg(session.id).arg(record.attempts + 1));

    QJsonObject data;
    data["idempotency_key"] = record.idempotencyKey;
    data["user_book_id"] = session.libraryEntryId;
    data["start_time"] = ReadingSession::formatTimestamp(session.startTime);
    data["end_time"] = ReadingSession::formatTimestamp(session.endTime);
    data["start_page"] = session.startPage;
    data["end_page"] = *session.endPage;
    if (session.focusScore) {
        data["focus_score"] = *session.focusScore;
    }
    data["total_pause_duration"] = session.totalPauseMs / 1000;

    QJsonObject responseData;
    RemoteStatus status = sendRequest("reading/sessions/sync", data, responseData,
                                      Operation::Replay, "POST", record.idempotencyKey);
    if (status != Ok) {
        return status;
    }

    if (ReadingSessionResult::fromServerJson(responseData, result)) {
        return Ok;
    }

    // The sync endpoint may answer with the stored session instead of a result
    if (resultFromSessionResponse(responseData, result)) {
        return Ok;
    }

    m_lastErrorMessage = "Sync response is neither a session result nor a session";
    LOG_ERROR(m_lastErrorMessage);
    return Terminal;
}

ReadingApiClient::RemoteStatus ReadingApiClient::pauseRemote(const QString &sessionId)
{
    LOG_DEBUG(QString("Pausing remote session: %1").arg(sessionId));

    QJsonObject responseData;
    return sendRequest("reading/sessions/" + sessionId + "/pause", QJsonObject(), responseData, Operation::Other);
}

ReadingApiClient::RemoteStatus ReadingApiClient::resumeRemote(const QString &sessionId)
{
    LOG_DEBUG(QString("Resuming remote session: %1").arg(sessionId));

    QJsonObject responseData;
    return sendRequest("reading/sessions/" + sessionId + "/resume", QJsonObject(), responseData, Operation::Other);
}

ReadingApiClient::RemoteStatus ReadingApiClient::fetchActive(std::optional<ReadingSession> &session,
                                                             bool *pausedWithoutTimestamp)
{
    session.reset();
    if (pausedWithoutTimestamp) {
        *pausedWithoutTimestamp = false;
    }

    QJsonObject responseData;
    RemoteStatus status = sendRequest("reading/sessions/active", QJsonObject(), responseData,
                                      Operation::Other, "GET");
    if (status != Ok) {
        return status;
    }

    if (responseData.isEmpty()) {
        LOG_DEBUG("Reading service reports no active session");
        return Ok;
    }

    ReadingSession remote = ReadingSession::fromServerJson(responseData);
    if (!remote.isValid()) {
        m_lastErrorMessage = "Active session response is missing id or start time";
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    if (responseData["is_paused"].toBool() && !remote.isPaused() && pausedWithoutTimestamp) {
        *pausedWithoutTimestamp = true;
    }

    session = remote;
    return Ok;
}

ReadingApiClient::RemoteStatus ReadingApiClient::fetchHistory(const SessionHistoryFilter &filter, QList<ReadingSession> &sessions)
{
    sessions.clear();

    QUrlQuery query;
    if (!filter.libraryEntryId.isEmpty()) {
        query.addQueryItem("user_book_id", filter.libraryEntryId);
    }
    if (filter.from.isValid()) {
        query.addQueryItem("start_date", ReadingSession::formatTimestamp(filter.from));
    }
    if (filter.to.isValid()) {
        query.addQueryItem("end_date", ReadingSession::formatTimestamp(filter.to));
    }
    query.addQueryItem("page", QString::number(qMax(1, filter.page)));
    query.addQueryItem("page_size", QString::number(qMax(1, filter.pageSize)));

    QJsonObject responseData;
    RemoteStatus status = sendRequest("reading/sessions?" + query.toString(QUrl::FullyEncoded),
                                      QJsonObject(), responseData, Operation::Other, "GET");
    if (status != Ok) {
        return status;
    }

    if (!responseData["items"].isArray()) {
        m_lastErrorMessage = "History response has no items array";
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    const QJsonArray items = responseData["items"].toArray();
    for (const QJsonValue &item : items) {
        ReadingSession session = ReadingSession::fromServerJson(item.toObject());
        if (session.isValid()) {
            sessions.append(session);
        } else {
            LOG_WARNING("Skipping malformed history item");
        }
    }

    LOG_DEBUG(QString("Fetched %1 history sessions").arg(sessions.size()));
    return Ok;
}

bool ReadingApiClient::ping()
{
    QJsonObject responseData;
    return sendRequest("health", QJsonObject(), responseData, Operation::Other, "GET") == Ok;
}

ReadingApiClient::RemoteStatus ReadingApiClient::classifyHttpStatus(int httpStatus, Operation operation)
{
    if (httpStatus >= 200 && httpStatus < 300) {
        return Ok;
    }

    if (httpStatus == 409) {
        switch (operation) {
            case Operation::Create:
                return Conflict;
            case Operation::Finalize:
            case Operation::Replay:
                return Duplicate;
            case Operation::Other:
                return Terminal;
        }
    }

    if (httpStatus == 404) {
        return NotFound;
    }

    // 408 is the server timing the request out
    if (httpStatus == 408) {
        return Retryable;
    }

    if (httpStatus >= 400 && httpStatus < 500) {
        return Terminal;
    }

    // 5xx and anything unexpected
    return Retryable;
}

QString ReadingApiClient::statusToString(RemoteStatus status)
{
    switch (status) {
        case Ok: return "Ok";
        case Duplicate: return "Duplicate";
        case Conflict: return "Conflict";
        case NotFound: return "NotFound";
        case Retryable: return "Retryable";
        case Terminal: return "Terminal";
    }
    return "Unknown";
}

ReadingApiClient::RemoteStatus ReadingApiClient::sendRequest(const QString &endpoint, const QJsonObject &data,
                                                             QJsonObject &responseData, Operation operation,
                                                             const QString &method, const QString &idempotencyKey)
{
    m_lastHttpStatus = 0;
    m_lastErrorMessage.clear();

    if (!m_initialized) {
        m_lastErrorMessage = "ReadingApiClient not initialized";
        LOG_ERROR(m_lastErrorMessage);
        return Retryable;
    }

    // Construct full URL
    QString url = m_serverUrl + endpoint;

    // Create request
    QNetworkRequest request;
    request.setUrl(QUrl(url));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QString token = authToken();
    if (!token.isEmpty()) {
        request.setRawHeader("Authorization", QString("Bearer %1").arg(token).toUtf8());
    }
    if (!idempotencyKey.isEmpty()) {
        request.setRawHeader("Idempotency-Key", idempotencyKey.toUtf8());
    }

    // Create a QEventLoop to make the request synchronous
    QEventLoop loop;
    QNetworkReply *reply = nullptr;

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);

    LOG_DEBUG(QString("Sending %1 request to: %2").arg(method, url));

    if (method == "GET") {
        reply = m_networkManager->get(request);
    } else if (method == "POST") {
        QByteArray jsonData = QJsonDocument(data).toJson(QJsonDocument::Compact);
        LOG_DEBUG(QString("POST data: %1").arg(QString::fromUtf8(jsonData)));
        reply = m_networkManager->post(request, jsonData);
    } else {
        m_lastErrorMessage = "Unsupported HTTP method: " + method;
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    timeoutTimer.start(m_requestTimeoutMs);

    // Blocks until the request is finished or the timeout fires
    loop.exec();

    if (timeoutTimer.isActive()) {
        timeoutTimer.stop();
    } else {
        reply->abort();
        reply->deleteLater();
        m_lastErrorMessage = QString("Request timeout for %1 %2").arg(method, url);
        LOG_WARNING(m_lastErrorMessage);
        return Retryable;
    }

    RemoteStatus status = processReply(reply, responseData, operation);
    reply->deleteLater();

    if (status != Ok) {
        LOG_WARNING(QString("%1 %2 -> %3 (HTTP %4)")
                   .arg(method, url, statusToString(status))
                   .arg(m_lastHttpStatus));
    }

    return status;
}

ReadingApiClient::RemoteStatus ReadingApiClient::processReply(QNetworkReply *reply, QJsonObject &responseData,
                                                              Operation operation)
{
    if (!reply) {
        m_lastErrorMessage = "Network reply is null";
        LOG_ERROR(m_lastErrorMessage);
        return Retryable;
    }

    m_lastHttpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    QByteArray responseBytes = reply->readAll();

    QNetworkReply::NetworkError error = reply->error();
    if (error != QNetworkReply::NoError) {
        m_lastErrorMessage = reply->errorString();

        if (m_lastHttpStatus == 0) {
            // No HTTP response at all: connection refused, DNS failure, TLS error...
            LOG_WARNING(QString("Network error (%1): %2").arg(error).arg(m_lastErrorMessage));
            return Retryable;
        }

        if (!responseBytes.isEmpty()) {
            LOG_DEBUG(QString("Error response: %1").arg(QString::fromUtf8(responseBytes)));

            QJsonDocument errorDoc = QJsonDocument::fromJson(responseBytes);
            if (errorDoc.isObject()) {
                responseData = errorDoc.object();

                // The service reports errors as {"detail": "..."}
                if (responseData["detail"].isString()) {
                    m_lastErrorMessage = responseData["detail"].toString();
                } else if (responseData["message"].isString()) {
                    m_lastErrorMessage = responseData["message"].toString();
                }
            }
        }

        return classifyHttpStatus(m_lastHttpStatus, operation);
    }

    if (responseBytes.size() <= 1024) {
        LOG_DEBUG(QString("Response: %1").arg(QString::fromUtf8(responseBytes)));
    } else {
        LOG_DEBUG(QString("Response (truncated): %1...").arg(QString::fromUtf8(responseBytes.left(1024))));
    }

    // Some endpoints return an empty body, or a bare null, for success
    QByteArray trimmed = responseBytes.trimmed();
    if (trimmed.isEmpty() || trimmed == "null") {
        responseData = QJsonObject();
        return Ok;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(responseBytes, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        m_lastErrorMessage = QString("JSON parse error: %1 at offset %2")
                             .arg(parseError.errorString())
                             .arg(parseError.offset);
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    if (!doc.isObject()) {
        m_lastErrorMessage = "Response is not a JSON object";
        LOG_ERROR(m_lastErrorMessage);
        return Terminal;
    }

    responseData = doc.object();
    return Ok;
}

bool ReadingApiClient::resultFromSessionResponse(const QJsonObject &json, ReadingSessionResult &result)
{
    ReadingSession stored = ReadingSession::fromServerJson(json);
    if (stored.id.isEmpty() || !json.contains("duration")) {
        return false;
    }

    result = ReadingSessionResult();
    result.sessionId = stored.id;
    result.durationSeconds = json["duration"].toInt();
    result.pagesRead = stored.pagesRead();
    result.isOffline = false;
    return true;
}
