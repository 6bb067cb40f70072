// ReadingSession.h
#ifndef READINGSESSION_H
#define READINGSESSION_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <optional>

/**
 * @brief One continuous-or-paused attempt at reading one library entry
 *
 * All timestamps are UTC. The pause total is kept in milliseconds so that
 * repeated short pauses do not lose time to rounding; it is converted to whole
 * seconds only at the wire edge.
 */
struct ReadingSession
{
    // Locally generated ids carry this prefix; the server never issues one starting with it
    static constexpr const char* OFFLINE_ID_PREFIX = "offline_";

    QString id;
    QString libraryEntryId;
    QDateTime startTime;
    QDateTime endTime;              // invalid while the session is running
    int startPage = 0;
    std::optional<int> endPage;
    qint64 totalPauseMs = 0;
    QDateTime pausedAt;             // invalid when not paused
    std::optional<int> focusScore;
    bool isOffline = false;
    bool needsSync = false;
    QString displayTitle;

    bool isValid() const { return !id.isEmpty() && startTime.isValid(); }
    bool hasEnded() const { return endTime.isValid(); }
    bool isPaused() const { return pausedAt.isValid(); }
    bool hasOfflineId() const;

    // Active reading time as of `now`: wall time minus closed pauses minus the open pause
    qint64 elapsedMsAt(const QDateTime& now) const;

    // (endTime - startTime) - totalPauseMs in whole seconds, never negative. 0 while running.
    int durationSeconds() const;

    // endPage - startPage, never negative. 0 while running.
    int pagesRead() const;

    // Storage representation, lossless
    QJsonObject toJson() const;
    static ReadingSession fromJson(const QJsonObject& json);

    // Reading service representation (GET /reading/sessions, /reading/sessions/active)
    static ReadingSession fromServerJson(const QJsonObject& json);

    static QString generateOfflineId();

    // ISO-8601 UTC with milliseconds, e.g. 2024-05-01T08:30:00.000Z
    static QString formatTimestamp(const QDateTime& timestamp);
    // Accepts ISO-8601 with or without offset; a missing offset means UTC
    static QDateTime parseTimestamp(const QString& value);
};

/**
 * @brief Snapshot of a session waiting to be reconciled with the reading service
 */
struct PendingSyncRecord
{
    qint64 sequence = 0;            // FIFO position, assigned by the store
    ReadingSession session;
    QString idempotencyKey;
    QDateTime enqueuedAt;
    int attempts = 0;

    // SHA-256 hex of "libraryEntryId|startTime(ISO-8601 UTC, ms)|id"
    static QString idempotencyKeyFor(const ReadingSession& session);
};

/**
 * @brief Query for session history, shared by the remote client and the local cache
 */
struct SessionHistoryFilter
{
    QString libraryEntryId;         // empty matches every entry
    QDateTime from;                 // inclusive; invalid means unbounded
    QDateTime to;                   // inclusive; invalid means unbounded
    int page = 1;
    int pageSize = 20;

    bool matches(const ReadingSession& session) const;
};

Q_DECLARE_METATYPE(ReadingSession)

#endif // READINGSESSION_H
