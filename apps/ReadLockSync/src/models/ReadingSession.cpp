#include "ReadingSession.h"
#include <QCryptographicHash>
#include <QRegularExpression>
#include <QUuid>

namespace {

QJsonValue optionalInt(const std::optional<int>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

std::optional<int> readOptionalInt(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    return value.toInt();
}

QJsonValue optionalTimestamp(const QDateTime& value)
{
    return value.isValid() ? QJsonValue(ReadingSession::formatTimestamp(value))
                           : QJsonValue(QJsonValue::Null);
}

} // namespace

bool ReadingSession::hasOfflineId() const
{
    return id.startsWith(QLatin1String(OFFLINE_ID_PREFIX));
}

qint64 ReadingSession::elapsedMsAt(const QDateTime& now) const
{
    // May come out negative when the wall clock was moved behind startTime
    const QDateTime reference = hasEnded() ? endTime : now;
    qint64 elapsed = startTime.msecsTo(reference) - totalPauseMs;

    if (isPaused() && !hasEnded()) {
        elapsed -= qMax<qint64>(0, pausedAt.msecsTo(reference));
    }

    return elapsed;
}

int ReadingSession::durationSeconds() const
{
    if (!hasEnded()) {
        return 0;
    }

    const qint64 activeMs = startTime.msecsTo(endTime) - totalPauseMs;
    return static_cast<int>(qMax<qint64>(0, activeMs / 1000));
}

int ReadingSession::pagesRead() const
{
    if (!endPage) {
        return 0;
    }
    return qMax(0, *endPage - startPage);
}

QJsonObject ReadingSession::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["user_book_id"] = libraryEntryId;
    json["start_time"] = optionalTimestamp(startTime);
    json["end_time"] = optionalTimestamp(endTime);
    json["start_page"] = startPage;
    json["end_page"] = optionalInt(endPage);
    json["total_pause_ms"] = totalPauseMs;
    json["paused_at"] = optionalTimestamp(pausedAt);
    json["focus_score"] = optionalInt(focusScore);
    json["is_offline"] = isOffline;
    json["needs_sync"] = needsSync;
    json["display_title"] = displayTitle;
    return json;
}

ReadingSession ReadingSession::fromJson(const QJsonObject& json)
{
    ReadingSession session;
    session.id = json["id"].toString();
    session.libraryEntryId = json["user_book_id"].toString();
    session.startTime = parseTimestamp(json["start_time"].toString());
    session.endTime = parseTimestamp(json["end_time"].toString());
    session.startPage = json["start_page"].toInt();
    session.endPage = readOptionalInt(json, "end_page");
    session.totalPauseMs = json["total_pause_ms"].toInteger();
    session.pausedAt = parseTimestamp(json["paused_at"].toString());
    session.focusScore = readOptionalInt(json, "focus_score");
    session.isOffline = json["is_offline"].toBool();
    session.needsSync = json["needs_sync"].toBool();
    session.displayTitle = json["display_title"].toString();
    return session;
}

ReadingSession ReadingSession::fromServerJson(const QJsonObject& json)
{
    ReadingSession session;
    session.id = json.contains("id") ? json["id"].toString() : json["session_id"].toString();
    session.libraryEntryId = json["user_book_id"].toString();
    session.startTime = parseTimestamp(json.contains("start_time") ? json["start_time"].toString()
                                                                    : json["started_at"].toString());
    session.endTime = parseTimestamp(json["end_time"].toString());
    session.startPage = json["start_page"].toInt();
    session.endPage = readOptionalInt(json, "end_page");
    session.focusScore = readOptionalInt(json, "focus_score");
    session.pausedAt = parseTimestamp(json["paused_at"].toString());

    if (json.contains("total_pause_duration") && !json["total_pause_duration"].isNull()) {
        session.totalPauseMs = json["total_pause_duration"].toInteger() * 1000;
    } else if (session.hasEnded() && json.contains("duration")) {
        // History rows only carry the active duration; recover the pause total from it
        const qint64 wallMs = session.startTime.msecsTo(session.endTime);
        session.totalPauseMs = qMax<qint64>(0, wallMs - json["duration"].toInteger() * 1000);
    }

    session.isOffline = false;
    session.needsSync = false;
    return session;
}

QString ReadingSession::generateOfflineId()
{
    return QLatin1String(OFFLINE_ID_PREFIX) + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString ReadingSession::formatTimestamp(const QDateTime& timestamp)
{
    if (!timestamp.isValid()) {
        return QString();
    }
    return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime ReadingSession::parseTimestamp(const QString& value)
{
    if (value.isEmpty()) {
        return QDateTime();
    }

    QDateTime parsed = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return QDateTime();
    }

    static const QRegularExpression offsetSuffix("(Z|[+-]\\d{2}:?\\d{2})$");
    if (!offsetSuffix.match(value).hasMatch()) {
        // The reading service writes naive UTC timestamps
        parsed.setTimeSpec(Qt::UTC);
    }

    return parsed.toUTC();
}

QString PendingSyncRecord::idempotencyKeyFor(const ReadingSession& session)
{
    const QString material = QString("%1|%2|%3")
                             .arg(session.libraryEntryId,
                                  ReadingSession::formatTimestamp(session.startTime),
                                  session.id);

    return QString::fromLatin1(
        QCryptographicHash::hash(material.toUtf8(), QCryptographicHash::Sha256).toHex());
}

bool SessionHistoryFilter::matches(const ReadingSession& session) const
{
    if (!libraryEntryId.isEmpty() && session.libraryEntryId != libraryEntryId) {
        return false;
    }
    if (from.isValid() && session.startTime < from) {
        return false;
    }
    if (to.isValid() && session.startTime > to) {
        return false;
    }
    return true;
}
