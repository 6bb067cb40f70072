#include "LockController.h"
#include "logger/logger.h"

void LoggingLockController::start(const QString &sessionId, const QString &displayTitle)
{
    LOG_INFO(QString("Lock start: session %1 (\"%2\")").arg(sessionId, displayTitle));
}

void LoggingLockController::pause()
{
    LOG_INFO("Lock pause");
}

void LoggingLockController::resume()
{
    LOG_INFO("Lock resume");
}

void LoggingLockController::stop()
{
    LOG_INFO("Lock stop");
}

bool LockStatusEvent::fromJson(const QJsonObject &json, LockStatusEvent &event)
{
    Status status = statusFromString(json["status"].toString());
    if (status == Unknown) {
        return false;
    }

    event.status = status;
    event.sessionId = json["sessionId"].toString();
    event.elapsedSeconds = json["elapsedSeconds"].toInteger();
    return true;
}

LockStatusEvent::Status LockStatusEvent::statusFromString(const QString &status)
{
    const QString normalized = status.trimmed().toLower();
    if (normalized == "started") return Started;
    if (normalized == "paused") return Paused;
    if (normalized == "resumed") return Resumed;
    if (normalized == "stopped") return Stopped;
    if (normalized == "heartbeat") return Heartbeat;
    return Unknown;
}

QString LockStatusEvent::statusToString(Status status)
{
    switch (status) {
        case Started: return "started";
        case Paused: return "paused";
        case Resumed: return "resumed";
        case Stopped: return "stopped";
        case Heartbeat: return "heartbeat";
        case Unknown: break;
    }
    return "unknown";
}

LockEventChannel::LockEventChannel(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<LockStatusEvent>("LockStatusEvent");
}

void LockEventChannel::post(const LockStatusEvent &event)
{
    QMetaObject::invokeMethod(this, [this, event]() {
        emit eventReceived(event);
    }, Qt::QueuedConnection);
}

bool LockEventChannel::postJson(const QJsonObject &json)
{
    LockStatusEvent event;
    if (!LockStatusEvent::fromJson(json, event)) {
        LOG_WARNING("Ignoring lock event with unknown status: " + json["status"].toString());
        return false;
    }

    post(event);
    return true;
}
