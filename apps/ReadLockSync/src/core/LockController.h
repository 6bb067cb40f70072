#ifndef LOCKCONTROLLER_H
#define LOCKCONTROLLER_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QMetaType>

/**
 * @brief Commands to the phone-lock service that blocks distractions while reading
 */
class LockController
{
public:
    virtual ~LockController() = default;

    virtual void start(const QString &sessionId, const QString &displayTitle) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;
};

// Used where no lock service exists (desktop, command line): commands are only logged
class LoggingLockController : public LockController
{
public:
    void start(const QString &sessionId, const QString &displayTitle) override;
    void pause() override;
    void resume() override;
    void stop() override;
};

struct LockStatusEvent
{
    enum Status {
        Started,
        Paused,
        Resumed,
        Stopped,
        Heartbeat,
        Unknown
    };

    Status status = Unknown;
    QString sessionId;
    qint64 elapsedSeconds = 0;

    // {status: "started"|"paused"|"resumed"|"stopped"|"heartbeat", sessionId, elapsedSeconds}
    static bool fromJson(const QJsonObject &json, LockStatusEvent &event);
    static Status statusFromString(const QString &status);
    static QString statusToString(Status status);
};

Q_DECLARE_METATYPE(LockStatusEvent)

/**
 * @brief Inbound status events from the lock service
 *
 * post() may be called from any thread; eventReceived is always emitted later
 * from this object's event loop, never from inside post().
 */
class LockEventChannel : public QObject
{
    Q_OBJECT
public:
    explicit LockEventChannel(QObject *parent = nullptr);

    void post(const LockStatusEvent &event);
    bool postJson(const QJsonObject &json);

signals:
    void eventReceived(const LockStatusEvent &event);
};

#endif // LOCKCONTROLLER_H
