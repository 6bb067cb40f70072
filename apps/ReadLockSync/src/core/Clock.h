#ifndef CLOCK_H
#define CLOCK_H

#include <QDateTime>

// Wall-clock source for session accounting; replaced in tests
class Clock
{
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override { return QDateTime::currentDateTimeUtc(); }
};

#endif // CLOCK_H
