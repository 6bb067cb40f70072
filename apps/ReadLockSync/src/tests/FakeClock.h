#ifndef FAKECLOCK_H
#define FAKECLOCK_H

#include "core/Clock.h"

class FakeClock : public Clock
{
public:
    explicit FakeClock(const QDateTime& start = QDateTime(QDate(2024, 5, 1), QTime(8, 0), Qt::UTC))
        : m_now(start)
    {
    }

    QDateTime now() const override { return m_now; }

    void advanceSeconds(qint64 seconds) { m_now = m_now.addSecs(seconds); }
    void advanceMs(qint64 ms) { m_now = m_now.addMSecs(ms); }
    void set(const QDateTime& now) { m_now = now; }

private:
    QDateTime m_now;
};

#endif // FAKECLOCK_H
