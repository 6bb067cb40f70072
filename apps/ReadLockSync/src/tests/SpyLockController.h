#ifndef SPYLOCKCONTROLLER_H
#define SPYLOCKCONTROLLER_H

#include <QStringList>

#include "core/LockController.h"

class SpyLockController : public LockController
{
public:
    void start(const QString& sessionId, const QString& displayTitle) override
    {
        Q_UNUSED(displayTitle)
        commands.append("start:" + sessionId);
    }
    void pause() override { commands.append("pause"); }
    void resume() override { commands.append("resume"); }
    void stop() override { commands.append("stop"); }

    QStringList commands;
};

#endif // SPYLOCKCONTROLLER_H
