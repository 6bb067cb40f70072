#ifndef SESSIONRESULT_H
#define SESSIONRESULT_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QMetaType>
#include <optional>

struct SessionRewards
{
    int coinsEarned = 0;
    int expEarned = 0;
    int bonusCoins = 0;
    int bonusExp = 0;
    bool streakBonus = false;
    bool dailyGoalBonus = false;

    QJsonObject toJson() const;
    static SessionRewards fromJson(const QJsonObject& json);

    bool operator==(const SessionRewards& other) const;
    bool operator!=(const SessionRewards& other) const { return !(*this == other); }
};

/**
 * @brief Outcome of a finished session as reported by the reading service,
 * or estimated locally when isOffline is set
 */
struct ReadingSessionResult
{
    QString sessionId;
    int durationSeconds = 0;
    int pagesRead = 0;
    int streakDays = 0;
    SessionRewards rewards;
    bool isOffline = false;

    bool levelUp = false;
    std::optional<int> newLevel;
    QStringList badgesEarned;

    QJsonObject toJson() const;
    static ReadingSessionResult fromJson(const QJsonObject& json);

    // Parses a SessionResultResponse body; false when required fields are missing
    static bool fromServerJson(const QJsonObject& json, ReadingSessionResult& result);
};

Q_DECLARE_METATYPE(ReadingSessionResult)

#endif // SESSIONRESULT_H
