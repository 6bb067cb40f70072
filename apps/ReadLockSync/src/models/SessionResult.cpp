#include "SessionResult.h"
#include <QJsonArray>

QJsonObject SessionRewards::toJson() const
{
    QJsonObject json;
    json["coins_earned"] = coinsEarned;
    json["exp_earned"] = expEarned;
    json["bonus_coins"] = bonusCoins;
    json["bonus_exp"] = bonusExp;
    json["streak_bonus"] = streakBonus;
    json["daily_goal_bonus"] = dailyGoalBonus;
    return json;
}

SessionRewards SessionRewards::fromJson(const QJsonObject& json)
{
    SessionRewards rewards;
    rewards.coinsEarned = json["coins_earned"].toInt();
    rewards.expEarned = json["exp_earned"].toInt();
    rewards.bonusCoins = json["bonus_coins"].toInt();
    rewards.bonusExp = json["bonus_exp"].toInt();
    rewards.streakBonus = json["streak_bonus"].toBool();
    rewards.dailyGoalBonus = json["daily_goal_bonus"].toBool();
    return rewards;
}

bool SessionRewards::operator==(const SessionRewards& other) const
{
    return coinsEarned == other.coinsEarned
        && expEarned == other.expEarned
        && bonusCoins == other.bonusCoins
        && bonusExp == other.bonusExp
        && streakBonus == other.streakBonus
        && dailyGoalBonus == other.dailyGoalBonus;
}

QJsonObject ReadingSessionResult::toJson() const
{
    QJsonObject json;
    json["session_id"] = sessionId;
    json["duration"] = durationSeconds;
    json["pages_read"] = pagesRead;
    json["streak_days"] = streakDays;
    json["rewards"] = rewards.toJson();
    json["is_offline"] = isOffline;
    json["level_up"] = levelUp;
    json["new_level"] = newLevel ? QJsonValue(*newLevel) : QJsonValue(QJsonValue::Null);
    json["badges_earned"] = QJsonArray::fromStringList(badgesEarned);
    return json;
}

ReadingSessionResult ReadingSessionResult::fromJson(const QJsonObject& json)
{
    ReadingSessionResult result;
    result.sessionId = json["session_id"].toString();
    result.durationSeconds = json["duration"].toInt();
    result.pagesRead = json["pages_read"].toInt();
    result.streakDays = json["streak_days"].toInt();
    result.rewards = SessionRewards::fromJson(json["rewards"].toObject());
    result.isOffline = json["is_offline"].toBool();
    result.levelUp = json["level_up"].toBool();
    if (json.contains("new_level") && !json["new_level"].isNull()) {
        result.newLevel = json["new_level"].toInt();
    }
    for (const QJsonValue& badge : json["badges_earned"].toArray()) {
        result.badgesEarned.append(badge.toString());
    }
    return result;
}

bool ReadingSessionResult::fromServerJson(const QJsonObject& json, ReadingSessionResult& result)
{
    if (!json.contains("session_id") || !json.contains("duration") || !json["rewards"].isObject()) {
        return false;
    }

    result = fromJson(json);
    result.isOffline = false;
    return true;
}
