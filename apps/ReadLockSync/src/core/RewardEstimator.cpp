#include "RewardEstimator.h"

RewardEstimator::RewardEstimator(const RewardRates& rates)
    : m_rates(rates)
{
}

SessionRewards RewardEstimator::estimateRewards(const ReadingSession& session) const
{
    SessionRewards rewards;

    const int minutes = session.durationSeconds() / 60;
    rewards.coinsEarned = minutes * qMax(0, m_rates.coinsPerMinute);
    rewards.expEarned = session.pagesRead() * qMax(0, m_rates.expPerPage);

    if (session.focusScore && *session.focusScore >= m_rates.focusBonusThreshold) {
        const int percent = qMax(0, m_rates.focusBonusPercent);
        rewards.bonusCoins = rewards.coinsEarned * percent / 100;
        rewards.bonusExp = rewards.expEarned * percent / 100;
    }

    return rewards;
}

ReadingSessionResult RewardEstimator::estimateResult(const ReadingSession& session) const
{
    ReadingSessionResult result;
    result.sessionId = session.id;
    result.durationSeconds = session.durationSeconds();
    result.pagesRead = session.pagesRead();
    result.streakDays = 1;
    result.rewards = estimateRewards(session);
    result.isOffline = true;
    return result;
}
