#ifndef REWARDESTIMATOR_H
#define REWARDESTIMATOR_H

#include "../models/ReadingSession.h"
#include "../models/SessionResult.h"

struct RewardRates
{
    int coinsPerMinute = 1;
    int expPerPage = 5;
    int focusBonusThreshold = 80;   // focus score at or above which the bonus applies
    int focusBonusPercent = 50;
};

/**
 * @brief Local approximation of the rewards the reading service grants
 *
 * Depends only on the session's own fields, so the same session always gets
 * the same estimate. Used when the service cannot be reached at end time.
 */
class RewardEstimator
{
public:
    explicit RewardEstimator(const RewardRates& rates = RewardRates());

    void setRates(const RewardRates& rates) { m_rates = rates; }
    const RewardRates& rates() const { return m_rates; }

    SessionRewards estimateRewards(const ReadingSession& session) const;

    // Result flagged isOffline, streakDays = 1 until the service corrects it
    ReadingSessionResult estimateResult(const ReadingSession& session) const;

private:
    RewardRates m_rates;
};

#endif // REWARDESTIMATOR_H
