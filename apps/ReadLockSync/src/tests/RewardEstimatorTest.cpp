#include <QtTest/QtTest>

#include "core/RewardEstimator.h"

class RewardEstimatorTest : public QObject
{
    Q_OBJECT

private:
    static ReadingSession session(int activeSeconds, int pages, std::optional<int> focus = std::nullopt)
    {
        ReadingSession s;
        s.id = "offline_1";
        s.libraryEntryId = "entry-1";
        s.startTime = QDateTime(QDate(2024, 5, 1), QTime(8, 0), Qt::UTC);
        s.endTime = s.startTime.addSecs(activeSeconds);
        s.startPage = 10;
        s.endPage = 10 + pages;
        s.focusScore = focus;
        return s;
    }

private slots:
    void testDefaultRates() {
        RewardEstimator estimator;

        // 300s and 10 pages: 5 minutes at 1 coin, 10 pages at 5 exp
        SessionRewards rewards = estimator.estimateRewards(session(300, 10));
        QCOMPARE(rewards.coinsEarned, 5);
        QCOMPARE(rewards.expEarned, 50);
        QCOMPARE(rewards.bonusCoins, 0);
        QCOMPARE(rewards.bonusExp, 0);
    }

    void testPartialMinutesAreDropped() {
        RewardEstimator estimator;
        QCOMPARE(estimator.estimateRewards(session(59, 0)).coinsEarned, 0);
        QCOMPARE(estimator.estimateRewards(session(119, 0)).coinsEarned, 1);
    }

    void testFocusBonus() {
        RewardEstimator estimator;

        SessionRewards below = estimator.estimateRewards(session(600, 4, 79));
        QCOMPARE(below.bonusCoins, 0);

        SessionRewards at = estimator.estimateRewards(session(600, 4, 80));
        QCOMPARE(at.coinsEarned, 10);
        QCOMPARE(at.bonusCoins, 5);
        QCOMPARE(at.bonusExp, 10);
    }

    void testCustomRates() {
        RewardRates rates;
        rates.coinsPerMinute = 3;
        rates.expPerPage = 0;
        rates.focusBonusThreshold = 50;
        rates.focusBonusPercent = 100;
        RewardEstimator estimator(rates);

        SessionRewards rewards = estimator.estimateRewards(session(120, 8, 50));
        QCOMPARE(rewards.coinsEarned, 6);
        QCOMPARE(rewards.expEarned, 0);
        QCOMPARE(rewards.bonusCoins, 6);
    }

    void testSameSessionSameEstimate() {
        RewardEstimator estimator;
        ReadingSession s = session(451, 7, 90);
        QVERIFY(estimator.estimateRewards(s) == estimator.estimateRewards(s));
    }

    void testEstimatedResult() {
        RewardEstimator estimator;
        ReadingSessionResult result = estimator.estimateResult(session(300, 10));
        QCOMPARE(result.sessionId, QString("offline_1"));
        QCOMPARE(result.durationSeconds, 300);
        QCOMPARE(result.pagesRead, 10);
        QCOMPARE(result.streakDays, 1);
        QVERIFY(result.isOffline);
    }
};

QTEST_MAIN(RewardEstimatorTest)
#include "RewardEstimatorTest.moc"
