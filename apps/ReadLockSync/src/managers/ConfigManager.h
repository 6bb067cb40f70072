#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QString>
#include <QSettings>
#include <QMutex>

#include "../core/RewardEstimator.h"
#include "dbservice/dbconfig.h"

class ConfigManager : public QObject
{
    Q_OBJECT
public:
    explicit ConfigManager(QObject *parent = nullptr);
    ~ConfigManager();

    // Directory holding readlock.conf; must be set before initialize()
    void setConfigDirectory(const QString &directory) { m_configDirectory = directory; }

    bool initialize();

    // Getters
    QString serverUrl() const;
    QString authToken() const;
    int requestTimeoutMs() const;
    int connectionCheckInterval() const;
    QString storePath() const;
    int historyLimit() const;
    int coinsPerMinute() const;
    int expPerPage() const;
    int focusBonusThreshold() const;
    int focusBonusPercent() const;
    int heartbeatDriftToleranceSec() const;
    QString logLevel() const;
    QString logFilePath() const;
    int logMaxSizeKb() const;

    RewardRates rewardRates() const;
    DbConfig dbConfig() const;
    QString configFilePath() const;

    // Setters
    void setServerUrl(const QString &url);
    void setAuthToken(const QString &token);
    void setRequestTimeoutMs(int milliseconds);
    void setConnectionCheckInterval(int milliseconds);
    void setStorePath(const QString &path);
    void setHistoryLimit(int limit);
    void setCoinsPerMinute(int coins);
    void setExpPerPage(int exp);
    void setFocusBonusThreshold(int threshold);
    void setFocusBonusPercent(int percent);
    void setHeartbeatDriftToleranceSec(int seconds);
    void setLogLevel(const QString &level);
    void setLogFilePath(const QString &path);
    void setLogMaxSizeKb(int kilobytes);

    // Configuration operations
    bool loadLocalConfig();
    bool saveLocalConfig();

signals:
    void configChanged();

private:
    void loadDefaults();
    void validateLoaded();
    void applyLogSettings();
    bool configFileExists() const;

    QSettings* m_settings;
    mutable QMutex m_mutex;
    QString m_configDirectory;

    QString m_serverUrl;
    QString m_authToken;
    int m_requestTimeoutMs;
    int m_connectionCheckInterval;
    QString m_storePath;
    int m_historyLimit;
    int m_coinsPerMinute;
    int m_expPerPage;
    int m_focusBonusThreshold;
    int m_focusBonusPercent;
    int m_heartbeatDriftToleranceSec;
    QString m_logLevel;
    QString m_logFilePath;
    int m_logMaxSizeKb;
    bool m_initialized;
};

#endif // CONFIGMANAGER_H
