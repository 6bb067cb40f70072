#include "ConfigManager.h"
#include "logger/logger.h"
#include <QDir>
#include <QStandardPaths>
#include <QFileInfo>
#include <QFile>

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
    , m_settings(nullptr)
    , m_initialized(false)
{
    // Load defaults
    loadDefaults();
}

ConfigManager::~ConfigManager()
{
    delete m_settings;
}

bool ConfigManager::initialize()
{
    if (m_initialized) {
        LOG_WARNING("ConfigManager already initialized");
        return true;
    }

    LOG_INFO("Initializing ConfigManager");

    QString configPath = configFilePath();
    LOG_INFO("Config file path: " + configPath);

    // Ensure the directory exists
    QFileInfo fileInfo(configPath);
    QDir dir = fileInfo.dir();
    if (!dir.exists()) {
        LOG_INFO("Creating config directory: " + dir.path());
        if (!dir.mkpath(".")) {
            LOG_ERROR("Failed to create config directory");
            return false;
        }
    }

    m_settings = new QSettings(configPath, QSettings::IniFormat);

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Error initializing QSettings: " + QString::number(m_settings->status()));
        return false;
    }

    m_initialized = true;
    return true;
}

void ConfigManager::loadDefaults()
{
    m_serverUrl = "http://localhost:8000/api/v1";
    m_authToken = "";
    m_requestTimeoutMs = 10000;
    m_connectionCheckInterval = 30000; // 30 seconds
    m_storePath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                  + "/readlock_sessions.db";
    m_historyLimit = 100;
    m_coinsPerMinute = 1;
    m_expPerPage = 5;
    m_focusBonusThreshold = 80;
    m_focusBonusPercent = 50;
    m_heartbeatDriftToleranceSec = 5;
    m_logLevel = "info";
    m_logFilePath = "";
    m_logMaxSizeKb = 1024;
}

QString ConfigManager::configFilePath() const
{
    QString configDir = m_configDirectory;
    if (configDir.isEmpty()) {
        configDir = qEnvironmentVariable("READLOCK_CONFIG_DIR");
    }
    if (configDir.isEmpty()) {
        configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    }

    return QDir(configDir).filePath("readlock.conf");
}

bool ConfigManager::configFileExists() const
{
    if (!m_settings) {
        LOG_ERROR("Settings object not initialized");
        return false;
    }

    QFileInfo info(m_settings->fileName());
    return info.exists() && info.size() > 0;
}

bool ConfigManager::loadLocalConfig()
{
    LOG_INFO("Loading local configuration");

    if (!m_initialized) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    if (!configFileExists()) {
        LOG_INFO("Configuration file not found, writing defaults");
        if (!saveLocalConfig()) {
            return false;
        }
        applyLogSettings();
        return true;
    }

    LOG_INFO("Configuration file found: " + m_settings->fileName());
    LOG_DEBUG("Config contains " + QString::number(m_settings->allKeys().size()) + " keys");

    {
        QMutexLocker locker(&m_mutex);

        m_serverUrl = m_settings->value("ServerUrl", m_serverUrl).toString();
        m_authToken = m_settings->value("AuthToken", m_authToken).toString();
        m_requestTimeoutMs = m_settings->value("RequestTimeoutMs", m_requestTimeoutMs).toInt();
        m_connectionCheckInterval = m_settings->value("ConnectionCheckInterval", m_connectionCheckInterval).toInt();
        m_storePath = m_settings->value("StorePath", m_storePath).toString();
        m_historyLimit = m_settings->value("HistoryLimit", m_historyLimit).toInt();
        m_coinsPerMinute = m_settings->value("CoinsPerMinute", m_coinsPerMinute).toInt();
        m_expPerPage = m_settings->value("ExpPerPage", m_expPerPage).toInt();
        m_focusBonusThreshold = m_settings->value("FocusBonusThreshold", m_focusBonusThreshold).toInt();
        m_focusBonusPercent = m_settings->value("FocusBonusPercent", m_focusBonusPercent).toInt();
        m_heartbeatDriftToleranceSec = m_settings->value("HeartbeatDriftToleranceSec",
                                                         m_heartbeatDriftToleranceSec).toInt();
        m_logLevel = m_settings->value("LogLevel", m_logLevel).toString();
        m_logFilePath = m_settings->value("LogFilePath", m_logFilePath).toString();
        m_logMaxSizeKb = m_settings->value("LogMaxSizeKb", m_logMaxSizeKb).toInt();

        validateLoaded();
    }

    applyLogSettings();

    LOG_INFO("Local configuration loaded successfully");
    return true;
}

// Caller must hold m_mutex
void ConfigManager::validateLoaded()
{
    if (m_serverUrl.trimmed().isEmpty()) {
        LOG_WARNING("Empty ServerUrl corrected to http://localhost:8000/api/v1");
        m_serverUrl = "http://localhost:8000/api/v1";
    }

    if (m_requestTimeoutMs < 1000) {
        LOG_WARNING("Invalid RequestTimeoutMs corrected from " + QString::number(m_requestTimeoutMs) + " to 1000");
        m_requestTimeoutMs = 1000;
    }

    if (m_connectionCheckInterval < 0) {
        LOG_WARNING("Invalid ConnectionCheckInterval corrected from "
                    + QString::number(m_connectionCheckInterval) + " to 0");
        m_connectionCheckInterval = 0; // 0 disables periodic checks
    } else if (m_connectionCheckInterval > 0 && m_connectionCheckInterval < 1000) {
        LOG_WARNING("Invalid ConnectionCheckInterval corrected from "
                    + QString::number(m_connectionCheckInterval) + " to 1000");
        m_connectionCheckInterval = 1000;
    }

    if (m_historyLimit < 1) {
        LOG_WARNING("Invalid HistoryLimit corrected from " + QString::number(m_historyLimit) + " to 1");
        m_historyLimit = 1;
    }

    if (m_coinsPerMinute < 0) {
        LOG_WARNING("Negative CoinsPerMinute corrected to 0");
        m_coinsPerMinute = 0;
    }

    if (m_expPerPage < 0) {
        LOG_WARNING("Negative ExpPerPage corrected to 0");
        m_expPerPage = 0;
    }

    if (m_focusBonusThreshold < 0 || m_focusBonusThreshold > 100) {
        int corrected = qBound(0, m_focusBonusThreshold, 100);
        LOG_WARNING("Invalid FocusBonusThreshold corrected from "
                    + QString::number(m_focusBonusThreshold) + " to " + QString::number(corrected));
        m_focusBonusThreshold = corrected;
    }

    if (m_focusBonusPercent < 0) {
        LOG_WARNING("Negative FocusBonusPercent corrected to 0");
        m_focusBonusPercent = 0;
    }

    if (m_heartbeatDriftToleranceSec < 0) {
        LOG_WARNING("Negative HeartbeatDriftToleranceSec corrected to 0");
        m_heartbeatDriftToleranceSec = 0;
    }

    bool levelOk = false;
    Logger::levelFromString(m_logLevel, &levelOk);
    if (!levelOk) {
        LOG_WARNING("Unknown LogLevel \"" + m_logLevel + "\" corrected to info");
        m_logLevel = "info";
    }

    if (m_logMaxSizeKb < 0) {
        LOG_WARNING("Negative LogMaxSizeKb corrected to 0");
        m_logMaxSizeKb = 0; // 0 disables rotation
    }
}

void ConfigManager::applyLogSettings()
{
    QString level;
    QString path;
    int maxSizeKb;
    {
        QMutexLocker locker(&m_mutex);
        level = m_logLevel;
        path = m_logFilePath;
        maxSizeKb = m_logMaxSizeKb;
    }

    Logger::instance()->setLogLevel(Logger::levelFromString(level));
    Logger::instance()->setMaxFileSize(qint64(maxSizeKb) * 1024);

    if (!path.isEmpty() && !Logger::instance()->setLogFile(path)) {
        LOG_WARNING("Could not open log file " + path);
    }
}

bool ConfigManager::saveLocalConfig()
{
    if (!m_initialized || !m_settings) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    LOG_INFO("Saving configuration to: " + m_settings->fileName());

    {
        QMutexLocker locker(&m_mutex);

        m_settings->setValue("ServerUrl", m_serverUrl);
        m_settings->setValue("AuthToken", m_authToken);
        m_settings->setValue("RequestTimeoutMs", m_requestTimeoutMs);
        m_settings->setValue("ConnectionCheckInterval", m_connectionCheckInterval);
        m_settings->setValue("StorePath", m_storePath);
        m_settings->setValue("HistoryLimit", m_historyLimit);
        m_settings->setValue("CoinsPerMinute", m_coinsPerMinute);
        m_settings->setValue("ExpPerPage", m_expPerPage);
        m_settings->setValue("FocusBonusThreshold", m_focusBonusThreshold);
        m_settings->setValue("FocusBonusPercent", m_focusBonusPercent);
        m_settings->setValue("HeartbeatDriftToleranceSec", m_heartbeatDriftToleranceSec);
        m_settings->setValue("LogLevel", m_logLevel);
        m_settings->setValue("LogFilePath", m_logFilePath);
        m_settings->setValue("LogMaxSizeKb", m_logMaxSizeKb);

        // Ensure settings are written to disk
        m_settings->sync();
    }

    QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration, error code: " + QString::number(status));
        return false;
    }

    LOG_INFO("Configuration saved successfully");
    return true;
}

RewardRates ConfigManager::rewardRates() const
{
    QMutexLocker locker(&m_mutex);
    RewardRates rates;
    rates.coinsPerMinute = m_coinsPerMinute;
    rates.expPerPage = m_expPerPage;
    rates.focusBonusThreshold = m_focusBonusThreshold;
    rates.focusBonusPercent = m_focusBonusPercent;
    return rates;
}

DbConfig ConfigManager::dbConfig() const
{
    QMutexLocker locker(&m_mutex);
    return DbConfig::forPath(m_storePath);
}

QString ConfigManager::serverUrl() const
{
    QMutexLocker locker(&m_mutex);
    return m_serverUrl;
}

QString ConfigManager::authToken() const
{
    QMutexLocker locker(&m_mutex);
    return m_authToken;
}

int ConfigManager::requestTimeoutMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_requestTimeoutMs;
}

int ConfigManager::connectionCheckInterval() const
{
    QMutexLocker locker(&m_mutex);
    return m_connectionCheckInterval;
}

QString ConfigManager::storePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_storePath;
}

int ConfigManager::historyLimit() const
{
    QMutexLocker locker(&m_mutex);
    return m_historyLimit;
}

int ConfigManager::coinsPerMinute() const
{
    QMutexLocker locker(&m_mutex);
    return m_coinsPerMinute;
}

int ConfigManager::expPerPage() const
{
    QMutexLocker locker(&m_mutex);
    return m_expPerPage;
}

int ConfigManager::focusBonusThreshold() const
{
    QMutexLocker locker(&m_mutex);
    return m_focusBonusThreshold;
}

int ConfigManager::focusBonusPercent() const
{
    QMutexLocker locker(&m_mutex);
    return m_focusBonusPercent;
}

int ConfigManager::heartbeatDriftToleranceSec() const
{
    QMutexLocker locker(&m_mutex);
    return m_heartbeatDriftToleranceSec;
}

QString ConfigManager::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString ConfigManager::logFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

int ConfigManager::logMaxSizeKb() const
{
    QMutexLocker locker(&m_mutex);
    return m_logMaxSizeKb;
}

// Setters ignore out-of-range values and only signal real changes

void ConfigManager::setServerUrl(const QString &url)
{
    {
        QMutexLocker locker(&m_mutex);
        if (url.trimmed().isEmpty() || m_serverUrl == url) {
            return;
        }
        m_serverUrl = url;
    }
    emit configChanged();
}

void ConfigManager::setAuthToken(const QString &token)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_authToken == token) {
            return;
        }
        m_authToken = token;
    }
    emit configChanged();
}

void ConfigManager::setRequestTimeoutMs(int milliseconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (milliseconds < 1000 || m_requestTimeoutMs == milliseconds) {
            return;
        }
        m_requestTimeoutMs = milliseconds;
    }
    emit configChanged();
}

void ConfigManager::setConnectionCheckInterval(int milliseconds)
{
    {
        QMutexLocker locker(&m_mutex);
        bool valid = milliseconds == 0 || milliseconds >= 1000;
        if (!valid || m_connectionCheckInterval == milliseconds) {
            return;
        }
        m_connectionCheckInterval = milliseconds;
    }
    emit configChanged();
}

void ConfigManager::setStorePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (path.isEmpty() || m_storePath == path) {
            return;
        }
        m_storePath = path;
    }
    emit configChanged();
}

void ConfigManager::setHistoryLimit(int limit)
{
    {
        QMutexLocker locker(&m_mutex);
        if (limit < 1 || m_historyLimit == limit) {
            return;
        }
        m_historyLimit = limit;
    }
    emit configChanged();
}

void ConfigManager::setCoinsPerMinute(int coins)
{
    {
        QMutexLocker locker(&m_mutex);
        if (coins < 0 || m_coinsPerMinute == coins) {
            return;
        }
        m_coinsPerMinute = coins;
    }
    emit configChanged();
}

void ConfigManager::setExpPerPage(int exp)
{
    {
        QMutexLocker locker(&m_mutex);
        if (exp < 0 || m_expPerPage == exp) {
            return;
        }
        m_expPerPage = exp;
    }
    emit configChanged();
}

void ConfigManager::setFocusBonusThreshold(int threshold)
{
    {
        QMutexLocker locker(&m_mutex);
        if (threshold < 0 || threshold > 100 || m_focusBonusThreshold == threshold) {
            return;
        }
        m_focusBonusThreshold = threshold;
    }
    emit configChanged();
}

void ConfigManager::setFocusBonusPercent(int percent)
{
    {
        QMutexLocker locker(&m_mutex);
        if (percent < 0 || m_focusBonusPercent == percent) {
            return;
        }
        m_focusBonusPercent = percent;
    }
    emit configChanged();
}

void ConfigManager::setHeartbeatDriftToleranceSec(int seconds)
{
    {
        QMutexLocker locker(&m_mutex);
        if (seconds < 0 || m_heartbeatDriftToleranceSec == seconds) {
            return;
        }
        m_heartbeatDriftToleranceSec = seconds;
    }
    emit configChanged();
}

void ConfigManager::setLogLevel(const QString &level)
{
    bool ok = false;
    Logger::levelFromString(level, &ok);
    if (!ok) {
        LOG_WARNING("Ignoring unknown log level: " + level);
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        const QString normalized = level.trimmed().toLower();
        if (m_logLevel == normalized) {
            return;
        }
        m_logLevel = normalized;
    }
    emit configChanged();
}

void ConfigManager::setLogFilePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logFilePath == path) {
            return;
        }
        m_logFilePath = path;
    }
    emit configChanged();
}

void ConfigManager::setLogMaxSizeKb(int kilobytes)
{
    {
        QMutexLocker locker(&m_mutex);
        if (kilobytes < 0 || m_logMaxSizeKb == kilobytes) {
            return;
        }
        m_logMaxSizeKb = kilobytes;
    }
    emit configChanged();
}
