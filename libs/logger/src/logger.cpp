#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

// Initialize static member to nullptr
Logger* Logger::m_instance = nullptr;

Logger* Logger::instance() {
    // Double-checked locking, the instance lives for the whole process
    if (m_instance == nullptr) {
        static QMutex mutex;
        QMutexLocker locker(&mutex);

        if (m_instance == nullptr) {
            m_instance = new Logger();
        }
    }
    return m_instance;
}

Logger::LogLevel Logger::levelFromString(const QString& name, bool* ok) {
    const QString level = name.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (level == "debug") {
        return Debug;
    } else if (level == "info") {
        return Info;
    } else if (level == "warning" || level == "warn") {
        return Warning;
    } else if (level == "error") {
        return Error;
    } else if (level == "fatal") {
        return Fatal;
    }

    if (ok) {
        *ok = false;
    }
    return Info;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
    , m_maxFileSize(0)
{
    // Default log file location, opened directly so the constructor never logs
    QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (logDir.isEmpty()) {
        logDir = QDir::tempPath();
    }
    QDir().mkpath(logDir);

    m_logFilePath = logDir + "/readlock.log";
    openLogFile();
}

Logger::~Logger() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    QFileInfo info(filePath);
    QDir().mkpath(info.absolutePath());

    m_logFilePath = filePath;
    bool opened = openLogFile();
    if (opened) {
        writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), QString(), -1));
    }
    return opened;
}

void Logger::setMaxFileSize(qint64 bytes) {
    QMutexLocker locker(&m_mutex);
    m_maxFileSize = qMax<qint64>(0, bytes);
}

// Caller must hold m_mutex
bool Logger::openLogFile() {
    m_logFile.setFileName(m_logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "Failed to open log file:" << m_logFilePath;
        return false;
    }
    m_logStream.setDevice(&m_logFile);
    return true;
}

// Caller must hold m_mutex. Keeps a single previous generation.
void Logger::rotateLogFile() {
    m_logStream.flush();
    m_logStream.setDevice(nullptr);
    m_logFile.close();

    const QString previous = m_logFilePath + ".1";
    QFile::remove(previous);
    if (!QFile::rename(m_logFilePath, previous)) {
        qWarning() << "Failed to rotate log file:" << m_logFilePath;
    }

    openLogFile();
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(logLevelToString(level)), QString(), -1));
}

bool Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
    return m_consoleOutput;
}

void Logger::debug(const QString& message, const QString& source, int line) {
    log(Debug, message, source, line);
}

void Logger::info(const QString& message, const QString& source, int line) {
    log(Info, message, source, line);
}

void Logger::warning(const QString& message, const QString& source, int line) {
    log(Warning, message, source, line);
}

void Logger::error(const QString& message, const QString& source, int line) {
    log(Error, message, source, line);
}

void Logger::fatal(const QString& message, const QString& source, int line) {
    log(Fatal, message, source, line);
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    // Format outside the lock to keep the critical section short
    QString formattedMessage = formatLogMessage(level, message, source, line);

    QMutexLocker locker(&m_mutex);
    writeToLog(formattedMessage);

    if (m_consoleOutput) {
        switch (level) {
            case Debug:
                qDebug().noquote() << formattedMessage;
                break;
            case Info:
                qInfo().noquote() << formattedMessage;
                break;
            case Warning:
                qWarning().noquote() << formattedMessage;
                break;
            case Error:
            case Fatal:
                qCritical().noquote() << formattedMessage;
                break;
        }
    }
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source, int line) {
    if (level < getLogLevel()) {
        return;
    }

    QStringList logParts;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        logParts.append(QString("%1: %2").arg(it.key(), it.value().toString()));
    }

    log(level, logParts.join(", "), source, line);
}

QString Logger::logLevelToString(LogLevel level) {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
        default:      return "UNKNOWN";
    }
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString pid = QString::number(QCoreApplication::applicationPid());
    QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()));
    QString levelStr = logLevelToString(level);

    if (source.isEmpty()) {
        return QString("[%1] [%2] [PID:%3] [TID:%4] %5")
            .arg(timestamp, levelStr, pid, threadId, message);
    }

    // "bool SessionStore::putActive(const ReadingSession&)" -> "SessionStore::putActive"
    QString sourceInfo = source;
    int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }
    int spacePos = sourceInfo.lastIndexOf(' ');
    if (spacePos >= 0) {
        sourceInfo = sourceInfo.mid(spacePos + 1);
    }
    while (sourceInfo.startsWith('*') || sourceInfo.startsWith('&')) {
        sourceInfo.remove(0, 1);
    }

    if (line >= 0) {
        sourceInfo += QString(":%1").arg(line);
    }

    return QString("[%1] [%2] [PID:%3] [TID:%4] [%5] %6")
        .arg(timestamp, levelStr, pid, threadId, sourceInfo, message);
}

void Logger::writeToLog(const QString& message) {
    if (m_logFile.isOpen() && m_maxFileSize > 0 && m_logFile.size() >= m_maxFileSize) {
        rotateLogFile();
    }

    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
    }
}

Logger::LogLevel Logger::getLogLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString Logger::getLogFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

bool Logger::isConsoleOutputEnabled() const {
    QMutexLocker locker(&m_mutex);
    return m_consoleOutput;
}

qint64 Logger::maxFileSize() const {
    QMutexLocker locker(&m_mutex);
    return m_maxFileSize;
}
