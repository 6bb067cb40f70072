#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QMap>
#include <QVariant>
#include <QThread>

// Define the logger_global macro for export/import
#if defined(_MSC_VER) || defined(WIN64) || defined(_WIN64) || defined(__WIN64__) || defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define DECL_EXPORT __declspec(dllexport)
#  define DECL_IMPORT __declspec(dllimport)
#else
#  define DECL_EXPORT     __attribute__((visibility("default")))
#  define DECL_IMPORT     __attribute__((visibility("default")))
#endif

#if defined(LOGGER_LIBRARY)
#  define LOGGER_EXPORT DECL_EXPORT
#else
#  define LOGGER_EXPORT DECL_IMPORT
#endif

/**
 * @brief Process-wide logger shared by the sync engine, its store and the CLI
 *
 * Messages are written to a log file and, when enabled, mirrored to the Qt
 * message handlers. All public methods are safe to call from any thread.
 */
class LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Log levels supported by the logger
     */
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< General informational messages
        Warning,  ///< Recoverable problems (offline fallback, swallowed remote errors)
        Error,    ///< Failed operations
        Fatal     ///< Unrecoverable errors
    };

    /**
     * @brief Gets the singleton instance of the logger
     * @return Pointer to the Logger instance
     */
    static Logger* instance();

    /**
     * @brief Parses a level name ("debug", "info", "warning", "error", "fatal")
     * @param name Case-insensitive level name
     * @param ok Set to false when the name is not recognised
     * @return The parsed level, Info when unrecognised
     */
    static LogLevel levelFromString(const QString& name, bool* ok = nullptr);

    /**
     * @brief Sets the output log file path, creating its directory if needed
     * @param filePath The full path to the log file
     * @return True if the file could be opened for appending
     */
    bool setLogFile(const QString& filePath);

    /**
     * @brief Caps the log file size; the full file is moved to "<path>.1"
     * @param bytes Maximum size in bytes, 0 for no limit
     */
    void setMaxFileSize(qint64 bytes);

    /**
     * @brief Sets the minimum log level for message filtering
     * @param level The minimum LogLevel to output
     */
    void setLogLevel(LogLevel level);

    /**
     * @brief Enables or disables console output
     * @param enable True to enable console output, false to disable
     * @return The new console output state
     */
    bool enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function or class name
     * @param line Source line, or -1 when unknown
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs key-value pairs as a single "key: value, ..." line
     * @param level The log level
     * @param data The key-value pairs to log
     * @param source The source function or class name
     * @param line Source line, or -1 when unknown
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data,
                 const QString& source = QString(), int line = -1);

    LogLevel getLogLevel() const;
    QString getLogFilePath() const;
    bool isConsoleOutputEnabled() const;
    qint64 maxFileSize() const;

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    static Logger* m_instance;
    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    mutable QMutex m_mutex;
    QString m_logFilePath;
    qint64 m_maxFileSize;

    static QString logLevelToString(LogLevel level);

    /**
     * @brief Formats a log message with timestamp and metadata
     * @param level The log level for the message
     * @param message The message to format
     * @param source Q_FUNC_INFO style signature, reduced to Class::method
     * @param line Source line, or -1 when unknown
     * @return Formatted log message string
     */
    static QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line);

    // Caller must hold m_mutex
    void writeToLog(const QString& message);
    void rotateLogFile();
    bool openLogFile();
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)

// Macro for logging with data
#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
