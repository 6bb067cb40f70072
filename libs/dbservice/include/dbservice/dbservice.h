#pragma once
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QMap>
#include <QVariant>
#include <QStringList>
#include <functional>
#include <optional>
#include "dbconfig.h"
#include "logger/logger.h"

// One named SQLite connection. Not thread-safe: use it from the thread that created it.
class DbService {
public:
    template<typename T>
    using QueryProcessor = std::function<T(const QSqlQuery&)>;

    explicit DbService(const DbConfig& config);
    ~DbService();

    DbService(const DbService&) = delete;
    DbService& operator=(const DbService&) = delete;

    // Opens the database file (creating its directory) and applies the pragmas
    bool open();

    // Runs a SELECT and converts every row. False on any failure, with results left empty.
    template<typename T>
    bool executeSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor<T>& processor,
        QList<T>& results);

    // First row only; nullopt for both "no rows" and failure
    template<typename T>
    std::optional<T> executeSingleSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor<T>& processor);

    // Execute an INSERT, UPDATE, DELETE or DDL statement
    bool executeModificationQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params = QMap<QString, QVariant>());

    // Execute statements in order, stopping at the first failure
    bool executeScript(const QStringList& statements);

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    QString lastError() const;

private:
    bool ensureConnected();
    bool prepareAndExec(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params);

    QString m_connectionName;
    QSqlDatabase m_db;
    DbConfig m_config;
    QString m_lastError;
};
