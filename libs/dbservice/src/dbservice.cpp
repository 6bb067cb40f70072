#include "dbservice/dbservice.hpp"
#include <QUuid>
#include <QDir>
#include <QFileInfo>
#include <QSqlDriver>
#include <QElapsedTimer>

DbService::DbService(const DbConfig& config)
    : m_config(config)
{
    // Unique connection name so several services can share one database file
    m_connectionName = QString("%1_%2")
                       .arg(config.connectionPrefix(),
                            QUuid::createUuid().toString(QUuid::WithoutBraces));

    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(config.databasePath());
    m_db.setConnectOptions(QString("QSQLITE_BUSY_TIMEOUT=%1").arg(config.busyTimeoutMs()));
}

DbService::~DbService() {
    if (m_db.isOpen()) {
        LOG_DEBUG(QString("Closing database connection: %1").arg(m_connectionName));
        m_db.close();
    }

    // The handle must be released before the connection can be removed
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool DbService::open() {
    if (!QSqlDatabase::isDriverAvailable("QSQLITE")) {
        m_lastError = "SQLite driver (QSQLITE) not available";
        LOG_FATAL(QString("%1. Available drivers: %2")
                 .arg(m_lastError, QSqlDatabase::drivers().join(", ")));
        return false;
    }

    QFileInfo fileInfo(m_config.databasePath());
    if (!fileInfo.absoluteDir().exists() && !QDir().mkpath(fileInfo.absolutePath())) {
        m_lastError = "Cannot create database directory " + fileInfo.absolutePath();
        LOG_ERROR(m_lastError);
        return false;
    }

    if (!m_db.isOpen() && !m_db.open()) {
        m_lastError = m_db.lastError().text();
        LOG_FATAL(QString("Database connection failed: %1 for database %2")
                 .arg(m_lastError, m_config.databasePath()));
        return false;
    }

    QStringList pragmas;
    pragmas << "PRAGMA journal_mode=WAL"
            << QString("PRAGMA synchronous=%1").arg(m_config.synchronousMode());

    if (!executeScript(pragmas)) {
        return false;
    }

    LOG_INFO(QString("Opened database %1 (connection %2, synchronous=%3)")
            .arg(m_config.databasePath(), m_connectionName, m_config.synchronousMode()));
    return true;
}

bool DbService::ensureConnected() {
    if (!m_db.isOpen()) {
        LOG_WARNING("Database connection is closed, attempting to reopen...");

        if (m_db.open()) {
            LOG_INFO(QString("Successfully reopened database connection: %1").arg(m_connectionName));
            return true;
        } else {
            m_lastError = m_db.lastError().text();
            LOG_ERROR(QString("Failed to reopen database connection: %1").arg(m_lastError));
            return false;
        }
    }
    return true;
}

bool DbService::prepareAndExec(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params) {
    if (params.isEmpty()) {
        if (!query.exec(queryStr)) {
            m_lastError = query.lastError().text();
            LOG_ERROR(QString("Query failed: %1\nQuery: %2").arg(m_lastError, queryStr));
            return false;
        }
        return true;
    }

    if (!query.prepare(queryStr)) {
        m_lastError = query.lastError().text();
        LOG_ERROR(QString("Query preparation failed: %1\nQuery: %2").arg(m_lastError, queryStr));
        return false;
    }

    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        query.bindValue(":" + it.key(), it.value());
    }

    if (!query.exec()) {
        m_lastError = query.lastError().text();
        LOG_ERROR(QString("Query failed: %1\nQuery: %2").arg(m_lastError, queryStr));
        LOG_DATA(Logger::Error, params);
        return false;
    }

    return true;
}

bool DbService::executeModificationQuery(const QString& queryStr, const QMap<QString, QVariant>& params) {
    if (!ensureConnected()) {
        LOG_ERROR("Cannot execute query, database is not connected");
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    QSqlQuery query(m_db);
    if (!prepareAndExec(query, queryStr, params)) {
        return false;
    }

    LOG_DEBUG(QString("Query executed in %1 ms, affected %2 rows")
             .arg(timer.elapsed())
             .arg(query.numRowsAffected()));
    return true;
}

bool DbService::executeScript(const QStringList& statements) {
    for (const QString& statement : statements) {
        if (!executeModificationQuery(statement)) {
            return false;
        }
    }
    return true;
}

bool DbService::beginTransaction() {
    if (!ensureConnected()) {
        LOG_ERROR("Cannot begin transaction, database is not connected");
        return false;
    }

    if (!m_db.driver()->hasFeature(QSqlDriver::Transactions)) {
        LOG_WARNING("Database driver does not support transactions");
        return false;
    }

    bool success = m_db.transaction();
    if (!success) {
        m_lastError = m_db.lastError().text();
        LOG_ERROR(QString("Failed to begin transaction: %1").arg(m_lastError));
    } else {
        LOG_DEBUG("Transaction started");
    }

    return success;
}

bool DbService::commitTransaction() {
    if (!m_db.isOpen()) {
        LOG_ERROR("Cannot commit transaction, database is not connected");
        return false;
    }

    bool success = m_db.commit();
    if (!success) {
        m_lastError = m_db.lastError().text();
        LOG_ERROR(QString("Failed to commit transaction: %1").arg(m_lastError));
    } else {
        LOG_DEBUG("Transaction committed");
    }

    return success;
}

bool DbService::rollbackTransaction() {
    if (!m_db.isOpen()) {
        LOG_ERROR("Cannot rollback transaction, database is not connected");
        return false;
    }

    bool success = m_db.rollback();
    if (!success) {
        m_lastError = m_db.lastError().text();
        LOG_ERROR(QString("Failed to rollback transaction: %1").arg(m_lastError));
    } else {
        LOG_DEBUG("Transaction rolled back");
    }

    return success;
}

QString DbService::lastError() const {
    return m_lastError;
}
