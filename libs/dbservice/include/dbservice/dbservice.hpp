#pragma once
#include "dbservice/dbservice.h"
#include "logger/logger.h"
#include <QElapsedTimer>

template<typename T>
bool DbService::executeSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor<T>& processor,
    QList<T>& results)
{
    results.clear();
    if (!ensureConnected()) {
        LOG_ERROR("Cannot execute query, database is not connected");
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    QSqlQuery query(m_db);
    query.setForwardOnly(true);
    if (!prepareAndExec(query, queryStr, params)) {
        return false;
    }

    try {
        while (query.next()) {
            results.append(processor(query));
        }
    }
    catch (const std::exception& ex) {
        m_lastError = QString::fromUtf8(ex.what());
        LOG_ERROR(QString("Row conversion failed: %1\nQuery: %2").arg(m_lastError, queryStr));
        results.clear();
        return false;
    }

    LOG_DEBUG(QString("Query executed in %1 ms, returned %2 rows")
             .arg(timer.elapsed())
             .arg(results.size()));
    return true;
}

template<typename T>
std::optional<T> DbService::executeSingleSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor<T>& processor)
{
    QList<T> rows;
    if (!executeSelectQuery<T>(queryStr, params, processor, rows) || rows.isEmpty()) {
        return std::nullopt;
    }
    return rows.first();
}
