#include "dbservice/dbconfig.h"

DbConfig DbConfig::forPath(const QString& databasePath) {
    DbConfig config;
    config.m_databasePath = databasePath;
    return config;
}
