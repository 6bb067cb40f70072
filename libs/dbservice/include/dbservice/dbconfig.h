#pragma once
#include <QString>

class DbConfig {
public:
    static DbConfig forPath(const QString& databasePath);

    QString databasePath() const { return m_databasePath; }
    QString connectionPrefix() const { return m_connectionPrefix; }
    int busyTimeoutMs() const { return m_busyTimeoutMs; }
    // SQLite "PRAGMA synchronous" value; FULL makes every commit durable before it returns
    QString synchronousMode() const { return m_synchronousMode; }

    void setConnectionPrefix(const QString& prefix) { m_connectionPrefix = prefix; }

private:
    QString m_databasePath;
    QString m_connectionPrefix = "dbservice";
    int m_busyTimeoutMs = 5000;
    QString m_synchronousMode = "FULL";
};
