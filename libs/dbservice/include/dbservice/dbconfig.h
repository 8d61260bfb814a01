#pragma once
#include <QString>

/**
 * @brief Connection parameters for the Qt SQL layer
 *
 * The driver defaults to QPSQL. QSQLITE is accepted for local runs; the
 * database name is then a file path or ":memory:".
 */
class DbConfig {
public:
    static DbConfig fromResource();
    static DbConfig fromEnvironment();
    static DbConfig fromFile(const QString& configPath);

    QString driver() const { return m_driver; }
    QString host() const { return m_host; }
    QString database() const { return m_database; }
    QString username() const { return m_username; }
    QString password() const { return m_password; }
    int port() const { return m_port; }
    QString connectionName() const { return m_connectionName; }

    bool isSqlite() const { return m_driver == "QSQLITE"; }

    // Human readable target, password omitted
    QString describe() const;

private:
    QString m_driver = "QPSQL";
    QString m_host = "localhost";
    QString m_database = "crewpay";
    QString m_username = "postgres";
    QString m_password;
    int m_port = 5432;
    QString m_connectionName = "crewpay";
};
