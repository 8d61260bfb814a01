#include "dbservice/dbconfig.h"
#include "logger/logger.h"
#include <QSettings>
#include <QProcessEnvironment>
#include <QFile>

DbConfig DbConfig::fromResource() {
    if (!QFile::exists(":/config/database.ini")) {
        LOG_WARNING("Database configuration not found in resources, using environment");
        return DbConfig::fromEnvironment();
    }
    return DbConfig::fromFile(":/config/database.ini");
}

DbConfig DbConfig::fromEnvironment() {
    DbConfig config;
    auto env = QProcessEnvironment::systemEnvironment();

    config.m_driver = env.value("CREWPAY_DB_DRIVER", config.m_driver);
    config.m_host = env.value("CREWPAY_DB_HOST", config.m_host);
    config.m_database = env.value("CREWPAY_DB_NAME", config.m_database);
    config.m_username = env.value("CREWPAY_DB_USER", config.m_username);
    config.m_password = env.value("CREWPAY_DB_PASSWORD", config.m_password);
    config.m_port = env.value("CREWPAY_DB_PORT", QString::number(config.m_port)).toInt();

    return config;
}

DbConfig DbConfig::fromFile(const QString& configPath) {
    DbConfig config;
    QSettings settings(configPath, QSettings::IniFormat);

    settings.beginGroup("Database");
    config.m_driver = settings.value("driver", config.m_driver).toString().toUpper();
    config.m_host = settings.value("host", config.m_host).toString();
    config.m_database = settings.value("database", config.m_database).toString();
    config.m_username = settings.value("username", config.m_username).toString();
    config.m_password = settings.value("password", config.m_password).toString();
    config.m_port = settings.value("port", config.m_port).toInt();
    config.m_connectionName = settings.value("connectionName", config.m_connectionName).toString();
    settings.endGroup();

    if (config.m_connectionName.isEmpty()) {
        config.m_connectionName = "crewpay";
    }

    return config;
}

QString DbConfig::describe() const {
    if (isSqlite()) {
        return QString("%1:%2").arg(m_driver, m_database);
    }
    return QString("%1:%2@%3:%4/%5")
        .arg(m_driver, m_username, m_host)
        .arg(m_port)
        .arg(m_database);
}
