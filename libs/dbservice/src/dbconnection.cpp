#include "dbservice/dbconnection.h"
#include "logger/logger.h"
#include <QSqlError>
#include <QSqlQuery>

QSqlDatabase DbConnection::open(const DbConfig& config) {
    const QString connectionName = config.connectionName();

    QSqlDatabase db;
    if (QSqlDatabase::contains(connectionName)) {
        db = QSqlDatabase::database(connectionName, false);
    } else {
        LOG_DEBUG(QString("Registering database connection: %1").arg(connectionName));
        db = QSqlDatabase::addDatabase(config.driver(), connectionName);
        db.setDatabaseName(config.database());
        if (!config.isSqlite()) {
            db.setHostName(config.host());
            db.setUserName(config.username());
            db.setPassword(config.password());
            db.setPort(config.port());
            db.setConnectOptions("application_name=CrewPay");
        }
    }

    if (db.isOpen()) {
        return db;
    }

    if (!db.open()) {
        LOG_FATAL(QString("Database connection failed: %1 for %2")
                 .arg(db.lastError().text(), config.describe()));
        return db;
    }

    if (config.isSqlite()) {
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA foreign_keys = ON")) {
            LOG_WARNING(QString("Could not enable SQLite foreign keys: %1").arg(pragma.lastError().text()));
        }
    }

    LOG_INFO(QString("Connected to %1").arg(config.describe()));
    return db;
}
