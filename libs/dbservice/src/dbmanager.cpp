#include "dbservice/dbmanager.h"
#include "dbservice/dbconnection.h"
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QFile>
#include <QRegularExpression>

DbManager& DbManager::instance() {
    static DbManager instance;
    return instance;
}

DbManager::DbManager() = default;

DbManager::~DbManager() {
    shutdown();
}

bool DbManager::initialize(const DbConfig& config) {
    if (m_initialized) {
        LOG_WARNING(QString("DbManager already initialized for %1").arg(m_config.describe()));
        return true;
    }

    const QStringList drivers = QSqlDatabase::drivers();
    if (!drivers.contains(config.driver())) {
        LOG_FATAL(QString("SQL driver %1 not available, installed: %2")
                 .arg(config.driver(), drivers.join(", ")));
        return false;
    }

    m_config = config;
    if (!probe()) {
        shutdown();
        return false;
    }

    m_initialized = true;
    LOG_INFO(QString("DbManager ready on %1").arg(config.describe()));
    return true;
}

void DbManager::shutdown() {
    // Services hold QSqlDatabase handles; release them before removing the connection
    m_services.clear();

    const QString connectionName = m_config.connectionName();
    if (QSqlDatabase::contains(connectionName)) {
        {
            QSqlDatabase db = QSqlDatabase::database(connectionName, false);
            if (db.isOpen()) {
                LOG_DEBUG(QString("Closing database connection: %1").arg(connectionName));
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(connectionName);
    }

    m_initialized = false;
}

bool DbManager::probe() {
    QSqlDatabase db = DbConnection::open(m_config);
    if (!db.isOpen()) {
        return false;
    }

    QSqlQuery query(db);
    if (!query.exec("SELECT 1")) {
        LOG_FATAL(QString("Probe query failed on %1: %2").arg(m_config.describe(), query.lastError().text()));
        return false;
    }
    return true;
}

bool DbManager::executeScript(const QString& scriptPath) {
    if (!m_initialized) {
        LOG_ERROR("Cannot execute script, DbManager not initialized");
        return false;
    }

    QFile file(scriptPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_ERROR(QString("Cannot open SQL script: %1").arg(scriptPath));
        return false;
    }

    QString script = QString::fromUtf8(file.readAll());
    // Strip "--" comments so a ';' inside one cannot split a statement
    static const QRegularExpression commentPattern("--[^\\n]*");
    script.remove(commentPattern);

    QSqlDatabase db = DbConnection::open(m_config);
    if (!db.isOpen()) {
        LOG_ERROR(QString("Cannot execute script %1, database is not connected").arg(scriptPath));
        return false;
    }

    int executed = 0;
    const QStringList statements = script.split(';', Qt::SkipEmptyParts);
    for (const QString& rawStatement : statements) {
        const QString statement = rawStatement.trimmed();
        if (statement.isEmpty()) {
            continue;
        }

        QSqlQuery query(db);
        if (!query.exec(statement)) {
            LOG_ERROR(QString("Script statement failed: %1\nStatement: %2")
                     .arg(query.lastError().text(), statement));
            return false;
        }
        ++executed;
    }

    LOG_INFO(QString("Executed %1 statements from %2").arg(executed).arg(scriptPath));
    return true;
}
