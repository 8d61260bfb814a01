#pragma once
#include "dbservice/dbservice.h"
#include "dbservice/dbconnection.h"
#include "logger/logger.h"
#include <QSqlDriver>
#include <QElapsedTimer>
#include <typeinfo>

template<typename T>
DbService<T>::DbService(const DbConfig& config)
    : m_connectionName(config.connectionName())
    , m_db(DbConnection::open(config))
{
    LOG_DEBUG(QString("Service %1 bound to connection %2").arg(typeid(T).name()).arg(m_connectionName));
}

template<typename T>
DbService<T>::~DbService() {
    // The connection is shared; DbManager::shutdown() closes and removes it
}

template<typename T>
bool DbService<T>::ensureConnected() {
    if (m_db.isOpen()) {
        return true;
    }

    LOG_WARNING(QString("Connection %1 is closed, reopening").arg(m_connectionName));
    if (!m_db.open()) {
        m_lastError = m_db.lastError().text();
        LOG_ERROR(QString("Failed to reopen connection %1: %2").arg(m_connectionName, m_lastError));
        return false;
    }
    return true;
}

template<typename T>
bool DbService<T>::run(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params) {
    if (!ensureConnected()) {
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    bool ok = false;
    if (params.isEmpty()) {
        ok = query.exec(queryStr);
    } else if (query.prepare(queryStr)) {
        for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
            query.bindValue(":" + it.key(), it.value());
        }
        ok = query.exec();
    }

    if (!ok) {
        m_lastError = query.lastError().text();
        LOG_ERROR(QString("Query failed: %1\nQuery: %2").arg(m_lastError, queryStr));
        if (!params.isEmpty()) {
            LOG_DATA(Logger::Error, params);
        }
        return false;
    }

    m_lastError.clear();
    LOG_DEBUG(QString("Query executed in %1 ms").arg(timer.elapsed()));
    return true;
}

template<typename T>
QList<T*> DbService<T>::executeSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor& processor)
{
    QList<T*> results;
    QSqlQuery query(m_db);
    if (!run(query, queryStr, params)) {
        return results;
    }

    try {
        while (query.next()) {
            results.append(processor(query));
        }
    }
    catch (const std::exception& ex) {
        m_lastError = QString::fromUtf8(ex.what());
        LOG_ERROR(QString("Failed to read row: %1\nQuery: %2").arg(m_lastError, queryStr));
        qDeleteAll(results);
        results.clear();
    }
    return results;
}

template<typename T>
std::optional<T*> DbService<T>::executeSingleSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor& processor)
{
    QSqlQuery query(m_db);
    if (!run(query, queryStr, params) || !query.next()) {
        return std::nullopt;
    }

    try {
        return processor(query);
    }
    catch (const std::exception& ex) {
        m_lastError = QString::fromUtf8(ex.what());
        LOG_ERROR(QString("Failed to read row: %1\nQuery: %2").arg(m_lastError, queryStr));
        return std::nullopt;
    }
}

template<typename T>
std::optional<QVariant> DbService<T>::executeScalarQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params)
{
    QSqlQuery query(m_db);
    if (!run(query, queryStr, params) || !query.next()) {
        return std::nullopt;
    }
    return query.value(0);
}

template<typename T>
bool DbService<T>::executeModificationQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params)
{
    QSqlQuery query(m_db);
    if (!run(query, queryStr, params)) {
        return false;
    }

    LOG_DEBUG(QString("%1 rows affected").arg(query.numRowsAffected()));
    return true;
}

template<typename T>
bool DbService<T>::beginTransaction() {
    if (!ensureConnected()) {
        return false;
    }

    if (!m_db.driver()->hasFeature(QSqlDriver::Transactions)) {
        m_lastError = QString("Driver %1 does not support transactions").arg(m_db.driverName());
        LOG_ERROR(m_lastError);
        return false;
    }

    if (!m_db.transaction()) {
        m_lastError = m_db.lastError().text();
        LOG_ERROR(QString("Failed to begin transaction: %1").arg(m_lastError));
        return false;
    }
    return true;
}

template<typename T>
bool DbService<T>::commitTransaction() {
    return finishTransaction(true);
}

template<typename T>
bool DbService<T>::rollbackTransaction() {
    return finishTransaction(false);
}

template<typename T>
bool DbService<T>::finishTransaction(bool commit) {
    const char* action = commit ? "commit" : "roll back";
    if (!m_db.isOpen()) {
        m_lastError = QString("Cannot %1, connection %2 is closed").arg(QLatin1String(action), m_connectionName);
        LOG_ERROR(m_lastError);
        return false;
    }

    const bool success = commit ? m_db.commit() : m_db.rollback();
    if (!success) {
        m_lastError = m_db.lastError().text();
        LOG_ERROR(QString("Failed to %1 transaction: %2").arg(QLatin1String(action), m_lastError));
    }
    return success;
}

template<typename T>
QString DbService<T>::lastError() const {
    return m_lastError.isEmpty() ? m_db.lastError().text() : m_lastError;
}
