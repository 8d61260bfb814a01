#pragma once
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QMap>
#include <QVariant>
#include <functional>
#include <optional>
#include "dbconfig.h"
#include "logger/logger.h"

/**
 * @brief Typed query helper for one model type
 *
 * Rows are turned into heap-allocated models by the caller-supplied
 * processor; ownership of the returned pointers passes to the caller.
 * Statements with parameters are prepared and bound by name (":key").
 */
template<typename T>
class DbService {
public:
    using QueryProcessor = std::function<T*(const QSqlQuery&)>;

    explicit DbService(const DbConfig& config);
    ~DbService();

    QList<T*> executeSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor& processor);

    // nullopt when no row matched or the query failed
    std::optional<T*> executeSingleSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor& processor);

    // First column of the first row, e.g. COUNT(*)
    std::optional<QVariant> executeScalarQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params);

    // INSERT, UPDATE or DELETE
    bool executeModificationQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params);

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    QString lastError() const;

private:
    bool ensureConnected();
    bool run(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params);
    bool finishTransaction(bool commit);

    QString m_connectionName;
    QSqlDatabase m_db;
    QString m_lastError;
};
