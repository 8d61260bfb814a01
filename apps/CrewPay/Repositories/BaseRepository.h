#ifndef BASEREPOSITORY_H
#define BASEREPOSITORY_H

#include <QObject>
#include <QSharedPointer>
#include <QList>
#include <QUuid>
#include <QSqlQuery>
#include <QStringList>
#include <functional>
#include <optional>
#include <stdexcept>

#include "dbservice/dbservice.hpp"
#include "logger/logger.h"

/**
 * @brief Storage of one model type in one table
 *
 * Ids are assigned by ModelFactory before a model reaches the repository, so
 * inserts never depend on generated keys. Payroll tables are keyed by
 * (user_id, month, year); the month helpers below build the shared filter.
 *
 * Every repository works on the same named connection. A transaction opened
 * through one repository therefore also covers statements issued by the
 * others until it is committed or rolled back. Transactions do not nest.
 */
template <typename T>
class BaseRepository : public QObject {
public:
    explicit BaseRepository(QObject* parent = nullptr)
        : QObject(parent), m_dbService(nullptr)
    {
    }

    virtual ~BaseRepository() = default;

    /**
     * @brief Binds the repository to the query service of its model type
     * @return False when dbService is null
     */
    bool initialize(DbService<T>* dbService) {
        if (!dbService) {
            LOG_ERROR(QString("%1 repository needs a database service").arg(getEntityName()));
            return false;
        }
        if (m_dbService) {
            LOG_WARNING(QString("%1 repository rebound to a new database service").arg(getEntityName()));
        }
        m_dbService = dbService;
        return true;
    }

    // SQL error of the last failed statement
    QString lastError() const {
        return m_dbService ? m_dbService->lastError() : QString("Database service not initialized");
    }

    virtual bool save(T* model) {
        return write(model, buildSaveQuery(), prepareParamsForSave(model), "insert");
    }

    /**
     * @brief Inserts the models in order and stops at the first failure
     * @return How many were inserted
     */
    int saveAll(const QList<QSharedPointer<T>>& models) {
        int saved = 0;
        for (const auto& model : models) {
            if (!save(model.data())) {
                break;
            }
            ++saved;
        }
        return saved;
    }

    virtual bool update(T* model) {
        return write(model, buildUpdateQuery(), prepareParamsForUpdate(model), "update");
    }

    // Null when the row does not exist or the query failed
    virtual QSharedPointer<T> getById(const QUuid& id) {
        return selectOne(QString("SELECT * FROM %1 WHERE id = :id").arg(getTableName()), idKey(id));
    }

    /**
     * @brief Deletes one row
     * @return True when the statement ran, also when no row matched
     */
    virtual bool remove(const QUuid& id) {
        const bool removed = modify(QString("DELETE FROM %1 WHERE id = :id").arg(getTableName()), idKey(id));
        if (removed) {
            LOG_DEBUG(QString("%1 %2 removed").arg(getEntityName(), uuidText(id)));
        }
        return removed;
    }

    /**
     * @brief Runs operation between BEGIN and COMMIT
     *
     * Returning false or throwing std::exception rolls every statement of the
     * operation back, including those issued through other repositories.
     *
     * @return True only when the operation succeeded and the commit went through
     */
    bool executeInTransaction(const std::function<bool()>& operation) {
        if (!ensureInitialized()) {
            return false;
        }
        if (!m_dbService->beginTransaction()) {
            LOG_ERROR(QString("%1: could not open transaction - %2").arg(getEntityName(), lastError()));
            return false;
        }

        bool committed = false;
        try {
            committed = operation() && m_dbService->commitTransaction();
        } catch (const std::exception& e) {
            LOG_ERROR(QString("%1: exception inside transaction - %2").arg(getEntityName(), e.what()));
        }

        if (!committed) {
            LOG_WARNING(QString("%1: rolling back transaction").arg(getEntityName()));
            m_dbService->rollbackTransaction();
        }
        return committed;
    }

protected:
    virtual QString getEntityName() const = 0;
    virtual QString getTableName() const = 0;

    virtual QString buildSaveQuery() = 0;
    virtual QString buildUpdateQuery() = 0;

    // One entry per named placeholder of the matching query
    virtual QMap<QString, QVariant> prepareParamsForSave(T* model) = 0;
    virtual QMap<QString, QVariant> prepareParamsForUpdate(T* model) = 0;

    virtual bool validateModel(T* model, QStringList& errors) = 0;

    // Ownership of the returned model passes to the caller
    virtual T* createModelFromQuery(const QSqlQuery& query) = 0;

    QList<QSharedPointer<T>> select(const QString& query, const QMap<QString, QVariant>& params) {
        QList<QSharedPointer<T>> models;
        if (!ensureInitialized()) {
            return models;
        }

        const QList<T*> rows = m_dbService->executeSelectQuery(query, params, rowReader());
        for (T* row : rows) {
            models.append(QSharedPointer<T>(row));
        }
        return models;
    }

    QSharedPointer<T> selectOne(const QString& query, const QMap<QString, QVariant>& params) {
        if (!ensureInitialized()) {
            return QSharedPointer<T>();
        }

        const std::optional<T*> row = m_dbService->executeSingleSelectQuery(query, params, rowReader());
        return row ? QSharedPointer<T>(*row) : QSharedPointer<T>();
    }

    bool modify(const QString& query, const QMap<QString, QVariant>& params) {
        if (!ensureInitialized()) {
            return false;
        }

        if (!m_dbService->executeModificationQuery(query, params)) {
            LOG_ERROR(QString("%1 statement failed: %2").arg(getEntityName(), lastError()));
            return false;
        }
        return true;
    }

    // -1 when the query failed
    int count(const QString& query, const QMap<QString, QVariant>& params) {
        if (!ensureInitialized()) {
            return -1;
        }

        const std::optional<QVariant> value = m_dbService->executeScalarQuery(query, params);
        if (!value) {
            LOG_ERROR(QString("%1 count failed: %2").arg(getEntityName(), lastError()));
            return -1;
        }
        return value->toInt();
    }

    static QString monthFilter() {
        return "user_id = :user_id AND month = :month AND year = :year";
    }

    static QMap<QString, QVariant> monthKey(const QUuid& userId, int month, int year) {
        QMap<QString, QVariant> params;
        params["user_id"] = uuidText(userId);
        params["month"] = month;
        params["year"] = year;
        return params;
    }

    QList<QSharedPointer<T>> selectMonth(const QUuid& userId, int month, int year, const QString& orderBy) {
        return select(QString("SELECT * FROM %1 WHERE %2 ORDER BY %3").arg(getTableName(), monthFilter(), orderBy),
                      monthKey(userId, month, year));
    }

    int countMonth(const QUuid& userId, int month, int year) {
        return count(QString("SELECT COUNT(*) FROM %1 WHERE %2").arg(getTableName(), monthFilter()),
                     monthKey(userId, month, year));
    }

    bool deleteMonth(const QUuid& userId, int month, int year) {
        const bool deleted = modify(QString("DELETE FROM %1 WHERE %2").arg(getTableName(), monthFilter()),
                                    monthKey(userId, month, year));
        if (deleted) {
            LOG_DEBUG(QString("%1 rows of %2/%3 deleted").arg(getEntityName()).arg(month).arg(year));
        }
        return deleted;
    }

    static QString uuidText(const QUuid& id) {
        return id.toString(QUuid::WithoutBraces);
    }

    // Null UUIDs are stored as NULL
    static QVariant uuidParam(const QUuid& id) {
        return id.isNull() ? QVariant() : QVariant(uuidText(id));
    }

    bool ensureInitialized() const {
        if (!m_dbService) {
            LOG_ERROR(QString("%1 repository used before initialize()").arg(getEntityName()));
            return false;
        }
        return true;
    }

private:
    static QMap<QString, QVariant> idKey(const QUuid& id) {
        QMap<QString, QVariant> params;
        params["id"] = uuidText(id);
        return params;
    }

    typename DbService<T>::QueryProcessor rowReader() {
        return [this](const QSqlQuery& query) -> T* { return createModelFromQuery(query); };
    }

    bool write(T* model, const QString& query, const QMap<QString, QVariant>& params, const char* verb) {
        if (!ensureInitialized()) {
            return false;
        }

        QStringList errors;
        if (!validateModel(model, errors)) {
            LOG_ERROR(QString("%1 %2 rejected: %3").arg(getEntityName(), QLatin1String(verb), errors.join(", ")));
            return false;
        }

        if (!m_dbService->executeModificationQuery(query, params)) {
            LOG_ERROR(QString("%1 %2 failed for %3: %4")
                     .arg(getEntityName(), QLatin1String(verb), uuidText(model->id()), lastError()));
            return false;
        }

        LOG_DEBUG(QString("%1 %2 ok: %3").arg(getEntityName(), QLatin1String(verb), uuidText(model->id())));
        return true;
    }

    DbService<T>* m_dbService;
};

#endif // BASEREPOSITORY_H
