#ifndef MODELFACTORY_H
#define MODELFACTORY_H

#include <QSqlQuery>
#include <QDate>
#include <QTime>
#include <QDateTime>
#include <QMap>
#include <QVariant>
#include <QUuid>
#include <QJsonObject>
#include <QJsonArray>
#include <QStringList>
#include <QSharedPointer>
#include "Models/DutyTypes.h"

class FlightDutyModel;
class LayoverRestPeriodModel;
class MonthlyCalculationModel;
class AuditTrailEntryModel;

/**
 * @brief Factory class for creating model instances
 *
 * Centralizes model creation so rows read from storage, rows built from a
 * roster and manually entered duties are initialized the same way. Also
 * holds the model validation rules and the JSON representation used by the
 * audit trail.
 */
class ModelFactory {
public:
    // Create models from query results
    static FlightDutyModel* createFlightDutyFromQuery(const QSqlQuery& query);
    static LayoverRestPeriodModel* createLayoverRestPeriodFromQuery(const QSqlQuery& query);
    static MonthlyCalculationModel* createMonthlyCalculationFromQuery(const QSqlQuery& query);
    static AuditTrailEntryModel* createAuditTrailEntryFromQuery(const QSqlQuery& query);

    // Create default models
    static FlightDutyModel* createDefaultFlightDuty(const QUuid& userId = QUuid(), const QDate& date = QDate());
    static LayoverRestPeriodModel* createDefaultLayoverRestPeriod(const QUuid& userId = QUuid());
    static MonthlyCalculationModel* createDefaultMonthlyCalculation(const QUuid& userId = QUuid(), int month = 0, int year = 0);
    static AuditTrailEntryModel* createDefaultAuditTrailEntry(const QUuid& flightId, const QUuid& userId,
                                                              DutyTypes::AuditAction action);

    // Validation
    static bool validateFlightDutyModel(const FlightDutyModel* model, QStringList& errors);
    static bool validateLayoverRestPeriodModel(const LayoverRestPeriodModel* model, QStringList& errors);
    static bool validateMonthlyCalculationModel(const MonthlyCalculationModel* model, QStringList& errors);
    static bool validateAuditTrailEntryModel(const AuditTrailEntryModel* model, QStringList& errors);

    // Timestamps
    static void setCreationTimestamps(QObject* model);
    static void setUpdateTimestamps(QObject* model);

    // JSON
    static QJsonObject modelToJson(const FlightDutyModel* model);
    static QJsonObject modelToJson(const LayoverRestPeriodModel* model);
    static QJsonObject modelToJson(const MonthlyCalculationModel* model);
    static QJsonObject modelToJson(const AuditTrailEntryModel* model);

    static QJsonArray modelsToJsonArray(const QList<QSharedPointer<FlightDutyModel>>& models);
    static QJsonArray modelsToJsonArray(const QList<QSharedPointer<LayoverRestPeriodModel>>& models);
    static QJsonArray modelsToJsonArray(const QList<QSharedPointer<AuditTrailEntryModel>>& models);

    // Storage representations shared with the repositories
    static QString dateToStorage(const QDate& date);
    static QString timeToStorage(const QTime& time);
    static QString dateTimeToStorage(const QDateTime& dateTime);
    static QString stringListToStorage(const QStringList& values);
    static QString jsonToStorage(const QJsonObject& json);

private:
    // Helper method to set common base model fields
    template<typename T>
    static void setBaseModelFields(T* model, const QSqlQuery& query);

    // Helpers for query value extraction with default values
    static QUuid getUuidOrDefault(const QSqlQuery& query, const QString& fieldName, const QUuid& defaultValue = QUuid());
    static QString getStringOrDefault(const QSqlQuery& query, const QString& fieldName, const QString& defaultValue = QString());
    static int getIntOrDefault(const QSqlQuery& query, const QString& fieldName, int defaultValue = 0);
    static double getDoubleOrDefault(const QSqlQuery& query, const QString& fieldName, double defaultValue = 0.0);
    static bool getBoolOrDefault(const QSqlQuery& query, const QString& fieldName, bool defaultValue = false);
    static QDate getDateOrDefault(const QSqlQuery& query, const QString& fieldName, const QDate& defaultValue = QDate());
    static QTime getTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QTime& defaultValue = QTime());
    static QDateTime getDateTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QDateTime& defaultValue = QDateTime());
    static QJsonObject getJsonObjectOrDefault(const QSqlQuery& query, const QString& fieldName, const QJsonObject& defaultValue = QJsonObject());
    static QStringList getStringListOrDefault(const QSqlQuery& query, const QString& fieldName);
};

#endif // MODELFACTORY_H
