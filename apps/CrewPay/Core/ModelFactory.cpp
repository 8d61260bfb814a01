#include "ModelFactory.h"

#include "Models/FlightDutyModel.h"
#include "Models/LayoverRestPeriodModel.h"
#include "Models/MonthlyCalculationModel.h"
#include "Models/AuditTrailEntryModel.h"

#include <QJsonDocument>
#include <QMetaObject>
#include <QMetaProperty>
#include <QSqlRecord>
#include "logger/logger.h"

//------------------------------------------------------------------------------
// Model creation from database query results
//------------------------------------------------------------------------------

FlightDutyModel* ModelFactory::createFlightDutyFromQuery(const QSqlQuery& query) {
    FlightDutyModel* duty = new FlightDutyModel();

    duty->setId(getUuidOrDefault(query, "id"));
    duty->setUserId(getUuidOrDefault(query, "user_id"));
    duty->setDate(getDateOrDefault(query, "duty_date"));
    duty->setMonth(getIntOrDefault(query, "month"));
    duty->setYear(getIntOrDefault(query, "year"));
    duty->setFlightNumbers(getStringListOrDefault(query, "flight_numbers"));
    duty->setSectors(getStringListOrDefault(query, "sectors"));
    duty->setDutyType(DutyTypes::dutyTypeFromString(getStringOrDefault(query, "duty_type")));
    duty->setReportTime(getTimeOrDefault(query, "report_time"));
    duty->setDebriefTime(getTimeOrDefault(query, "debrief_time"));
    duty->setIsCrossDay(getBoolOrDefault(query, "is_cross_day"));
    duty->setDutyHours(getDoubleOrDefault(query, "duty_hours"));
    duty->setFlightPay(getDoubleOrDefault(query, "flight_pay"));
    duty->setDataSource(DutyTypes::dataSourceFromString(getStringOrDefault(query, "data_source", "manual")));
    duty->setOriginalData(getJsonObjectOrDefault(query, "original_data"));
    duty->setLastEditedAt(getDateTimeOrDefault(query, "last_edited_at"));
    duty->setLastEditedBy(getUuidOrDefault(query, "last_edited_by"));

    setBaseModelFields(duty, query);

    return duty;
}

LayoverRestPeriodModel* ModelFactory::createLayoverRestPeriodFromQuery(const QSqlQuery& query) {
    LayoverRestPeriodModel* period = new LayoverRestPeriodModel();

    period->setId(getUuidOrDefault(query, "id"));
    period->setUserId(getUuidOrDefault(query, "user_id"));
    period->setOutboundFlightId(getUuidOrDefault(query, "outbound_flight_id"));
    period->setInboundFlightId(getUuidOrDefault(query, "inbound_flight_id"));
    period->setRestStartTime(getDateTimeOrDefault(query, "rest_start_time"));
    period->setRestEndTime(getDateTimeOrDefault(query, "rest_end_time"));
    period->setRestHours(getDoubleOrDefault(query, "rest_hours"));
    period->setPerDiemPay(getDoubleOrDefault(query, "per_diem_pay"));
    period->setMonth(getIntOrDefault(query, "month"));
    period->setYear(getIntOrDefault(query, "year"));

    setBaseModelFields(period, query);

    return period;
}

MonthlyCalculationModel* ModelFactory::createMonthlyCalculationFromQuery(const QSqlQuery& query) {
    MonthlyCalculationModel* calculation = new MonthlyCalculationModel();

    calculation->setId(getUuidOrDefault(query, "id"));
    calculation->setUserId(getUuidOrDefault(query, "user_id"));
    calculation->setMonth(getIntOrDefault(query, "month"));
    calculation->setYear(getIntOrDefault(query, "year"));
    calculation->setBasicSalary(getDoubleOrDefault(query, "basic_salary"));
    calculation->setHousingAllowance(getDoubleOrDefault(query, "housing_allowance"));
    calculation->setTransportAllowance(getDoubleOrDefault(query, "transport_allowance"));
    calculation->setTotalDutyHours(getDoubleOrDefault(query, "total_duty_hours"));
    calculation->setFlightPay(getDoubleOrDefault(query, "flight_pay"));
    calculation->setTotalRestHours(getDoubleOrDefault(query, "total_rest_hours"));
    calculation->setPerDiemPay(getDoubleOrDefault(query, "per_diem_pay"));
    calculation->setAsbyCount(getIntOrDefault(query, "asby_count"));
    calculation->setAsbyPay(getDoubleOrDefault(query, "asby_pay"));
    calculation->setTotalFixed(getDoubleOrDefault(query, "total_fixed"));
    calculation->setTotalVariable(getDoubleOrDefault(query, "total_variable"));
    calculation->setTotalSalary(getDoubleOrDefault(query, "total_salary"));

    setBaseModelFields(calculation, query);

    return calculation;
}

AuditTrailEntryModel* ModelFactory::createAuditTrailEntryFromQuery(const QSqlQuery& query) {
    AuditTrailEntryModel* entry = new AuditTrailEntryModel();

    entry->setId(getUuidOrDefault(query, "id"));
    entry->setFlightId(getUuidOrDefault(query, "flight_id"));
    entry->setUserId(getUuidOrDefault(query, "user_id"));
    entry->setAction(DutyTypes::auditActionFromString(getStringOrDefault(query, "action")));
    entry->setOldData(getJsonObjectOrDefault(query, "old_data"));
    entry->setNewData(getJsonObjectOrDefault(query, "new_data"));
    entry->setChangeReason(getStringOrDefault(query, "change_reason"));

    setBaseModelFields(entry, query);

    return entry;
}

//------------------------------------------------------------------------------
// Default model creation
//------------------------------------------------------------------------------

FlightDutyModel* ModelFactory::createDefaultFlightDuty(const QUuid& userId, const QDate& date) {
    FlightDutyModel* duty = new FlightDutyModel();

    duty->setId(QUuid::createUuid());

    if (!userId.isNull()) {
        duty->setUserId(userId);
    }

    if (date.isValid()) {
        duty->setDate(date);
        duty->setMonth(date.month());
        duty->setYear(date.year());
    }

    duty->setDataSource(DutyTypes::DataSource::Manual);
    duty->setOriginalData(QJsonObject());

    setCreationTimestamps(duty);

    return duty;
}

LayoverRestPeriodModel* ModelFactory::createDefaultLayoverRestPeriod(const QUuid& userId) {
    LayoverRestPeriodModel* period = new LayoverRestPeriodModel();

    period->setId(QUuid::createUuid());

    if (!userId.isNull()) {
        period->setUserId(userId);
    }

    setCreationTimestamps(period);

    return period;
}

MonthlyCalculationModel* ModelFactory::createDefaultMonthlyCalculation(const QUuid& userId, int month, int year) {
    MonthlyCalculationModel* calculation = new MonthlyCalculationModel();

    calculation->setId(QUuid::createUuid());
    calculation->setUserId(userId);
    calculation->setMonth(month);
    calculation->setYear(year);

    setCreationTimestamps(calculation);

    return calculation;
}

AuditTrailEntryModel* ModelFactory::createDefaultAuditTrailEntry(const QUuid& flightId, const QUuid& userId,
                                                                 DutyTypes::AuditAction action) {
    AuditTrailEntryModel* entry = new AuditTrailEntryModel();

    entry->setId(QUuid::createUuid());
    entry->setFlightId(flightId);
    entry->setUserId(userId);
    entry->setAction(action);

    setCreationTimestamps(entry);

    return entry;
}

//------------------------------------------------------------------------------
// Model validation
//------------------------------------------------------------------------------

bool ModelFactory::validateFlightDutyModel(const FlightDutyModel* model, QStringList& errors) {
    errors.clear();

    if (model->id().isNull()) {
        errors.append("ID is required");
    }

    if (model->userId().isNull()) {
        errors.append("User ID is required");
    }

    if (!model->date().isValid()) {
        errors.append("Duty date is required and must be valid");
    }

    if (model->month() < 1 || model->month() > 12) {
        errors.append("Month must be between 1 and 12");
    }

    if (model->year() < 2000) {
        errors.append("Year is required");
    }

    if (model->dutyHours() < 0) {
        errors.append("Duty hours cannot be negative");
    }

    if (model->flightPay() < 0) {
        errors.append("Flight pay cannot be negative");
    }

    return errors.isEmpty();
}

bool ModelFactory::validateLayoverRestPeriodModel(const LayoverRestPeriodModel* model, QStringList& errors) {
    errors.clear();

    if (model->id().isNull()) {
        errors.append("ID is required");
    }

    if (model->userId().isNull()) {
        errors.append("User ID is required");
    }

    if (model->outboundFlightId().isNull() || model->inboundFlightId().isNull()) {
        errors.append("Outbound and inbound flight IDs are required");
    }

    if (model->outboundFlightId() == model->inboundFlightId()) {
        errors.append("Outbound and inbound flights must differ");
    }

    if (model->restHours() < 0) {
        errors.append("Rest hours cannot be negative");
    }

    if (model->restStartTime().isValid() && model->restEndTime().isValid()
        && model->restEndTime() < model->restStartTime()) {
        errors.append("Rest must end after it starts");
    }

    return errors.isEmpty();
}

bool ModelFactory::validateMonthlyCalculationModel(const MonthlyCalculationModel* model, QStringList& errors) {
    errors.clear();

    if (model->userId().isNull()) {
        errors.append("User ID is required");
    }

    if (model->month() < 1 || model->month() > 12) {
        errors.append("Month must be between 1 and 12");
    }

    if (model->year() < 2000) {
        errors.append("Year is required");
    }

    return errors.isEmpty();
}

bool ModelFactory::validateAuditTrailEntryModel(const AuditTrailEntryModel* model, QStringList& errors) {
    errors.clear();

    if (model->id().isNull()) {
        errors.append("ID is required");
    }

    if (model->flightId().isNull()) {
        errors.append("Flight ID is required");
    }

    if (model->userId().isNull()) {
        errors.append("User ID is required");
    }

    return errors.isEmpty();
}

//------------------------------------------------------------------------------
// Timestamps
//------------------------------------------------------------------------------

void ModelFactory::setCreationTimestamps(QObject* model) {
    QDateTime now = QDateTime::currentDateTimeUtc();

    // Use introspection to set timestamps if the model has these properties
    const QMetaObject* metaObject = model->metaObject();

    if (metaObject->indexOfProperty("createdAt") != -1) {
        model->setProperty("createdAt", now);
    }

    if (metaObject->indexOfProperty("updatedAt") != -1) {
        model->setProperty("updatedAt", now);
    }
}

void ModelFactory::setUpdateTimestamps(QObject* model) {
    const QMetaObject* metaObject = model->metaObject();

    if (metaObject->indexOfProperty("updatedAt") != -1) {
        model->setProperty("updatedAt", QDateTime::currentDateTimeUtc());
    }
}

//------------------------------------------------------------------------------
// JSON
//------------------------------------------------------------------------------

QJsonObject ModelFactory::modelToJson(const FlightDutyModel* model) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id().toString(QUuid::WithoutBraces);
    json["user_id"] = model->userId().toString(QUuid::WithoutBraces);
    json["date"] = dateToStorage(model->date());
    json["month"] = model->month();
    json["year"] = model->year();
    json["flight_numbers"] = QJsonArray::fromStringList(model->flightNumbers());
    json["sectors"] = QJsonArray::fromStringList(model->sectors());
    json["duty_type"] = DutyTypes::dutyTypeToString(model->dutyType());
    json["report_time"] = timeToStorage(model->reportTime());
    json["debrief_time"] = timeToStorage(model->debriefTime());
    json["is_cross_day"] = model->isCrossDay();
    json["duty_hours"] = model->dutyHours();
    json["flight_pay"] = model->flightPay();
    json["data_source"] = DutyTypes::dataSourceToString(model->dataSource());

    if (model->lastEditedAt().isValid()) {
        json["last_edited_at"] = dateTimeToStorage(model->lastEditedAt());
    }

    if (!model->lastEditedBy().isNull()) {
        json["last_edited_by"] = model->lastEditedBy().toString(QUuid::WithoutBraces);
    }

    return json;
}

QJsonObject ModelFactory::modelToJson(const LayoverRestPeriodModel* model) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id().toString(QUuid::WithoutBraces);
    json["user_id"] = model->userId().toString(QUuid::WithoutBraces);
    json["outbound_flight_id"] = model->outboundFlightId().toString(QUuid::WithoutBraces);
    json["inbound_flight_id"] = model->inboundFlightId().toString(QUuid::WithoutBraces);
    json["rest_start_time"] = dateTimeToStorage(model->restStartTime());
    json["rest_end_time"] = dateTimeToStorage(model->restEndTime());
    json["rest_hours"] = model->restHours();
    json["per_diem_pay"] = model->perDiemPay();
    json["month"] = model->month();
    json["year"] = model->year();
    return json;
}

QJsonObject ModelFactory::modelToJson(const MonthlyCalculationModel* model) {
    if (!model) {
        return QJsonObject();
    }

    // Timestamps are left out so two recalculations of the same data compare equal
    QJsonObject json;
    json["user_id"] = model->userId().toString(QUuid::WithoutBraces);
    json["month"] = model->month();
    json["year"] = model->year();
    json["basic_salary"] = model->basicSalary();
    json["housing_allowance"] = model->housingAllowance();
    json["transport_allowance"] = model->transportAllowance();
    json["total_duty_hours"] = model->totalDutyHours();
    json["flight_pay"] = model->flightPay();
    json["total_rest_hours"] = model->totalRestHours();
    json["per_diem_pay"] = model->perDiemPay();
    json["asby_count"] = model->asbyCount();
    json["asby_pay"] = model->asbyPay();
    json["total_fixed"] = model->totalFixed();
    json["total_variable"] = model->totalVariable();
    json["total_salary"] = model->totalSalary();
    return json;
}

QJsonObject ModelFactory::modelToJson(const AuditTrailEntryModel* model) {
    if (!model) {
        return QJsonObject();
    }

    QJsonObject json;
    json["id"] = model->id().toString(QUuid::WithoutBraces);
    json["flight_id"] = model->flightId().toString(QUuid::WithoutBraces);
    json["user_id"] = model->userId().toString(QUuid::WithoutBraces);
    json["action"] = DutyTypes::auditActionToString(model->action());
    json["old_data"] = model->oldData();
    json["new_data"] = model->newData();
    json["change_reason"] = model->changeReason();
    json["created_at"] = dateTimeToStorage(model->createdAt());
    return json;
}

QJsonArray ModelFactory::modelsToJsonArray(const QList<QSharedPointer<FlightDutyModel>>& models) {
    QJsonArray array;
    for (const auto& model : models) {
        array.append(modelToJson(model.data()));
    }
    return array;
}

QJsonArray ModelFactory::modelsToJsonArray(const QList<QSharedPointer<LayoverRestPeriodModel>>& models) {
    QJsonArray array;
    for (const auto& model : models) {
        array.append(modelToJson(model.data()));
    }
    return array;
}

QJsonArray ModelFactory::modelsToJsonArray(const QList<QSharedPointer<AuditTrailEntryModel>>& models) {
    QJsonArray array;
    for (const auto& model : models) {
        array.append(modelToJson(model.data()));
    }
    return array;
}

//------------------------------------------------------------------------------
// Storage representations
//------------------------------------------------------------------------------

QString ModelFactory::dateToStorage(const QDate& date) {
    return date.isValid() ? date.toString(Qt::ISODate) : QString();
}

QString ModelFactory::timeToStorage(const QTime& time) {
    return time.isValid() ? time.toString("HH:mm") : QString();
}

QString ModelFactory::dateTimeToStorage(const QDateTime& dateTime) {
    return dateTime.isValid() ? dateTime.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QString ModelFactory::stringListToStorage(const QStringList& values) {
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(values)).toJson(QJsonDocument::Compact));
}

QString ModelFactory::jsonToStorage(const QJsonObject& json) {
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

template<typename T>
void ModelFactory::setBaseModelFields(T* model, const QSqlQuery& query) {
    // Not every model carries updatedAt, so go through the property system
    const QMetaObject* metaObject = model->metaObject();

    const QDateTime createdAt = getDateTimeOrDefault(query, "created_at");
    if (createdAt.isValid() && metaObject->indexOfProperty("createdAt") != -1) {
        model->setProperty("createdAt", createdAt);
    }

    const QDateTime updatedAt = getDateTimeOrDefault(query, "updated_at");
    if (updatedAt.isValid() && metaObject->indexOfProperty("updatedAt") != -1) {
        model->setProperty("updatedAt", updatedAt);
    }
}

QUuid ModelFactory::getUuidOrDefault(const QSqlQuery& query, const QString& fieldName, const QUuid& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QUuid uuid = QUuid(query.value(fieldName).toString());
        return uuid.isNull() ? defaultValue : uuid;
    }
    return defaultValue;
}

QString ModelFactory::getStringOrDefault(const QSqlQuery& query, const QString& fieldName, const QString& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        return query.value(fieldName).toString();
    }
    return defaultValue;
}

int ModelFactory::getIntOrDefault(const QSqlQuery& query, const QString& fieldName, int defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        bool ok;
        int value = query.value(fieldName).toInt(&ok);
        return ok ? value : defaultValue;
    }
    return defaultValue;
}

double ModelFactory::getDoubleOrDefault(const QSqlQuery& query, const QString& fieldName, double defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        bool ok;
        double value = query.value(fieldName).toDouble(&ok);
        return ok ? value : defaultValue;
    }
    return defaultValue;
}

bool ModelFactory::getBoolOrDefault(const QSqlQuery& query, const QString& fieldName, bool defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        // PostgreSQL returns a bool, SQLite an integer
        QVariant value = query.value(fieldName);
        if (value.typeId() == QMetaType::QString) {
            QString str = value.toString().toLower();
            return str == "true" || str == "t" || str == "1" || str == "yes" || str == "y";
        }
        return value.toBool();
    }
    return defaultValue;
}

QDate ModelFactory::getDateOrDefault(const QSqlQuery& query, const QString& fieldName, const QDate& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QDate date = QDate::fromString(query.value(fieldName).toString().left(10), Qt::ISODate);
        return date.isValid() ? date : defaultValue;
    }
    return defaultValue;
}

QTime ModelFactory::getTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QTime& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QTime time = QTime::fromString(query.value(fieldName).toString().left(5), "HH:mm");
        return time.isValid() ? time : defaultValue;
    }
    return defaultValue;
}

QDateTime ModelFactory::getDateTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QDateTime& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QDateTime dt = QDateTime::fromString(query.value(fieldName).toString(), Qt::ISODateWithMs);
        return dt.isValid() ? dt : defaultValue;
    }
    return defaultValue;
}

QJsonObject ModelFactory::getJsonObjectOrDefault(const QSqlQuery& query, const QString& fieldName, const QJsonObject& defaultValue) {
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QJsonDocument doc = QJsonDocument::fromJson(query.value(fieldName).toByteArray());
        if (doc.isObject()) {
            return doc.object();
        }
    }
    return defaultValue;
}

QStringList ModelFactory::getStringListOrDefault(const QSqlQuery& query, const QString& fieldName) {
    QStringList values;
    if (query.record().indexOf(fieldName) != -1 && !query.value(fieldName).isNull()) {
        QJsonDocument doc = QJsonDocument::fromJson(query.value(fieldName).toByteArray());
        if (doc.isArray()) {
            for (const QJsonValue& value : doc.array()) {
                values.append(value.toString());
            }
        }
    }
    return values;
}
