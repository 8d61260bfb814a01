#include "FlightDutyRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

FlightDutyRepository::FlightDutyRepository(QObject *parent)
    : BaseRepository<FlightDutyModel>(parent)
{
}

QString FlightDutyRepository::getEntityName() const
{
    return "FlightDuty";
}

QString FlightDutyRepository::getTableName() const
{
    return "flight_duties";
}

QString FlightDutyRepository::buildSaveQuery()
{
    return "INSERT INTO flight_duties "
           "(id, user_id, duty_date, month, year, flight_numbers, sectors, duty_type, "
           "report_time, debrief_time, is_cross_day, duty_hours, flight_pay, data_source, "
           "original_data, last_edited_at, last_edited_by, created_at, updated_at) "
           "VALUES "
           "(:id, :user_id, :duty_date, :month, :year, :flight_numbers, :sectors, :duty_type, "
           ":report_time, :debrief_time, :is_cross_day, :duty_hours, :flight_pay, :data_source, "
           ":original_data, :last_edited_at, :last_edited_by, :created_at, :updated_at)";
}

QString FlightDutyRepository::buildUpdateQuery()
{
    // user_id and created_at never change
    return "UPDATE flight_duties SET "
           "duty_date = :duty_date, "
           "month = :month, "
           "year = :year, "
           "flight_numbers = :flight_numbers, "
           "sectors = :sectors, "
           "duty_type = :duty_type, "
           "report_time = :report_time, "
           "debrief_time = :debrief_time, "
           "is_cross_day = :is_cross_day, "
           "duty_hours = :duty_hours, "
           "flight_pay = :flight_pay, "
           "data_source = :data_source, "
           "original_data = :original_data, "
           "last_edited_at = :last_edited_at, "
           "last_edited_by = :last_edited_by, "
           "updated_at = :updated_at "
           "WHERE id = :id";
}

QMap<QString, QVariant> FlightDutyRepository::prepareParamsForSave(FlightDutyModel* duty)
{
    QMap<QString, QVariant> params = prepareParamsForUpdate(duty);
    params["user_id"] = uuidText(duty->userId());
    params["created_at"] = ModelFactory::dateTimeToStorage(duty->createdAt());
    return params;
}

QMap<QString, QVariant> FlightDutyRepository::prepareParamsForUpdate(FlightDutyModel* duty)
{
    QMap<QString, QVariant> params;
    params["id"] = uuidText(duty->id());
    params["duty_date"] = ModelFactory::dateToStorage(duty->date());
    params["month"] = duty->month();
    params["year"] = duty->year();
    params["flight_numbers"] = ModelFactory::stringListToStorage(duty->flightNumbers());
    params["sectors"] = ModelFactory::stringListToStorage(duty->sectors());
    params["duty_type"] = DutyTypes::dutyTypeToString(duty->dutyType());
    params["report_time"] = duty->reportTime().isValid() ? QVariant(ModelFactory::timeToStorage(duty->reportTime())) : QVariant();
    params["debrief_time"] = duty->debriefTime().isValid() ? QVariant(ModelFactory::timeToStorage(duty->debriefTime())) : QVariant();
    params["is_cross_day"] = duty->isCrossDay();
    params["duty_hours"] = duty->dutyHours();
    params["flight_pay"] = duty->flightPay();
    params["data_source"] = DutyTypes::dataSourceToString(duty->dataSource());
    params["original_data"] = ModelFactory::jsonToStorage(duty->originalData());
    params["last_edited_at"] = duty->lastEditedAt().isValid() ? QVariant(ModelFactory::dateTimeToStorage(duty->lastEditedAt())) : QVariant();
    params["last_edited_by"] = uuidParam(duty->lastEditedBy());
    params["updated_at"] = ModelFactory::dateTimeToStorage(duty->updatedAt());
    return params;
}

bool FlightDutyRepository::validateModel(FlightDutyModel* model, QStringList& errors)
{
    return ModelFactory::validateFlightDutyModel(model, errors);
}

FlightDutyModel* FlightDutyRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createFlightDutyFromQuery(query);
}

QList<QSharedPointer<FlightDutyModel>> FlightDutyRepository::getByMonth(const QUuid &userId, int month, int year)
{
    auto duties = selectMonth(userId, month, year, "duty_date, report_time, id");
    LOG_DEBUG(QString("Retrieved %1 flight duties for %2/%3").arg(duties.size()).arg(month).arg(year));
    return duties;
}

QList<QSharedPointer<FlightDutyModel>> FlightDutyRepository::getByDateRange(const QUuid &userId,
                                                                            const QDate &from,
                                                                            const QDate &to)
{
    QMap<QString, QVariant> params;
    params["user_id"] = uuidText(userId);
    params["from_date"] = ModelFactory::dateToStorage(from);
    params["to_date"] = ModelFactory::dateToStorage(to);

    // Dates are stored as yyyy-MM-dd, so text order is date order
    return select("SELECT * FROM flight_duties "
                  "WHERE user_id = :user_id AND duty_date >= :from_date AND duty_date <= :to_date "
                  "ORDER BY duty_date, report_time, id",
                  params);
}

QList<QSharedPointer<FlightDutyModel>> FlightDutyRepository::getByMonthWithLookahead(const QUuid &userId,
                                                                                     int month,
                                                                                     int year,
                                                                                     int lookaheadDays)
{
    const QDate first(year, month, 1);
    if (!first.isValid()) {
        LOG_ERROR(QString("Invalid month %1/%2").arg(month).arg(year));
        return QList<QSharedPointer<FlightDutyModel>>();
    }

    const QDate last = first.addMonths(1).addDays(qMax(0, lookaheadDays) - 1);
    return getByDateRange(userId, first, last);
}

int FlightDutyRepository::countByMonth(const QUuid &userId, int month, int year)
{
    return countMonth(userId, month, year);
}

bool FlightDutyRepository::deleteByMonth(const QUuid &userId, int month, int year)
{
    const bool success = deleteMonth(userId, month, year);
    if (success) {
        LOG_INFO(QString("Deleted flight duties for %1/%2").arg(month).arg(year));
    }
    return success;
}
