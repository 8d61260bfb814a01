#include "LayoverRestPeriodRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

LayoverRestPeriodRepository::LayoverRestPeriodRepository(QObject *parent)
    : BaseRepository<LayoverRestPeriodModel>(parent)
{
}

QString LayoverRestPeriodRepository::getEntityName() const
{
    return "LayoverRestPeriod";
}

QString LayoverRestPeriodRepository::getTableName() const
{
    return "layover_rest_periods";
}

QString LayoverRestPeriodRepository::buildSaveQuery()
{
    return "INSERT INTO layover_rest_periods "
           "(id, user_id, outbound_flight_id, inbound_flight_id, rest_start_time, rest_end_time, "
           "rest_hours, per_diem_pay, month, year, created_at) "
           "VALUES "
           "(:id, :user_id, :outbound_flight_id, :inbound_flight_id, :rest_start_time, :rest_end_time, "
           ":rest_hours, :per_diem_pay, :month, :year, :created_at)";
}

QString LayoverRestPeriodRepository::buildUpdateQuery()
{
    return "UPDATE layover_rest_periods SET "
           "outbound_flight_id = :outbound_flight_id, "
           "inbound_flight_id = :inbound_flight_id, "
           "rest_start_time = :rest_start_time, "
           "rest_end_time = :rest_end_time, "
           "rest_hours = :rest_hours, "
           "per_diem_pay = :per_diem_pay, "
           "month = :month, "
           "year = :year "
           "WHERE id = :id";
}

QMap<QString, QVariant> LayoverRestPeriodRepository::prepareParamsForSave(LayoverRestPeriodModel* period)
{
    QMap<QString, QVariant> params = prepareParamsForUpdate(period);
    params["user_id"] = uuidText(period->userId());
    params["created_at"] = ModelFactory::dateTimeToStorage(period->createdAt());
    return params;
}

QMap<QString, QVariant> LayoverRestPeriodRepository::prepareParamsForUpdate(LayoverRestPeriodModel* period)
{
    QMap<QString, QVariant> params;
    params["id"] = uuidText(period->id());
    params["outbound_flight_id"] = uuidText(period->outboundFlightId());
    params["inbound_flight_id"] = uuidText(period->inboundFlightId());
    params["rest_start_time"] = ModelFactory::dateTimeToStorage(period->restStartTime());
    params["rest_end_time"] = ModelFactory::dateTimeToStorage(period->restEndTime());
    params["rest_hours"] = period->restHours();
    params["per_diem_pay"] = period->perDiemPay();
    params["month"] = period->month();
    params["year"] = period->year();
    return params;
}

bool LayoverRestPeriodRepository::validateModel(LayoverRestPeriodModel* model, QStringList& errors)
{
    return ModelFactory::validateLayoverRestPeriodModel(model, errors);
}

LayoverRestPeriodModel* LayoverRestPeriodRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createLayoverRestPeriodFromQuery(query);
}

QList<QSharedPointer<LayoverRestPeriodModel>> LayoverRestPeriodRepository::getByMonth(const QUuid &userId, int month, int year)
{
    return selectMonth(userId, month, year, "rest_start_time, id");
}

QList<QSharedPointer<LayoverRestPeriodModel>> LayoverRestPeriodRepository::getByFlight(const QUuid &flightId)
{
    QMap<QString, QVariant> params;
    params["outbound_id"] = uuidText(flightId);
    params["inbound_id"] = uuidText(flightId);

    return select("SELECT * FROM layover_rest_periods "
                  "WHERE outbound_flight_id = :outbound_id OR inbound_flight_id = :inbound_id "
                  "ORDER BY rest_start_time, id",
                  params);
}

bool LayoverRestPeriodRepository::deleteByMonth(const QUuid &userId, int month, int year)
{
    return deleteMonth(userId, month, year);
}
