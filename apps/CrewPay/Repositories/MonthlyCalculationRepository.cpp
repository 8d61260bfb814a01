#include "MonthlyCalculationRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

namespace {

const char* const kTotalColumns[] = {
    "basic_salary", "housing_allowance", "transport_allowance", "total_duty_hours",
    "flight_pay", "total_rest_hours", "per_diem_pay", "asby_count", "asby_pay",
    "total_fixed", "total_variable", "total_salary"
};

}

MonthlyCalculationRepository::MonthlyCalculationRepository(QObject *parent)
    : BaseRepository<MonthlyCalculationModel>(parent)
{
}

QString MonthlyCalculationRepository::getEntityName() const
{
    return "MonthlyCalculation";
}

QString MonthlyCalculationRepository::getTableName() const
{
    return "monthly_calculations";
}

QString MonthlyCalculationRepository::buildSaveQuery()
{
    return "INSERT INTO monthly_calculations "
           "(id, user_id, month, year, basic_salary, housing_allowance, transport_allowance, "
           "total_duty_hours, flight_pay, total_rest_hours, per_diem_pay, asby_count, asby_pay, "
           "total_fixed, total_variable, total_salary, created_at, updated_at) "
           "VALUES "
           "(:id, :user_id, :month, :year, :basic_salary, :housing_allowance, :transport_allowance, "
           ":total_duty_hours, :flight_pay, :total_rest_hours, :per_diem_pay, :asby_count, :asby_pay, "
           ":total_fixed, :total_variable, :total_salary, :created_at, :updated_at)";
}

QString MonthlyCalculationRepository::buildUpdateQuery()
{
    QStringList assignments;
    for (const char* column : kTotalColumns) {
        assignments.append(QString("%1 = :%1").arg(QLatin1String(column)));
    }
    return QString("UPDATE monthly_calculations SET %1 WHERE id = :id").arg(assignments.join(", "));
}

QMap<QString, QVariant> MonthlyCalculationRepository::prepareParamsForSave(MonthlyCalculationModel* calculation)
{
    QMap<QString, QVariant> params = prepareParamsForUpdate(calculation);
    params["user_id"] = uuidText(calculation->userId());
    params["month"] = calculation->month();
    params["year"] = calculation->year();
    params["created_at"] = ModelFactory::dateTimeToStorage(calculation->createdAt());
    return params;
}

QMap<QString, QVariant> MonthlyCalculationRepository::prepareParamsForUpdate(MonthlyCalculationModel* calculation)
{
    QMap<QString, QVariant> params;
    params["id"] = uuidText(calculation->id());
    params["basic_salary"] = calculation->basicSalary();
    params["housing_allowance"] = calculation->housingAllowance();
    params["transport_allowance"] = calculation->transportAllowance();
    params["total_duty_hours"] = calculation->totalDutyHours();
    params["flight_pay"] = calculation->flightPay();
    params["total_rest_hours"] = calculation->totalRestHours();
    params["per_diem_pay"] = calculation->perDiemPay();
    params["asby_count"] = calculation->asbyCount();
    params["asby_pay"] = calculation->asbyPay();
    params["total_fixed"] = calculation->totalFixed();
    params["total_variable"] = calculation->totalVariable();
    params["total_salary"] = calculation->totalSalary();
    params["updated_at"] = ModelFactory::dateTimeToStorage(calculation->updatedAt());
    return params;
}

bool MonthlyCalculationRepository::validateModel(MonthlyCalculationModel* model, QStringList& errors)
{
    return ModelFactory::validateMonthlyCalculationModel(model, errors);
}

MonthlyCalculationModel* MonthlyCalculationRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createMonthlyCalculationFromQuery(query);
}

bool MonthlyCalculationRepository::upsert(MonthlyCalculationModel* calculation)
{
    if (!ensureInitialized()) {
        return false;
    }

    QStringList validationErrors;
    if (!validateModel(calculation, validationErrors)) {
        LOG_ERROR(QString("Cannot store monthly calculation: %1").arg(validationErrors.join(", ")));
        return false;
    }

    // ON CONFLICT ... DO UPDATE is understood by PostgreSQL and SQLite 3.24+
    // updated_at only moves when a total changed
    QStringList assignments;
    QStringList unchanged;
    for (const char* column : kTotalColumns) {
        assignments.append(QString("%1 = excluded.%1").arg(QLatin1String(column)));
        unchanged.append(QString("monthly_calculations.%1 = excluded.%1").arg(QLatin1String(column)));
    }
    assignments.append(QString("updated_at = CASE WHEN %1 THEN monthly_calculations.updated_at "
                               "ELSE excluded.updated_at END").arg(unchanged.join(" AND ")));

    const QString query = buildSaveQuery()
        + " ON CONFLICT (user_id, month, year) DO UPDATE SET "
        + assignments.join(", ");

    const bool success = modify(query, prepareParamsForSave(calculation));
    if (success) {
        LOG_INFO(QString("Stored monthly calculation %1/%2: total salary %3")
                .arg(calculation->month())
                .arg(calculation->year())
                .arg(calculation->totalSalary(), 0, 'f', 2));
    }
    return success;
}

QSharedPointer<MonthlyCalculationModel> MonthlyCalculationRepository::getByMonth(const QUuid &userId, int month, int year)
{
    return selectOne(QString("SELECT * FROM monthly_calculations WHERE %1").arg(monthFilter()),
                     monthKey(userId, month, year));
}

bool MonthlyCalculationRepository::deleteByMonth(const QUuid &userId, int month, int year)
{
    return deleteMonth(userId, month, year);
}
