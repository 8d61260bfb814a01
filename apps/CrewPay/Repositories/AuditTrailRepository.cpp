#include "AuditTrailRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

AuditTrailRepository::AuditTrailRepository(QObject *parent)
    : BaseRepository<AuditTrailEntryModel>(parent)
{
}

QString AuditTrailRepository::getEntityName() const
{
    return "AuditTrailEntry";
}

QString AuditTrailRepository::getTableName() const
{
    return "audit_trail";
}

QString AuditTrailRepository::buildSaveQuery()
{
    return "INSERT INTO audit_trail "
           "(id, flight_id, user_id, action, old_data, new_data, change_reason, created_at) "
           "VALUES "
           "(:id, :flight_id, :user_id, :action, :old_data, :new_data, :change_reason, :created_at)";
}

QString AuditTrailRepository::buildUpdateQuery()
{
    return QString();
}

bool AuditTrailRepository::update(AuditTrailEntryModel* model)
{
    LOG_ERROR(QString("Audit trail entries are append-only, refusing to update %1").arg(uuidText(model->id())));
    return false;
}

QMap<QString, QVariant> AuditTrailRepository::prepareParamsForSave(AuditTrailEntryModel* entry)
{
    QMap<QString, QVariant> params;
    params["id"] = uuidText(entry->id());
    params["flight_id"] = uuidParam(entry->flightId());
    params["user_id"] = uuidText(entry->userId());
    params["action"] = DutyTypes::auditActionToString(entry->action());
    params["old_data"] = entry->oldData().isEmpty() ? QVariant() : QVariant(ModelFactory::jsonToStorage(entry->oldData()));
    params["new_data"] = entry->newData().isEmpty() ? QVariant() : QVariant(ModelFactory::jsonToStorage(entry->newData()));
    params["change_reason"] = entry->changeReason().isEmpty() ? QVariant() : QVariant(entry->changeReason());
    params["created_at"] = ModelFactory::dateTimeToStorage(entry->createdAt());
    return params;
}

QMap<QString, QVariant> AuditTrailRepository::prepareParamsForUpdate(AuditTrailEntryModel* entry)
{
    return prepareParamsForSave(entry);
}

bool AuditTrailRepository::validateModel(AuditTrailEntryModel* model, QStringList& errors)
{
    return ModelFactory::validateAuditTrailEntryModel(model, errors);
}

AuditTrailEntryModel* AuditTrailRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createAuditTrailEntryFromQuery(query);
}

QList<QSharedPointer<AuditTrailEntryModel>> AuditTrailRepository::getByFlight(const QUuid &flightId)
{
    QMap<QString, QVariant> params;
    params["flight_id"] = uuidText(flightId);

    return select("SELECT * FROM audit_trail WHERE flight_id = :flight_id ORDER BY created_at, id",
                  params);
}

QList<QSharedPointer<AuditTrailEntryModel>> AuditTrailRepository::getByUser(const QUuid &userId)
{
    QMap<QString, QVariant> params;
    params["user_id"] = uuidText(userId);

    return select("SELECT * FROM audit_trail WHERE user_id = :user_id ORDER BY created_at, id",
                  params);
}
