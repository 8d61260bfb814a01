#ifndef AUDITTRAILREPOSITORY_H
#define AUDITTRAILREPOSITORY_H

#include "BaseRepository.h"
#include "Models/AuditTrailEntryModel.h"

/**
 * @brief Append-only store of duty changes
 *
 * Entries outlive the duty they describe; update() is rejected.
 */
class AuditTrailRepository : public BaseRepository<AuditTrailEntryModel>
{
    Q_OBJECT
public:
    explicit AuditTrailRepository(QObject *parent = nullptr);

    bool update(AuditTrailEntryModel* model) override;

    // Oldest first
    QList<QSharedPointer<AuditTrailEntryModel>> getByFlight(const QUuid &flightId);
    QList<QSharedPointer<AuditTrailEntryModel>> getByUser(const QUuid &userId);

protected:
    QString getEntityName() const override;
    QString getTableName() const override;
    QString buildSaveQuery() override;
    QString buildUpdateQuery() override;
    QMap<QString, QVariant> prepareParamsForSave(AuditTrailEntryModel* model) override;
    QMap<QString, QVariant> prepareParamsForUpdate(AuditTrailEntryModel* model) override;
    bool validateModel(AuditTrailEntryModel* model, QStringList& errors) override;
    AuditTrailEntryModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // AUDITTRAILREPOSITORY_H
