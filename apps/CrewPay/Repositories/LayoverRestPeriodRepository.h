#ifndef LAYOVERRESTPERIODREPOSITORY_H
#define LAYOVERRESTPERIODREPOSITORY_H

#include "BaseRepository.h"
#include "Models/LayoverRestPeriodModel.h"

class LayoverRestPeriodRepository : public BaseRepository<LayoverRestPeriodModel>
{
    Q_OBJECT
public:
    explicit LayoverRestPeriodRepository(QObject *parent = nullptr);

    QList<QSharedPointer<LayoverRestPeriodModel>> getByMonth(const QUuid &userId, int month, int year);
    // Rest periods in which the duty is either leg
    QList<QSharedPointer<LayoverRestPeriodModel>> getByFlight(const QUuid &flightId);
    bool deleteByMonth(const QUuid &userId, int month, int year);

protected:
    QString getEntityName() const override;
    QString getTableName() const override;
    QString buildSaveQuery() override;
    QString buildUpdateQuery() override;
    QMap<QString, QVariant> prepareParamsForSave(LayoverRestPeriodModel* model) override;
    QMap<QString, QVariant> prepareParamsForUpdate(LayoverRestPeriodModel* model) override;
    bool validateModel(LayoverRestPeriodModel* model, QStringList& errors) override;
    LayoverRestPeriodModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // LAYOVERRESTPERIODREPOSITORY_H
