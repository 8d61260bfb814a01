#ifndef MONTHLYCALCULATIONREPOSITORY_H
#define MONTHLYCALCULATIONREPOSITORY_H

#include "BaseRepository.h"
#include "Models/MonthlyCalculationModel.h"

class MonthlyCalculationRepository : public BaseRepository<MonthlyCalculationModel>
{
    Q_OBJECT
public:
    explicit MonthlyCalculationRepository(QObject *parent = nullptr);

    /**
     * @brief Inserts the calculation or replaces the totals of the existing row
     *
     * (user_id, month, year) is unique; on conflict the stored id and
     * created_at are kept.
     */
    bool upsert(MonthlyCalculationModel* calculation);

    QSharedPointer<MonthlyCalculationModel> getByMonth(const QUuid &userId, int month, int year);
    bool deleteByMonth(const QUuid &userId, int month, int year);

protected:
    QString getEntityName() const override;
    QString getTableName() const override;
    QString buildSaveQuery() override;
    QString buildUpdateQuery() override;
    QMap<QString, QVariant> prepareParamsForSave(MonthlyCalculationModel* model) override;
    QMap<QString, QVariant> prepareParamsForUpdate(MonthlyCalculationModel* model) override;
    bool validateModel(MonthlyCalculationModel* model, QStringList& errors) override;
    MonthlyCalculationModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // MONTHLYCALCULATIONREPOSITORY_H
