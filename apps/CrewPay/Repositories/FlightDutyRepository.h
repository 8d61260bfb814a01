#ifndef FLIGHTDUTYREPOSITORY_H
#define FLIGHTDUTYREPOSITORY_H

#include "BaseRepository.h"
#include "Models/FlightDutyModel.h"
#include <QDate>

class FlightDutyRepository : public BaseRepository<FlightDutyModel>
{
    Q_OBJECT
public:
    explicit FlightDutyRepository(QObject *parent = nullptr);

    // Ordered by date, report time, id
    QList<QSharedPointer<FlightDutyModel>> getByMonth(const QUuid &userId, int month, int year);

    /**
     * @brief Duties of the month followed by the first days of the next month
     * @param lookaheadDays Days of the following month to include; 0 reads the month only
     */
    QList<QSharedPointer<FlightDutyModel>> getByMonthWithLookahead(const QUuid &userId, int month, int year,
                                                                   int lookaheadDays);

    QList<QSharedPointer<FlightDutyModel>> getByDateRange(const QUuid &userId, const QDate &from, const QDate &to);

    // -1 on storage failure
    int countByMonth(const QUuid &userId, int month, int year);
    bool deleteByMonth(const QUuid &userId, int month, int year);

protected:
    QString getEntityName() const override;
    QString getTableName() const override;
    QString buildSaveQuery() override;
    QString buildUpdateQuery() override;
    QMap<QString, QVariant> prepareParamsForSave(FlightDutyModel* model) override;
    QMap<QString, QVariant> prepareParamsForUpdate(FlightDutyModel* model) override;
    bool validateModel(FlightDutyModel* model, QStringList& errors) override;
    FlightDutyModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // FLIGHTDUTYREPOSITORY_H
