#ifndef FLIGHTDUTYSERVICE_H
#define FLIGHTDUTYSERVICE_H

#include <QObject>
#include <QDate>
#include <QList>
#include <QPair>
#include <QSharedPointer>
#include <QStringList>
#include <QTime>
#include <QUuid>
#include "RecalculationEngine.h"
#include "Models/AuditTrailEntryModel.h"
#include "Models/FlightDutyModel.h"

class FlightDutyRepository;
class AuditTrailRepository;

// Editable fields of a stored duty; the original roster payload is kept
struct FlightDutyEdit {
    QDate date;
    DutyTypes::DutyType dutyType = DutyTypes::DutyType::Unknown;
    QStringList flightNumbers;
    QStringList sectors;
    QTime reportTime;
    QTime debriefTime;
    bool isCrossDay = false;
};

struct DutyOperationResult {
    bool success = false;
    QSharedPointer<FlightDutyModel> duty;
    QList<RecalculationResult> recalculations;
    QStringList errors;
    QStringList warnings;
};

struct BulkDeleteResult {
    bool success = false;
    int deletedCount = 0;
    QList<QUuid> failedIds;
    QList<RecalculationResult> recalculations;
    QStringList errors;
};

/**
 * @brief Edits and deletes stored duties
 *
 * Every change writes an audit entry in the same transaction and is followed
 * by a recalculation of the affected months.
 */
class FlightDutyService : public QObject
{
    Q_OBJECT
public:
    FlightDutyService(FlightDutyRepository* flightDutyRepository,
                      AuditTrailRepository* auditRepository,
                      RecalculationEngine* recalculationEngine,
                      QObject *parent = nullptr);

    DutyOperationResult editFlightDuty(const QUuid& flightId, const FlightDutyEdit& edit,
                                       const QUuid& userId, DutyTypes::Position position,
                                       const QString& changeReason);

    DutyOperationResult deleteFlightDuty(const QUuid& flightId, const QUuid& userId,
                                         DutyTypes::Position position,
                                         const QString& changeReason = QString());

    /**
     * @brief Deletes each duty, then recalculates every affected month once
     *
     * A duty that cannot be deleted is listed in failedIds; the remaining
     * deletes and recalculations still run.
     */
    BulkDeleteResult bulkDeleteFlightDuties(const QList<QUuid>& flightIds, const QUuid& userId,
                                            DutyTypes::Position position,
                                            const QString& changeReason = QString());

    QList<QSharedPointer<AuditTrailEntryModel>> getAuditTrail(const QUuid& flightId);

signals:
    void flightDutyChanged(const QUuid& flightId, DutyTypes::AuditAction action);

private:
    QSharedPointer<FlightDutyModel> loadOwnedDuty(const QUuid& flightId, const QUuid& userId, QString& error);
    bool removeWithAudit(const QSharedPointer<FlightDutyModel>& duty, const QUuid& userId,
                         const QString& changeReason, QString& error);
    // The duty's month, plus the previous month when its outbound legs may pair with this duty
    void addAffectedMonths(QList<QPair<int, int>>& months, const QDate& date, const QUuid& userId);
    static QStringList collectErrors(const QList<RecalculationResult>& results);

    FlightDutyRepository* m_flightDutyRepository;
    AuditTrailRepository* m_auditRepository;
    RecalculationEngine* m_recalculationEngine;
    PayCalculator m_calculator;
};

#endif // FLIGHTDUTYSERVICE_H
