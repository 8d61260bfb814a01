#ifndef MANUALENTRYPROCESSOR_H
#define MANUALENTRYPROCESSOR_H

#include <QObject>
#include <QDate>
#include <QList>
#include <QMap>
#include <QSharedPointer>
#include <QStringList>
#include <QUuid>
#include "RecalculationEngine.h"
#include "Models/FlightDutyModel.h"

class FlightDutyRepository;
class AuditTrailRepository;

/**
 * @brief One manually keyed duty
 *
 * For a layover, date/reportTime/debriefTimeOutbound describe the outbound
 * leg and inboundDate/reportTimeInbound/debriefTime the inbound leg; airports
 * then holds origin and destination of both legs.
 */
struct ManualEntryData {
    QDate date;
    DutyTypes::DutyType dutyType = DutyTypes::DutyType::Turnaround;
    // "123" or "FZ123"
    QStringList flightNumbers;
    // Consecutive airport codes, e.g. DXB, KHI, DXB
    QStringList airports;
    QString reportTime;
    QString debriefTime;
    bool isCrossDay = false;

    QDate inboundDate;
    QString reportTimeInbound;
    QString debriefTimeOutbound;
    bool isCrossDayOutbound = false;
    bool isCrossDayInbound = false;
};

struct ManualValidationResult {
    bool valid = false;
    QStringList errors;
    QStringList warnings;
    QMap<QString, QString> fieldErrors;
    double calculatedDutyHours = 0.0;
    double estimatedPay = 0.0;
};

struct ManualEntryResult {
    bool success = false;
    int processedCount = 0;
    QList<QSharedPointer<FlightDutyModel>> flightDuties;
    QList<RecalculationResult> recalculations;
    QStringList errors;
    QStringList warnings;
};

class ManualEntryProcessor : public QObject
{
    Q_OBJECT
public:
    ManualEntryProcessor(FlightDutyRepository* flightDutyRepository,
                         AuditTrailRepository* auditRepository,
                         RecalculationEngine* recalculationEngine,
                         QObject *parent = nullptr);

    /**
     * @brief Validates an entry against the year selected by the user
     *
     * The outbound date must fall in selectedYear; a layover inbound date may
     * also fall in the following year.
     */
    ManualValidationResult validateManualEntry(const ManualEntryData& data, DutyTypes::Position position,
                                               int selectedYear) const;

    // "123" -> "FZ123"; empty entries dropped
    static QStringList normalizeFlightNumbers(const QStringList& flightNumbers);
    // DXB, KHI, DXB -> DXB-KHI, KHI-DXB
    static QStringList airportsToSectors(const QStringList& airports);

    /**
     * @brief Builds the duties of a validated entry, with pay applied
     *
     * A layover yields its outbound and inbound duties, each dated and
     * counted in its own month.
     */
    QList<QSharedPointer<FlightDutyModel>> convertToFlightDuties(const ManualEntryData& data,
                                                                 const QUuid& userId,
                                                                 DutyTypes::Position position,
                                                                 QStringList& warnings) const;

    ManualEntryResult processManualEntry(const ManualEntryData& data, const QUuid& userId,
                                         DutyTypes::Position position, int selectedYear);

    /**
     * @brief Saves every valid entry and recalculates each affected month once
     *
     * Invalid entries are reported as "Entry N: ..." errors.
     */
    ManualEntryResult processBatchManualEntries(const QList<ManualEntryData>& entries, const QUuid& userId,
                                                DutyTypes::Position position, int selectedYear);

private:
    static bool requiresFlightDetails(DutyTypes::DutyType type);
    static bool validateTimeSequence(const QString& report, const QString& debrief, bool isCrossDay,
                                     const QString& label, ManualValidationResult& result, double* hours);
    QSharedPointer<FlightDutyModel> createDuty(const QUuid& userId, const QDate& date, DutyTypes::DutyType type,
                                               const QStringList& flightNumbers, const QStringList& sectors,
                                               const QString& report, const QString& debrief, bool isCrossDay,
                                               DutyTypes::Position position, QStringList& warnings) const;
    bool storeDuties(const QList<QSharedPointer<FlightDutyModel>>& duties, const QUuid& userId, QString& error);

    FlightDutyRepository* m_flightDutyRepository;
    AuditTrailRepository* m_auditRepository;
    RecalculationEngine* m_recalculationEngine;
    PayCalculator m_calculator;
};

#endif // MANUALENTRYPROCESSOR_H
