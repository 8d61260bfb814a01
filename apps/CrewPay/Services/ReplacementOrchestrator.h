#ifndef REPLACEMENTORCHESTRATOR_H
#define REPLACEMENTORCHESTRATOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QUuid>

class FlightDutyRepository;
class LayoverRestPeriodRepository;
class MonthlyCalculationRepository;
class AuditTrailRepository;

struct ExistingDataCheck {
    bool exists = false;
    int flightCount = 0;
    QString error;
};

struct ReplacementResult {
    bool success = false;
    int deletedFlights = 0;
    QStringList errors;
};

/**
 * @brief Detects and removes the stored data of a month before a re-upload
 *
 * replaceRosterData() does not open a transaction of its own; the upload
 * path calls it inside the transaction that also inserts the new duties.
 */
class ReplacementOrchestrator : public QObject
{
    Q_OBJECT
public:
    ReplacementOrchestrator(FlightDutyRepository* flightDutyRepository,
                            LayoverRestPeriodRepository* restPeriodRepository,
                            MonthlyCalculationRepository* calculationRepository,
                            AuditTrailRepository* auditRepository,
                            QObject *parent = nullptr);

    // Months 1-12, years 2020-2100
    static bool validateMonthYear(int month, int year, QString* error = nullptr);

    ExistingDataCheck checkForExistingData(const QUuid& userId, int month, int year);

    /**
     * @brief Deletes the flights, rest periods and monthly calculation of the key
     *
     * Every deleted flight gets a "deleted" audit entry.
     */
    ReplacementResult replaceRosterData(const QUuid& userId, int month, int year,
                                        const QString& reason = QString());

    static QString createReplacementSummary(int month, int year, int flightCount);

private:
    FlightDutyRepository* m_flightDutyRepository;
    LayoverRestPeriodRepository* m_restPeriodRepository;
    MonthlyCalculationRepository* m_calculationRepository;
    AuditTrailRepository* m_auditRepository;
};

#endif // REPLACEMENTORCHESTRATOR_H
