#ifndef RECALCULATIONENGINE_H
#define RECALCULATIONENGINE_H

#include <QObject>
#include <QList>
#include <QPair>
#include <QSharedPointer>
#include <QStringList>
#include <QUuid>
#include "Core/PayCalculator.h"
#include "Models/DutyTypes.h"

class FlightDutyRepository;
class LayoverRestPeriodRepository;
class MonthlyCalculationRepository;

struct RecalculationResult {
    bool success = false;
    int month = 0;
    int year = 0;
    QSharedPointer<MonthlyCalculationModel> calculation;
    QList<QSharedPointer<LayoverRestPeriodModel>> restPeriods;
    CalculationSummary summary;
    QStringList errors;
    QStringList warnings;
};

/**
 * @brief Rebuilds the stored totals of one (user, month, year) from scratch
 *
 * Each run reads the month's duties (plus the first days of the next month as
 * inbound candidates), re-pairs layovers, replaces the month's rest periods
 * and upserts the monthly calculation. Nothing is patched incrementally, so
 * two runs over unchanged duties store identical totals.
 *
 * The engine moves Idle -> Recomputing -> Persisted or Failed for every
 * run and reports each move through stateChanged().
 */
class RecalculationEngine : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle,
        Recomputing,
        Persisted,
        Failed
    };
    Q_ENUM(State)

    RecalculationEngine(FlightDutyRepository* flightDutyRepository,
                        LayoverRestPeriodRepository* restPeriodRepository,
                        MonthlyCalculationRepository* calculationRepository,
                        QObject *parent = nullptr);

    void setHomeBase(const QString& homeBase) { m_homeBase = homeBase; }
    void setLayoverPairingDays(int days) { m_pairingDays = days; }
    void setLookaheadDays(int days) { m_lookaheadDays = days; }

    // Never shorter than the pairing window, an inbound leg in reach must be loaded
    int lookaheadDays() const { return qMax(m_lookaheadDays, m_pairingDays); }
    State state() const { return m_state; }

    RecalculationResult recalculateMonthlyTotals(const QUuid& userId, int month, int year,
                                                 DutyTypes::Position position);

    /**
     * @brief Recalculates each distinct (month, year) once
     *
     * A failing month is reported in its own result and does not stop the
     * remaining months.
     */
    QList<RecalculationResult> recalculateMonths(const QUuid& userId,
                                                 const QList<QPair<int, int>>& months,
                                                 DutyTypes::Position position);

signals:
    void stateChanged(RecalculationEngine::State state);
    void monthRecalculated(int month, int year, double totalSalary);

private:
    void setState(State state);
    RecalculationResult fail(RecalculationResult& result, const QString& error);

    FlightDutyRepository* m_flightDutyRepository;
    LayoverRestPeriodRepository* m_restPeriodRepository;
    MonthlyCalculationRepository* m_calculationRepository;
    PayCalculator m_calculator;
    QString m_homeBase;
    int m_pairingDays;
    int m_lookaheadDays;
    State m_state;
};

#endif // RECALCULATIONENGINE_H
