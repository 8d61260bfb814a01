#ifndef PAYCALCULATOR_H
#define PAYCALCULATOR_H

#include <QList>
#include <QSharedPointer>
#include <QStringList>
#include <QUuid>
#include "RateTable.h"
#include "LayoverPairer.h"
#include "Models/FlightDutyModel.h"
#include "Models/LayoverRestPeriodModel.h"
#include "Models/MonthlyCalculationModel.h"

struct CalculationSummary {
    int totalFlights = 0;
    int totalTurnarounds = 0;
    int totalLayovers = 0;
    int totalAsbyDuties = 0;
    double averageDutyHours = 0.0;
    double averageRestHours = 0.0;
};

struct MonthlyCalculationResult {
    QSharedPointer<MonthlyCalculationModel> calculation;
    CalculationSummary summary;
    QStringList warnings;
};

/**
 * @brief Pay components of duties, rest periods and whole months
 *
 * Every component is rounded half-up to two decimals where it is computed.
 * Sums of already rounded components are not rounded again.
 *
 * Rates are resolved per duty from its own month; per diem uses the month of
 * the outbound leg.
 */
class PayCalculator {
public:
    explicit PayCalculator(const RateTable& rateTable = RateTable::standard());

    static double roundCurrency(double amount);

    SalaryRates ratesFor(DutyTypes::Position position, int year, int month) const;

    static double calculateFlightPay(double dutyHours, const SalaryRates& rates);
    static double calculatePerDiemPay(double restHours, const SalaryRates& rates);
    static double calculateAsbyPay(const SalaryRates& rates);
    static double calculateRecurrentPay(const SalaryRates& rates);
    static double calculateBusinessPromotionPay(const SalaryRates& rates);

    /**
     * @brief Sets the flight pay of one duty from its type and hours
     * @return Warnings such as duty hours above 24
     */
    QStringList applyDutyPay(FlightDutyModel* duty, DutyTypes::Position position) const;

    // ELD in the original roster text, the flight numbers or the sectors
    static bool isElearningDuty(const FlightDutyModel& duty);

    QList<QSharedPointer<LayoverRestPeriodModel>> createRestPeriods(const QUuid& userId,
                                                                   DutyTypes::Position position,
                                                                   const QList<LayoverPair>& pairs) const;

    /**
     * @brief Derives the monthly totals from scratch
     *
     * Only duties and rest periods of (month, year) are counted.
     * totalFixed = basic + housing + transport,
     * totalVariable = flight pay + per diem + ASBY pay,
     * totalSalary = totalFixed + totalVariable.
     */
    MonthlyCalculationResult calculateMonthly(const QUuid& userId,
                                              DutyTypes::Position position,
                                              int month,
                                              int year,
                                              const QList<QSharedPointer<FlightDutyModel>>& duties,
                                              const QList<QSharedPointer<LayoverRestPeriodModel>>& restPeriods) const;

    static const int RecurrentPaidHours = 4;
    static const int BusinessPromotionPaidHours = 5;

private:
    const RateTable& m_rateTable;
};

#endif // PAYCALCULATOR_H
