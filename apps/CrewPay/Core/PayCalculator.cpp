#include "PayCalculator.h"
#include "ModelFactory.h"
#include "logger/logger.h"

#include <cmath>

using DutyTypes::DutyType;

PayCalculator::PayCalculator(const RateTable& rateTable)
    : m_rateTable(rateTable)
{
}

double PayCalculator::roundCurrency(double amount)
{
    // Half-up; the epsilon keeps 207.265 from landing on 207.26 through binary representation
    return std::floor(amount * 100.0 + 0.5 + 1e-9) / 100.0;
}

SalaryRates PayCalculator::ratesFor(DutyTypes::Position position, int year, int month) const
{
    return m_rateTable.resolve(position, year, month);
}

double PayCalculator::calculateFlightPay(double dutyHours, const SalaryRates& rates)
{
    return roundCurrency(dutyHours * rates.hourlyRate);
}

double PayCalculator::calculatePerDiemPay(double restHours, const SalaryRates& rates)
{
    return roundCurrency(restHours * rates.perDiemRate);
}

double PayCalculator::calculateAsbyPay(const SalaryRates& rates)
{
    return roundCurrency(rates.asbyFixedPay());
}

double PayCalculator::calculateRecurrentPay(const SalaryRates& rates)
{
    return roundCurrency(RecurrentPaidHours * rates.hourlyRate);
}

double PayCalculator::calculateBusinessPromotionPay(const SalaryRates& rates)
{
    return roundCurrency(BusinessPromotionPaidHours * rates.hourlyRate);
}

bool PayCalculator::isElearningDuty(const FlightDutyModel& duty)
{
    if (duty.originalData().value("duties").toString().contains("ELD", Qt::CaseInsensitive)) {
        return true;
    }

    for (const QString& flightNumber : duty.flightNumbers()) {
        if (flightNumber.contains("ELD", Qt::CaseInsensitive)) {
            return true;
        }
    }

    for (const QString& sector : duty.sectors()) {
        if (sector.contains("ELD", Qt::CaseInsensitive)) {
            return true;
        }
    }

    return false;
}

QStringList PayCalculator::applyDutyPay(FlightDutyModel* duty, DutyTypes::Position position) const
{
    QStringList warnings;
    const SalaryRates rates = ratesFor(position, duty->year(), duty->month());
    const QString label = QString("%1 %2").arg(duty->date().toString(Qt::ISODate),
                                                 DutyTypes::dutyTypeToString(duty->dutyType()));

    if (duty->dutyHours() > 24) {
        warnings.append(QString("%1: Duty hours (%2) exceed 24 hours - please verify")
                        .arg(label).arg(duty->dutyHours(), 0, 'f', 2));
    }

    double flightPay = 0.0;
    switch (duty->dutyType()) {
        case DutyType::Turnaround:
        case DutyType::Layover:
            if (duty->dutyHours() <= 0) {
                warnings.append(QString("%1: Duty hours must be greater than 0").arg(label));
            }
            flightPay = calculateFlightPay(duty->dutyHours(), rates);
            break;

        case DutyType::Asby:
            // Paid once per duty through the monthly ASBY component
            flightPay = 0.0;
            break;

        case DutyType::Recurrent:
            flightPay = isElearningDuty(*duty) ? 0.0 : calculateRecurrentPay(rates);
            break;

        case DutyType::BusinessPromotion:
            flightPay = calculateBusinessPromotionPay(rates);
            break;

        case DutyType::Sby:
        case DutyType::Off:
        case DutyType::Rest:
        case DutyType::AnnualLeave:
            break;

        case DutyType::Unknown:
            warnings.append(QString("%1: Unknown duty type, no pay computed").arg(label));
            break;
    }

    duty->setFlightPay(flightPay);
    return warnings;
}

QList<QSharedPointer<LayoverRestPeriodModel>> PayCalculator::createRestPeriods(const QUuid& userId,
                                                                              DutyTypes::Position position,
                                                                              const QList<LayoverPair>& pairs) const
{
    QList<QSharedPointer<LayoverRestPeriodModel>> periods;

    for (const LayoverPair& pair : pairs) {
        const FlightDutyModel* outbound = pair.outbound.data();
        const SalaryRates rates = ratesFor(position, outbound->year(), outbound->month());

        QSharedPointer<LayoverRestPeriodModel> period(ModelFactory::createDefaultLayoverRestPeriod(userId));
        period->setOutboundFlightId(outbound->id());
        period->setInboundFlightId(pair.inbound->id());
        period->setRestStartTime(pair.restStart);
        period->setRestEndTime(pair.restEnd);
        period->setRestHours(pair.restHours);
        period->setPerDiemPay(calculatePerDiemPay(pair.restHours, rates));
        period->setMonth(outbound->month());
        period->setYear(outbound->year());
        periods.append(period);
    }

    return periods;
}

MonthlyCalculationResult PayCalculator::calculateMonthly(const QUuid& userId,
                                                         DutyTypes::Position position,
                                                         int month,
                                                         int year,
                                                         const QList<QSharedPointer<FlightDutyModel>>& duties,
                                                         const QList<QSharedPointer<LayoverRestPeriodModel>>& restPeriods) const
{
    MonthlyCalculationResult result;
    const SalaryRates rates = ratesFor(position, year, month);

    QSharedPointer<MonthlyCalculationModel> calculation(
        ModelFactory::createDefaultMonthlyCalculation(userId, month, year));

    double totalDutyHours = 0.0;
    double flightPay = 0.0;
    int asbyCount = 0;
    CalculationSummary& summary = result.summary;

    for (const auto& duty : duties) {
        if (duty->month() != month || duty->year() != year) {
            continue;
        }

        const DutyType type = duty->dutyType();
        if (type != DutyType::Recurrent && type != DutyType::BusinessPromotion) {
            totalDutyHours += duty->dutyHours();
        }
        flightPay += duty->flightPay();

        switch (type) {
            case DutyType::Turnaround:
                ++summary.totalTurnarounds;
                break;
            case DutyType::Layover:
                ++summary.totalLayovers;
                break;
            case DutyType::Asby:
                ++asbyCount;
                break;
            default:
                break;
        }
    }

    double totalRestHours = 0.0;
    double perDiemPay = 0.0;
    int restPeriodCount = 0;
    for (const auto& period : restPeriods) {
        if (period->month() != month || period->year() != year) {
            continue;
        }
        totalRestHours += period->restHours();
        perDiemPay += period->perDiemPay();
        ++restPeriodCount;
    }

    const double asbyPay = roundCurrency(asbyCount * rates.asbyFixedPay());

    calculation->setBasicSalary(rates.basicSalary);
    calculation->setHousingAllowance(rates.housingAllowance);
    calculation->setTransportAllowance(rates.transportAllowance);
    calculation->setTotalDutyHours(totalDutyHours);
    calculation->setFlightPay(flightPay);
    calculation->setTotalRestHours(totalRestHours);
    calculation->setPerDiemPay(perDiemPay);
    calculation->setAsbyCount(asbyCount);
    calculation->setAsbyPay(asbyPay);
    calculation->setTotalFixed(rates.totalFixed());
    calculation->setTotalVariable(flightPay + perDiemPay + asbyPay);
    calculation->setTotalSalary(calculation->totalFixed() + calculation->totalVariable());

    summary.totalAsbyDuties = asbyCount;
    summary.totalFlights = summary.totalTurnarounds + summary.totalLayovers + asbyCount;
    summary.averageDutyHours = summary.totalFlights > 0 ? totalDutyHours / summary.totalFlights : 0.0;
    summary.averageRestHours = restPeriodCount > 0 ? totalRestHours / restPeriodCount : 0.0;

    result.calculation = calculation;

    LOG_DATA(Logger::Debug, (QMap<QString, QVariant>{
        {"month", QString("%1/%2").arg(month).arg(year)},
        {"position", DutyTypes::positionToString(position)},
        {"flightPay", flightPay},
        {"perDiemPay", perDiemPay},
        {"asbyPay", asbyPay},
        {"totalSalary", calculation->totalSalary()}
    }));

    return result;
}
