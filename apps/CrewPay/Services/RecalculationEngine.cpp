#include "RecalculationEngine.h"
#include "Core/LayoverPairer.h"
#include "Repositories/FlightDutyRepository.h"
#include "Repositories/LayoverRestPeriodRepository.h"
#include "Repositories/MonthlyCalculationRepository.h"
#include "ReplacementOrchestrator.h"
#include "logger/logger.h"

RecalculationEngine::RecalculationEngine(FlightDutyRepository* flightDutyRepository,
                                         LayoverRestPeriodRepository* restPeriodRepository,
                                         MonthlyCalculationRepository* calculationRepository,
                                         QObject *parent)
    : QObject(parent)
    , m_flightDutyRepository(flightDutyRepository)
    , m_restPeriodRepository(restPeriodRepository)
    , m_calculationRepository(calculationRepository)
    , m_homeBase("DXB")
    , m_pairingDays(5)
    , m_lookaheadDays(3)
    , m_state(Idle)
{
    qRegisterMetaType<RecalculationEngine::State>("RecalculationEngine::State");
}

void RecalculationEngine::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

RecalculationResult RecalculationEngine::fail(RecalculationResult& result, const QString& error)
{
    result.success = false;
    result.errors.append(error);
    LOG_ERROR(QString("Recalculation of %1/%2 failed: %3").arg(result.month).arg(result.year).arg(error));
    setState(Failed);
    return result;
}

RecalculationResult RecalculationEngine::recalculateMonthlyTotals(const QUuid& userId, int month, int year,
                                                                  DutyTypes::Position position)
{
    RecalculationResult result;
    result.month = month;
    result.year = year;

    setState(Recomputing);

    QString validationError;
    if (!ReplacementOrchestrator::validateMonthYear(month, year, &validationError)) {
        return fail(result, validationError);
    }

    if (userId.isNull()) {
        return fail(result, "User ID is required");
    }

    // The count doubles as a storage probe; the list reads cannot tell "empty" from "failed"
    const int dutyCount = m_flightDutyRepository->countByMonth(userId, month, year);
    if (dutyCount < 0) {
        return fail(result, QString("Failed to read flight duties: %1").arg(m_flightDutyRepository->lastError()));
    }

    const QList<QSharedPointer<FlightDutyModel>> duties =
        m_flightDutyRepository->getByMonthWithLookahead(userId, month, year, lookaheadDays());

    LayoverPairer pairer(m_homeBase, m_pairingDays);
    const PairingResult pairing = pairer.pair(duties, month, year);
    result.warnings.append(pairing.warnings);

    result.restPeriods = m_calculator.createRestPeriods(userId, position, pairing.pairs);

    MonthlyCalculationResult monthly = m_calculator.calculateMonthly(userId, position, month, year,
                                                                     duties, result.restPeriods);
    result.summary = monthly.summary;
    result.warnings.append(monthly.warnings);

    // Rest periods of the month are rebuilt together with the totals
    const bool stored = m_restPeriodRepository->executeInTransaction([&]() {
        if (!m_restPeriodRepository->deleteByMonth(userId, month, year)) {
            return false;
        }
        if (m_restPeriodRepository->saveAll(result.restPeriods) != result.restPeriods.size()) {
            return false;
        }
        return m_calculationRepository->upsert(monthly.calculation.data());
    });

    if (!stored) {
        return fail(result, QString("Failed to store monthly calculation: %1")
                    .arg(m_calculationRepository->lastError()));
    }

    result.calculation = m_calculationRepository->getByMonth(userId, month, year);
    if (!result.calculation) {
        result.calculation = monthly.calculation;
    }

    result.success = true;
    setState(Persisted);

    LOG_INFO(QString("Recalculated %1/%2: %3 duties, %4 rest periods, total salary %5")
            .arg(month).arg(year)
            .arg(dutyCount)
            .arg(result.restPeriods.size())
            .arg(result.calculation->totalSalary(), 0, 'f', 2));

    emit monthRecalculated(month, year, result.calculation->totalSalary());
    return result;
}

QList<RecalculationResult> RecalculationEngine::recalculateMonths(const QUuid& userId,
                                                                  const QList<QPair<int, int>>& months,
                                                                  DutyTypes::Position position)
{
    QList<QPair<int, int>> distinctMonths;
    for (const auto& key : months) {
        if (!distinctMonths.contains(key)) {
            distinctMonths.append(key);
        }
    }

    QList<RecalculationResult> results;
    for (const auto& key : distinctMonths) {
        results.append(recalculateMonthlyTotals(userId, key.first, key.second, position));
    }
    return results;
}
