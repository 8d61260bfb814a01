#include "ReplacementOrchestrator.h"
#include "Core/ModelFactory.h"
#include "Models/AuditTrailEntryModel.h"
#include "Repositories/AuditTrailRepository.h"
#include "Repositories/FlightDutyRepository.h"
#include "Repositories/LayoverRestPeriodRepository.h"
#include "Repositories/MonthlyCalculationRepository.h"
#include "logger/logger.h"

#include <QLocale>

ReplacementOrchestrator::ReplacementOrchestrator(FlightDutyRepository* flightDutyRepository,
                                                 LayoverRestPeriodRepository* restPeriodRepository,
                                                 MonthlyCalculationRepository* calculationRepository,
                                                 AuditTrailRepository* auditRepository,
                                                 QObject *parent)
    : QObject(parent)
    , m_flightDutyRepository(flightDutyRepository)
    , m_restPeriodRepository(restPeriodRepository)
    , m_calculationRepository(calculationRepository)
    , m_auditRepository(auditRepository)
{
}

bool ReplacementOrchestrator::validateMonthYear(int month, int year, QString* error)
{
    QString message;
    if (month < 1 || month > 12) {
        message = QString("Invalid month: %1. Must be between 1 and 12").arg(month);
    } else if (year < 2020 || year > 2100) {
        message = QString("Invalid year: %1. Must be between 2020 and 2100").arg(year);
    }

    if (error) {
        *error = message;
    }
    return message.isEmpty();
}

ExistingDataCheck ReplacementOrchestrator::checkForExistingData(const QUuid& userId, int month, int year)
{
    ExistingDataCheck check;

    QString validationError;
    if (!validateMonthYear(month, year, &validationError)) {
        check.error = validationError;
        return check;
    }

    const int count = m_flightDutyRepository->countByMonth(userId, month, year);
    if (count < 0) {
        check.error = QString("Failed to check existing data: %1").arg(m_flightDutyRepository->lastError());
        LOG_ERROR(check.error);
        return check;
    }

    check.flightCount = count;
    check.exists = count > 0;
    LOG_DEBUG(QString("Existing data for %1/%2: %3 flights").arg(month).arg(year).arg(count));
    return check;
}

ReplacementResult ReplacementOrchestrator::replaceRosterData(const QUuid& userId, int month, int year,
                                                             const QString& reason)
{
    ReplacementResult result;

    QString validationError;
    if (!validateMonthYear(month, year, &validationError)) {
        result.errors.append(validationError);
        return result;
    }

    const QList<QSharedPointer<FlightDutyModel>> existing = m_flightDutyRepository->getByMonth(userId, month, year);
    const QString changeReason = reason.isEmpty()
        ? QString("Roster replacement for %1/%2").arg(month).arg(year)
        : reason;

    for (const auto& duty : existing) {
        QSharedPointer<AuditTrailEntryModel> entry(
            ModelFactory::createDefaultAuditTrailEntry(duty->id(), userId, DutyTypes::AuditAction::Deleted));
        entry->setOldData(ModelFactory::modelToJson(duty.data()));
        entry->setChangeReason(changeReason);
        if (!m_auditRepository->save(entry.data())) {
            result.errors.append(QString("Failed to write audit entry for flight %1: %2")
                                 .arg(duty->id().toString(QUuid::WithoutBraces), m_auditRepository->lastError()));
            return result;
        }
    }

    if (!m_restPeriodRepository->deleteByMonth(userId, month, year)) {
        result.errors.append(QString("Failed to delete rest periods: %1").arg(m_restPeriodRepository->lastError()));
        return result;
    }

    // Rest periods of the previous month that used one of these flights go with the cascade
    if (!m_flightDutyRepository->deleteByMonth(userId, month, year)) {
        result.errors.append(QString("Failed to delete flight duties: %1").arg(m_flightDutyRepository->lastError()));
        return result;
    }

    if (!m_calculationRepository->deleteByMonth(userId, month, year)) {
        result.errors.append(QString("Failed to delete monthly calculation: %1").arg(m_calculationRepository->lastError()));
        return result;
    }

    result.deletedFlights = existing.size();
    result.success = true;
    LOG_INFO(QString("Replacement removed %1 flights for %2/%3").arg(existing.size()).arg(month).arg(year));
    return result;
}

QString ReplacementOrchestrator::createReplacementSummary(int month, int year, int flightCount)
{
    const QString monthName = QLocale::c().standaloneMonthName(month, QLocale::LongFormat);

    if (flightCount == 0) {
        return QString("No existing data found for %1 %2.").arg(monthName).arg(year);
    }

    if (flightCount == 1) {
        return QString("This will replace 1 existing flight and all related data for %1 %2.").arg(monthName).arg(year);
    }

    return QString("This will replace %1 existing flights and all related data for %2 %3.")
        .arg(flightCount).arg(monthName).arg(year);
}
