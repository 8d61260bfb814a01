#include "FlightDutyService.h"
#include "Core/ModelFactory.h"
#include "Core/TimeParser.h"
#include "Repositories/AuditTrailRepository.h"
#include "Repositories/FlightDutyRepository.h"
#include "logger/logger.h"

FlightDutyService::FlightDutyService(FlightDutyRepository* flightDutyRepository,
                                     AuditTrailRepository* auditRepository,
                                     RecalculationEngine* recalculationEngine,
                                     QObject *parent)
    : QObject(parent)
    , m_flightDutyRepository(flightDutyRepository)
    , m_auditRepository(auditRepository)
    , m_recalculationEngine(recalculationEngine)
{
}

QSharedPointer<FlightDutyModel> FlightDutyService::loadOwnedDuty(const QUuid& flightId, const QUuid& userId,
                                                                 QString& error)
{
    QSharedPointer<FlightDutyModel> duty = m_flightDutyRepository->getById(flightId);
    if (!duty || duty->userId() != userId) {
        error = QString("Flight duty not found: %1").arg(flightId.toString(QUuid::WithoutBraces));
        return nullptr;
    }
    return duty;
}

void FlightDutyService::addAffectedMonths(QList<QPair<int, int>>& months, const QDate& date, const QUuid& userId)
{
    const QPair<int, int> key(date.month(), date.year());
    if (!months.contains(key)) {
        months.append(key);
    }

    if (date.day() > m_recalculationEngine->lookaheadDays()) {
        return;
    }

    const QDate previous = date.addMonths(-1);
    const QPair<int, int> previousKey(previous.month(), previous.year());
    if (!months.contains(previousKey)
        && m_flightDutyRepository->countByMonth(userId, previous.month(), previous.year()) > 0) {
        months.append(previousKey);
    }
}

QStringList FlightDutyService::collectErrors(const QList<RecalculationResult>& results)
{
    QStringList errors;
    for (const RecalculationResult& result : results) {
        for (const QString& error : result.errors) {
            errors.append(QString("%1/%2: %3").arg(result.month).arg(result.year).arg(error));
        }
    }
    return errors;
}

DutyOperationResult FlightDutyService::editFlightDuty(const QUuid& flightId, const FlightDutyEdit& edit,
                                                      const QUuid& userId, DutyTypes::Position position,
                                                      const QString& changeReason)
{
    DutyOperationResult result;

    QString error;
    QSharedPointer<FlightDutyModel> duty = loadOwnedDuty(flightId, userId, error);
    if (!duty) {
        result.errors.append(error);
        return result;
    }

    if (!edit.date.isValid()) {
        result.errors.append("A valid date is required");
        return result;
    }

    const QDate previousDate = duty->date();
    const QJsonObject oldData = ModelFactory::modelToJson(duty.data());

    duty->setDate(edit.date);
    duty->setMonth(edit.date.month());
    duty->setYear(edit.date.year());
    duty->setDutyType(edit.dutyType);
    duty->setFlightNumbers(edit.flightNumbers);
    duty->setSectors(edit.sectors);
    duty->setReportTime(edit.reportTime);
    duty->setDebriefTime(edit.debriefTime);
    duty->setIsCrossDay(edit.isCrossDay);

    if (edit.reportTime.isValid() && edit.debriefTime.isValid()) {
        duty->setDutyHours(TimeParser::calculateDuration(TimeValue::fromQTime(edit.reportTime),
                                                         TimeValue::fromQTime(edit.debriefTime),
                                                         edit.isCrossDay));
    } else {
        duty->setDutyHours(0.0);
    }

    result.warnings.append(m_calculator.applyDutyPay(duty.data(), position));

    duty->setDataSource(DutyTypes::DataSource::Edited);
    duty->setLastEditedAt(QDateTime::currentDateTimeUtc());
    duty->setLastEditedBy(userId);
    ModelFactory::setUpdateTimestamps(duty.data());

    QSharedPointer<AuditTrailEntryModel> entry(
        ModelFactory::createDefaultAuditTrailEntry(flightId, userId, DutyTypes::AuditAction::Updated));
    entry->setOldData(oldData);
    entry->setNewData(ModelFactory::modelToJson(duty.data()));
    entry->setChangeReason(changeReason);

    const bool stored = m_flightDutyRepository->executeInTransaction([&]() {
        return m_flightDutyRepository->update(duty.data()) && m_auditRepository->save(entry.data());
    });

    if (!stored) {
        result.errors.append(QString("Failed to update flight duty: %1").arg(m_flightDutyRepository->lastError()));
        return result;
    }

    LOG_INFO(QString("Flight duty %1 edited").arg(flightId.toString(QUuid::WithoutBraces)));
    emit flightDutyChanged(flightId, DutyTypes::AuditAction::Updated);

    QList<QPair<int, int>> months;
    addAffectedMonths(months, previousDate, userId);
    addAffectedMonths(months, edit.date, userId);
    result.recalculations = m_recalculationEngine->recalculateMonths(userId, months, position);
    result.errors.append(collectErrors(result.recalculations));

    result.duty = duty;
    result.success = result.errors.isEmpty();
    return result;
}

bool FlightDutyService::removeWithAudit(const QSharedPointer<FlightDutyModel>& duty, const QUuid& userId,
                                        const QString& changeReason, QString& error)
{
    QSharedPointer<AuditTrailEntryModel> entry(
        ModelFactory::createDefaultAuditTrailEntry(duty->id(), userId, DutyTypes::AuditAction::Deleted));
    entry->setOldData(ModelFactory::modelToJson(duty.data()));
    entry->setChangeReason(changeReason);

    // Rest periods referencing the duty are removed by the cascade
    const bool removed = m_flightDutyRepository->executeInTransaction([&]() {
        return m_auditRepository->save(entry.data()) && m_flightDutyRepository->remove(duty->id());
    });

    if (!removed) {
        error = QString("Failed to delete flight duty %1: %2")
                .arg(duty->id().toString(QUuid::WithoutBraces), m_flightDutyRepository->lastError());
        LOG_ERROR(error);
        return false;
    }

    emit flightDutyChanged(duty->id(), DutyTypes::AuditAction::Deleted);
    return true;
}

DutyOperationResult FlightDutyService::deleteFlightDuty(const QUuid& flightId, const QUuid& userId,
                                                        DutyTypes::Position position,
                                                        const QString& changeReason)
{
    DutyOperationResult result;

    QString error;
    QSharedPointer<FlightDutyModel> duty = loadOwnedDuty(flightId, userId, error);
    if (!duty) {
        result.errors.append(error);
        return result;
    }

    if (!removeWithAudit(duty, userId, changeReason, error)) {
        result.errors.append(error);
        return result;
    }

    QList<QPair<int, int>> months;
    addAffectedMonths(months, duty->date(), userId);
    result.recalculations = m_recalculationEngine->recalculateMonths(userId, months, position);
    result.errors.append(collectErrors(result.recalculations));

    result.duty = duty;
    result.success = result.errors.isEmpty();
    return result;
}

BulkDeleteResult FlightDutyService::bulkDeleteFlightDuties(const QList<QUuid>& flightIds, const QUuid& userId,
                                                           DutyTypes::Position position,
                                                           const QString& changeReason)
{
    BulkDeleteResult result;
    QList<QDate> deletedDates;

    for (const QUuid& flightId : flightIds) {
        QString error;
        QSharedPointer<FlightDutyModel> duty = loadOwnedDuty(flightId, userId, error);
        if (!duty || !removeWithAudit(duty, userId, changeReason, error)) {
            result.failedIds.append(flightId);
            result.errors.append(error);
            continue;
        }
        deletedDates.append(duty->date());
        ++result.deletedCount;
    }

    // Only after every delete has been issued
    QList<QPair<int, int>> months;
    for (const QDate& date : deletedDates) {
        addAffectedMonths(months, date, userId);
    }
    result.recalculations = m_recalculationEngine->recalculateMonths(userId, months, position);
    result.errors.append(collectErrors(result.recalculations));

    LOG_INFO(QString("Bulk delete removed %1 of %2 flight duties, recalculated %3 months")
            .arg(result.deletedCount).arg(flightIds.size()).arg(months.size()));

    result.success = result.errors.isEmpty();
    return result;
}

QList<QSharedPointer<AuditTrailEntryModel>> FlightDutyService::getAuditTrail(const QUuid& flightId)
{
    return m_auditRepository->getByFlight(flightId);
}
