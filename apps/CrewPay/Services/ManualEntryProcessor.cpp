#include "ManualEntryProcessor.h"
#include "Core/ModelFactory.h"
#include "Core/TimeParser.h"
#include "Repositories/AuditTrailRepository.h"
#include "Repositories/FlightDutyRepository.h"
#include "logger/logger.h"

#include <QRegularExpression>

using DutyTypes::DutyType;

ManualEntryProcessor::ManualEntryProcessor(FlightDutyRepository* flightDutyRepository,
                                           AuditTrailRepository* auditRepository,
                                           RecalculationEngine* recalculationEngine,
                                           QObject *parent)
    : QObject(parent)
    , m_flightDutyRepository(flightDutyRepository)
    , m_auditRepository(auditRepository)
    , m_recalculationEngine(recalculationEngine)
{
}

bool ManualEntryProcessor::requiresFlightDetails(DutyType type)
{
    return type == DutyType::Turnaround || type == DutyType::Layover;
}

QStringList ManualEntryProcessor::normalizeFlightNumbers(const QStringList& flightNumbers)
{
    QStringList normalized;
    for (const QString& raw : flightNumbers) {
        const QString number = raw.trimmed().toUpper();
        if (number.isEmpty()) {
            continue;
        }
        normalized.append(number.startsWith("FZ") ? number : "FZ" + number);
    }
    return normalized;
}

QStringList ManualEntryProcessor::airportsToSectors(const QStringList& airports)
{
    QStringList codes;
    for (const QString& airport : airports) {
        if (!airport.trimmed().isEmpty()) {
            codes.append(airport.trimmed().toUpper());
        }
    }

    QStringList sectors;
    for (int i = 0; i + 1 < codes.size(); ++i) {
        sectors.append(QString("%1-%2").arg(codes.at(i), codes.at(i + 1)));
    }
    return sectors;
}

bool ManualEntryProcessor::validateTimeSequence(const QString& report, const QString& debrief, bool isCrossDay,
                                                const QString& label, ManualValidationResult& result,
                                                double* hours)
{
    static const QRegularExpression timePattern("^([0-1]?[0-9]|2[0-3]):[0-5][0-9]$");

    if (report.trimmed().isEmpty() || debrief.trimmed().isEmpty()) {
        const QString error = QString("%1report and debrief times are required").arg(label);
        result.fieldErrors["timeSequence"] = error;
        result.errors.append(error);
        return false;
    }

    if (!timePattern.match(report.trimmed()).hasMatch() || !timePattern.match(debrief.trimmed()).hasMatch()) {
        const QString error = QString("%1invalid time format, use HH:MM").arg(label);
        result.fieldErrors["timeSequence"] = error;
        result.errors.append(error);
        return false;
    }

    const TimeValue reportValue = TimeParser::parse(report);
    const TimeValue debriefValue = TimeParser::parse(debrief);

    if (debriefValue.totalMinutes <= reportValue.totalMinutes && !isCrossDay) {
        const QString error = QString("%1debrief time must be after report time").arg(label);
        result.fieldErrors["timeSequence"] = error;
        result.errors.append(error);
        return false;
    }

    const double duration = TimeParser::calculateDuration(reportValue, debriefValue, isCrossDay);
    if (duration > 16) {
        result.warnings.append(QString("%1very long duty (%2 hours), please verify times")
                               .arg(label).arg(duration, 0, 'f', 2));
    } else if (duration < 1) {
        result.warnings.append(QString("%1very short duty (%2 hours), please verify times")
                               .arg(label).arg(duration, 0, 'f', 2));
    }

    if (hours) {
        *hours = duration;
    }
    return true;
}

ManualValidationResult ManualEntryProcessor::validateManualEntry(const ManualEntryData& data,
                                                                 DutyTypes::Position position,
                                                                 int selectedYear) const
{
    ManualValidationResult result;

    auto addError = [&result](const QString& field, const QString& error) {
        result.fieldErrors[field] = error;
        result.errors.append(error);
    };

    if (!data.date.isValid()) {
        addError("date", "Date is required");
    } else if (data.date.year() != selectedYear) {
        addError("date", QString("Date must be within %1").arg(selectedYear));
    }

    const bool isLayover = data.dutyType == DutyType::Layover;
    if (isLayover) {
        if (!data.inboundDate.isValid()) {
            addError("inboundDate", "Inbound date is required for layover duties");
        } else if (data.inboundDate.year() != selectedYear && data.inboundDate.year() != selectedYear + 1) {
            addError("inboundDate", QString("Date must be within %1 or %2").arg(selectedYear).arg(selectedYear + 1));
        } else if (data.date.isValid() && data.inboundDate < data.date) {
            addError("inboundDate", "Inbound date cannot be before outbound date");
        }
    }

    if (requiresFlightDetails(data.dutyType)) {
        QStringList numbers;
        for (const QString& number : data.flightNumbers) {
            if (!number.trimmed().isEmpty()) {
                numbers.append(number.trimmed().toUpper());
            }
        }

        static const QRegularExpression numberPattern("^(FZ)?\\d{3,4}$");
        if (numbers.isEmpty()) {
            addError("flightNumbers", "At least one flight number is required");
        } else {
            for (const QString& number : numbers) {
                if (!numberPattern.match(number).hasMatch()) {
                    addError("flightNumbers", QString("Invalid flight number: %1").arg(number));
                    break;
                }
            }

            QStringList normalized = normalizeFlightNumbers(numbers);
            if (normalized.removeDuplicates() > 0) {
                addError("flightNumbers", "Duplicate flight numbers are not allowed");
            } else if (isLayover && numbers.size() != 2) {
                addError("flightNumbers", "Layover duties require exactly two flight numbers (outbound and inbound)");
            } else if (data.dutyType == DutyType::Turnaround && numbers.size() < 2) {
                result.warnings.append("Turnarounds typically have multiple flight numbers");
            }
        }

        static const QRegularExpression airportPattern("^[A-Z]{3}$");
        QStringList airports;
        for (const QString& airport : data.airports) {
            if (!airport.trimmed().isEmpty()) {
                airports.append(airport.trimmed().toUpper());
            }
        }

        if (airports.isEmpty()) {
            addError("sectors", "At least one airport is required");
        } else {
            for (const QString& airport : airports) {
                if (!airportPattern.match(airport).hasMatch()) {
                    addError("sectors", QString("Invalid airport code: %1").arg(airport));
                    break;
                }
            }
            if (!result.fieldErrors.contains("sectors")) {
                if (isLayover && airports.size() != 4) {
                    addError("sectors", "Layover duties require 4 airports (outbound: origin-destination, inbound: origin-destination)");
                } else if (!isLayover && airports.size() < 2) {
                    addError("sectors", "At least two airports are required");
                }
            }
        }
    }

    double hours = 0.0;
    if (isLayover) {
        double outboundHours = 0.0;
        double inboundHours = 0.0;
        const bool outboundOk = validateTimeSequence(data.reportTime, data.debriefTimeOutbound,
                                                     data.isCrossDayOutbound, "Outbound: ", result, &outboundHours);
        const bool inboundOk = validateTimeSequence(data.reportTimeInbound, data.debriefTime,
                                                    data.isCrossDayInbound, "Inbound: ", result, &inboundHours);
        if (outboundOk && inboundOk) {
            hours = outboundHours + inboundHours;
        }
    } else if (data.dutyType != DutyType::Off) {
        validateTimeSequence(data.reportTime, data.debriefTime, data.isCrossDay, QString(), result, &hours);
    }

    result.valid = result.errors.isEmpty();
    if (result.valid && data.date.isValid()) {
        const SalaryRates rates = m_calculator.ratesFor(position, data.date.year(), data.date.month());
        result.calculatedDutyHours = hours;
        switch (data.dutyType) {
            case DutyType::Turnaround:
            case DutyType::Layover:
                result.estimatedPay = PayCalculator::calculateFlightPay(hours, rates);
                break;
            case DutyType::Asby:
                result.estimatedPay = PayCalculator::calculateAsbyPay(rates);
                break;
            case DutyType::Recurrent:
                result.estimatedPay = PayCalculator::calculateRecurrentPay(rates);
                break;
            case DutyType::BusinessPromotion:
                result.estimatedPay = PayCalculator::calculateBusinessPromotionPay(rates);
                break;
            default:
                result.estimatedPay = 0.0;
                break;
        }
    }

    return result;
}

QSharedPointer<FlightDutyModel> ManualEntryProcessor::createDuty(const QUuid& userId, const QDate& date,
                                                                 DutyType type,
                                                                 const QStringList& flightNumbers,
                                                                 const QStringList& sectors,
                                                                 const QString& report, const QString& debrief,
                                                                 bool isCrossDay,
                                                                 DutyTypes::Position position,
                                                                 QStringList& warnings) const
{
    QSharedPointer<FlightDutyModel> duty(ModelFactory::createDefaultFlightDuty(userId, date));
    duty->setDutyType(type);
    duty->setFlightNumbers(flightNumbers);
    duty->setSectors(sectors);
    duty->setIsCrossDay(isCrossDay);

    const std::optional<TimeValue> reportValue = TimeParser::tryParse(report);
    const std::optional<TimeValue> debriefValue = TimeParser::tryParse(debrief);
    if (type != DutyType::Off && reportValue && debriefValue) {
        duty->setReportTime(reportValue->toQTime());
        duty->setDebriefTime(debriefValue->toQTime());
        duty->setDutyHours(TimeParser::calculateDuration(*reportValue, *debriefValue, isCrossDay));
    } else {
        // Off days carry zero times
        duty->setReportTime(QTime(0, 0));
        duty->setDebriefTime(QTime(0, 0));
        duty->setDutyHours(0.0);
    }

    warnings.append(m_calculator.applyDutyPay(duty.data(), position));
    return duty;
}

QList<QSharedPointer<FlightDutyModel>> ManualEntryProcessor::convertToFlightDuties(const ManualEntryData& data,
                                                                                   const QUuid& userId,
                                                                                   DutyTypes::Position position,
                                                                                   QStringList& warnings) const
{
    QList<QSharedPointer<FlightDutyModel>> duties;
    const QStringList flightNumbers = requiresFlightDetails(data.dutyType)
        ? normalizeFlightNumbers(data.flightNumbers)
        : QStringList();
    const QStringList sectors = requiresFlightDetails(data.dutyType)
        ? airportsToSectors(data.airports)
        : QStringList();

    if (data.dutyType == DutyType::Layover && flightNumbers.size() == 2 && sectors.size() == 3) {
        // Sectors are outbound, the stay at the destination, and inbound
        duties.append(createDuty(userId, data.date, DutyType::Layover,
                                 QStringList{flightNumbers.at(0)}, QStringList{sectors.at(0)},
                                 data.reportTime, data.debriefTimeOutbound, data.isCrossDayOutbound,
                                 position, warnings));
        duties.append(createDuty(userId, data.inboundDate, DutyType::Layover,
                                 QStringList{flightNumbers.at(1)}, QStringList{sectors.at(2)},
                                 data.reportTimeInbound, data.debriefTime, data.isCrossDayInbound,
                                 position, warnings));
        return duties;
    }

    duties.append(createDuty(userId, data.date, data.dutyType, flightNumbers, sectors,
                             data.reportTime, data.debriefTime, data.isCrossDay, position, warnings));
    return duties;
}

bool ManualEntryProcessor::storeDuties(const QList<QSharedPointer<FlightDutyModel>>& duties, const QUuid& userId,
                                       QString& error)
{
    const bool stored = m_flightDutyRepository->executeInTransaction([&]() {
        for (const auto& duty : duties) {
            if (!m_flightDutyRepository->save(duty.data())) {
                return false;
            }

            QSharedPointer<AuditTrailEntryModel> entry(
                ModelFactory::createDefaultAuditTrailEntry(duty->id(), userId, DutyTypes::AuditAction::Created));
            entry->setNewData(ModelFactory::modelToJson(duty.data()));
            entry->setChangeReason("Manual entry");
            if (!m_auditRepository->save(entry.data())) {
                return false;
            }
        }
        return true;
    });

    if (!stored) {
        error = QString("Failed to save flight duties: %1").arg(m_flightDutyRepository->lastError());
        LOG_ERROR(error);
    }
    return stored;
}

ManualEntryResult ManualEntryProcessor::processManualEntry(const ManualEntryData& data, const QUuid& userId,
                                                           DutyTypes::Position position, int selectedYear)
{
    return processBatchManualEntries(QList<ManualEntryData>{data}, userId, position, selectedYear);
}

ManualEntryResult ManualEntryProcessor::processBatchManualEntries(const QList<ManualEntryData>& entries,
                                                                  const QUuid& userId,
                                                                  DutyTypes::Position position,
                                                                  int selectedYear)
{
    ManualEntryResult result;
    const bool single = entries.size() == 1;

    QList<QSharedPointer<FlightDutyModel>> duties;
    for (int i = 0; i < entries.size(); ++i) {
        const QString prefix = single ? QString() : QString("Entry %1: ").arg(i + 1);
        const ManualValidationResult validation = validateManualEntry(entries.at(i), position, selectedYear);

        for (const QString& warning : validation.warnings) {
            result.warnings.append(prefix + warning);
        }

        if (!validation.valid) {
            result.errors.append(prefix + validation.errors.join(", "));
            continue;
        }

        QStringList conversionWarnings;
        duties.append(convertToFlightDuties(entries.at(i), userId, position, conversionWarnings));
        for (const QString& warning : conversionWarnings) {
            result.warnings.append(prefix + warning);
        }
    }

    if (duties.isEmpty()) {
        if (result.errors.isEmpty()) {
            result.errors.append("No entries to process");
        }
        return result;
    }

    QString error;
    if (!storeDuties(duties, userId, error)) {
        result.errors.append(error);
        return result;
    }

    result.flightDuties = duties;
    result.processedCount = duties.size();

    QList<QPair<int, int>> months;
    for (const auto& duty : duties) {
        const QPair<int, int> key(duty->month(), duty->year());
        if (!months.contains(key)) {
            months.append(key);
        }
    }

    result.recalculations = m_recalculationEngine->recalculateMonths(userId, months, position);
    for (const RecalculationResult& recalculation : result.recalculations) {
        result.warnings.append(recalculation.warnings);
        for (const QString& recalcError : recalculation.errors) {
            result.errors.append(QString("%1/%2: %3").arg(recalculation.month).arg(recalculation.year).arg(recalcError));
        }
    }

    LOG_INFO(QString("Manual entry stored %1 flight duties across %2 months")
            .arg(result.processedCount).arg(months.size()));

    result.success = result.errors.isEmpty();
    return result;
}
