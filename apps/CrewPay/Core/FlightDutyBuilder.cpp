#include "FlightDutyBuilder.h"
#include "ModelFactory.h"
#include "logger/logger.h"

#include <QJsonArray>
#include <QRegularExpression>

using DutyTypes::DutyType;

namespace {

QString rowLabel(const RosterRow& row)
{
    return QString("Row %1").arg(row.rowIndex + 1);
}

QStringList nonEmptyLines(const QString& text)
{
    QStringList lines;
    for (const QString& line : text.split('\n')) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            lines.append(trimmed);
        }
    }
    return lines;
}

}

FlightDutyBuilder::FlightDutyBuilder(const DutyBuildOptions& options)
    : m_options(options)
    , m_classifier(options.homeBase)
{
}

DutyBuildResult FlightDutyBuilder::build(const QList<RosterRow>& rows) const
{
    DutyBuildResult result;

    for (const RosterRow& row : rows) {
        if (m_options.filterToTargetMonth && m_options.month > 0 && m_options.year > 0
            && (row.date.month() != m_options.month || row.date.year() != m_options.year)) {
            result.warnings.append(QString("Filtered out duty from %1 (belongs to %2/%3, target: %4/%5)")
                                   .arg(row.date.toString(Qt::ISODate))
                                   .arg(row.date.month()).arg(row.date.year())
                                   .arg(m_options.month).arg(m_options.year));
            ++result.filteredRows;
            continue;
        }

        QSharedPointer<FlightDutyModel> duty = buildDuty(row, result.warnings);
        if (duty) {
            result.duties.append(duty);
        } else {
            ++result.skippedRows;
        }
    }

    if (result.filteredRows > 0) {
        result.warnings.append(QString("Month boundary filtering: %1 duties filtered out (%2 remaining)")
                               .arg(result.filteredRows).arg(result.duties.size()));
    }

    LOG_INFO(QString("Built %1 duties from %2 rows (%3 skipped, %4 outside %5/%6)")
             .arg(result.duties.size()).arg(rows.size()).arg(result.skippedRows)
             .arg(result.filteredRows).arg(m_options.month).arg(m_options.year));
    return result;
}

QSharedPointer<FlightDutyModel> FlightDutyBuilder::buildDuty(const RosterRow& row, QStringList& warnings) const
{
    if (!row.date.isValid()) {
        warnings.append(QString("%1: Invalid date \"%2\"").arg(rowLabel(row), row.dateText));
        return nullptr;
    }

    const ClassificationResult classification = m_classifier.classify(row.duties, row.details);
    for (const QString& warning : classification.warnings) {
        warnings.append(QString("%1: %2").arg(rowLabel(row), warning));
    }

    LOG_DEBUG(QString("%1 classified as %2 (%3): %4")
              .arg(rowLabel(row), DutyTypes::dutyTypeToString(classification.dutyType))
              .arg(classification.confidence)
              .arg(classification.reasoning));

    if (classification.dutyType == DutyType::Off) {
        return nullptr;
    }

    QSharedPointer<FlightDutyModel> duty(ModelFactory::createDefaultFlightDuty(m_options.userId, row.date));
    duty->setDutyType(classification.dutyType);
    duty->setFlightNumbers(classification.flightNumbers);
    duty->setSectors(classification.sectors);
    duty->setDataSource(m_options.dataSource);
    duty->setOriginalData(originalData(row, classification));

    bool ok = false;
    if (classification.dutyType == DutyType::Recurrent) {
        ok = applyTrainingTimes(duty.data(), row, warnings);
    } else {
        ok = applyTimes(duty.data(), row, warnings);
    }

    if (!ok) {
        return nullptr;
    }
    return duty;
}

bool FlightDutyBuilder::applyTimes(FlightDutyModel* duty, const RosterRow& row, QStringList& warnings) const
{
    const QString reportToken = firstLine(row.reportTime);
    const QString debriefToken = lastLine(row.debriefTime);
    const DutyType type = duty->dutyType();

    if (reportToken.isEmpty() || debriefToken.isEmpty()) {
        switch (type) {
            case DutyType::Sby:
                // Unpaid home standby without times is not worth a record
                return false;
            case DutyType::Asby:
                warnings.append(QString("%1: Airport standby without report/debrief times").arg(rowLabel(row)));
                return true;
            case DutyType::BusinessPromotion:
            case DutyType::Rest:
            case DutyType::AnnualLeave:
                return true;
            default:
                warnings.append(QString("%1: Missing report or debrief time").arg(rowLabel(row)));
                return false;
        }
    }

    TimeValue report;
    TimeValue debrief;
    try {
        report = TimeParser::parse(reportToken, row.rowIndex + 1);
        debrief = TimeParser::parse(debriefToken, row.rowIndex + 1);
    } catch (const TimeFormatError& e) {
        warnings.append(QString("%1: Invalid time \"%2\": %3").arg(rowLabel(row), e.token(), e.reason()));
        LOG_DEBUG(QString::fromStdString(e.what()));
        return false;
    }

    bool crossDay = debrief.isCrossDay;
    if (TimeParser::impliesOvernight(report, debrief, crossDay)) {
        if (!m_options.inferImplicitOvernight) {
            warnings.append(QString("%1: Debrief %2 is not after report %3 and has no next-day marker")
                            .arg(rowLabel(row), debrief.toString(), report.toString()));
            return false;
        }
        warnings.append(QString("%1: Debrief %2 is not after report %3 without a next-day marker; treated as overnight duty")
                        .arg(rowLabel(row), debrief.toString(), report.toString()));
        crossDay = true;
    }

    duty->setReportTime(report.toQTime());
    duty->setDebriefTime(debrief.toQTime());
    duty->setIsCrossDay(crossDay);
    duty->setDutyHours(TimeParser::calculateDuration(report, debrief, crossDay));
    return true;
}

bool FlightDutyBuilder::applyTrainingTimes(FlightDutyModel* duty, const RosterRow& row, QStringList& warnings) const
{
    std::optional<TrainingTimes> times;
    if (!row.actualTimes.isEmpty()) {
        times = parseTrainingTimes(row.actualTimes);
        if (!times) {
            warnings.append(QString("%1: Could not read training times \"%2\", using 08:00-16:00")
                            .arg(rowLabel(row), row.actualTimes.simplified()));
        }
    }

    if (!times) {
        // Report/debrief columns are used when present, otherwise a standard training day
        const std::optional<TimeValue> report = TimeParser::tryParse(firstLine(row.reportTime));
        const std::optional<TimeValue> debrief = TimeParser::tryParse(lastLine(row.debriefTime));

        TrainingTimes fallback;
        if (report && debrief) {
            fallback.start = *report;
            fallback.end = *debrief;
            fallback.isCrossDay = debrief->isCrossDay || TimeParser::impliesOvernight(*report, *debrief, debrief->isCrossDay);
            fallback.totalHours = TimeParser::calculateDuration(*report, *debrief, fallback.isCrossDay);
        } else {
            fallback.start = TimeValue::fromMinutes(8 * 60);
            fallback.end = TimeValue::fromMinutes(16 * 60);
            fallback.totalHours = 8.0;
        }
        times = fallback;
    }

    duty->setReportTime(times->start.toQTime());
    duty->setDebriefTime(times->end.toQTime());
    duty->setIsCrossDay(times->isCrossDay);
    duty->setDutyHours(times->totalHours);
    return true;
}

QJsonObject FlightDutyBuilder::originalData(const RosterRow& row, const ClassificationResult& classification) const
{
    QJsonObject classificationJson;
    classificationJson["duty_type"] = DutyTypes::dutyTypeToString(classification.dutyType);
    classificationJson["confidence"] = classification.confidence;
    classificationJson["reasoning"] = classification.reasoning;

    QJsonObject json;
    json["row"] = QJsonArray::fromStringList(row.rawCells);
    json["row_index"] = row.rowIndex;
    json["source"] = DutyTypes::dataSourceToString(m_options.dataSource);
    json["duties"] = row.duties;
    json["details"] = row.details;
    json["classification"] = classificationJson;
    if (!row.actualTimes.isEmpty()) {
        json["actual_times"] = row.actualTimes;
    }
    return json;
}

QString FlightDutyBuilder::firstLine(const QString& text)
{
    const QStringList lines = nonEmptyLines(text);
    return lines.isEmpty() ? QString() : lines.first();
}

QString FlightDutyBuilder::lastLine(const QString& text)
{
    const QStringList lines = nonEmptyLines(text);
    return lines.isEmpty() ? QString() : lines.last();
}

std::optional<TrainingTimes> FlightDutyBuilder::parseTrainingTimes(const QString& text)
{
    static const QRegularExpression rangePattern("(\\d{1,2}:\\d{2})\\s*-\\s*(\\d{1,2}:\\d{2})");

    TrainingTimes times;
    int totalMinutes = 0;
    bool first = true;

    QRegularExpressionMatchIterator it = rangePattern.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const std::optional<TimeValue> start = TimeParser::tryParse(match.captured(1));
        const std::optional<TimeValue> end = TimeParser::tryParse(match.captured(2));
        if (!start || !end) {
            return std::nullopt;
        }

        totalMinutes += TimeParser::calculateDurationMinutes(*start, *end, false);
        if (first) {
            times.start = *start;
            first = false;
        }
        times.end = *end;
    }

    if (first) {
        return std::nullopt;
    }

    times.isCrossDay = times.end.totalMinutes <= times.start.totalMinutes;
    times.totalHours = totalMinutes / 60.0;
    return times;
}
