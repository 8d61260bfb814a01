#include "StructureDetector.h"
#include "Core/DutyClassifier.h"
#include "logger/logger.h"

#include <QRegularExpression>
#include <utility>

namespace {

const QString AIRLINE_MARKER = "flydubai";
const QString SCHEDULE_BANNER = "schedule details";

// Flexible scan windows
const int MARKER_SCAN_ROWS = 20;
const int BANNER_SCAN_ROWS = 30;
const int SCAN_COLUMNS = 26;
const int DATE_RANGE_SCAN_ROWS = 20;
const int EMPLOYEE_SCAN_ROWS = 20;
const int EMPLOYEE_SCAN_COLUMNS = 6;

const QStringList MONTH_NAMES = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

int normalizeYear(int year)
{
    return year < 100 ? year + 2000 : year;
}

QDate excelSerialToDate(double serial)
{
    // Spreadsheet day zero, accounting for the 1900 leap year bug
    return QDate(1899, 12, 30).addDays(static_cast<qint64>(serial));
}

}

//-----------------------------------------------------------------------------
// CSV
//-----------------------------------------------------------------------------

IngestResult StructureDetector::detectCsv(const RosterGrid& grid) const
{
    IngestResult result;
    result.metadata.format = RosterFormat::Csv;

    if (grid.rowCount() < 2) {
        result.errors.append("CSV file does not contain enough rows");
        return result;
    }

    if (!containsAirlineMarker(grid.cell(0, 0))) {
        result.errors.append("Cell A1 does not contain the flydubai identifier");
    }

    const QString period = grid.cell(1, 2);
    result.metadata.periodText = period;
    if (period.isEmpty()) {
        result.errors.append("Cell C2 is empty; expected the roster month and year");
    } else if (!parsePeriodText(period, result.metadata.month, result.metadata.year)) {
        result.errors.append(QString("Could not extract month and year from cell C2: \"%1\"").arg(period));
    }

    if (!result.errors.isEmpty()) {
        LOG_WARNING(QString("CSV structure rejected: %1").arg(result.errors.join("; ")));
        return result;
    }

    result.metadata.periodStart = QDate(result.metadata.year, result.metadata.month, 1);
    result.metadata.periodEnd = result.metadata.periodStart.addMonths(1).addDays(-1);
    result.metadata.dataStartRow = CsvDataStartRow;
    result.metadata.headerRow = CsvDataStartRow - 1;

    ColumnMapping& columns = result.metadata.columns;
    columns.date = 0;
    columns.duties = 1;
    columns.details = 2;
    columns.reportTime = 3;
    columns.debriefTime = 4;

    for (int row = CsvDataStartRow; row < grid.rowCount(); ++row) {
        const QStringList cells = grid.row(row);

        bool sentinel = false;
        for (const QString& cell : cells) {
            if (isEndSentinel(cell)) {
                sentinel = true;
                break;
            }
        }
        if (sentinel) {
            LOG_DEBUG(QString("CSV data ends at row %1").arg(row + 1));
            break;
        }

        if (grid.isRowBlank(row)) {
            continue;
        }

        // Day-off rows are often exported without their time columns
        const QString duties = cells.value(columns.duties).trimmed();
        if (duties.isEmpty() || DutyClassifier::isNonDutyCalendarEntry(duties)) {
            continue;
        }

        if (cells.size() < 5) {
            result.warnings.append(QString("Row %1: Expected at least 5 columns, found %2")
                                   .arg(row + 1).arg(cells.size()));
            continue;
        }

        RosterRow rosterRow = makeRow(grid, row, columns);

        rosterRow.date = parseRosterDate(rosterRow.dateText, result.metadata.year);
        if (!rosterRow.date.isValid()) {
            result.warnings.append(QString("Row %1: Invalid date format \"%2\"").arg(row + 1).arg(rosterRow.dateText));
            continue;
        }

        result.rows.append(rosterRow);
    }

    result.success = true;
    LOG_INFO(QString("CSV roster for %1/%2: %3 duty rows, %4 warnings")
             .arg(result.metadata.month).arg(result.metadata.year)
             .arg(result.rows.size()).arg(result.warnings.size()));
    return result;
}

//-----------------------------------------------------------------------------
// Spreadsheet
//-----------------------------------------------------------------------------

IngestResult StructureDetector::detectExcel(const RosterGrid& grid) const
{
    IngestResult result;
    result.metadata.format = RosterFormat::Excel;

    if (grid.rowCount() == 0) {
        result.errors.append("Worksheet is empty");
        return result;
    }

    if (matchesStandardExcelLayout(grid)) {
        result.metadata.headerRow = ExcelHeaderRow;
        result.metadata.dataStartRow = ExcelHeaderRow + 1;
        result.metadata.columns = standardExcelColumns();
    } else {
        LOG_INFO("Standard spreadsheet layout not found, scanning for roster structure");
        if (!locateFlexibleExcelLayout(grid, result.metadata, result.errors)) {
            LOG_WARNING(QString("Spreadsheet structure rejected: %1").arg(result.errors.join("; ")));
            return result;
        }
        result.metadata.usedFlexibleLayout = true;
    }

    extractExcelMetadata(grid, result.metadata, result.warnings);
    if (result.metadata.month == 0 || result.metadata.year == 0) {
        result.errors.append("Could not find the roster date range (DD/MM/YYYY - DD/MM/YYYY)");
        LOG_WARNING(result.errors.last());
        return result;
    }

    collectExcelRows(grid, result);

    result.success = true;
    LOG_INFO(QString("Spreadsheet roster for %1/%2 (%3 layout): %4 duty rows, %5 warnings")
             .arg(result.metadata.month).arg(result.metadata.year)
             .arg(result.metadata.usedFlexibleLayout ? "flexible" : "standard")
             .arg(result.rows.size()).arg(result.warnings.size()));
    return result;
}

bool StructureDetector::matchesStandardExcelLayout(const RosterGrid& grid) const
{
    if (!containsAirlineMarker(grid.cell(0, 0))) {
        return false;
    }

    const ColumnMapping standard = standardExcelColumns();
    const QString dateHeader = grid.cell(ExcelHeaderRow, standard.date).toLower();
    const QString dutiesHeader = grid.cell(ExcelHeaderRow, standard.duties).toLower();
    return dateHeader.contains("date") && dutiesHeader.contains("duties");
}

bool StructureDetector::locateFlexibleExcelLayout(const RosterGrid& grid, RosterMetadata& metadata,
                                                  QStringList& errors) const
{
    bool markerFound = false;
    for (int row = 0; row < qMin(MARKER_SCAN_ROWS, grid.rowCount()); ++row) {
        if (containsAirlineMarker(grid.cell(row, 0))) {
            markerFound = true;
            break;
        }
    }
    if (!markerFound) {
        errors.append(QString("flydubai identifier not found in the first %1 rows of column A").arg(MARKER_SCAN_ROWS));
        return false;
    }

    int bannerRow = -1;
    for (int row = 0; row < qMin(BANNER_SCAN_ROWS, grid.rowCount()) && bannerRow < 0; ++row) {
        for (int column = 0; column < SCAN_COLUMNS; ++column) {
            if (grid.cell(row, column).toLower().contains(SCHEDULE_BANNER)) {
                bannerRow = row;
                break;
            }
        }
    }
    if (bannerRow < 0) {
        errors.append("\"Schedule Details\" section not found");
        return false;
    }

    // Headers normally follow the banner directly; allow one spacer row
    for (int row = bannerRow + 1; row <= bannerRow + 2 && row < grid.rowCount(); ++row) {
        const ColumnMapping mapping = mapHeaderRow(grid, row);
        if (mapping.isComplete()) {
            metadata.headerRow = row;
            metadata.dataStartRow = row + 1;
            metadata.columns = mapping;
            LOG_DEBUG(QString("Header row %1: date=%2 duties=%3 details=%4 report=%5 debrief=%6")
                      .arg(row + 1).arg(mapping.date).arg(mapping.duties).arg(mapping.details)
                      .arg(mapping.reportTime).arg(mapping.debriefTime));
            return true;
        }
    }

    errors.append("Required columns (Date, Duties) not found below \"Schedule Details\"");
    return false;
}

void StructureDetector::extractExcelMetadata(const RosterGrid& grid, RosterMetadata& metadata,
                                             QStringList& warnings) const
{
    QString rangeText;
    if (!metadata.usedFlexibleLayout && parseDateRange(grid.cell(3, 6), metadata.periodStart, metadata.periodEnd)) {
        rangeText = grid.cell(3, 6);
    } else {
        for (int row = 0; row < qMin(DATE_RANGE_SCAN_ROWS, grid.rowCount()) && rangeText.isEmpty(); ++row) {
            for (int column = 0; column < SCAN_COLUMNS; ++column) {
                const QString text = grid.cell(row, column);
                if (parseDateRange(text, metadata.periodStart, metadata.periodEnd)) {
                    rangeText = text;
                    break;
                }
            }
        }
    }

    if (!rangeText.isEmpty()) {
        metadata.periodText = rangeText;
        metadata.month = metadata.periodStart.month();
        metadata.year = metadata.periodStart.year();
    }

    QString employeeText;
    if (!metadata.usedFlexibleLayout && parseEmployeeInfo(grid.cell(5, 0))) {
        employeeText = grid.cell(5, 0);
    } else {
        for (int row = 0; row < qMin(EMPLOYEE_SCAN_ROWS, grid.rowCount()) && employeeText.isEmpty(); ++row) {
            for (int column = 0; column < EMPLOYEE_SCAN_COLUMNS; ++column) {
                if (parseEmployeeInfo(grid.cell(row, column))) {
                    employeeText = grid.cell(row, column);
                    break;
                }
            }
        }
    }

    if (employeeText.isEmpty()) {
        warnings.append("Could not parse employee info");
        return;
    }

    QString error;
    const std::optional<EmployeeInfo> employee = parseEmployeeInfo(employeeText, &error);
    if (employee) {
        metadata.employee = *employee;
    } else {
        warnings.append(QString("Could not parse employee info: %1").arg(error));
    }
}

void StructureDetector::collectExcelRows(const RosterGrid& grid, IngestResult& result) const
{
    const ColumnMapping& columns = result.metadata.columns;
    int emptyRows = 0;

    for (int row = result.metadata.dataStartRow; row < grid.rowCount(); ++row) {
        if (isEndSentinel(grid.cell(row, 0)) || isEndSentinel(grid.firstNonEmpty(row))) {
            LOG_DEBUG(QString("Spreadsheet data ends at row %1").arg(row + 1));
            break;
        }

        RosterRow rosterRow = makeRow(grid, row, columns);

        if (rosterRow.dateText.isEmpty() && rosterRow.duties.isEmpty()) {
            if (++emptyRows >= MaxConsecutiveEmptyRows) {
                LOG_DEBUG(QString("Stopping after %1 empty rows at row %2").arg(emptyRows).arg(row + 1));
                break;
            }
            continue;
        }
        emptyRows = 0;

        const QString lowerDate = rosterRow.dateText.toLower();
        if (rosterRow.dateText.isEmpty() || lowerDate.contains("date") || lowerDate.contains("schedule")) {
            continue;
        }

        if (rosterRow.duties.isEmpty()
            || DutyClassifier::isNonDutyCalendarEntry(rosterRow.duties)
            || DutyClassifier::isNonDutyCalendarEntry(rosterRow.details)) {
            continue;
        }

        rosterRow.date = parseRosterDate(rosterRow.dateText, result.metadata.year);
        if (!rosterRow.date.isValid()) {
            result.warnings.append(QString("Row %1: Invalid date format \"%2\"").arg(row + 1).arg(rosterRow.dateText));
            continue;
        }

        result.rows.append(rosterRow);
    }
}

RosterRow StructureDetector::makeRow(const RosterGrid& grid, int row, const ColumnMapping& columns)
{
    RosterRow rosterRow;
    rosterRow.rowIndex = row;
    rosterRow.rawCells = grid.row(row);
    rosterRow.dateText = grid.cell(row, columns.date).trimmed();
    rosterRow.duties = grid.cell(row, columns.duties).trimmed();
    rosterRow.details = grid.cell(row, columns.details).trimmed();
    rosterRow.reportTime = grid.cell(row, columns.reportTime).trimmed();
    rosterRow.debriefTime = grid.cell(row, columns.debriefTime).trimmed();
    rosterRow.actualTimes = grid.cell(row, columns.actualTimes).trimmed();
    rosterRow.indicator = grid.cell(row, columns.indicator).trimmed();
    return rosterRow;
}

//-----------------------------------------------------------------------------
// Metadata parsing
//-----------------------------------------------------------------------------

bool StructureDetector::parsePeriodText(const QString& text, int& month, int& year)
{
    const QString lower = text.trimmed().toLower();
    if (lower.isEmpty()) {
        return false;
    }

    int foundMonth = 0;
    int foundYear = 0;

    for (int i = 0; i < MONTH_NAMES.size(); ++i) {
        if (lower.contains(MONTH_NAMES.at(i))) {
            foundMonth = i + 1;
            break;
        }
    }

    // Abbreviations such as "Jan-25" or "Sept 2025"
    if (foundMonth == 0) {
        static const QRegularExpression wordPattern("[a-z]{3,}");
        QRegularExpressionMatchIterator words = wordPattern.globalMatch(lower);
        while (words.hasNext() && foundMonth == 0) {
            const QString word = words.next().captured(0);
            for (int i = 0; i < MONTH_NAMES.size(); ++i) {
                if (MONTH_NAMES.at(i).startsWith(word)) {
                    foundMonth = i + 1;
                    break;
                }
            }
        }
    }

    if (foundMonth != 0) {
        static const QRegularExpression yearPattern("(?:^|[^\\d])(20\\d{2}|\\d{2})(?:$|[^\\d])");
        const QRegularExpressionMatch match = yearPattern.match(lower);
        if (match.hasMatch()) {
            foundYear = normalizeYear(match.captured(1).toInt());
        }
    } else {
        static const QRegularExpression numericPattern("\\b(\\d{1,2})[/\\-](\\d{2,4})\\b");
        const QRegularExpressionMatch match = numericPattern.match(lower);
        if (match.hasMatch()) {
            foundMonth = match.captured(1).toInt();
            foundYear = normalizeYear(match.captured(2).toInt());
        }
    }

    if (foundMonth < 1 || foundMonth > 12 || foundYear == 0) {
        return false;
    }

    month = foundMonth;
    year = foundYear;
    return true;
}

bool StructureDetector::parseDateRange(const QString& text, QDate& start, QDate& end)
{
    static const QRegularExpression rangePattern("(\\d{2})/(\\d{2})/(\\d{4})\\s*-\\s*(\\d{2})/(\\d{2})/(\\d{4})");
    const QRegularExpressionMatch match = rangePattern.match(text);
    if (!match.hasMatch()) {
        return false;
    }

    const QDate first(match.captured(3).toInt(), match.captured(2).toInt(), match.captured(1).toInt());
    const QDate last(match.captured(6).toInt(), match.captured(5).toInt(), match.captured(4).toInt());
    if (!first.isValid() || !last.isValid() || last < first) {
        return false;
    }

    start = first;
    end = last;
    return true;
}

std::optional<EmployeeInfo> StructureDetector::parseEmployeeInfo(const QString& text, QString* error)
{
    const QStringList parts = text.simplified().split(' ', Qt::SkipEmptyParts);
    if (parts.size() < 4) {
        if (error) {
            *error = QString("Invalid employee info format: \"%1\"").arg(text);
        }
        return std::nullopt;
    }

    static const QRegularExpression idPattern("^\\d+$");
    if (!idPattern.match(parts.first()).hasMatch()) {
        if (error) {
            *error = QString("Employee number missing in \"%1\"").arg(text);
        }
        return std::nullopt;
    }

    static const QRegularExpression detailsPattern("([A-Z]{3}),([A-Z]+),([A-Z0-9]+)");
    const QRegularExpressionMatch details = detailsPattern.match(parts.mid(3).join(' '));
    if (!details.hasMatch()) {
        if (error) {
            *error = QString("Could not parse employee details from \"%1\"").arg(parts.mid(3).join(' '));
        }
        return std::nullopt;
    }

    EmployeeInfo info;
    info.employeeId = parts.at(0);
    info.lastName = parts.at(1);
    info.firstName = parts.at(2);
    info.base = details.captured(1);
    info.positionCode = details.captured(2);
    info.aircraft = details.captured(3);
    info.hasPosition = DutyTypes::positionFromString(info.positionCode, info.position);

    if (!info.hasPosition) {
        LOG_WARNING(QString("Unknown position code \"%1\" for employee %2").arg(info.positionCode, info.employeeId));
    }
    return info;
}

QDate StructureDetector::parseRosterDate(const QString& text, int fallbackYear)
{
    QString cleaned = text.trimmed();
    if (cleaned.isEmpty()) {
        return QDate();
    }

    // Serial day numbers from date-typed spreadsheet cells
    bool isNumber = false;
    const double serial = cleaned.toDouble(&isNumber);
    if (isNumber) {
        if (serial >= 20000 && serial <= 80000) {
            return excelSerialToDate(serial);
        }
        return QDate();
    }

    // "03/04/2025 Thu" and multi-line cells keep only the leading date
    cleaned = cleaned.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts).first();

    static const QRegularExpression fullPattern("^(\\d{1,2})[/\\-.](\\d{1,2})[/\\-.](\\d{2,4})$");
    static const QRegularExpression shortPattern("^(\\d{1,2})[/\\-.](\\d{1,2})$");

    int day = 0;
    int month = 0;
    int year = 0;

    QRegularExpressionMatch match = fullPattern.match(cleaned);
    if (match.hasMatch()) {
        day = match.captured(1).toInt();
        month = match.captured(2).toInt();
        year = normalizeYear(match.captured(3).toInt());
    } else {
        match = shortPattern.match(cleaned);
        if (!match.hasMatch() || fallbackYear <= 0) {
            return QDate();
        }
        day = match.captured(1).toInt();
        month = match.captured(2).toInt();
        year = fallbackYear;
    }

    // Month-first exports
    if (month > 12 && day <= 12) {
        std::swap(day, month);
    }

    const QDate date(year, month, day);
    return date.isValid() ? date : QDate();
}

bool StructureDetector::containsAirlineMarker(const QString& text)
{
    return text.contains(AIRLINE_MARKER, Qt::CaseInsensitive);
}

bool StructureDetector::isEndSentinel(const QString& text)
{
    return text.contains("total hours", Qt::CaseInsensitive);
}

ColumnMapping StructureDetector::mapHeaderRow(const RosterGrid& grid, int row)
{
    ColumnMapping mapping;
    const int columns = qMax(grid.columnCount(row), SCAN_COLUMNS);

    for (int column = 0; column < columns; ++column) {
        const QString header = grid.cell(row, column).simplified().toLower();
        if (header.isEmpty()) {
            continue;
        }

        if (header.contains("report") && mapping.reportTime < 0) {
            mapping.reportTime = column;
        } else if (header.contains("debrief") && mapping.debriefTime < 0) {
            mapping.debriefTime = column;
        } else if (header.contains("actual") && mapping.actualTimes < 0) {
            mapping.actualTimes = column;
        } else if (header.contains("indicator") && mapping.indicator < 0) {
            mapping.indicator = column;
        } else if (header.contains("duties") && mapping.duties < 0) {
            mapping.duties = column;
        } else if (header.contains("details") && mapping.details < 0) {
            mapping.details = column;
        } else if (header.contains("date") && mapping.date < 0) {
            mapping.date = column;
        }
    }

    return mapping;
}

ColumnMapping StructureDetector::standardExcelColumns()
{
    ColumnMapping mapping;
    mapping.date = RosterGrid::columnIndex("A");
    mapping.duties = RosterGrid::columnIndex("C");
    mapping.details = RosterGrid::columnIndex("F");
    mapping.reportTime = RosterGrid::columnIndex("L");
    mapping.actualTimes = RosterGrid::columnIndex("M");
    mapping.debriefTime = RosterGrid::columnIndex("Q");
    mapping.indicator = RosterGrid::columnIndex("U");
    return mapping;
}
