#ifndef STRUCTUREDETECTOR_H
#define STRUCTUREDETECTOR_H

#include <QDate>
#include <QString>
#include <optional>
#include "RosterGrid.h"
#include "RosterTypes.h"

/**
 * @brief Locates metadata cells and the duty rows inside a roster grid
 *
 * CSV exports use a fixed layout: airline marker in A1, period in C2, data
 * from the fifth row until the "total hours" row.
 *
 * Spreadsheet exports are first checked against the standard layout (marker
 * in A1, date range in G4, employee line in A6, headers on row 9). When that
 * does not match, a bounded scan looks for the marker, the
 * "Schedule Details" banner and the header keywords and re-derives the column
 * mapping before giving up.
 *
 * Non-duty calendar rows (day off, rest day) and blank rows are skipped
 * without a warning.
 */
class StructureDetector {
public:
    IngestResult detectCsv(const RosterGrid& grid) const;
    IngestResult detectExcel(const RosterGrid& grid) const;

    // "January 2025", "Jan-25", "01/2025"
    static bool parsePeriodText(const QString& text, int& month, int& year);

    // "01/07/2025 - 31/07/2025 (All times in Local Base)"
    static bool parseDateRange(const QString& text, QDate& start, QDate& end);

    static std::optional<EmployeeInfo> parseEmployeeInfo(const QString& text, QString* error = nullptr);

    /**
     * @brief Parses a roster date cell
     *
     * Accepts DD/MM/YYYY (also with '-' or '.'), an optional trailing weekday
     * ("03/04/2025 Thu"), DD/MM with fallbackYear, and spreadsheet serial
     * numbers. Day and month are swapped only when the second field exceeds 12.
     */
    static QDate parseRosterDate(const QString& text, int fallbackYear = 0);

    static bool containsAirlineMarker(const QString& text);
    static bool isEndSentinel(const QString& text);

    // Keyword based mapping of a header row
    static ColumnMapping mapHeaderRow(const RosterGrid& grid, int row);

    // Standard spreadsheet columns A, C, F, L, M, Q, U
    static ColumnMapping standardExcelColumns();

    static const int CsvDataStartRow = 4;
    static const int ExcelHeaderRow = 8;
    static const int MaxConsecutiveEmptyRows = 5;

private:
    bool matchesStandardExcelLayout(const RosterGrid& grid) const;
    bool locateFlexibleExcelLayout(const RosterGrid& grid, RosterMetadata& metadata, QStringList& errors) const;
    void extractExcelMetadata(const RosterGrid& grid, RosterMetadata& metadata, QStringList& warnings) const;
    void collectExcelRows(const RosterGrid& grid, IngestResult& result) const;

    static RosterRow makeRow(const RosterGrid& grid, int row, const ColumnMapping& columns);
};

#endif // STRUCTUREDETECTOR_H
