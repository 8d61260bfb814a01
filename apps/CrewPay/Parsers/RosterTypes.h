#ifndef ROSTERTYPES_H
#define ROSTERTYPES_H

#include <QDate>
#include <QList>
#include <QString>
#include <QStringList>
#include "Models/DutyTypes.h"

enum class RosterFormat {
    Csv,
    Excel
};

/**
 * @brief Crew member line of a roster ("7818 TEIXEIRA RAFAEL DXB,CM,73H")
 */
struct EmployeeInfo {
    QString employeeId;
    QString lastName;
    QString firstName;
    QString base;
    QString positionCode;
    QString aircraft;
    DutyTypes::Position position = DutyTypes::Position::CCM;
    bool hasPosition = false;

    bool isValid() const { return !employeeId.isEmpty(); }
    QString fullName() const { return QString("%1 %2").arg(firstName, lastName).trimmed(); }
};

/**
 * @brief Zero-based grid columns of each roster field, -1 when absent
 */
struct ColumnMapping {
    int date = -1;
    int duties = -1;
    int details = -1;
    int reportTime = -1;
    int debriefTime = -1;
    int actualTimes = -1;
    int indicator = -1;

    bool isComplete() const { return date >= 0 && duties >= 0; }
};

// One calendar row with a duty, as found in the file
struct RosterRow {
    int rowIndex = -1;
    QDate date;
    QString dateText;
    QString duties;
    QString details;
    QString reportTime;
    QString debriefTime;
    QString actualTimes;
    QString indicator;
    QStringList rawCells;
};

struct RosterMetadata {
    RosterFormat format = RosterFormat::Csv;
    int month = 0;
    int year = 0;
    QDate periodStart;
    QDate periodEnd;
    QString periodText;
    EmployeeInfo employee;
    bool usedFlexibleLayout = false;
    int headerRow = -1;
    int dataStartRow = -1;
    ColumnMapping columns;
};

/**
 * @brief Outcome of structure detection or ingestion
 *
 * success is false only for structural errors; row problems are warnings and
 * the remaining rows are still returned.
 */
struct IngestResult {
    bool success = false;
    QList<RosterRow> rows;
    RosterMetadata metadata;
    QStringList errors;
    QStringList warnings;
};

#endif // ROSTERTYPES_H
