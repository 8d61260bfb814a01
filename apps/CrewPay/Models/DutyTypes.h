#ifndef DUTYTYPES_H
#define DUTYTYPES_H

#include <QObject>
#include <QString>

namespace DutyTypes {

    Q_NAMESPACE

    // Corresponds to the duty_type column values
    enum class DutyType {
        Turnaround,
        Layover,
        Asby,
        Sby,
        Recurrent,
        Off,
        BusinessPromotion,
        Rest,
        AnnualLeave,
        Unknown
    };
    Q_ENUM_NS(DutyType)

    enum class Position {
        CCM,
        SCCM
    };
    Q_ENUM_NS(Position)

    // Where a flight duty record came from
    enum class DataSource {
        Csv,
        Excel,
        Manual,
        Edited
    };
    Q_ENUM_NS(DataSource)

    enum class AuditAction {
        Created,
        Updated,
        Deleted
    };
    Q_ENUM_NS(AuditAction)

    QString dutyTypeToString(DutyType type);
    DutyType dutyTypeFromString(const QString& value);

    QString positionToString(Position position);
    // Accepts CCM/SCCM and the roster codes CM/SCM; false for anything else
    bool positionFromString(const QString& value, Position& position);

    QString dataSourceToString(DataSource source);
    DataSource dataSourceFromString(const QString& value);

    QString auditActionToString(AuditAction action);
    AuditAction auditActionFromString(const QString& value);

    // Turnaround, layover and ASBY count as flights in the monthly summary
    bool isFlightDuty(DutyType type);

}

#endif // DUTYTYPES_H
