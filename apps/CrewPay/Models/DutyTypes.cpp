#include "DutyTypes.h"

namespace DutyTypes {

QString dutyTypeToString(DutyType type)
{
    switch (type) {
    case DutyType::Turnaround:        return "turnaround";
    case DutyType::Layover:           return "layover";
    case DutyType::Asby:              return "asby";
    case DutyType::Sby:               return "sby";
    case DutyType::Recurrent:         return "recurrent";
    case DutyType::Off:               return "off";
    case DutyType::BusinessPromotion: return "business_promotion";
    case DutyType::Rest:              return "rest";
    case DutyType::AnnualLeave:       return "annual_leave";
    case DutyType::Unknown:           return "unknown";
    }
    return "unknown";
}

DutyType dutyTypeFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == "turnaround") return DutyType::Turnaround;
    if (normalized == "layover") return DutyType::Layover;
    if (normalized == "asby") return DutyType::Asby;
    if (normalized == "sby") return DutyType::Sby;
    if (normalized == "recurrent") return DutyType::Recurrent;
    if (normalized == "off") return DutyType::Off;
    if (normalized == "business_promotion") return DutyType::BusinessPromotion;
    if (normalized == "rest") return DutyType::Rest;
    if (normalized == "annual_leave") return DutyType::AnnualLeave;
    return DutyType::Unknown;
}

QString positionToString(Position position)
{
    return position == Position::SCCM ? "SCCM" : "CCM";
}

bool positionFromString(const QString& value, Position& position)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == "CCM" || normalized == "CM") {
        position = Position::CCM;
        return true;
    }
    if (normalized == "SCCM" || normalized == "SCM") {
        position = Position::SCCM;
        return true;
    }
    return false;
}

QString dataSourceToString(DataSource source)
{
    switch (source) {
    case DataSource::Csv:    return "csv";
    case DataSource::Excel:  return "excel";
    case DataSource::Manual: return "manual";
    case DataSource::Edited: return "edited";
    }
    return "manual";
}

DataSource dataSourceFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == "csv") return DataSource::Csv;
    if (normalized == "excel") return DataSource::Excel;
    if (normalized == "edited") return DataSource::Edited;
    return DataSource::Manual;
}

QString auditActionToString(AuditAction action)
{
    switch (action) {
    case AuditAction::Created: return "created";
    case AuditAction::Updated: return "updated";
    case AuditAction::Deleted: return "deleted";
    }
    return "created";
}

AuditAction auditActionFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == "updated") return AuditAction::Updated;
    if (normalized == "deleted") return AuditAction::Deleted;
    return AuditAction::Created;
}

bool isFlightDuty(DutyType type)
{
    return type == DutyType::Turnaround || type == DutyType::Layover || type == DutyType::Asby;
}

}
