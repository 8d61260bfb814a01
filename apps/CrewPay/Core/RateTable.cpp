#include "RateTable.h"
#include "logger/logger.h"

namespace {

SalaryRates makeRates(DutyTypes::Position position, double basic, double housing, double transport,
                      double hourly, double perDiem)
{
    SalaryRates rates;
    rates.position = position;
    rates.basicSalary = basic;
    rates.housingAllowance = housing;
    rates.transportAllowance = transport;
    rates.hourlyRate = hourly;
    rates.perDiemRate = perDiem;
    rates.asbyHours = 4.0;
    return rates;
}

RateTable buildStandardTable()
{
    RateEra legacy;
    legacy.effectiveYear = 2000;
    legacy.effectiveMonth = 1;
    legacy.label = "legacy";
    legacy.ccm = makeRates(DutyTypes::Position::CCM, 3275, 4000, 1000, 50, 8.82);
    legacy.sccm = makeRates(DutyTypes::Position::SCCM, 4275, 5000, 1000, 62, 8.82);

    RateEra july2025;
    july2025.effectiveYear = 2025;
    july2025.effectiveMonth = 7;
    july2025.label = "2025-07";
    july2025.ccm = makeRates(DutyTypes::Position::CCM, 3405, 4500, 1000, 50, 8.82);
    july2025.sccm = makeRates(DutyTypes::Position::SCCM, 4446, 5500, 1000, 62, 8.82);

    RateTable table;
    table.addEra(legacy);
    table.addEra(july2025);
    return table;
}

}

const RateTable& RateTable::standard()
{
    static const RateTable table = buildStandardTable();
    return table;
}

RateTable::RateTable(const QList<RateEra>& eras)
{
    for (const RateEra& era : eras) {
        addEra(era);
    }
}

bool RateTable::addEra(const RateEra& era)
{
    if (era.effectiveMonth < 1 || era.effectiveMonth > 12) {
        LOG_ERROR(QString("Rejected rate era '%1': invalid month %2").arg(era.label).arg(era.effectiveMonth));
        return false;
    }

    if (!m_eras.isEmpty() && era.sortKey() <= m_eras.last().sortKey()) {
        LOG_ERROR(QString("Rejected rate era '%1': must start after %2")
                  .arg(era.label, m_eras.last().label));
        return false;
    }

    m_eras.append(era);
    return true;
}

const RateEra* RateTable::eraFor(int year, int month) const
{
    if (m_eras.isEmpty()) {
        return nullptr;
    }

    const int key = year * 12 + (month - 1);
    const RateEra* selected = &m_eras.first();
    for (const RateEra& era : m_eras) {
        if (era.sortKey() <= key) {
            selected = &era;
        } else {
            break;
        }
    }
    return selected;
}

SalaryRates RateTable::resolve(DutyTypes::Position position, int year, int month) const
{
    const RateEra* era = eraFor(year, month);
    if (!era) {
        LOG_ERROR("Rate table is empty");
        return SalaryRates();
    }
    return position == DutyTypes::Position::SCCM ? era->sccm : era->ccm;
}

SalaryRates RateTable::resolve(DutyTypes::Position position) const
{
    if (m_eras.isEmpty()) {
        LOG_ERROR("Rate table is empty");
        return SalaryRates();
    }
    return position == DutyTypes::Position::SCCM ? m_eras.first().sccm : m_eras.first().ccm;
}
