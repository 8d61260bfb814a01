#ifndef RATETABLE_H
#define RATETABLE_H

#include <QList>
#include <QString>
#include "Models/DutyTypes.h"

struct SalaryRates {
    DutyTypes::Position position = DutyTypes::Position::CCM;
    double basicSalary = 0.0;
    double housingAllowance = 0.0;
    double transportAllowance = 0.0;
    double hourlyRate = 0.0;
    double perDiemRate = 0.0;
    double asbyHours = 4.0;

    double totalFixed() const { return basicSalary + housingAllowance + transportAllowance; }
    double asbyFixedPay() const { return asbyHours * hourlyRate; }
};

/**
 * @brief Rate set effective from the first day of (effectiveYear, effectiveMonth)
 */
struct RateEra {
    int effectiveYear = 0;
    int effectiveMonth = 1;
    QString label;
    SalaryRates ccm;
    SalaryRates sccm;

    int sortKey() const { return effectiveYear * 12 + (effectiveMonth - 1); }
};

/**
 * @brief Append-only list of effective-dated rate sets
 *
 * resolve() returns the last era whose effective date is on or before the
 * requested month. Introducing a new pay era means appending to the table;
 * callers never change.
 */
class RateTable {
public:
    // Legacy rates plus the July 2025 revision
    static const RateTable& standard();

    explicit RateTable(const QList<RateEra>& eras = QList<RateEra>());

    /**
     * @brief Appends an era; rejected unless it starts after the current last era
     */
    bool addEra(const RateEra& era);

    SalaryRates resolve(DutyTypes::Position position, int year, int month) const;

    // No date given: the earliest (legacy) rates
    SalaryRates resolve(DutyTypes::Position position) const;

    const RateEra* eraFor(int year, int month) const;
    const QList<RateEra>& eras() const { return m_eras; }
    bool isEmpty() const { return m_eras.isEmpty(); }

private:
    QList<RateEra> m_eras;
};

#endif // RATETABLE_H
