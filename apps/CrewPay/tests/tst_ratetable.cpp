#include <QtTest>
#include "Core/RateTable.h"

using DutyTypes::Position;

class TestRateTable : public QObject
{
    Q_OBJECT

private slots:
    void legacyRatesBeforeJuly2025();
    void newRatesFromJuly2025();
    void sharedRates();
    void undatedLookupUsesLegacy();
    void erasAreAppendOnly();
};

void TestRateTable::legacyRatesBeforeJuly2025()
{
    const SalaryRates ccm = RateTable::standard().resolve(Position::CCM, 2025, 6);
    QCOMPARE(ccm.basicSalary, 3275.0);
    QCOMPARE(ccm.housingAllowance, 4000.0);
    QCOMPARE(ccm.totalFixed(), 8275.0);

    const SalaryRates sccm = RateTable::standard().resolve(Position::SCCM, 2024, 12);
    QCOMPARE(sccm.basicSalary, 4275.0);
    QCOMPARE(sccm.housingAllowance, 5000.0);
}

void TestRateTable::newRatesFromJuly2025()
{
    const SalaryRates ccm = RateTable::standard().resolve(Position::CCM, 2025, 7);
    QCOMPARE(ccm.basicSalary, 3405.0);
    QCOMPARE(ccm.housingAllowance, 4500.0);

    const SalaryRates sccm = RateTable::standard().resolve(Position::SCCM, 2026, 1);
    QCOMPARE(sccm.basicSalary, 4446.0);
    QCOMPARE(sccm.housingAllowance, 5500.0);
}

void TestRateTable::sharedRates()
{
    for (int month = 1; month <= 12; ++month) {
        const SalaryRates ccm = RateTable::standard().resolve(Position::CCM, 2025, month);
        const SalaryRates sccm = RateTable::standard().resolve(Position::SCCM, 2025, month);
        QCOMPARE(ccm.hourlyRate, 50.0);
        QCOMPARE(sccm.hourlyRate, 62.0);
        QCOMPARE(ccm.perDiemRate, 8.82);
        QCOMPARE(ccm.transportAllowance, 1000.0);
        QCOMPARE(ccm.asbyFixedPay(), 200.0);
        QCOMPARE(sccm.asbyFixedPay(), 248.0);
    }
}

void TestRateTable::undatedLookupUsesLegacy()
{
    QCOMPARE(RateTable::standard().resolve(Position::CCM).basicSalary, 3275.0);
    // Before the first era the earliest rates still apply
    QCOMPARE(RateTable::standard().resolve(Position::CCM, 2019, 1).basicSalary, 3275.0);
}

void TestRateTable::erasAreAppendOnly()
{
    RateTable table(RateTable::standard().eras());
    const int eraCount = table.eras().size();

    RateEra earlier = table.eras().first();
    earlier.effectiveYear = 2020;
    QVERIFY(!table.addEra(earlier));
    QCOMPARE(table.eras().size(), eraCount);

    RateEra later = table.eras().last();
    later.effectiveYear = 2027;
    later.effectiveMonth = 1;
    later.label = "2027";
    later.ccm.basicSalary = 3600;
    QVERIFY(table.addEra(later));

    QCOMPARE(table.resolve(Position::CCM, 2026, 12).basicSalary, 3405.0);
    QCOMPARE(table.resolve(Position::CCM, 2027, 1).basicSalary, 3600.0);
}

QTEST_MAIN(TestRateTable)
#include "tst_ratetable.moc"
