#include <QtTest>
#include <QTimeZone>
#include "Core/LayoverPairer.h"
#include "Core/ModelFactory.h"
#include "Core/PayCalculator.h"

using DutyTypes::DutyType;

namespace {

const QUuid kUserId("{5f7d1c2e-0a4b-4c8d-9e1f-2a3b4c5d6e7f}");

QSharedPointer<FlightDutyModel> leg(const QDate& date, const QString& flight, const QString& sector,
                                    const QTime& report, const QTime& debrief, bool crossDay = false)
{
    QSharedPointer<FlightDutyModel> duty(ModelFactory::createDefaultFlightDuty(kUserId, date));
    duty->setDutyType(DutyType::Layover);
    duty->setFlightNumbers({flight});
    duty->setSectors({sector});
    duty->setReportTime(report);
    duty->setDebriefTime(debrief);
    duty->setIsCrossDay(crossDay);
    return duty;
}

}

class TestLayoverPairer : public QObject
{
    Q_OBJECT

private slots:
    void pairsOutboundWithInbound();
    void restPeriodCarriesPerDiem();
    void outboundWithoutInboundIsUnpaired();
    void inboundOutsideWindowIsIgnored();
    void destinationMustMatch();
    void inboundIsUsedOnce();
    void skipsInboundBeforeDebrief();
    void crossMonthInboundCandidate();
    void classifiesLegs();
};

void TestLayoverPairer::pairsOutboundWithInbound()
{
    const auto outbound = leg(QDate(2025, 7, 10), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));
    const auto inbound = leg(QDate(2025, 7, 11), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    const LayoverPairer pairer;
    const PairingResult result = pairer.pair({inbound, outbound}, 7, 2025);

    QCOMPARE(result.pairs.size(), 1);
    QVERIFY(result.unpaired.isEmpty());

    const LayoverPair& pair = result.pairs.first();
    QCOMPARE(pair.outbound, outbound);
    QCOMPARE(pair.inbound, inbound);
    QCOMPARE(pair.destination, QString("KHI"));
    QCOMPARE(pair.restHours, 23.5);
    QCOMPARE(pair.restStart, QDateTime(QDate(2025, 7, 10), QTime(16, 0), QTimeZone::utc()));
    QCOMPARE(pair.restEnd, QDateTime(QDate(2025, 7, 11), QTime(15, 30), QTimeZone::utc()));
}

void TestLayoverPairer::restPeriodCarriesPerDiem()
{
    const auto outbound = leg(QDate(2025, 7, 10), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));
    const auto inbound = leg(QDate(2025, 7, 11), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    const PairingResult pairing = LayoverPairer().pair({outbound, inbound}, 7, 2025);
    const PayCalculator calculator;
    const auto periods = calculator.createRestPeriods(kUserId, DutyTypes::Position::CCM, pairing.pairs);

    QCOMPARE(periods.size(), 1);
    const auto& period = periods.first();
    QCOMPARE(period->outboundFlightId(), outbound->id());
    QCOMPARE(period->inboundFlightId(), inbound->id());
    QCOMPARE(period->restHours(), 23.5);
    QCOMPARE(period->perDiemPay(), 207.27);
    QCOMPARE(period->perDiemPay(), PayCalculator::roundCurrency(period->restHours() * 8.82));
    QCOMPARE(period->month(), 7);
    QCOMPARE(period->year(), 2025);
}

void TestLayoverPairer::outboundWithoutInboundIsUnpaired()
{
    const auto outbound = leg(QDate(2025, 7, 10), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));

    const PairingResult result = LayoverPairer().pair({outbound}, 7, 2025);
    QVERIFY(result.pairs.isEmpty());
    QCOMPARE(result.unpaired.size(), 1);
    QCOMPARE(result.warnings.size(), 1);
    QVERIFY(result.warnings.first().startsWith("No pair found for outbound flight FZ967 to KHI"));
}

void TestLayoverPairer::inboundOutsideWindowIsIgnored()
{
    const auto outbound = leg(QDate(2025, 7, 1), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));
    const auto late = leg(QDate(2025, 7, 7), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    QCOMPARE(LayoverPairer("DXB", 5).pair({outbound, late}, 7, 2025).pairs.size(), 0);
    QCOMPARE(LayoverPairer("DXB", 6).pair({outbound, late}, 7, 2025).pairs.size(), 1);
}

void TestLayoverPairer::destinationMustMatch()
{
    const auto outbound = leg(QDate(2025, 7, 10), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));
    const auto inbound = leg(QDate(2025, 7, 11), "FZ332", "LHE-DXB", QTime(15, 30), QTime(19, 0));

    const PairingResult result = LayoverPairer().pair({outbound, inbound}, 7, 2025);
    QVERIFY(result.pairs.isEmpty());
    QCOMPARE(result.unpaired.size(), 1);
}

void TestLayoverPairer::inboundIsUsedOnce()
{
    const auto first = leg(QDate(2025, 7, 10), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));
    const auto second = leg(QDate(2025, 7, 11), "FZ967", "DXB-KHI", QTime(12, 0), QTime(16, 0));
    const auto inbound = leg(QDate(2025, 7, 12), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    const PairingResult result = LayoverPairer().pair({first, second, inbound}, 7, 2025);
    QCOMPARE(result.pairs.size(), 1);
    QCOMPARE(result.pairs.first().outbound, first);
    QCOMPARE(result.pairs.first().restHours, 47.5);
    QCOMPARE(result.unpaired.size(), 1);
    QCOMPARE(result.unpaired.first(), second);
}

void TestLayoverPairer::skipsInboundBeforeDebrief()
{
    // Debrief at 03:00 on 11 July; the 01:00 inbound that day leaves before it
    const auto outbound = leg(QDate(2025, 7, 10), "FZ967", "DXB-KHI", QTime(20, 0), QTime(3, 0), true);
    const auto early = leg(QDate(2025, 7, 11), "FZ970", "KHI-DXB", QTime(1, 0), QTime(4, 30));
    const auto later = leg(QDate(2025, 7, 12), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    const PairingResult result = LayoverPairer().pair({outbound, early, later}, 7, 2025);
    QCOMPARE(result.pairs.size(), 1);
    QCOMPARE(result.pairs.first().inbound, later);
    QCOMPARE(result.pairs.first().restHours, 36.5);
    QVERIFY(result.unpaired.isEmpty());
    QCOMPARE(result.warnings.size(), 1);
    QVERIFY(result.warnings.first().contains("not positive"));
}

void TestLayoverPairer::crossMonthInboundCandidate()
{
    const auto outbound = leg(QDate(2025, 7, 31), "FZ967", "DXB-KHI", QTime(20, 0), QTime(0, 30), true);
    const auto inbound = leg(QDate(2025, 8, 2), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    const PairingResult july = LayoverPairer().pair({outbound, inbound}, 7, 2025);
    QCOMPARE(july.pairs.size(), 1);
    // Debrief after midnight on 1 August, report on 2 August
    QCOMPARE(july.pairs.first().restHours, 39.0);

    // The July outbound belongs to July; August pairs nothing
    const PairingResult august = LayoverPairer().pair({outbound, inbound}, 8, 2025);
    QVERIFY(august.pairs.isEmpty());
    QVERIFY(august.unpaired.isEmpty());
}

void TestLayoverPairer::classifiesLegs()
{
    const LayoverPairer pairer("dxb");
    const auto outbound = leg(QDate(2025, 7, 10), "FZ967", "DXB - KHI", QTime(12, 0), QTime(16, 0));
    const auto inbound = leg(QDate(2025, 7, 11), "FZ968", "KHI-DXB", QTime(15, 30), QTime(19, 0));

    QVERIFY(pairer.isOutbound(*outbound));
    QVERIFY(!pairer.isInbound(*outbound));
    QVERIFY(pairer.isInbound(*inbound));
    QCOMPARE(pairer.destinationOf(*outbound), QString("KHI"));
    QCOMPARE(pairer.destinationOf(*inbound), QString("KHI"));
}

QTEST_MAIN(TestLayoverPairer)
#include "tst_layoverpairer.moc"
