#include <QtTest>
#include "Core/DutyClassifier.h"

using DutyTypes::DutyType;

class TestDutyClassifier : public QObject
{
    Q_OBJECT

private slots:
    void classifiesRows_data();
    void classifiesRows();
    void turnaroundConfidence();
    void singleFlightWithoutSector();
    void unknownIsBestGuess();
    void recognizesCalendarRows();
    void extractsFlightsAndSectors();
    void validatesTokens();
    void turnaroundSequence();

private:
    DutyClassifier m_classifier;
};

void TestDutyClassifier::classifiesRows_data()
{
    QTest::addColumn<QString>("duties");
    QTest::addColumn<QString>("details");
    QTest::addColumn<DutyTypes::DutyType>("expected");

    QTest::newRow("turnaround") << "FZ549 FZ550" << "DXB - CMB CMB - DXB" << DutyType::Turnaround;
    QTest::newRow("outbound layover") << "FZ967" << "DXB - KHI" << DutyType::Layover;
    QTest::newRow("inbound layover") << "FZ968" << "KHI - DXB" << DutyType::Layover;
    QTest::newRow("airport standby") << "ASBY" << "" << DutyType::Asby;
    QTest::newRow("extended airport standby") << "XSBY" << "" << DutyType::Asby;
    QTest::newRow("home standby") << "SBY" << "" << DutyType::Sby;
    QTest::newRow("recurrent") << "RECURRENT" << "" << DutyType::Recurrent;
    QTest::newRow("e-learning") << "ELD" << "" << DutyType::Recurrent;
    QTest::newRow("business promotion") << "BUSINESS PROMOTION" << "" << DutyType::BusinessPromotion;
    QTest::newRow("day off") << "DAY OFF" << "" << DutyType::Off;
    QTest::newRow("rest day") << "REST DAY" << "" << DutyType::Off;
    QTest::newRow("annual leave") << "ANNUAL LEAVE" << "" << DutyType::AnnualLeave;
}

void TestDutyClassifier::classifiesRows()
{
    QFETCH(QString, duties);
    QFETCH(QString, details);
    QFETCH(DutyTypes::DutyType, expected);

    const ClassificationResult result = m_classifier.classify(duties, details);
    QCOMPARE(result.dutyType, expected);
    QVERIFY(!result.reasoning.isEmpty());
}

void TestDutyClassifier::turnaroundConfidence()
{
    const ClassificationResult confirmed = m_classifier.classify("FZ549 FZ550", "DXB - CMB\nCMB - DXB");
    QCOMPARE(confirmed.flightNumbers, QStringList({"FZ549", "FZ550"}));
    QCOMPARE(confirmed.sectors, QStringList({"DXB-CMB", "CMB-DXB"}));
    QCOMPARE(confirmed.confidence, 0.9);
    QVERIFY(confirmed.warnings.isEmpty());

    const ClassificationResult unconfirmed = m_classifier.classify("FZ549 FZ550", "");
    QCOMPARE(unconfirmed.dutyType, DutyType::Turnaround);
    QCOMPARE(unconfirmed.confidence, 0.7);
    QCOMPARE(unconfirmed.warnings.size(), 1);
}

void TestDutyClassifier::singleFlightWithoutSector()
{
    const ClassificationResult result = m_classifier.classify("FZ967", "");
    QCOMPARE(result.dutyType, DutyType::Layover);
    QCOMPARE(result.confidence, 0.6);
    QVERIFY(!result.warnings.isEmpty());
}

void TestDutyClassifier::unknownIsBestGuess()
{
    const ClassificationResult result = m_classifier.classify("MEETING", "");
    QCOMPARE(result.dutyType, DutyType::Unknown);
    QVERIFY(result.confidence < 0.5);
    QCOMPARE(result.warnings, QStringList({"Could not detect flight numbers in duties column"}));
}

void TestDutyClassifier::recognizesCalendarRows()
{
    QVERIFY(DutyClassifier::isNonDutyCalendarEntry("Day Off"));
    QVERIFY(DutyClassifier::isNonDutyCalendarEntry("ADDITIONAL DAY OFF"));
    QVERIFY(DutyClassifier::isNonDutyCalendarEntry("*OFF"));
    QVERIFY(DutyClassifier::isNonDutyCalendarEntry("X"));
    QVERIFY(!DutyClassifier::isNonDutyCalendarEntry(""));
    QVERIFY(!DutyClassifier::isNonDutyCalendarEntry("FZ549"));
}

void TestDutyClassifier::extractsFlightsAndSectors()
{
    QCOMPARE(DutyClassifier::extractFlightNumbers("fz549 FZ550 FZ549"), QStringList({"FZ549", "FZ550"}));
    QCOMPARE(DutyClassifier::extractSectors("DXB - KHI, KHI-DXB"), QStringList({"DXB-KHI", "KHI-DXB"}));
    QCOMPARE(DutyClassifier::sectorAirports("DXB - KHI"), QStringList({"DXB", "KHI"}));
}

void TestDutyClassifier::validatesTokens()
{
    QVERIFY(DutyClassifier::validateFlightNumber("FZ549"));
    QVERIFY(DutyClassifier::validateFlightNumber("FZ1234"));
    QVERIFY(!DutyClassifier::validateFlightNumber("EK549"));
    QVERIFY(!DutyClassifier::validateFlightNumber("FZ12"));

    QVERIFY(DutyClassifier::validateSector("DXB-KHI"));
    QVERIFY(DutyClassifier::validateSector("DXB - KHI"));
    QVERIFY(!DutyClassifier::validateSector("DX-KHI"));
}

void TestDutyClassifier::turnaroundSequence()
{
    QVERIFY(DutyClassifier::isTurnaroundSequence({"DXB-CMB", "CMB-DXB"}));
    QVERIFY(DutyClassifier::isTurnaroundSequence({"DXB-KWI", "KWI-BAH", "BAH-DXB"}));
    QVERIFY(!DutyClassifier::isTurnaroundSequence({"DXB-CMB", "KHI-DXB"}));
    QVERIFY(!DutyClassifier::isTurnaroundSequence({"DXB-CMB"}));
}

QTEST_MAIN(TestDutyClassifier)
#include "tst_dutyclassifier.moc"
