#include <QtTest>
#include "Core/TimeParser.h"

class TestTimeParser : public QObject
{
    Q_OBJECT

private slots:
    void parsesPlainTimes_data();
    void parsesPlainTimes();
    void superscriptMarksNextDay();
    void stripsExportArtifacts();
    void rejectsInvalidTokens_data();
    void rejectsInvalidTokens();
    void tryParseReportsError();
    void durationIsNeverNegative();
    void durationHonoursCrossDay();
    void restPeriodAcrossDays();
    void formatsHours();
};

void TestTimeParser::parsesPlainTimes_data()
{
    QTest::addColumn<QString>("token");
    QTest::addColumn<int>("hours");
    QTest::addColumn<int>("minutes");

    QTest::newRow("morning") << "09:20" << 9 << 20;
    QTest::newRow("midnight") << "00:00" << 0 << 0;
    QTest::newRow("single digit hour") << "7:05" << 7 << 5;
    QTest::newRow("last minute") << "23:59" << 23 << 59;
    QTest::newRow("padded") << "  14:30 " << 14 << 30;
}

void TestTimeParser::parsesPlainTimes()
{
    QFETCH(QString, token);
    QFETCH(int, hours);
    QFETCH(int, minutes);

    const TimeValue value = TimeParser::parse(token);
    QCOMPARE(value.hours, hours);
    QCOMPARE(value.minutes, minutes);
    QCOMPARE(value.totalMinutes, hours * 60 + minutes);
    QVERIFY(!value.isCrossDay);
}

void TestTimeParser::superscriptMarksNextDay()
{
    const TimeValue plain = TimeParser::parse("05:45");
    const TimeValue marked = TimeParser::parse(QString::fromUtf8("05:45¹"));

    QVERIFY(marked.isCrossDay);
    QCOMPARE(marked.hours, plain.hours);
    QCOMPARE(marked.minutes, plain.minutes);
    QCOMPARE(marked.totalMinutes, plain.totalMinutes);

    QVERIFY(TimeParser::hasCrossDayMarker(QString::fromUtf8("01:10⁺¹")));
    QVERIFY(!TimeParser::hasCrossDayMarker(QString::fromUtf8("01:10⁰")));
}

void TestTimeParser::stripsExportArtifacts()
{
    const TimeValue value = TimeParser::parse(QString::fromUtf8("04:33?¹"));
    QCOMPARE(value.totalMinutes, 4 * 60 + 33);
    QVERIFY(value.isCrossDay);

    bool crossDay = true;
    QCOMPARE(TimeParser::cleanToken(QString::fromUtf8("♦12:00"), &crossDay), QString("12:00"));
    QVERIFY(!crossDay);

    QCOMPARE(TimeParser::parse("05:45 (L)").totalMinutes, 5 * 60 + 45);
}

void TestTimeParser::rejectsInvalidTokens_data()
{
    QTest::addColumn<QString>("token");

    QTest::newRow("empty") << "";
    QTest::newRow("text") << "ASBY";
    QTest::newRow("hour out of range") << "25:00";
    QTest::newRow("minute out of range") << "10:75";
}

void TestTimeParser::rejectsInvalidTokens()
{
    QFETCH(QString, token);
    QVERIFY_THROWS_EXCEPTION(TimeFormatError, TimeParser::parse(token, 12));
}

void TestTimeParser::tryParseReportsError()
{
    QString error;
    QVERIFY(!TimeParser::tryParse("nope", &error).has_value());
    QVERIFY(error.contains("nope"));

    try {
        TimeParser::parse("nope", 7);
        QFAIL("parse accepted an invalid token");
    } catch (const TimeFormatError& e) {
        QCOMPARE(e.token(), QString("nope"));
        QCOMPARE(e.row(), 7);
    }
}

void TestTimeParser::durationIsNeverNegative()
{
    for (int report = 0; report < 24 * 60; report += 37) {
        for (int debrief = 0; debrief < 24 * 60; debrief += 53) {
            const TimeValue start = TimeValue::fromMinutes(report);
            const TimeValue end = TimeValue::fromMinutes(debrief);
            QVERIFY(TimeParser::calculateDuration(start, end, false) >= 0.0);
            QVERIFY(TimeParser::calculateDuration(start, end, true) >= 0.0);
        }
    }
}

void TestTimeParser::durationHonoursCrossDay()
{
    const TimeValue report = TimeParser::parse("09:20");
    const TimeValue debrief = TimeParser::parse("17:50");
    QCOMPARE(TimeParser::calculateDuration(report, debrief, false), 8.5);

    const TimeValue lateReport = TimeParser::parse("22:00");
    const TimeValue earlyDebrief = TimeParser::parse(QString::fromUtf8("05:30¹"));
    QCOMPARE(TimeParser::calculateDuration(lateReport, earlyDebrief, earlyDebrief.isCrossDay), 7.5);

    QVERIFY(TimeParser::impliesOvernight(lateReport, TimeParser::parse("05:30"), false));
    QVERIFY(!TimeParser::impliesOvernight(report, debrief, false));
}

void TestTimeParser::restPeriodAcrossDays()
{
    const TimeValue debrief = TimeParser::parse("16:00");
    const TimeValue report = TimeParser::parse("15:30");
    QCOMPARE(TimeParser::calculateRestPeriod(debrief, false, report, 1), 23.5);

    // Debrief after midnight shortens the rest
    QCOMPARE(TimeParser::calculateRestPeriod(TimeParser::parse("01:00"), true, report, 2), 38.5);
}

void TestTimeParser::formatsHours()
{
    QCOMPARE(TimeParser::formatTime(TimeValue::fromMinutes(65)), QString("01:05"));
    QCOMPARE(TimeParser::formatDecimalHours(8.5), QString("8:30"));
    QCOMPARE(TimeParser::formatDecimalHours(10.25), QString("10:15"));
}

QTEST_MAIN(TestTimeParser)
#include "tst_timeparser.moc"
