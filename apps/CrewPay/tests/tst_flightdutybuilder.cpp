#include <QtTest>
#include "Core/FlightDutyBuilder.h"

using DutyTypes::DutyType;

namespace {

RosterRow makeRow(const QDate& date, const QString& duties, const QString& details,
                  const QString& report, const QString& debrief, const QString& actualTimes = QString())
{
    static int rowIndex = 3;

    RosterRow row;
    row.rowIndex = ++rowIndex;
    row.date = date;
    row.dateText = date.toString("dd/MM/yyyy");
    row.duties = duties;
    row.details = details;
    row.reportTime = report;
    row.debriefTime = debrief;
    row.actualTimes = actualTimes;
    row.rawCells = QStringList{row.dateText, duties, details, report, debrief};
    return row;
}

DutyBuildOptions julyOptions()
{
    DutyBuildOptions options;
    options.userId = QUuid("{8b0f1a52-3d1c-4a55-9d0b-1f2e3a4b5c6d}");
    options.month = 7;
    options.year = 2025;
    options.dataSource = DutyTypes::DataSource::Csv;
    return options;
}

bool containsText(const QStringList& messages, const QString& text)
{
    for (const QString& message : messages) {
        if (message.contains(text)) {
            return true;
        }
    }
    return false;
}

}

class TestFlightDutyBuilder : public QObject
{
    Q_OBJECT

private slots:
    void buildsTurnaround();
    void multiLineCellsUseFirstReportAndLastDebrief();
    void explicitNextDayMarker();
    void implicitOvernightIsInferred();
    void implicitOvernightCanBeRejected();
    void recurrentUsesActualTimes();
    void recurrentDefaultsToTrainingDay();
    void standbyWithoutTimes();
    void rowsOutsideTargetMonthAreFiltered();
    void invalidTimesSkipRow();
    void parsesTrainingRanges();
};

void TestFlightDutyBuilder::buildsTurnaround()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 1), "FZ549 FZ550", "DXB - CMB CMB - DXB", "09:20", "17:50")
    });

    QCOMPARE(result.duties.size(), 1);
    const QSharedPointer<FlightDutyModel> duty = result.duties.first();
    QCOMPARE(duty->dutyType(), DutyType::Turnaround);
    QCOMPARE(duty->userId(), julyOptions().userId);
    QCOMPARE(duty->month(), 7);
    QCOMPARE(duty->year(), 2025);
    QCOMPARE(duty->flightNumbers(), QStringList({"FZ549", "FZ550"}));
    QCOMPARE(duty->sectors(), QStringList({"DXB-CMB", "CMB-DXB"}));
    QCOMPARE(duty->reportTime(), QTime(9, 20));
    QCOMPARE(duty->debriefTime(), QTime(17, 50));
    QVERIFY(!duty->isCrossDay());
    QCOMPARE(duty->dutyHours(), 8.5);
    QCOMPARE(duty->flightPay(), 0.0);
    QCOMPARE(duty->dataSource(), DutyTypes::DataSource::Csv);
    QCOMPARE(duty->originalData().value("duties").toString(), QString("FZ549 FZ550"));
    QCOMPARE(duty->originalData().value("classification").toObject().value("duty_type").toString(),
             QString("turnaround"));
}

void TestFlightDutyBuilder::multiLineCellsUseFirstReportAndLastDebrief()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 2), "FZ549\nFZ550", "DXB - CMB\nCMB - DXB", "09:20\n13:00", "12:00\n17:50")
    });

    QCOMPARE(result.duties.size(), 1);
    QCOMPARE(result.duties.first()->dutyHours(), 8.5);
}

void TestFlightDutyBuilder::explicitNextDayMarker()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 3), "FZ1141 FZ1142", "DXB - TBS TBS - DXB", "22:00", QString::fromUtf8("05:30¹"))
    });

    QCOMPARE(result.duties.size(), 1);
    QVERIFY(result.duties.first()->isCrossDay());
    QCOMPARE(result.duties.first()->dutyHours(), 7.5);
    QVERIFY(!containsText(result.warnings, "overnight"));
}

void TestFlightDutyBuilder::implicitOvernightIsInferred()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 3), "FZ1141 FZ1142", "DXB - TBS TBS - DXB", "22:00", "05:30")
    });

    QCOMPARE(result.duties.size(), 1);
    QVERIFY(result.duties.first()->isCrossDay());
    QCOMPARE(result.duties.first()->dutyHours(), 7.5);
    QVERIFY(containsText(result.warnings, "treated as overnight duty"));
}

void TestFlightDutyBuilder::implicitOvernightCanBeRejected()
{
    DutyBuildOptions options = julyOptions();
    options.inferImplicitOvernight = false;

    const FlightDutyBuilder builder(options);
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 3), "FZ1141 FZ1142", "DXB - TBS TBS - DXB", "22:00", "05:30")
    });

    QVERIFY(result.duties.isEmpty());
    QCOMPARE(result.skippedRows, 1);
    QVERIFY(containsText(result.warnings, "no next-day marker"));
}

void TestFlightDutyBuilder::recurrentUsesActualTimes()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 4), "RECURRENT", "", "", "", "08:00 - 12:00\n13:00 - 17:00")
    });

    QCOMPARE(result.duties.size(), 1);
    const QSharedPointer<FlightDutyModel> duty = result.duties.first();
    QCOMPARE(duty->dutyType(), DutyType::Recurrent);
    QCOMPARE(duty->reportTime(), QTime(8, 0));
    QCOMPARE(duty->debriefTime(), QTime(17, 0));
    QCOMPARE(duty->dutyHours(), 8.0);
}

void TestFlightDutyBuilder::recurrentDefaultsToTrainingDay()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 5), "ELD", "", "", "")
    });

    QCOMPARE(result.duties.size(), 1);
    QCOMPARE(result.duties.first()->reportTime(), QTime(8, 0));
    QCOMPARE(result.duties.first()->debriefTime(), QTime(16, 0));
    QCOMPARE(result.duties.first()->dutyHours(), 8.0);
}

void TestFlightDutyBuilder::standbyWithoutTimes()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 6), "SBY", "", "", ""),
        makeRow(QDate(2025, 7, 7), "ASBY", "", "", ""),
        makeRow(QDate(2025, 7, 8), "ASBY", "", "08:00", "12:00")
    });

    // Home standby without times yields no record, airport standby is kept
    QCOMPARE(result.duties.size(), 2);
    QCOMPARE(result.skippedRows, 1);
    QCOMPARE(result.duties.at(0)->dutyType(), DutyType::Asby);
    QCOMPARE(result.duties.at(0)->dutyHours(), 0.0);
    QCOMPARE(result.duties.at(1)->dutyHours(), 4.0);
    QVERIFY(containsText(result.warnings, "Airport standby without report/debrief times"));
}

void TestFlightDutyBuilder::rowsOutsideTargetMonthAreFiltered()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 6, 30), "FZ967", "DXB - KHI", "12:00", "16:00"),
        makeRow(QDate(2025, 7, 31), "FZ967", "DXB - KHI", "12:00", "16:00"),
        makeRow(QDate(2025, 8, 1), "FZ968", "KHI - DXB", "15:30", "19:00")
    });

    QCOMPARE(result.duties.size(), 1);
    QCOMPARE(result.filteredRows, 2);
    QVERIFY(containsText(result.warnings, "Filtered out duty from 2025-08-01"));
    QVERIFY(containsText(result.warnings, "2 duties filtered out (1 remaining)"));

    DutyBuildOptions options = julyOptions();
    options.filterToTargetMonth = false;
    QCOMPARE(FlightDutyBuilder(options).build({
        makeRow(QDate(2025, 8, 1), "FZ968", "KHI - DXB", "15:30", "19:00")
    }).duties.size(), 1);
}

void TestFlightDutyBuilder::invalidTimesSkipRow()
{
    const FlightDutyBuilder builder(julyOptions());
    const DutyBuildResult result = builder.build({
        makeRow(QDate(2025, 7, 9), "FZ549 FZ550", "DXB - CMB CMB - DXB", "ab:cd", "17:50"),
        makeRow(QDate(2025, 7, 10), "FZ549 FZ550", "DXB - CMB CMB - DXB", "", "")
    });

    QVERIFY(result.duties.isEmpty());
    QCOMPARE(result.skippedRows, 2);
    QVERIFY(containsText(result.warnings, "Invalid time"));
    QVERIFY(containsText(result.warnings, "Missing report or debrief time"));
}

void TestFlightDutyBuilder::parsesTrainingRanges()
{
    const std::optional<TrainingTimes> overnight = FlightDutyBuilder::parseTrainingTimes("23:00 - 01:00");
    QVERIFY(overnight.has_value());
    QVERIFY(overnight->isCrossDay);
    QCOMPARE(overnight->totalHours, 2.0);

    QVERIFY(!FlightDutyBuilder::parseTrainingTimes("classroom").has_value());
}

QTEST_MAIN(TestFlightDutyBuilder)
#include "tst_flightdutybuilder.moc"
