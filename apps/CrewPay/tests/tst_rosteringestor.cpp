#include <QtTest>
#include <miniz.h>
#include "Parsers/RosterIngestor.h"
#include "Parsers/StructureDetector.h"
#include "Parsers/XlsxRosterReader.h"

namespace {

typedef QList<QPair<QString, QString>> CellList;

QByteArray julyCsv()
{
    return QByteArray(
        "flydubai Crew Roster,,,,\n"
        ",,July 2025,,\n"
        ",,,,\n"
        "Date,Duties,Details,Report,Debrief\n"
        "01/07/2025,FZ549 FZ550,DXB - CMB CMB - DXB,09:20,17:50\n"
        "02/07/2025,DAY OFF,,,\n"
        "03/07/2025,ASBY,,08:00,12:00\n"
        "04/07/2025,FZ967\n"
        "\"05/07/2025\",\"FZ967\",\"DXB - KHI\",\"16:00\",\"02:10\xc2\xb9\"\n"
        "06/07/2025,Day off\n"
        "07/07/2025,OFF\n"
        "Total Hours,,,,\n"
        "06/07/2025,FZ001,DXB - BAH,10:00,12:00\n");
}

QString sheetXml(const CellList& cells)
{
    QMap<int, QStringList> rows;
    for (const auto& cell : cells) {
        int row = 0;
        int column = 0;
        RosterGrid::parseCellReference(cell.first, row, column);
        rows[row + 1].append(QString("<c r=\"%1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">%2</t></is></c>")
                             .arg(cell.first, cell.second.toHtmlEscaped()));
    }

    QString xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                  "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>";
    for (auto it = rows.constBegin(); it != rows.constEnd(); ++it) {
        xml += QString("<row r=\"%1\">%2</row>").arg(it.key()).arg(it.value().join(QString()));
    }
    xml += "</sheetData></worksheet>";
    return xml;
}

QByteArray zipArchive(const QMap<QString, QByteArray>& entries)
{
    mz_zip_archive zip;
    mz_zip_zero_struct(&zip);
    if (!mz_zip_writer_init_heap(&zip, 0, 0)) {
        return QByteArray();
    }

    for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
        const QByteArray name = it.key().toUtf8();
        if (!mz_zip_writer_add_mem(&zip, name.constData(), it.value().constData(),
                                   static_cast<size_t>(it.value().size()), MZ_DEFAULT_COMPRESSION)) {
            mz_zip_writer_end(&zip);
            return QByteArray();
        }
    }

    void* buffer = nullptr;
    size_t size = 0;
    QByteArray archive;
    if (mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size)) {
        archive = QByteArray(static_cast<const char*>(buffer), static_cast<int>(size));
        mz_free(buffer);
    }
    mz_zip_writer_end(&zip);
    return archive;
}

QByteArray standardWorkbook()
{
    const CellList cells = {
        {"A1", "flydubai"},
        {"G4", "01/07/2025 - 31/07/2025 (All times in Local Base)"},
        {"A6", "7818 TEIXEIRA RAFAEL DXB,CM,73H"},
        {"A8", "Schedule Details"},
        {"A9", "Date"}, {"C9", "Duties"}, {"F9", "Details"}, {"L9", "Report Time"},
        {"M9", "Actual Times"}, {"Q9", "Debrief Time"}, {"U9", "Indicator"},
        {"A10", "01/07/2025 Tue"}, {"C10", "FZ549\nFZ550"}, {"F10", "DXB - CMB\nCMB - DXB"},
        {"L10", "09:20"}, {"Q10", "17:50"},
        {"A11", "02/07/2025 Wed"}, {"C11", "FZ967"}, {"F11", "DXB - KHI"},
        {"L11", "12:00"}, {"Q11", "16:00"},
        {"A12", "03/07/2025 Thu"}, {"C12", "FZ968"}, {"F12", "KHI - DXB"},
        {"L12", "15:30"}, {"Q12", "19:00"},
        {"A13", "04/07/2025 Fri"}, {"C13", "ASBY"}, {"L13", "08:00"}, {"Q13", "12:00"},
        {"A14", "05/07/2025 Sat"}, {"C14", "DAY OFF"},
        {"A16", "Total Hours and Statistics"},
        {"A17", "06/07/2025 Sun"}, {"C17", "FZ001"}, {"F17", "DXB - BAH"},
        {"L17", "10:00"}, {"Q17", "12:00"}
    };

    QMap<QString, QByteArray> entries;
    entries["xl/workbook.xml"] =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
        "<sheets><sheet name=\"Roster\" sheetId=\"1\" r:id=\"rId1\"/></sheets></workbook>";
    entries["xl/_rels/workbook.xml.rels"] =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" "
        "Target=\"worksheets/roster.xml\"/></Relationships>";
    entries["xl/worksheets/roster.xml"] = sheetXml(cells).toUtf8();
    return zipArchive(entries);
}

QByteArray shiftedWorkbook()
{
    const CellList cells = {
        {"A2", "flydubai crew schedule"},
        {"D3", "01/08/2025 - 31/08/2025"},
        {"B4", "9001 DOE JANE DXB,SCM,73H"},
        {"B5", "Schedule Details"},
        {"A6", "Date"}, {"B6", "Duties"}, {"C6", "Details"}, {"D6", "Report Time"}, {"E6", "Debrief Time"},
        {"A7", "01/08/2025"}, {"B7", "FZ1141 FZ1142"}, {"C7", "DXB - TBS TBS - DXB"},
        {"D7", "06:05"}, {"E7", "13:35"},
        {"A8", "02/08/2025"}, {"B8", "SBY"}, {"D8", "04:00"}, {"E8", "16:00"}
    };

    QMap<QString, QByteArray> entries;
    entries["xl/worksheets/sheet1.xml"] = sheetXml(cells).toUtf8();
    return zipArchive(entries);
}

}

class TestRosterIngestor : public QObject
{
    Q_OBJECT

private slots:
    void ingestsCsvRoster();
    void csvSkipsShortDayOffRows();
    void csvRejectsMissingMarker();
    void csvRejectsMissingPeriod();
    void rejectsInvalidFiles();
    void detectsFormat();
    void ingestsStandardWorkbook();
    void ingestsShiftedWorkbook();
    void refusesOversizedWorkbookPart();
    void rejectsWorkbookWithoutRange();
    void parsesRosterDates();
    void parsesPeriodText();
    void parsesEmployeeInfo();
};

void TestRosterIngestor::ingestsCsvRoster()
{
    const RosterIngestor ingestor;
    const IngestResult result = ingestor.ingest(julyCsv(), "roster.csv");

    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QCOMPARE(result.metadata.format, RosterFormat::Csv);
    QCOMPARE(result.metadata.month, 7);
    QCOMPARE(result.metadata.year, 2025);

    // Day off rows are skipped silently even without time columns, the short
    // FZ967 row with a warning, rows after the sentinel are ignored
    QCOMPARE(result.rows.size(), 3);
    QCOMPARE(result.rows.at(0).date, QDate(2025, 7, 1));
    QCOMPARE(result.rows.at(0).duties, QString("FZ549 FZ550"));
    QCOMPARE(result.rows.at(0).reportTime, QString("09:20"));
    QCOMPARE(result.rows.at(1).duties, QString("ASBY"));
    QCOMPARE(result.rows.at(2).details, QString("DXB - KHI"));

    QCOMPARE(result.warnings.size(), 1);
    QVERIFY(result.warnings.first().contains("Expected at least 5 columns"));
}

void TestRosterIngestor::csvSkipsShortDayOffRows()
{
    const QByteArray content(
        "flydubai Crew Roster,,,,\n"
        ",,July 2025,,\n"
        ",,,,\n"
        "Date,Duties,Details,Report,Debrief\n"
        "01/07/2025,Day off\n"
        "02/07/2025,OFF\n"
        "03/07/2025,REST DAY,\n"
        "04/07/2025,,\n"
        "05/07/2025,ASBY,,08:00,12:00\n"
        "Total Hours,,,,\n");

    const IngestResult result = RosterIngestor().ingest(content, "roster.csv");
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QCOMPARE(result.rows.size(), 1);
    QCOMPARE(result.rows.first().duties, QString("ASBY"));
    QVERIFY2(result.warnings.isEmpty(), qPrintable(result.warnings.join("; ")));
}

void TestRosterIngestor::csvRejectsMissingMarker()
{
    QByteArray content = julyCsv();
    content.replace("flydubai", "airline");

    const IngestResult result = RosterIngestor().ingest(content, "roster.csv");
    QVERIFY(!result.success);
    QVERIFY(result.errors.first().contains("A1"));
    QVERIFY(result.rows.isEmpty());
}

void TestRosterIngestor::csvRejectsMissingPeriod()
{
    QByteArray content = julyCsv();
    content.replace("July 2025", "Crew");

    const IngestResult result = RosterIngestor().ingest(content, "roster.csv");
    QVERIFY(!result.success);
    QVERIFY(result.errors.first().contains("C2"));
}

void TestRosterIngestor::rejectsInvalidFiles()
{
    const RosterIngestor ingestor;

    IngestResult result = ingestor.ingest(julyCsv(), "roster.pdf");
    QVERIFY(!result.success);
    QVERIFY(result.errors.first().startsWith("Unsupported file type"));

    result = ingestor.ingest(QByteArray(), "roster.csv");
    QCOMPARE(result.errors, QStringList({"File is empty"}));

    result = ingestor.ingest("flydubai\n,,July 2025\nx\n", "roster.csv");
    QCOMPARE(result.errors, QStringList({"CSV file must contain at least 5 lines"}));

    result = RosterIngestor(64).ingest(julyCsv(), "roster.csv");
    QVERIFY(!result.success);
    QVERIFY(result.errors.first().contains("exceeds the maximum"));

    result = ingestor.ingest(julyCsv(), "roster.xlsx");
    QCOMPARE(result.errors, QStringList({"File is not a valid Excel workbook"}));
}

void TestRosterIngestor::detectsFormat()
{
    QVERIFY(RosterIngestor::detectFormat("July.CSV") == RosterFormat::Csv);
    QVERIFY(RosterIngestor::detectFormat("text/csv") == RosterFormat::Csv);
    QVERIFY(RosterIngestor::detectFormat("roster.xlsm") == RosterFormat::Excel);
    QVERIFY(RosterIngestor::detectFormat("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet")
            == RosterFormat::Excel);
    QVERIFY(!RosterIngestor::detectFormat("roster.xls").has_value());
}

void TestRosterIngestor::ingestsStandardWorkbook()
{
    const QByteArray workbook = standardWorkbook();
    QVERIFY(!workbook.isEmpty());

    const IngestResult result = RosterIngestor().ingest(workbook, "roster.xlsx");
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));

    const RosterMetadata& metadata = result.metadata;
    QCOMPARE(metadata.format, RosterFormat::Excel);
    QVERIFY(!metadata.usedFlexibleLayout);
    QCOMPARE(metadata.month, 7);
    QCOMPARE(metadata.year, 2025);
    QCOMPARE(metadata.periodEnd, QDate(2025, 7, 31));
    QCOMPARE(metadata.employee.employeeId, QString("7818"));
    QCOMPARE(metadata.employee.fullName(), QString("RAFAEL TEIXEIRA"));
    QVERIFY(metadata.employee.hasPosition);
    QCOMPARE(metadata.employee.position, DutyTypes::Position::CCM);

    QCOMPARE(result.rows.size(), 4);
    QCOMPARE(result.rows.at(0).date, QDate(2025, 7, 1));
    QCOMPARE(result.rows.at(0).duties, QString("FZ549\nFZ550"));
    QCOMPARE(result.rows.at(1).reportTime, QString("12:00"));
    QCOMPARE(result.rows.at(2).debriefTime, QString("19:00"));
    QCOMPARE(result.rows.at(3).duties, QString("ASBY"));
}

void TestRosterIngestor::ingestsShiftedWorkbook()
{
    const IngestResult result = RosterIngestor().ingest(shiftedWorkbook(), "roster.xlsx");
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));

    QVERIFY(result.metadata.usedFlexibleLayout);
    QCOMPARE(result.metadata.month, 8);
    QCOMPARE(result.metadata.columns.duties, 1);
    QCOMPARE(result.metadata.columns.debriefTime, 4);
    QCOMPARE(result.metadata.employee.position, DutyTypes::Position::SCCM);

    QCOMPARE(result.rows.size(), 2);
    QCOMPARE(result.rows.at(0).duties, QString("FZ1141 FZ1142"));
    QCOMPARE(result.rows.at(1).duties, QString("SBY"));
}

void TestRosterIngestor::refusesOversizedWorkbookPart()
{
    const QByteArray workbook = standardWorkbook();

    XlsxRosterReader reader;
    RosterGrid grid;
    QVERIFY2(reader.read(workbook, grid), qPrintable(reader.lastError()));
    QCOMPARE(reader.sheetName(), QString("Roster"));

    XlsxRosterReader limited;
    limited.setMaxPartSize(128);
    QCOMPARE(limited.maxPartSize(), qint64(128));
    RosterGrid limitedGrid;
    QVERIFY(!limited.read(workbook, limitedGrid));
    QVERIFY2(limited.lastError().contains("exceeds 128 bytes"), qPrintable(limited.lastError()));
    QVERIFY(limited.lastError().contains("xl/workbook.xml"));
}

void TestRosterIngestor::rejectsWorkbookWithoutRange()
{
    QMap<QString, QByteArray> entries;
    entries["xl/worksheets/sheet1.xml"] = sheetXml({
        {"A1", "flydubai"},
        {"A8", "Schedule Details"},
        {"A9", "Date"}, {"C9", "Duties"},
        {"A10", "01/07/2025"}, {"C10", "ASBY"}
    }).toUtf8();

    const IngestResult result = RosterIngestor().ingest(zipArchive(entries), "roster.xlsx");
    QVERIFY(!result.success);
    QVERIFY(result.errors.last().contains("date range"));
}

void TestRosterIngestor::parsesRosterDates()
{
    QCOMPARE(StructureDetector::parseRosterDate("03/04/2025"), QDate(2025, 4, 3));
    QCOMPARE(StructureDetector::parseRosterDate("03/04/2025 Thu"), QDate(2025, 4, 3));
    QCOMPARE(StructureDetector::parseRosterDate("04/13/2025"), QDate(2025, 4, 13));
    QCOMPARE(StructureDetector::parseRosterDate("03.04.25"), QDate(2025, 4, 3));
    QCOMPARE(StructureDetector::parseRosterDate("15/07", 2025), QDate(2025, 7, 15));
    QCOMPARE(StructureDetector::parseRosterDate("45839"), QDate(2025, 7, 1));
    QVERIFY(!StructureDetector::parseRosterDate("15/07").isValid());
    QVERIFY(!StructureDetector::parseRosterDate("31/02/2025").isValid());
}

void TestRosterIngestor::parsesPeriodText()
{
    int month = 0;
    int year = 0;
    QVERIFY(StructureDetector::parsePeriodText("January 2025", month, year));
    QCOMPARE(month, 1);
    QCOMPARE(year, 2025);

    QVERIFY(StructureDetector::parsePeriodText("Sep-25", month, year));
    QCOMPARE(month, 9);
    QCOMPARE(year, 2025);

    QVERIFY(StructureDetector::parsePeriodText("07/2025", month, year));
    QCOMPARE(month, 7);

    QVERIFY(!StructureDetector::parsePeriodText("roster", month, year));
}

void TestRosterIngestor::parsesEmployeeInfo()
{
    const std::optional<EmployeeInfo> info = StructureDetector::parseEmployeeInfo("7818 TEIXEIRA RAFAEL DXB,CM,73H");
    QVERIFY(info.has_value());
    QCOMPARE(info->base, QString("DXB"));
    QCOMPARE(info->positionCode, QString("CM"));
    QCOMPARE(info->aircraft, QString("73H"));

    QString error;
    QVERIFY(!StructureDetector::parseEmployeeInfo("TEIXEIRA RAFAEL DXB,CM,73H", &error).has_value());
    QVERIFY(!error.isEmpty());
}

QTEST_MAIN(TestRosterIngestor)
#include "tst_rosteringestor.moc"
