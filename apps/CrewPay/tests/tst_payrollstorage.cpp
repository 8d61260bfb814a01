#include <QtTest>
#include <QTemporaryDir>
#include <QSettings>
#include <QSignalSpy>
#include <QTimeZone>
#include <algorithm>
#include "Core/ModelFactory.h"
#include "Repositories/AuditTrailRepository.h"
#include "Repositories/FlightDutyRepository.h"
#include "Repositories/LayoverRestPeriodRepository.h"
#include "Repositories/MonthlyCalculationRepository.h"
#include "Services/CrewPayConfig.h"
#include "Services/FlightDutyService.h"
#include "Services/ManualEntryProcessor.h"
#include "Services/PayrollServices.h"
#include "Services/RecalculationEngine.h"
#include "Services/UploadProcessor.h"

using DutyTypes::AuditAction;
using DutyTypes::DutyType;
using DutyTypes::Position;

namespace {

// July 2025: a turnaround, an airport standby and a Karachi layover with 23.5 h rest
QByteArray julyRoster()
{
    return QByteArray(
        "flydubai Crew Roster,,,,\n"
        ",,July 2025,,\n"
        ",,,,\n"
        "Date,Duties,Details,Report,Debrief\n"
        "01/07/2025,FZ549 FZ550,DXB - CMB CMB - DXB,09:20,17:50\n"
        "03/07/2025,ASBY,,08:00,12:00\n"
        "10/07/2025,FZ967,DXB - KHI,12:00,16:00\n"
        "11/07/2025,FZ968,KHI - DXB,15:30,20:15\n");
}

UploadOptions julyOptions(const QUuid& userId)
{
    UploadOptions options;
    options.userId = userId;
    options.position = Position::CCM;
    options.month = 7;
    options.year = 2025;
    return options;
}

QSharedPointer<FlightDutyModel> findDuty(const QList<QSharedPointer<FlightDutyModel>>& duties, const QDate& date)
{
    for (const auto& duty : duties) {
        if (duty->date() == date) {
            return duty;
        }
    }
    return QSharedPointer<FlightDutyModel>();
}

QList<QUuid> idsOf(const QList<QSharedPointer<FlightDutyModel>>& duties)
{
    QList<QUuid> ids;
    for (const auto& duty : duties) {
        ids.append(duty->id());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}

// Every test works on its own user, so the shared database needs no reset between tests
class TestPayrollStorage : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void uploadStoresDutiesAndTotals();
    void recalculationIsIdempotent();
    void existingMonthNeedsConfirmation();
    void declinedReplacementKeepsData();
    void confirmedReplacementSwapsData();
    void dryRunWritesNothing();
    void editRecalculatesMonth();
    void deleteRemovesRestPeriod();
    void deleteRejectsForeignDuty();
    void bulkDeleteLeavesFixedOnlyMonth();
    void manualLayoverIsPaired();
    void layoverAcrossMonthEndIsPaired();
    void invalidMonthIsRejected();

private:
    UploadResult upload(const QUuid& userId);

    QTemporaryDir m_dir;
    PayrollServices* m_services = nullptr;
    CrewPayConfig* m_config = nullptr;
};

void TestPayrollStorage::initTestCase()
{
    QVERIFY(m_dir.isValid());

    const QString iniPath = m_dir.filePath("database.ini");
    {
        QSettings settings(iniPath, QSettings::IniFormat);
        settings.beginGroup("Database");
        settings.setValue("driver", "QSQLITE");
        settings.setValue("database", m_dir.filePath("crewpay.db"));
        settings.setValue("connectionName", "crewpay");
        settings.endGroup();
        settings.sync();
    }

    m_config = new CrewPayConfig();
    m_config->setLogLevel("warning");
    m_config->applyLogging();

    m_services = new PayrollServices();
    QVERIFY(m_services->initialize(DbConfig::fromFile(iniPath), *m_config));
    QVERIFY(m_services->applySchema());
}

void TestPayrollStorage::cleanupTestCase()
{
    if (m_services) {
        m_services->shutdown();
    }
    delete m_services;
    m_services = nullptr;
    delete m_config;
    m_config = nullptr;
}

UploadResult TestPayrollStorage::upload(const QUuid& userId)
{
    return m_services->uploadProcessor()->processUpload(julyRoster(), "july.csv", julyOptions(userId));
}

void TestPayrollStorage::uploadStoresDutiesAndTotals()
{
    const QUuid userId = QUuid::createUuid();

    QList<int> progress;
    const UploadResult result = m_services->uploadProcessor()->processUpload(
        julyRoster(), "july.csv", julyOptions(userId),
        [&progress](int percent, const QString&) { progress.append(percent); });

    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QVERIFY(!result.replacementPerformed);
    QCOMPARE(result.flightDuties.size(), 4);
    QCOMPARE(result.layoverRestPeriods.size(), 1);
    QCOMPARE(progress.first(), 10);
    QCOMPARE(progress.last(), 100);

    QVERIFY(result.monthlyCalculation);
    QCOMPARE(result.monthlyCalculation->flightPay(), 862.5);
    QCOMPARE(result.monthlyCalculation->perDiemPay(), 207.27);
    QCOMPARE(result.monthlyCalculation->asbyPay(), 200.0);
    QCOMPARE(result.monthlyCalculation->totalVariable(), 1269.77);
    QCOMPARE(result.monthlyCalculation->totalSalary(), 10174.77);
    QCOMPARE(result.summary.totalTurnarounds, 1);
    QCOMPARE(result.summary.totalLayovers, 2);
    QCOMPARE(result.summary.totalAsbyDuties, 1);

    QCOMPARE(m_services->flightDutyRepository()->countByMonth(userId, 7, 2025), 4);
    const auto stored = m_services->flightDutyRepository()->getByMonth(userId, 7, 2025);
    for (const auto& duty : stored) {
        QCOMPARE(duty->dataSource(), DutyTypes::DataSource::Csv);
    }

    const auto restPeriods = m_services->restPeriodRepository()->getByMonth(userId, 7, 2025);
    QCOMPARE(restPeriods.size(), 1);
    QCOMPARE(restPeriods.first()->restHours(), 23.5);
    QCOMPARE(restPeriods.first()->restStartTime(), QDateTime(QDate(2025, 7, 10), QTime(16, 0), QTimeZone::utc()));

    const auto calculation = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QVERIFY(calculation);
    QCOMPARE(calculation->totalSalary(), 10174.77);
    QCOMPARE(calculation->totalFixed(), 8905.0);

    const auto audit = m_services->auditRepository()->getByUser(userId);
    QCOMPARE(audit.size(), 4);
    for (const auto& entry : audit) {
        QCOMPARE(entry->action(), AuditAction::Created);
        QCOMPARE(entry->changeReason(), QString("Roster upload: july.csv"));
    }
}

void TestPayrollStorage::recalculationIsIdempotent()
{
    const QUuid userId = QUuid::createUuid();
    QVERIFY(upload(userId).success);

    RecalculationEngine* engine = m_services->recalculationEngine();
    QSignalSpy recalculated(engine, &RecalculationEngine::monthRecalculated);

    const RecalculationResult first = engine->recalculateMonthlyTotals(userId, 7, 2025, Position::CCM);
    QVERIFY2(first.success, qPrintable(first.errors.join("; ")));
    QCOMPARE(engine->state(), RecalculationEngine::Persisted);
    QCOMPARE(recalculated.count(), 1);
    QCOMPARE(recalculated.first().at(0).toInt(), 7);
    QCOMPARE(recalculated.first().at(2).toDouble(), 10174.77);
    const auto afterFirst = m_services->calculationRepository()->getByMonth(userId, 7, 2025);

    // Timestamps are stored with milliseconds; make sure a rewrite would be visible
    QTest::qWait(20);
    const RecalculationResult second = engine->recalculateMonthlyTotals(userId, 7, 2025, Position::CCM);
    QVERIFY(second.success);
    const auto afterSecond = m_services->calculationRepository()->getByMonth(userId, 7, 2025);

    QCOMPARE(afterSecond->id(), afterFirst->id());
    QCOMPARE(afterSecond->createdAt(), afterFirst->createdAt());
    QCOMPARE(afterSecond->updatedAt(), afterFirst->updatedAt());

    QCOMPARE(ModelFactory::modelToJson(afterSecond.data()), ModelFactory::modelToJson(afterFirst.data()));

    // Rest periods are rebuilt, not accumulated
    QCOMPARE(m_services->restPeriodRepository()->getByMonth(userId, 7, 2025).size(), 1);
}

void TestPayrollStorage::existingMonthNeedsConfirmation()
{
    const QUuid userId = QUuid::createUuid();
    QVERIFY(upload(userId).success);

    const UploadResult again = upload(userId);
    QVERIFY(!again.success);
    QVERIFY(again.requiresConfirmation);
    QCOMPARE(again.existingFlightCount, 4);
    QVERIFY(again.errors.first().endsWith("Confirm replacement to continue."));
    QCOMPARE(m_services->flightDutyRepository()->countByMonth(userId, 7, 2025), 4);
}

void TestPayrollStorage::declinedReplacementKeepsData()
{
    const QUuid userId = QUuid::createUuid();
    QVERIFY(upload(userId).success);
    const QList<QUuid> before = idsOf(m_services->flightDutyRepository()->getByMonth(userId, 7, 2025));

    UploadOptions options = julyOptions(userId);
    options.replaceExisting = true;

    int seenCount = 0;
    const UploadResult result = m_services->uploadProcessor()->processUpload(
        julyRoster(), "july.csv", options, UploadProcessor::ProgressCallback(),
        [&seenCount](const ExistingDataCheck& existing, const QString&) {
            seenCount = existing.flightCount;
            return false;
        });

    QVERIFY(!result.success);
    QVERIFY(result.requiresConfirmation);
    QCOMPARE(seenCount, 4);
    QVERIFY(result.errors.contains("Replacement cancelled, existing data was kept"));

    QCOMPARE(idsOf(m_services->flightDutyRepository()->getByMonth(userId, 7, 2025)), before);
    QCOMPARE(m_services->restPeriodRepository()->getByMonth(userId, 7, 2025).size(), 1);
}

void TestPayrollStorage::confirmedReplacementSwapsData()
{
    const QUuid userId = QUuid::createUuid();
    QVERIFY(upload(userId).success);
    const QList<QUuid> before = idsOf(m_services->flightDutyRepository()->getByMonth(userId, 7, 2025));

    UploadOptions options = julyOptions(userId);
    options.replaceExisting = true;

    const UploadResult result = m_services->uploadProcessor()->processUpload(
        julyRoster(), "july.csv", options, UploadProcessor::ProgressCallback(),
        [](const ExistingDataCheck&, const QString&) { return true; });

    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QVERIFY(result.replacementPerformed);

    const QList<QUuid> after = idsOf(m_services->flightDutyRepository()->getByMonth(userId, 7, 2025));
    QCOMPARE(after.size(), 4);
    for (const QUuid& id : before) {
        QVERIFY(!after.contains(id));
    }

    QCOMPARE(m_services->restPeriodRepository()->getByMonth(userId, 7, 2025).size(), 1);
    QCOMPARE(m_services->calculationRepository()->getByMonth(userId, 7, 2025)->totalSalary(), 10174.77);

    int deleted = 0;
    for (const auto& entry : m_services->auditRepository()->getByUser(userId)) {
        if (entry->action() == AuditAction::Deleted) {
            ++deleted;
        }
    }
    QCOMPARE(deleted, 4);
}

void TestPayrollStorage::dryRunWritesNothing()
{
    const QUuid userId = QUuid::createUuid();
    const UploadResult result = m_services->uploadProcessor()->dryRun(julyRoster(), "july.csv", julyOptions(userId));

    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QCOMPARE(result.flightDuties.size(), 4);
    QCOMPARE(result.layoverRestPeriods.size(), 1);
    QCOMPARE(result.monthlyCalculation->totalSalary(), 10174.77);
    QCOMPARE(result.existingFlightCount, 0);

    QCOMPARE(m_services->flightDutyRepository()->countByMonth(userId, 7, 2025), 0);
    QVERIFY(!m_services->calculationRepository()->getByMonth(userId, 7, 2025));
    QVERIFY(m_services->auditRepository()->getByUser(userId).isEmpty());
}

void TestPayrollStorage::editRecalculatesMonth()
{
    const QUuid userId = QUuid::createUuid();
    const UploadResult uploaded = upload(userId);
    QVERIFY(uploaded.success);

    const auto turnaround = findDuty(uploaded.flightDuties, QDate(2025, 7, 1));
    QVERIFY(turnaround);
    const auto before = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QVERIFY(before);
    QTest::qWait(20);

    FlightDutyEdit edit;
    edit.date = turnaround->date();
    edit.dutyType = DutyType::Turnaround;
    edit.flightNumbers = turnaround->flightNumbers();
    edit.sectors = turnaround->sectors();
    edit.reportTime = QTime(9, 20);
    edit.debriefTime = QTime(18, 50);

    const DutyOperationResult result = m_services->flightDutyService()->editFlightDuty(
        turnaround->id(), edit, userId, Position::CCM, "Delayed return");
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QCOMPARE(result.duty->dutyHours(), 9.5);
    QCOMPARE(result.duty->flightPay(), 475.0);

    const auto stored = m_services->flightDutyRepository()->getById(turnaround->id());
    QCOMPARE(stored->dataSource(), DutyTypes::DataSource::Edited);
    QCOMPARE(stored->lastEditedBy(), userId);

    const auto after = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QCOMPARE(after->flightPay(), 912.5);
    QCOMPARE(after->createdAt(), before->createdAt());
    QVERIFY(after->updatedAt() > before->updatedAt());

    const auto trail = m_services->flightDutyService()->getAuditTrail(turnaround->id());
    QCOMPARE(trail.size(), 2);
    bool updated = false;
    for (const auto& entry : trail) {
        if (entry->action() == AuditAction::Updated) {
            updated = true;
            QCOMPARE(entry->changeReason(), QString("Delayed return"));
            QCOMPARE(entry->oldData().value("duty_hours").toDouble(), 8.5);
            QCOMPARE(entry->newData().value("duty_hours").toDouble(), 9.5);
        }
    }
    QVERIFY(updated);
}

void TestPayrollStorage::deleteRemovesRestPeriod()
{
    const QUuid userId = QUuid::createUuid();
    const UploadResult uploaded = upload(userId);
    QVERIFY(uploaded.success);

    const auto inbound = findDuty(uploaded.flightDuties, QDate(2025, 7, 11));
    QVERIFY(inbound);

    const DutyOperationResult result =
        m_services->flightDutyService()->deleteFlightDuty(inbound->id(), userId, Position::CCM, "Crew swap");
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));

    QVERIFY(!m_services->flightDutyRepository()->getById(inbound->id()));
    QVERIFY(m_services->restPeriodRepository()->getByMonth(userId, 7, 2025).isEmpty());

    const auto calculation = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QCOMPARE(calculation->perDiemPay(), 0.0);
    QCOMPARE(calculation->flightPay(), 625.0);

    // The audit trail outlives the duty
    const auto trail = m_services->flightDutyService()->getAuditTrail(inbound->id());
    QCOMPARE(trail.size(), 2);
}

void TestPayrollStorage::deleteRejectsForeignDuty()
{
    const QUuid owner = QUuid::createUuid();
    const UploadResult uploaded = upload(owner);
    QVERIFY(uploaded.success);

    const QUuid flightId = uploaded.flightDuties.first()->id();
    const DutyOperationResult result =
        m_services->flightDutyService()->deleteFlightDuty(flightId, QUuid::createUuid(), Position::CCM);
    QVERIFY(!result.success);
    QVERIFY(result.errors.first().startsWith("Flight duty not found"));
    QVERIFY(m_services->flightDutyRepository()->getById(flightId));
}

void TestPayrollStorage::bulkDeleteLeavesFixedOnlyMonth()
{
    const QUuid userId = QUuid::createUuid();
    const UploadResult uploaded = upload(userId);
    QVERIFY(uploaded.success);

    QList<QUuid> ids;
    for (const auto& duty : uploaded.flightDuties) {
        ids.append(duty->id());
    }
    const QUuid missing = QUuid::createUuid();
    ids.append(missing);

    const BulkDeleteResult result =
        m_services->flightDutyService()->bulkDeleteFlightDuties(ids, userId, Position::CCM, "Cleanup");
    QVERIFY(!result.success);
    QCOMPARE(result.deletedCount, 4);
    QCOMPARE(result.failedIds, QList<QUuid>({missing}));

    QCOMPARE(m_services->flightDutyRepository()->countByMonth(userId, 7, 2025), 0);
    const auto calculation = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QVERIFY(calculation);
    QCOMPARE(calculation->totalVariable(), 0.0);
    QCOMPARE(calculation->totalSalary(), 8905.0);
}

void TestPayrollStorage::manualLayoverIsPaired()
{
    const QUuid userId = QUuid::createUuid();

    ManualEntryData data;
    data.date = QDate(2025, 7, 10);
    data.inboundDate = QDate(2025, 7, 11);
    data.dutyType = DutyType::Layover;
    data.flightNumbers = {"967", "968"};
    data.airports = {"DXB", "KHI", "KHI", "DXB"};
    data.reportTime = "12:00";
    data.debriefTimeOutbound = "16:00";
    data.reportTimeInbound = "15:30";
    data.debriefTime = "20:15";

    const ManualEntryResult result =
        m_services->manualEntryProcessor()->processManualEntry(data, userId, Position::CCM, 2025);
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QCOMPARE(result.processedCount, 2);
    QCOMPARE(result.recalculations.size(), 1);

    const auto restPeriods = m_services->restPeriodRepository()->getByMonth(userId, 7, 2025);
    QCOMPARE(restPeriods.size(), 1);
    QCOMPARE(restPeriods.first()->perDiemPay(), 207.27);

    const auto calculation = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QCOMPARE(calculation->flightPay(), 437.5);
    QCOMPARE(calculation->totalVariable(), 644.77);

    const auto audit = m_services->auditRepository()->getByUser(userId);
    QCOMPARE(audit.size(), 2);
    QCOMPARE(audit.first()->changeReason(), QString("Manual entry"));
}

void TestPayrollStorage::layoverAcrossMonthEndIsPaired()
{
    const QUuid userId = QUuid::createUuid();

    // Inbound four days later, beyond the configured lookahead of 3 but inside the 5 day pairing window
    ManualEntryData data;
    data.date = QDate(2025, 7, 31);
    data.inboundDate = QDate(2025, 8, 4);
    data.dutyType = DutyType::Layover;
    data.flightNumbers = {"967", "968"};
    data.airports = {"DXB", "KHI", "KHI", "DXB"};
    data.reportTime = "12:00";
    data.debriefTimeOutbound = "16:00";
    data.reportTimeInbound = "15:30";
    data.debriefTime = "20:15";

    QCOMPARE(m_services->recalculationEngine()->lookaheadDays(), 5);

    const ManualEntryResult result =
        m_services->manualEntryProcessor()->processManualEntry(data, userId, Position::CCM, 2025);
    QVERIFY2(result.success, qPrintable(result.errors.join("; ")));
    QCOMPARE(result.recalculations.size(), 2);
    for (const QString& warning : result.warnings) {
        QVERIFY2(!warning.contains("No pair found"), qPrintable(warning));
    }

    const auto julyRest = m_services->restPeriodRepository()->getByMonth(userId, 7, 2025);
    QCOMPARE(julyRest.size(), 1);
    QCOMPARE(julyRest.first()->restHours(), 95.5);
    QCOMPARE(julyRest.first()->perDiemPay(), 842.31);

    const auto july = m_services->calculationRepository()->getByMonth(userId, 7, 2025);
    QVERIFY(july);
    QCOMPARE(july->flightPay(), 200.0);
    QCOMPARE(july->perDiemPay(), 842.31);
    QCOMPARE(july->totalVariable(), 1042.31);

    const auto august = m_services->calculationRepository()->getByMonth(userId, 8, 2025);
    QVERIFY(august);
    QCOMPARE(august->flightPay(), 237.5);
    QCOMPARE(august->perDiemPay(), 0.0);
    QVERIFY(m_services->restPeriodRepository()->getByMonth(userId, 8, 2025).isEmpty());
}

void TestPayrollStorage::invalidMonthIsRejected()
{
    UploadOptions options = julyOptions(QUuid::createUuid());
    options.month = 13;

    const UploadResult result = m_services->uploadProcessor()->processUpload(julyRoster(), "july.csv", options);
    QVERIFY(!result.success);
    QVERIFY(!result.errors.isEmpty());
    QCOMPARE(m_services->flightDutyRepository()->countByMonth(options.userId, 7, 2025), 0);
}

QTEST_MAIN(TestPayrollStorage)
#include "tst_payrollstorage.moc"
