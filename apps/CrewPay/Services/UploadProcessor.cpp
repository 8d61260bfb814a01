#include "UploadProcessor.h"
#include "Core/FlightDutyBuilder.h"
#include "Core/LayoverPairer.h"
#include "Core/ModelFactory.h"
#include "Parsers/RosterIngestor.h"
#include "Repositories/AuditTrailRepository.h"
#include "Repositories/FlightDutyRepository.h"
#include "logger/logger.h"

#include <QFile>
#include <QFileInfo>

UploadProcessor::UploadProcessor(FlightDutyRepository* flightDutyRepository,
                                 AuditTrailRepository* auditRepository,
                                 ReplacementOrchestrator* replacementOrchestrator,
                                 RecalculationEngine* recalculationEngine,
                                 QObject *parent)
    : QObject(parent)
    , m_flightDutyRepository(flightDutyRepository)
    , m_auditRepository(auditRepository)
    , m_replacementOrchestrator(replacementOrchestrator)
    , m_recalculationEngine(recalculationEngine)
    , m_homeBase("DXB")
    , m_maxFileSize(RosterIngestor::DefaultMaxFileSize)
    , m_pairingDays(5)
    , m_inferImplicitOvernight(true)
{
}

void UploadProcessor::reportProgress(const ProgressCallback& onProgress, int percent, const QString& message)
{
    LOG_DEBUG(QString("Upload progress %1%: %2").arg(percent).arg(message));
    if (onProgress) {
        onProgress(percent, message);
    }
    emit progressChanged(percent, message);
}

bool UploadProcessor::parseAndPrice(const QByteArray& content, const QString& fileName,
                                    const UploadOptions& options, UploadResult& result,
                                    const ProgressCallback& onProgress)
{
    QString error;
    if (!ReplacementOrchestrator::validateMonthYear(options.month, options.year, &error)) {
        result.errors.append(error);
        return false;
    }

    if (options.userId.isNull()) {
        result.errors.append("User id is required");
        return false;
    }

    reportProgress(onProgress, 10, "Parsing roster file");

    const RosterIngestor ingestor(m_maxFileSize);
    const IngestResult ingested = ingestor.ingest(content, fileName);
    result.metadata = ingested.metadata;
    result.warnings.append(ingested.warnings);

    if (!ingested.success) {
        result.errors.append(ingested.errors);
        LOG_WARNING(QString("Roster %1 rejected: %2").arg(fileName, ingested.errors.join("; ")));
        return false;
    }

    if (ingested.metadata.month > 0
        && (ingested.metadata.month != options.month || ingested.metadata.year != options.year)) {
        result.warnings.append(QString("Roster period %1/%2 differs from the selected month %3/%4")
                               .arg(ingested.metadata.month).arg(ingested.metadata.year)
                               .arg(options.month).arg(options.year));
    }

    const EmployeeInfo& employee = ingested.metadata.employee;
    if (employee.hasPosition && employee.position != options.position) {
        result.warnings.append(QString("Roster position %1 differs from the selected position %2, using %2")
                               .arg(DutyTypes::positionToString(employee.position),
                                    DutyTypes::positionToString(options.position)));
    }

    reportProgress(onProgress, 30, "Classifying duties");

    DutyBuildOptions buildOptions;
    buildOptions.userId = options.userId;
    buildOptions.month = options.month;
    buildOptions.year = options.year;
    buildOptions.dataSource = ingested.metadata.format == RosterFormat::Excel
        ? DutyTypes::DataSource::Excel
        : DutyTypes::DataSource::Csv;
    buildOptions.homeBase = m_homeBase;
    buildOptions.inferImplicitOvernight = m_inferImplicitOvernight;

    const FlightDutyBuilder builder(buildOptions);
    const DutyBuildResult built = builder.build(ingested.rows);
    result.warnings.append(built.warnings);

    if (built.duties.isEmpty()) {
        result.errors.append(QString("No flight duties found for %1/%2").arg(options.month).arg(options.year));
        return false;
    }

    for (const auto& duty : built.duties) {
        result.warnings.append(m_calculator.applyDutyPay(duty.data(), options.position));
    }
    result.flightDuties = built.duties;

    LOG_DATA(Logger::Info, (QMap<QString, QVariant>{
        {"file", fileName},
        {"rows", ingested.rows.size()},
        {"duties", built.duties.size()},
        {"skippedRows", built.skippedRows},
        {"filteredRows", built.filteredRows},
        {"warnings", result.warnings.size()}
    }));
    return true;
}

bool UploadProcessor::storeDuties(const UploadResult& result, const UploadOptions& options, bool replace,
                                  const QString& fileName, QString& error)
{
    const QString reason = QString("Roster upload: %1").arg(QFileInfo(fileName).fileName());

    const bool stored = m_flightDutyRepository->executeInTransaction([&]() {
        if (replace) {
            const ReplacementResult replaced = m_replacementOrchestrator->replaceRosterData(
                options.userId, options.month, options.year, "Replaced by " + reason);
            if (!replaced.success) {
                error = replaced.errors.join("; ");
                return false;
            }
        }

        if (m_flightDutyRepository->saveAll(result.flightDuties) != result.flightDuties.size()) {
            error = QString("Failed to save flight duties: %1").arg(m_flightDutyRepository->lastError());
            return false;
        }

        for (const auto& duty : result.flightDuties) {
            QSharedPointer<AuditTrailEntryModel> entry(
                ModelFactory::createDefaultAuditTrailEntry(duty->id(), options.userId, DutyTypes::AuditAction::Created));
            entry->setNewData(ModelFactory::modelToJson(duty.data()));
            entry->setChangeReason(reason);
            if (!m_auditRepository->save(entry.data())) {
                error = QString("Failed to write audit trail: %1").arg(m_auditRepository->lastError());
                return false;
            }
        }
        return true;
    });

    if (!stored && error.isEmpty()) {
        error = QString("Failed to store roster: %1").arg(m_flightDutyRepository->lastError());
    }
    return stored;
}

UploadResult UploadProcessor::processUpload(const QByteArray& content,
                                            const QString& fileName,
                                            const UploadOptions& options,
                                            const ProgressCallback& onProgress,
                                            const ConfirmCallback& confirm)
{
    UploadResult result;
    LOG_INFO(QString("Processing roster upload %1 for %2/%3").arg(fileName).arg(options.month).arg(options.year));

    if (!parseAndPrice(content, fileName, options, result, onProgress)) {
        return result;
    }

    reportProgress(onProgress, 55, "Checking existing data");

    const ExistingDataCheck existing =
        m_replacementOrchestrator->checkForExistingData(options.userId, options.month, options.year);
    if (!existing.error.isEmpty()) {
        result.errors.append(existing.error);
        return result;
    }

    result.existingFlightCount = existing.flightCount;
    if (existing.exists) {
        const QString summary = ReplacementOrchestrator::createReplacementSummary(
            options.month, options.year, existing.flightCount);

        if (!options.replaceExisting) {
            result.requiresConfirmation = true;
            result.errors.append(summary + " Confirm replacement to continue.");
            return result;
        }

        if (confirm && !confirm(existing, summary)) {
            LOG_INFO(QString("Replacement of %1/%2 declined").arg(options.month).arg(options.year));
            result.requiresConfirmation = true;
            result.errors.append("Replacement cancelled, existing data was kept");
            return result;
        }
    }

    reportProgress(onProgress, 70, "Saving flight duties");

    QString error;
    if (!storeDuties(result, options, existing.exists, fileName, error)) {
        LOG_ERROR(error);
        result.errors.append(error);
        return result;
    }
    result.replacementPerformed = existing.exists;

    reportProgress(onProgress, 85, "Calculating monthly totals");

    QList<QPair<int, int>> months;
    months.append(qMakePair(options.month, options.year));
    const QDate previous = QDate(options.year, options.month, 1).addMonths(-1);
    if (m_flightDutyRepository->countByMonth(options.userId, previous.month(), previous.year()) > 0) {
        // Its outbound legs may pair with inbound legs of this upload
        months.append(qMakePair(previous.month(), previous.year()));
    }

    const QList<RecalculationResult> recalculations =
        m_recalculationEngine->recalculateMonths(options.userId, months, options.position);
    for (const RecalculationResult& recalculation : recalculations) {
        result.warnings.append(recalculation.warnings);
        for (const QString& recalcError : recalculation.errors) {
            result.errors.append(QString("%1/%2: %3").arg(recalculation.month).arg(recalculation.year).arg(recalcError));
        }

        if (recalculation.month == options.month && recalculation.year == options.year) {
            result.layoverRestPeriods = recalculation.restPeriods;
            result.monthlyCalculation = recalculation.calculation;
            result.summary = recalculation.summary;
        }
    }

    reportProgress(onProgress, 100, "Upload complete");

    result.success = result.errors.isEmpty();
    LOG_INFO(QString("Roster upload %1 finished: %2 duties, %3 rest periods, %4 warnings%5")
            .arg(fileName)
            .arg(result.flightDuties.size())
            .arg(result.layoverRestPeriods.size())
            .arg(result.warnings.size())
            .arg(result.replacementPerformed ? ", replaced existing data" : ""));
    return result;
}

UploadResult UploadProcessor::processFile(const QString& filePath,
                                          const UploadOptions& options,
                                          const ProgressCallback& onProgress,
                                          const ConfirmCallback& confirm)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        UploadResult result;
        result.errors.append(QString("Cannot open %1: %2").arg(filePath, file.errorString()));
        LOG_ERROR(result.errors.first());
        return result;
    }

    const QByteArray content = file.readAll();
    file.close();
    return processUpload(content, QFileInfo(filePath).fileName(), options, onProgress, confirm);
}

UploadResult UploadProcessor::dryRun(const QByteArray& content, const QString& fileName,
                                     const UploadOptions& options)
{
    UploadResult result;
    if (!parseAndPrice(content, fileName, options, result, ProgressCallback())) {
        return result;
    }

    const LayoverPairer pairer(m_homeBase, m_pairingDays);
    const PairingResult pairing = pairer.pair(result.flightDuties, options.month, options.year);
    result.warnings.append(pairing.warnings);

    result.layoverRestPeriods = m_calculator.createRestPeriods(options.userId, options.position, pairing.pairs);

    const MonthlyCalculationResult monthly = m_calculator.calculateMonthly(
        options.userId, options.position, options.month, options.year,
        result.flightDuties, result.layoverRestPeriods);
    result.monthlyCalculation = monthly.calculation;
    result.summary = monthly.summary;
    result.warnings.append(monthly.warnings);

    const ExistingDataCheck existing =
        m_replacementOrchestrator->checkForExistingData(options.userId, options.month, options.year);
    if (!existing.error.isEmpty()) {
        result.warnings.append(existing.error);
    }
    result.existingFlightCount = existing.flightCount;
    result.requiresConfirmation = existing.exists;

    result.success = true;
    return result;
}
