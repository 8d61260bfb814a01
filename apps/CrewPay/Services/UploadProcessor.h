#ifndef UPLOADPROCESSOR_H
#define UPLOADPROCESSOR_H

#include <QObject>
#include <QByteArray>
#include <QList>
#include <QSharedPointer>
#include <QStringList>
#include <QUuid>
#include <functional>
#include "RecalculationEngine.h"
#include "ReplacementOrchestrator.h"
#include "Parsers/RosterTypes.h"

class FlightDutyRepository;
class AuditTrailRepository;

struct UploadOptions {
    QUuid userId;
    DutyTypes::Position position = DutyTypes::Position::CCM;
    int month = 0;
    int year = 0;
    bool replaceExisting = false;
};

struct UploadResult {
    bool success = false;
    QList<QSharedPointer<FlightDutyModel>> flightDuties;
    QList<QSharedPointer<LayoverRestPeriodModel>> layoverRestPeriods;
    QSharedPointer<MonthlyCalculationModel> monthlyCalculation;
    CalculationSummary summary;
    RosterMetadata metadata;
    QStringList errors;
    QStringList warnings;
    bool replacementPerformed = false;
    bool requiresConfirmation = false;
    int existingFlightCount = 0;
};

/**
 * @brief Runs one roster file through ingestion, pay calculation and storage
 *
 * Progress is reported at 10 (parsing), 30 (classifying), 55 (existing data),
 * 70 (saving), 85 (monthly totals) and 100 percent.
 *
 * When the month already holds duties the upload stops with
 * requiresConfirmation unless replaceExisting is set. With replaceExisting the
 * optional confirm callback sees the existing data and the replacement
 * summary; returning false leaves the stored month untouched. Deleting the old
 * month and inserting the new duties happen in one transaction.
 */
class UploadProcessor : public QObject
{
    Q_OBJECT
public:
    typedef std::function<void(int percent, const QString& message)> ProgressCallback;
    typedef std::function<bool(const ExistingDataCheck& existing, const QString& summary)> ConfirmCallback;

    UploadProcessor(FlightDutyRepository* flightDutyRepository,
                    AuditTrailRepository* auditRepository,
                    ReplacementOrchestrator* replacementOrchestrator,
                    RecalculationEngine* recalculationEngine,
                    QObject *parent = nullptr);

    void setHomeBase(const QString& homeBase) { m_homeBase = homeBase; }
    void setMaxFileSize(qint64 bytes) { m_maxFileSize = bytes; }
    void setLayoverPairingDays(int days) { m_pairingDays = days; }
    void setInferImplicitOvernight(bool enabled) { m_inferImplicitOvernight = enabled; }

    UploadResult processUpload(const QByteArray& content,
                               const QString& fileName,
                               const UploadOptions& options,
                               const ProgressCallback& onProgress = ProgressCallback(),
                               const ConfirmCallback& confirm = ConfirmCallback());

    UploadResult processFile(const QString& filePath,
                             const UploadOptions& options,
                             const ProgressCallback& onProgress = ProgressCallback(),
                             const ConfirmCallback& confirm = ConfirmCallback());

    /**
     * @brief Parses and prices a roster without writing anything
     *
     * Rest periods and the monthly totals are computed from the file alone.
     * existingFlightCount reports what a real upload would replace.
     */
    UploadResult dryRun(const QByteArray& content, const QString& fileName, const UploadOptions& options);

signals:
    void progressChanged(int percent, const QString& message);

private:
    bool parseAndPrice(const QByteArray& content, const QString& fileName, const UploadOptions& options,
                       UploadResult& result, const ProgressCallback& onProgress);
    bool storeDuties(const UploadResult& result, const UploadOptions& options, bool replace,
                     const QString& fileName, QString& error);
    void reportProgress(const ProgressCallback& onProgress, int percent, const QString& message);

    FlightDutyRepository* m_flightDutyRepository;
    AuditTrailRepository* m_auditRepository;
    ReplacementOrchestrator* m_replacementOrchestrator;
    RecalculationEngine* m_recalculationEngine;
    PayCalculator m_calculator;
    QString m_homeBase;
    qint64 m_maxFileSize;
    int m_pairingDays;
    bool m_inferImplicitOvernight;
};

#endif // UPLOADPROCESSOR_H
