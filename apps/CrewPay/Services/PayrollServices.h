#ifndef PAYROLLSERVICES_H
#define PAYROLLSERVICES_H

#include <QObject>
#include <QString>
#include "dbservice/dbconfig.h"

class CrewPayConfig;
class FlightDutyRepository;
class LayoverRestPeriodRepository;
class MonthlyCalculationRepository;
class AuditTrailRepository;
class RecalculationEngine;
class ReplacementOrchestrator;
class UploadProcessor;
class FlightDutyService;
class ManualEntryProcessor;

/**
 * @brief Owns the database connection, the repositories and the services built on them
 *
 * initialize() opens the database through DbManager, binds every repository
 * to its DbService and wires the services with the roster settings of the
 * given CrewPayConfig. All objects are children of this one.
 */
class PayrollServices : public QObject
{
    Q_OBJECT
public:
    explicit PayrollServices(QObject *parent = nullptr);
    ~PayrollServices();

    bool initialize(const DbConfig& dbConfig, const CrewPayConfig& config);
    bool isInitialized() const { return m_initialized; }

    // Applies the bundled schema, or the script at scriptPath when given
    bool applySchema(const QString& scriptPath = QString());

    void shutdown();

    FlightDutyRepository* flightDutyRepository() const { return m_flightDutyRepository; }
    LayoverRestPeriodRepository* restPeriodRepository() const { return m_restPeriodRepository; }
    MonthlyCalculationRepository* calculationRepository() const { return m_calculationRepository; }
    AuditTrailRepository* auditRepository() const { return m_auditRepository; }

    RecalculationEngine* recalculationEngine() const { return m_recalculationEngine; }
    ReplacementOrchestrator* replacementOrchestrator() const { return m_replacementOrchestrator; }
    UploadProcessor* uploadProcessor() const { return m_uploadProcessor; }
    FlightDutyService* flightDutyService() const { return m_flightDutyService; }
    ManualEntryProcessor* manualEntryProcessor() const { return m_manualEntryProcessor; }

    // Registers the resources compiled into the engine library
    static void initResources();

signals:
    void errorOccurred(const QString &errorMessage);

private:
    void setupRepositories();
    void setupServices(const CrewPayConfig& config);
    void cleanup();

    bool m_initialized;

    FlightDutyRepository* m_flightDutyRepository;
    LayoverRestPeriodRepository* m_restPeriodRepository;
    MonthlyCalculationRepository* m_calculationRepository;
    AuditTrailRepository* m_auditRepository;

    RecalculationEngine* m_recalculationEngine;
    ReplacementOrchestrator* m_replacementOrchestrator;
    UploadProcessor* m_uploadProcessor;
    FlightDutyService* m_flightDutyService;
    ManualEntryProcessor* m_manualEntryProcessor;
};

#endif // PAYROLLSERVICES_H
