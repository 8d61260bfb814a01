#include "PayrollServices.h"
#include "CrewPayConfig.h"
#include "FlightDutyService.h"
#include "ManualEntryProcessor.h"
#include "RecalculationEngine.h"
#include "ReplacementOrchestrator.h"
#include "UploadProcessor.h"
#include "Repositories/AuditTrailRepository.h"
#include "Repositories/FlightDutyRepository.h"
#include "Repositories/LayoverRestPeriodRepository.h"
#include "Repositories/MonthlyCalculationRepository.h"
#include "dbservice/dbmanager.h"
#include "logger/logger.h"
#include <stdexcept>

PayrollServices::PayrollServices(QObject *parent)
    : QObject(parent)
    , m_initialized(false)
    , m_flightDutyRepository(nullptr)
    , m_restPeriodRepository(nullptr)
    , m_calculationRepository(nullptr)
    , m_auditRepository(nullptr)
    , m_recalculationEngine(nullptr)
    , m_replacementOrchestrator(nullptr)
    , m_uploadProcessor(nullptr)
    , m_flightDutyService(nullptr)
    , m_manualEntryProcessor(nullptr)
{
    initResources();
}

PayrollServices::~PayrollServices()
{
    cleanup();
}

void PayrollServices::initResources()
{
    Q_INIT_RESOURCE(crewpay);
}

bool PayrollServices::initialize(const DbConfig& dbConfig, const CrewPayConfig& config)
{
    if (m_initialized) {
        LOG_INFO("Payroll services already initialized");
        return true;
    }

    if (!DbManager::instance().initialize(dbConfig)) {
        LOG_FATAL("Failed to initialize database manager");
        emit errorOccurred("Failed to initialize database connection");
        return false;
    }

    LOG_INFO(QString("Database connection initialized to %1").arg(dbConfig.describe()));

    try {
        setupRepositories();
        setupServices(config);
    }
    catch (const std::exception& ex) {
        LOG_FATAL(QString("Exception during service setup: %1").arg(ex.what()));
        emit errorOccurred(QString("Failed to initialize services: %1").arg(ex.what()));
        cleanup();
        return false;
    }

    m_initialized = true;
    LOG_INFO("Payroll services initialized");
    return true;
}

void PayrollServices::setupRepositories()
{
    LOG_DEBUG("Creating repositories");

    m_flightDutyRepository = new FlightDutyRepository(this);
    m_restPeriodRepository = new LayoverRestPeriodRepository(this);
    m_calculationRepository = new MonthlyCalculationRepository(this);
    m_auditRepository = new AuditTrailRepository(this);

    DbManager& db = DbManager::instance();
    const bool bound = m_flightDutyRepository->initialize(&db.getService<FlightDutyModel>())
        && m_restPeriodRepository->initialize(&db.getService<LayoverRestPeriodModel>())
        && m_calculationRepository->initialize(&db.getService<MonthlyCalculationModel>())
        && m_auditRepository->initialize(&db.getService<AuditTrailEntryModel>());
    if (!bound) {
        throw std::runtime_error("Repository could not be bound to its database service");
    }
}

void PayrollServices::setupServices(const CrewPayConfig& config)
{
    LOG_DEBUG("Creating services");

    m_recalculationEngine = new RecalculationEngine(m_flightDutyRepository, m_restPeriodRepository,
                                                    m_calculationRepository, this);
    m_recalculationEngine->setHomeBase(config.homeBase());
    m_recalculationEngine->setLayoverPairingDays(config.layoverPairingDays());
    m_recalculationEngine->setLookaheadDays(config.crossMonthLookaheadDays());

    m_replacementOrchestrator = new ReplacementOrchestrator(m_flightDutyRepository, m_restPeriodRepository,
                                                            m_calculationRepository, m_auditRepository, this);

    m_uploadProcessor = new UploadProcessor(m_flightDutyRepository, m_auditRepository,
                                            m_replacementOrchestrator, m_recalculationEngine, this);
    m_uploadProcessor->setHomeBase(config.homeBase());
    m_uploadProcessor->setMaxFileSize(config.maxUploadSizeBytes());
    m_uploadProcessor->setLayoverPairingDays(config.layoverPairingDays());
    m_uploadProcessor->setInferImplicitOvernight(config.inferImplicitOvernight());

    m_flightDutyService = new FlightDutyService(m_flightDutyRepository, m_auditRepository,
                                                m_recalculationEngine, this);
    m_manualEntryProcessor = new ManualEntryProcessor(m_flightDutyRepository, m_auditRepository,
                                                      m_recalculationEngine, this);
}

bool PayrollServices::applySchema(const QString& scriptPath)
{
    const QString path = scriptPath.isEmpty() ? QString(":/sql/schema.sql") : scriptPath;
    if (!DbManager::instance().executeScript(path)) {
        emit errorOccurred(QString("Failed to apply schema %1").arg(path));
        return false;
    }
    return true;
}

void PayrollServices::cleanup()
{
    // Services hold raw pointers to the repositories, delete them first
    delete m_manualEntryProcessor;
    delete m_flightDutyService;
    delete m_uploadProcessor;
    delete m_replacementOrchestrator;
    delete m_recalculationEngine;
    m_manualEntryProcessor = nullptr;
    m_flightDutyService = nullptr;
    m_uploadProcessor = nullptr;
    m_replacementOrchestrator = nullptr;
    m_recalculationEngine = nullptr;

    delete m_auditRepository;
    delete m_calculationRepository;
    delete m_restPeriodRepository;
    delete m_flightDutyRepository;
    m_auditRepository = nullptr;
    m_calculationRepository = nullptr;
    m_restPeriodRepository = nullptr;
    m_flightDutyRepository = nullptr;

    m_initialized = false;
}

void PayrollServices::shutdown()
{
    cleanup();
    DbManager::instance().shutdown();
    LOG_INFO("Payroll services shut down");
}
