#pragma once
#include "dbservice.hpp"
#include "dbconfig.h"
#include "logger/logger.h"
#include <QMap>
#include <memory>
#include <stdexcept>
#include <typeindex>

/**
 * @brief Owner of the shared database connection and of one DbService per model type
 *
 * All services created here run on the same named connection, so a transaction
 * begun through any repository covers statements issued by the others.
 */
class DbManager {
public:
    static DbManager& instance();

    /**
     * @brief Opens the shared connection described by config and probes it
     * @return False when the driver is missing or the probe query fails
     */
    bool initialize(const DbConfig& config);

    // Drops every service and closes the shared connection
    void shutdown();

    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Runs a ';'-separated SQL script (schema files) statement by statement
     * @param scriptPath File system or resource path
     * @return False on the first failing statement
     */
    bool executeScript(const QString& scriptPath);

    // Get service for a specific model
    template<typename T>
    DbService<T>& getService() {
        if (!m_initialized) {
            LOG_FATAL(QString("DbManager not initialized! Attempting to get service for %1")
                     .arg(typeid(T).name()));
            throw std::runtime_error("DbManager not initialized");
        }

        const std::type_index typeIndex(typeid(T));
        if (!m_services.contains(typeIndex)) {
            LOG_DEBUG(QString("Creating new DB service for %1").arg(typeid(T).name()));
            m_services[typeIndex] = std::make_shared<DbService<T>>(m_config);
        }

        return *std::static_pointer_cast<DbService<T>>(m_services[typeIndex]);
    }

private:
    DbManager();
    ~DbManager();

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

    bool probe();

    bool m_initialized = false;
    DbConfig m_config;
    QMap<std::type_index, std::shared_ptr<void>> m_services;
};
