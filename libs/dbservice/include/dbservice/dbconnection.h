#pragma once
#include <QSqlDatabase>
#include "dbconfig.h"

/**
 * @brief Access to the named connection shared by every DbService
 */
class DbConnection {
public:
    /**
     * @brief Returns the connection named by the config, registering and
     * opening it on first use
     *
     * For SQLite, foreign key enforcement is switched on when the
     * connection is opened.
     */
    static QSqlDatabase open(const DbConfig& config);
};
