#pragma once

#include "sqlxfer/db_connection.h"
#include "sqlxfer/types.h"

#include <string>
#include <vector>

namespace sqlxfer {

// -------------------------------------------------------------------------
// ServerBrowser -- connection check and catalog listings for one server
// -------------------------------------------------------------------------
class ServerBrowser {
public:
    ServerBrowser(ConnectionSettings settings, ConnectionFactory factory);

    // true when a login to the server succeeds; the reason otherwise
    bool test_connection(std::string* error = nullptr);

    // User databases (system databases excluded), ordered by name
    std::vector<DatabaseInfo> list_databases();

    // Base tables of one database, ordered by schema and name
    std::vector<TableInfo> list_tables(const std::string& database);

private:
    ConnectionSettings settings_;
    ConnectionFactory  factory_;
};

}  // namespace sqlxfer
