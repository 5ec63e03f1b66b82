#include "sqlxfer/server_browser.h"
#include "sqlxfer/error.h"
#include "sqlxfer/logging.h"

namespace sqlxfer {

ServerBrowser::ServerBrowser(ConnectionSettings settings, ConnectionFactory factory)
    : settings_(std::move(settings)), factory_(std::move(factory))
{
}

bool ServerBrowser::test_connection(std::string* error) {
    try {
        auto conn = factory_(settings_, "master");
        int64_t one = 0;
        if (!conn->query_scalar_int("SELECT 1", one) || one != 1) {
            if (error) *error = conn->last_error();
            return false;
        }
    } catch (const ConnectionError& e) {
        LOG_DEBUG("Connection test failed: %s", e.what());
        if (error) *error = e.what();
        return false;
    }
    LOG_INFO("Connection to %s succeeded", settings_.server.c_str());
    return true;
}

std::vector<DatabaseInfo> ServerBrowser::list_databases() {
    auto conn = factory_(settings_, "master");

    const std::string sql =
        "SELECT d.name, d.state_desc, d.recovery_model_desc, "
        "       CAST(SUM(CAST(mf.size AS BIGINT)) * 8 / 1024 AS BIGINT) AS size_mb "
        "FROM sys.databases d "
        "LEFT JOIN sys.master_files mf ON d.database_id = mf.database_id "
        "WHERE d.database_id > 4 "
        "GROUP BY d.name, d.state_desc, d.recovery_model_desc "
        "ORDER BY d.name";

    std::vector<DatabaseInfo> result;
    bool ok = conn->query_rows(sql, [&](const Row& row) {
        if (row.size() < 4) return true;
        DatabaseInfo db;
        db.name           = value_as_string(row[0]);
        db.state          = value_as_string(row[1]);
        db.recovery_model = value_as_string(row[2]);
        db.size_mb        = value_as_int64(row[3]);
        result.push_back(std::move(db));
        return true;
    });
    if (!ok) {
        throw SourceError("Cannot list databases on " + settings_.server + ": " +
                          conn->last_error());
    }

    LOG_DEBUG("Found %zu user databases on %s", result.size(), settings_.server.c_str());
    return result;
}

std::vector<TableInfo> ServerBrowser::list_tables(const std::string& database) {
    if (database.empty()) throw ConfigError("Database name is required to list tables");

    auto conn = factory_(settings_, database);

    const std::string sql =
        "SELECT t.TABLE_SCHEMA, t.TABLE_NAME, COUNT(c.COLUMN_NAME) AS column_count "
        "FROM INFORMATION_SCHEMA.TABLES t "
        "LEFT JOIN INFORMATION_SCHEMA.COLUMNS c "
        "  ON t.TABLE_NAME = c.TABLE_NAME AND t.TABLE_SCHEMA = c.TABLE_SCHEMA "
        "WHERE t.TABLE_TYPE = 'BASE TABLE' "
        "GROUP BY t.TABLE_SCHEMA, t.TABLE_NAME "
        "ORDER BY t.TABLE_SCHEMA, t.TABLE_NAME";

    std::vector<TableInfo> result;
    bool ok = conn->query_rows(sql, [&](const Row& row) {
        if (row.size() < 3) return true;
        TableInfo tbl;
        std::string schema = value_as_string(row[0]);
        if (!schema.empty()) tbl.schema_name = schema;
        tbl.table_name   = value_as_string(row[1]);
        tbl.column_count = static_cast<int32_t>(value_as_int64(row[2]));
        result.push_back(std::move(tbl));
        return true;
    });
    if (!ok) {
        throw SourceError("Cannot list tables of '" + database + "': " + conn->last_error());
    }

    LOG_DEBUG("Found %zu tables in %s", result.size(), database.c_str());
    return result;
}

}  // namespace sqlxfer
