#pragma once

#include "sqlxfer/db_connection.h"
#include "sqlxfer/types.h"

#include <cstdint>
#include <memory>
#include <string>

namespace sqlxfer {

// -------------------------------------------------------------------------
// SourceReader -- read-only access to a table or an arbitrary query
//
// Holds one connection per database, opened on first use and reused by
// later calls against the same database. Cursors returned by open_cursor()
// run on that connection, so the reader must outlive them.
//
// Failures are raised as SourceError (missing table, invalid query),
// ConfigError (bad arguments) or ConnectionError (server unreachable).
// -------------------------------------------------------------------------
class SourceReader {
public:
    SourceReader(ConnectionSettings settings, ConnectionFactory factory);

    // Number of rows the source expression yields
    int64_t row_count(const std::string& database, const std::string& source,
                      bool is_query);

    // At most max_rows rows plus column metadata; never modifies anything
    PreviewResult preview(const std::string& database, const std::string& source,
                          bool is_query, int64_t max_rows = kDefaultPreviewRows);

    // Streaming cursor over every row of the source expression
    std::unique_ptr<IRowCursor> open_cursor(const std::string& database,
                                            const std::string& source,
                                            bool is_query);

    // Statement text for each operation
    static std::string count_sql(const std::string& source, bool is_query);
    static std::string preview_sql(const std::string& source, bool is_query,
                                   int64_t max_rows);
    static std::string select_sql(const std::string& source, bool is_query);

private:
    IConnection& connection(const std::string& database);

    // Table mode: raise SourceError unless the object exists
    void require_table(IConnection& conn, const std::string& database,
                       const std::string& table);

    ConnectionSettings           settings_;
    ConnectionFactory            factory_;
    std::unique_ptr<IConnection> conn_;
    std::string                  database_;
};

}  // namespace sqlxfer
