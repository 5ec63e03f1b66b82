#pragma once

// In-memory stand-in for a SQL Server instance. Connections understand the
// statements the transfer engine issues (counts, previews, scans, catalog
// lookups, CREATE TABLE, DELETE, SET IDENTITY_INSERT, parameterized INSERT)
// and give transactions snapshot/restore semantics.

#include "sqlxfer/db_connection.h"
#include "sqlxfer/types.h"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sqlxfer {
namespace fake {

struct FakeTable {
    std::string                   schema_name = "dbo";
    std::string                   name;
    std::vector<ColumnDescriptor> columns;
    std::vector<std::string>      declared_types;   // from CREATE TABLE, e.g. "NVARCHAR(50)"
    std::vector<Row>              rows;
    int64_t                       next_identity = 1;

    int identity_index() const;
    int column_index(const std::string& name) const;
};

struct FakeResult {
    std::vector<ColumnDescriptor> columns;
    std::vector<Row>              rows;
};

struct FakeDatabase {
    std::map<std::string, FakeTable>  tables;    // keyed by "[schema].[name]"
    std::map<std::string, FakeResult> queries;   // keyed by trimmed query text
};

class FakeServer {
public:
    FakeServer();

    // Create (or replace) a table in a database
    FakeTable& add_table(const std::string& database, const std::string& schema,
                         const std::string& name, std::vector<ColumnDescriptor> columns,
                         std::vector<Row> rows = {});

    // Register the result of an arbitrary query
    void add_query(const std::string& database, const std::string& sql,
                   std::vector<ColumnDescriptor> columns, std::vector<Row> rows);

    FakeTable*       find_table(const std::string& database, const std::string& schema,
                                const std::string& name);
    int64_t          row_count(const std::string& database, const std::string& schema,
                               const std::string& name);

    ConnectionFactory factory();

    std::map<std::string, FakeDatabase> databases;
    std::set<std::string>               unreachable_servers;
    std::vector<std::string>            statements;   // every statement, in order

    // Failure injection
    int64_t  fail_insert_at     = -1;    // 1-based insert number that fails
    int64_t  cursor_fail_after  = -1;    // scans fail after this many rows
    bool     fail_commit        = false;
    bool     fail_ddl           = false;
    int      open_connections   = 0;
    int      open_transactions  = 0;

    // Called after every successful insert with the running insert count
    std::function<void(int64_t)> on_insert;

    int64_t  insert_count = 0;
};

// Column descriptor shorthand for tests
ColumnDescriptor column(const std::string& name, const std::string& type,
                        bool nullable = true, int32_t max_length = 0,
                        uint8_t precision = 0, uint8_t scale = 0,
                        bool identity = false);

}  // namespace fake
}  // namespace sqlxfer
