#pragma once

#include "sqlxfer/types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sqlxfer {

// -------------------------------------------------------------------------
// IRowCursor -- forward-only result set with column metadata
// -------------------------------------------------------------------------
class IRowCursor {
public:
    virtual ~IRowCursor() = default;

    // Metadata of every projected column, available before the first fetch
    virtual const std::vector<ColumnDescriptor>& columns() const = 0;

    // Fetch the next row. Returns false at end of data or on error;
    // failed() tells the two apart.
    virtual bool next(Row& row) = 0;

    virtual bool failed() const = 0;
    virtual std::string last_error() const = 0;
};

// -------------------------------------------------------------------------
// IPreparedStatement -- one parameterized statement, executed per row
// -------------------------------------------------------------------------
class IPreparedStatement {
public:
    virtual ~IPreparedStatement() = default;

    // Bind one parameter per value and execute
    virtual bool execute(const Row& params) = 0;

    virtual std::string last_error() const = 0;
};

// -------------------------------------------------------------------------
// IConnection -- a session on one database of one server
//
// Methods report failure through their return value and last_error();
// callers decide which typed error a failure becomes.
// -------------------------------------------------------------------------
using RowCallback = std::function<bool(const Row& row)>;

class IConnection {
public:
    virtual ~IConnection() = default;

    // Execute a statement that returns no rows
    virtual bool execute(const std::string& sql) = 0;

    // Execute and fetch the first column of the first row.
    // A NULL or empty result yields an empty string / zero.
    virtual bool query_scalar(const std::string& sql, std::string& result) = 0;
    virtual bool query_scalar_int(const std::string& sql, int64_t& result) = 0;

    // Execute a query and return a cursor over its rows (nullptr on failure)
    virtual std::unique_ptr<IRowCursor> open_cursor(const std::string& sql) = 0;

    // Prepare a statement with '?' parameter markers (nullptr on failure)
    virtual std::unique_ptr<IPreparedStatement> prepare(
        const std::string& sql, const std::vector<ColumnDescriptor>& params) = 0;

    // Explicit transaction control; autocommit applies outside a transaction
    virtual bool begin_transaction() = 0;
    virtual bool commit() = 0;
    virtual bool rollback() = 0;
    virtual bool in_transaction() const = 0;

    virtual std::string last_error() const = 0;

    // Execute a query and process rows via callback (stops when the
    // callback returns false or after max_rows rows)
    bool query_rows(const std::string& sql, const RowCallback& callback,
                    int64_t max_rows = -1);
};

// Text form of a value: "" for NULL, 1/0 for bit, 0x-prefixed hex for binary
std::string value_as_string(const RowValue& value);

// Integer form of a numeric or numeric-text value; 0 for NULL
int64_t value_as_int64(const RowValue& value);

// Opens a connection to `database` on the server described by `settings`.
// Throws ConnectionError when the server cannot be reached.
using ConnectionFactory = std::function<std::unique_ptr<IConnection>(
    const ConnectionSettings& settings, const std::string& database)>;

// Factory producing OdbcConnection instances
ConnectionFactory odbc_connection_factory();

}  // namespace sqlxfer
