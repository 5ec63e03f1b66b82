#pragma once

#include "sqlxfer/db_connection.h"
#include "sqlxfer/types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif
#include <sql.h>
#include <sqlext.h>

namespace sqlxfer {

// -------------------------------------------------------------------------
// OdbcConnection -- IConnection over the SQL Server ODBC driver
//
// Tries "ODBC Driver 18 for SQL Server" first and falls back to Driver 17.
// One connection owns one database context; statements, cursors and
// prepared statements each get their own statement handle.
// -------------------------------------------------------------------------
class OdbcConnection : public IConnection {
public:
    OdbcConnection();
    ~OdbcConnection() override;

    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;

    // Connect to `database` on settings.server
    bool connect(const ConnectionSettings& settings, const std::string& database);

    bool execute(const std::string& sql) override;
    bool query_scalar(const std::string& sql, std::string& result) override;
    bool query_scalar_int(const std::string& sql, int64_t& result) override;

    std::unique_ptr<IRowCursor> open_cursor(const std::string& sql) override;
    std::unique_ptr<IPreparedStatement> prepare(
        const std::string& sql, const std::vector<ColumnDescriptor>& params) override;

    bool begin_transaction() override;
    bool commit() override;
    bool rollback() override;
    bool in_transaction() const override { return in_transaction_; }

    std::string last_error() const override { return last_error_; }

    bool is_connected() const { return connected_; }

    // ODBC connection string for one driver (password included)
    static std::string build_connection_string(const ConnectionSettings& settings,
                                               const std::string& database,
                                               const std::string& driver);

    // Diagnostic records of a handle, "[state] message | ..."
    static std::string get_diag(SQLSMALLINT handle_type, SQLHANDLE handle);

    // Text travels to and from the driver as UTF-16 (SQL_C_WCHAR); values
    // and statements are UTF-8 on our side. Invalid sequences become U+FFFD.
    static std::string    utf16_to_utf8(const std::u16string& text);
    static std::u16string utf8_to_utf16(const std::string& text);

    // "yyyy-mm-dd hh:mi:ss[.fff]" -> "yyyy-mm-ddThh:mi:ss[.fff]". SQL Server
    // reads the first form for datetime/smalldatetime by the session's
    // DATEFORMAT, the second the same way under every setting. Other text
    // is returned unchanged.
    static std::string iso8601_datetime(const std::string& text);

    // Column descriptor from SQLDescribeCol / SQLColAttribute results.
    // A "<type> identity" type name marks an identity column; col_size 0
    // on a length type means (MAX).
    static ColumnDescriptor describe_column(const std::string& name,
                                            const std::string& type_name,
                                            uint64_t col_size, int digits,
                                            bool nullable, bool auto_unique);

private:
    bool alloc_handles();
    void free_handles();
    bool end_transaction(SQLSMALLINT completion);

    SQLHENV  env_  = SQL_NULL_HENV;
    SQLHDBC  dbc_  = SQL_NULL_HDBC;
    SQLHSTMT stmt_ = SQL_NULL_HSTMT;
    bool     connected_      = false;
    bool     in_transaction_ = false;
    std::string server_;
    std::string last_error_;
};

}  // namespace sqlxfer
