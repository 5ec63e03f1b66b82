#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sqlxfer {

// -------------------------------------------------------------------------
// SQL Server data type identifiers (matches sys.types.system_type_id)
// -------------------------------------------------------------------------
enum class SqlType : uint8_t {
    Unknown       = 0,
    TinyInt       = 48,
    SmallInt      = 52,
    Int           = 56,
    BigInt        = 127,
    Bit           = 104,
    Float         = 62,
    Real          = 59,
    Decimal       = 106,
    Numeric       = 108,
    Money         = 60,
    SmallMoney    = 122,
    Date          = 40,
    Time          = 41,
    DateTime      = 61,
    DateTime2     = 42,
    SmallDateTime = 58,
    DateTimeOffset= 43,
    Char          = 175,
    VarChar       = 167,
    NChar         = 239,
    NVarChar      = 231,
    Text          = 35,
    NText         = 99,
    Binary        = 173,
    VarBinary     = 165,
    Image         = 34,
    UniqueId      = 36,
    Xml           = 241,
    Timestamp     = 189,
    Sql_Variant   = 98,
    Json          = 244,
};

// -------------------------------------------------------------------------
// Column metadata of one projected source column
// -------------------------------------------------------------------------
struct ColumnDescriptor {
    std::string name;
    std::string type_name;          // lower-case declared type, e.g. "nvarchar"
    bool        is_nullable  = true;
    int32_t     max_length   = 0;   // characters/bytes; -1 = MAX
    uint8_t     precision    = 0;
    uint8_t     scale        = 0;
    bool        is_identity  = false;
};

// -------------------------------------------------------------------------
// Runtime value representation
// -------------------------------------------------------------------------
using NullValue = std::monostate;

using RowValue = std::variant<
    NullValue,
    bool,
    int16_t,                // tinyint and smallint
    int32_t,
    int64_t,
    float,
    double,
    std::string,            // UTF-8 text; decimals and temporals in canonical text
    std::vector<uint8_t>    // raw binary
>;

using Row = std::vector<RowValue>;

// -------------------------------------------------------------------------
// Server connection parameters (supplied by the caller, never persisted)
// -------------------------------------------------------------------------
enum class AuthMode {
    Integrated,
    SqlLogin,
};

struct ConnectionSettings {
    std::string server;
    AuthMode    auth_mode = AuthMode::Integrated;
    std::string username;
    std::string password;
    int32_t     timeout_seconds = 30;
    bool        trust_server_certificate = true;
};

// -------------------------------------------------------------------------
// Transfer request
// -------------------------------------------------------------------------
enum class TransferMode {
    Table,
    Query,
};

enum class TransferAction {
    Append,
    Replace,
};

struct TransferRequest {
    std::string    source_database;
    TransferMode   mode = TransferMode::Table;
    std::string    source_table;     // Table mode
    std::string    source_query;     // Query mode
    std::string    destination_database;
    std::string    destination_table;
    TransferAction action = TransferAction::Append;
    bool           keep_identity = false;

    bool is_query() const { return mode == TransferMode::Query; }

    const std::string& source_expression() const {
        return is_query() ? source_query : source_table;
    }
};

// Rows per destination batch
constexpr int64_t kBatchSize = 1000;

// Default row limit for previews
constexpr int64_t kDefaultPreviewRows = 10;

// -------------------------------------------------------------------------
// Transfer state machine and outcome
// -------------------------------------------------------------------------
enum class TransferState {
    Validating,
    Counting,
    PreparingSchema,
    ClearingDestination,
    Loading,
    Committing,
    Succeeded,
    Failed,
    Cancelled,
};

const char* to_string(TransferState state);

inline bool is_terminal(TransferState s) {
    return s == TransferState::Succeeded || s == TransferState::Failed ||
           s == TransferState::Cancelled;
}

enum class ErrorKind {
    None,
    Config,
    Connection,
    Source,
    Schema,
    Transfer,
    Cancelled,
    Internal,
};

const char* to_string(ErrorKind kind);

struct TransferProgress {
    int64_t       total_rows       = 0;
    int64_t       transferred_rows = 0;
    std::string   status;
    bool          is_complete      = false;
    bool          is_success       = false;
    std::string   error_message;
    TransferState state            = TransferState::Validating;
    ErrorKind     error_kind       = ErrorKind::None;

    // floor(transferred * 100 / total), 0 when total is 0, 100 on success
    int percentage() const;
};

struct TransferResult {
    bool          success          = false;
    bool          cancelled        = false;
    ErrorKind     error_kind       = ErrorKind::None;
    std::string   error_message;
    int64_t       total_rows       = 0;
    int64_t       transferred_rows = 0;
    TransferState final_state      = TransferState::Validating;
    bool          table_created    = false;
    double        elapsed_seconds  = 0.0;
};

// -------------------------------------------------------------------------
// Server browsing
// -------------------------------------------------------------------------
struct DatabaseInfo {
    std::string name;
    std::string state;
    std::string recovery_model;
    int64_t     size_mb = 0;
};

struct TableInfo {
    std::string schema_name = "dbo";
    std::string table_name;
    int32_t     column_count = 0;

    std::string full_name() const { return schema_name + "." + table_name; }
};

struct PreviewResult {
    std::vector<ColumnDescriptor> columns;
    std::vector<Row>              rows;
};

}  // namespace sqlxfer
