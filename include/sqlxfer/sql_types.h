#pragma once

#include "sqlxfer/types.h"

#include <string>
#include <vector>

namespace sqlxfer {

// -------------------------------------------------------------------------
// Fixed SQL Server type table
//
// Every type a destination column may be created with, keyed by the
// declared type name reported by the source. Names not in the table are
// rejected; there is no fallback type.
// -------------------------------------------------------------------------

enum TypeParams : uint8_t {
    kNoParams        = 0,
    kLength          = 1 << 0,   // (n) or (MAX)
    kPrecisionScale  = 1 << 1,   // (p,s)
    kFloatPrecision  = 1 << 2,   // (n), approximate numerics
    kFractionalScale = 1 << 3,   // (s), fractional seconds
};

struct SqlTypeInfo {
    const char* name;           // canonical lower-case name
    SqlType     type;
    uint8_t     params;
    int32_t     max_length;     // largest non-MAX length; 0 if not applicable
};

// Look up a declared type name (case-insensitive, aliases accepted).
// Returns nullptr for names outside the table.
const SqlTypeInfo* find_sql_type(const std::string& type_name);

// All entries, in table order
const std::vector<SqlTypeInfo>& sql_type_table();

inline bool is_unicode(SqlType t) {
    return t == SqlType::NChar || t == SqlType::NVarChar || t == SqlType::NText;
}

inline bool is_binary(SqlType t) {
    return t == SqlType::Binary || t == SqlType::VarBinary ||
           t == SqlType::Image || t == SqlType::Timestamp;
}

// Destination type clause for a column, e.g. "NVARCHAR(50)", "DECIMAL(10,2)",
// "VARBINARY(MAX)". Throws SchemaError for unmapped types or out-of-range
// length/precision/scale.
std::string format_column_type(const ColumnDescriptor& col);

}  // namespace sqlxfer
