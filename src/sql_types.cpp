#include "sqlxfer/sql_types.h"
#include "sqlxfer/error.h"

#include <algorithm>
#include <cctype>

namespace sqlxfer {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // Collapse "double  precision"-style whitespace runs and trim
    std::string out;
    bool space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
            continue;
        }
        if (space) out += ' ';
        space = false;
        out += c;
    }
    return out;
}

std::string upper(const char* s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

struct Alias {
    const char* alias;
    const char* name;
};

const Alias kAliases[] = {
    {"rowversion",        "timestamp"},
    {"sysname",           "nvarchar"},
    {"double precision",  "float"},
    {"integer",           "int"},
    {"dec",               "decimal"},
    {"character",         "char"},
    {"character varying", "varchar"},
    {"national character", "nchar"},
    {"national character varying", "nvarchar"},
    {"national char varying", "nvarchar"},
    {"binary varying",    "varbinary"},
};

}  // namespace

const std::vector<SqlTypeInfo>& sql_type_table() {
    static const std::vector<SqlTypeInfo> table = {
        // Exact numerics
        {"tinyint",          SqlType::TinyInt,        kNoParams,        0},
        {"smallint",         SqlType::SmallInt,       kNoParams,        0},
        {"int",              SqlType::Int,            kNoParams,        0},
        {"bigint",           SqlType::BigInt,         kNoParams,        0},
        {"bit",              SqlType::Bit,            kNoParams,        0},
        {"decimal",          SqlType::Decimal,        kPrecisionScale,  0},
        {"numeric",          SqlType::Numeric,        kPrecisionScale,  0},
        {"money",            SqlType::Money,          kNoParams,        0},
        {"smallmoney",       SqlType::SmallMoney,     kNoParams,        0},

        // Approximate numerics
        {"float",            SqlType::Float,          kFloatPrecision,  0},
        {"real",             SqlType::Real,           kNoParams,        0},

        // Date and time
        {"date",             SqlType::Date,           kNoParams,        0},
        {"time",             SqlType::Time,           kFractionalScale, 0},
        {"datetime",         SqlType::DateTime,       kNoParams,        0},
        {"datetime2",        SqlType::DateTime2,      kFractionalScale, 0},
        {"smalldatetime",    SqlType::SmallDateTime,  kNoParams,        0},
        {"datetimeoffset",   SqlType::DateTimeOffset, kFractionalScale, 0},

        // Character strings
        {"char",             SqlType::Char,           kLength,          8000},
        {"varchar",          SqlType::VarChar,        kLength,          8000},
        {"text",             SqlType::Text,           kNoParams,        0},
        {"nchar",            SqlType::NChar,          kLength,          4000},
        {"nvarchar",         SqlType::NVarChar,       kLength,          4000},
        {"ntext",            SqlType::NText,          kNoParams,        0},

        // Binary strings
        {"binary",           SqlType::Binary,         kLength,          8000},
        {"varbinary",        SqlType::VarBinary,      kLength,          8000},
        {"image",            SqlType::Image,          kNoParams,        0},

        // Other
        {"uniqueidentifier", SqlType::UniqueId,       kNoParams,        0},
        {"xml",              SqlType::Xml,            kNoParams,        0},
        {"timestamp",        SqlType::Timestamp,      kNoParams,        0},
        {"sql_variant",      SqlType::Sql_Variant,    kNoParams,        0},
        {"json",             SqlType::Json,           kNoParams,        0},
    };
    return table;
}

const SqlTypeInfo* find_sql_type(const std::string& type_name) {
    std::string name = lower(type_name);
    for (const auto& a : kAliases) {
        if (name == a.alias) {
            name = a.name;
            break;
        }
    }
    for (const auto& info : sql_type_table()) {
        if (name == info.name) return &info;
    }
    return nullptr;
}

std::string format_column_type(const ColumnDescriptor& col) {
    const SqlTypeInfo* info = find_sql_type(col.type_name);
    if (!info) {
        throw SchemaError("Column '" + col.name + "' has unsupported type '" +
                          col.type_name + "'");
    }

    // A destination rowversion column cannot receive the source values
    if (info->type == SqlType::Timestamp) return "BINARY(8)";

    std::string result = upper(info->name);

    if (info->params & kLength) {
        bool variable = info->type == SqlType::VarChar ||
                        info->type == SqlType::NVarChar ||
                        info->type == SqlType::VarBinary;
        int32_t len = col.max_length;
        if (len < 0 || len > info->max_length) {
            if (!variable) {
                throw SchemaError("Column '" + col.name + "': length " +
                                  std::to_string(len) + " is out of range for " +
                                  result);
            }
            result += "(MAX)";
        } else {
            result += "(" + std::to_string(len > 0 ? len : 1) + ")";
        }
    }
    else if (info->params & kPrecisionScale) {
        int precision = col.precision > 0 ? col.precision : 18;
        int scale     = col.scale;
        if (precision > 38 || scale > precision) {
            throw SchemaError("Column '" + col.name + "': precision/scale (" +
                              std::to_string(precision) + "," +
                              std::to_string(scale) + ") is out of range for " +
                              result);
        }
        result += "(" + std::to_string(precision) + "," + std::to_string(scale) + ")";
    }
    else if (info->params & kFloatPrecision) {
        if (col.precision > 53) {
            throw SchemaError("Column '" + col.name + "': float precision " +
                              std::to_string(col.precision) + " exceeds 53");
        }
        if (col.precision > 0) {
            result += "(" + std::to_string(col.precision) + ")";
        }
    }
    else if (info->params & kFractionalScale) {
        if (col.scale > 7) {
            throw SchemaError("Column '" + col.name + "': fractional seconds scale " +
                              std::to_string(col.scale) + " exceeds 7");
        }
        result += "(" + std::to_string(col.scale) + ")";
    }

    return result;
}

}  // namespace sqlxfer
