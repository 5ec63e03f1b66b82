#include "sqlxfer/odbc_connection.h"
#include "sqlxfer/error.h"
#include "sqlxfer/logging.h"
#include "sqlxfer/sql_types.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace sqlxfer {

namespace {

constexpr size_t kChunkSize = 8192;
constexpr size_t kWideChunk = 4096;

static_assert(sizeof(SQLWCHAR) == sizeof(char16_t), "SQLWCHAR must be a UTF-16 code unit");

SQLCHAR* sql_text(const std::string& s) {
    return reinterpret_cast<SQLCHAR*>(const_cast<char*>(s.c_str()));
}

// NUL-terminated UTF-16 copy of a UTF-8 string
std::vector<SQLWCHAR> wide_text(const std::string& s) {
    std::u16string w = OdbcConnection::utf8_to_utf16(s);
    std::vector<SQLWCHAR> out(w.begin(), w.end());
    out.push_back(0);
    return out;
}

SqlType column_type(const ColumnDescriptor& col) {
    const SqlTypeInfo* info = find_sql_type(col.type_name);
    return info ? info->type : SqlType::Unknown;
}

// Read a character column as UTF-16 in chunks; false on driver error
bool fetch_text(SQLHSTMT stmt, SQLUSMALLINT col, RowValue& out) {
    std::u16string value;
    SQLWCHAR buf[kWideChunk];

    for (;;) {
        SQLLEN ind = 0;
        SQLRETURN ret = SQLGetData(stmt, col, SQL_C_WCHAR, buf, sizeof(buf), &ind);
        if (ret == SQL_NO_DATA) break;
        if (!SQL_SUCCEEDED(ret)) return false;
        if (ind == SQL_NULL_DATA) {
            out = NullValue{};
            return true;
        }
        // ind counts bytes; a truncated chunk ends in a terminator
        size_t n = (ind == SQL_NO_TOTAL || ind >= static_cast<SQLLEN>(sizeof(buf)))
                       ? kWideChunk - 1
                       : static_cast<size_t>(ind) / sizeof(SQLWCHAR);
        value.append(buf, buf + n);
        if (ret == SQL_SUCCESS) break;
    }

    out = OdbcConnection::utf16_to_utf8(value);
    return true;
}

bool fetch_binary(SQLHSTMT stmt, SQLUSMALLINT col, RowValue& out) {
    std::vector<uint8_t> value;
    uint8_t buf[kChunkSize];

    for (;;) {
        SQLLEN ind = 0;
        SQLRETURN ret = SQLGetData(stmt, col, SQL_C_BINARY, buf, sizeof(buf), &ind);
        if (ret == SQL_NO_DATA) break;
        if (!SQL_SUCCEEDED(ret)) return false;
        if (ind == SQL_NULL_DATA) {
            out = NullValue{};
            return true;
        }
        size_t n = (ind == SQL_NO_TOTAL || ind > static_cast<SQLLEN>(sizeof(buf)))
                       ? sizeof(buf)
                       : static_cast<size_t>(ind);
        value.insert(value.end(), buf, buf + n);
        if (ret == SQL_SUCCESS) break;
    }

    out = std::move(value);
    return true;
}

template <typename T>
bool fetch_fixed(SQLHSTMT stmt, SQLUSMALLINT col, SQLSMALLINT c_type, RowValue& out) {
    T val{};
    SQLLEN ind = 0;
    SQLRETURN ret = SQLGetData(stmt, col, c_type, &val, sizeof(val), &ind);
    if (!SQL_SUCCEEDED(ret)) return false;
    if (ind == SQL_NULL_DATA) out = NullValue{};
    else out = val;
    return true;
}

bool fetch_column_value(SQLHSTMT stmt, SQLUSMALLINT col, SqlType type, RowValue& out) {
    switch (type) {
    case SqlType::TinyInt:
    case SqlType::SmallInt:
        return fetch_fixed<int16_t>(stmt, col, SQL_C_SSHORT, out);
    case SqlType::Int:
        return fetch_fixed<int32_t>(stmt, col, SQL_C_SLONG, out);
    case SqlType::BigInt:
        return fetch_fixed<int64_t>(stmt, col, SQL_C_SBIGINT, out);
    case SqlType::Bit: {
        unsigned char val = 0;
        SQLLEN ind = 0;
        SQLRETURN ret = SQLGetData(stmt, col, SQL_C_BIT, &val, sizeof(val), &ind);
        if (!SQL_SUCCEEDED(ret)) return false;
        if (ind == SQL_NULL_DATA) out = NullValue{};
        else out = (val != 0);
        return true;
    }
    case SqlType::Float:
        return fetch_fixed<double>(stmt, col, SQL_C_DOUBLE, out);
    case SqlType::Real:
        return fetch_fixed<float>(stmt, col, SQL_C_FLOAT, out);
    case SqlType::Binary:
    case SqlType::VarBinary:
    case SqlType::Image:
    case SqlType::Timestamp:
        return fetch_binary(stmt, col, out);
    default:
        // varchar, nvarchar, decimal, money, temporals, guid, xml, ...
        return fetch_text(stmt, col, out);
    }
}

// -------------------------------------------------------------------------
// OdbcCursor
// -------------------------------------------------------------------------
class OdbcCursor : public IRowCursor {
public:
    OdbcCursor(SQLHSTMT stmt, std::vector<ColumnDescriptor> columns)
        : stmt_(stmt), columns_(std::move(columns))
    {
        types_.reserve(columns_.size());
        for (const auto& c : columns_) types_.push_back(column_type(c));
    }

    ~OdbcCursor() override {
        if (stmt_ != SQL_NULL_HSTMT) {
            SQLFreeStmt(stmt_, SQL_CLOSE);
            SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
        }
    }

    const std::vector<ColumnDescriptor>& columns() const override { return columns_; }

    bool next(Row& row) override {
        if (done_) return false;

        SQLRETURN ret = SQLFetch(stmt_);
        if (ret == SQL_NO_DATA) {
            done_ = true;
            return false;
        }
        if (!SQL_SUCCEEDED(ret)) {
            fail(OdbcConnection::get_diag(SQL_HANDLE_STMT, stmt_));
            return false;
        }

        row.assign(columns_.size(), NullValue{});
        for (size_t i = 0; i < columns_.size(); ++i) {
            auto col = static_cast<SQLUSMALLINT>(i + 1);
            if (!fetch_column_value(stmt_, col, types_[i], row[i])) {
                fail("Cannot read column '" + columns_[i].name + "': " +
                     OdbcConnection::get_diag(SQL_HANDLE_STMT, stmt_));
                return false;
            }
        }
        return true;
    }

    bool failed() const override { return failed_; }
    std::string last_error() const override { return last_error_; }

private:
    void fail(const std::string& msg) {
        failed_ = true;
        done_ = true;
        last_error_ = msg;
        LOG_ERROR("Fetch failed: %s", msg.c_str());
    }

    SQLHSTMT stmt_;
    std::vector<ColumnDescriptor> columns_;
    std::vector<SqlType> types_;
    bool done_   = false;
    bool failed_ = false;
    std::string last_error_;
};

// -------------------------------------------------------------------------
// OdbcPreparedStatement
// -------------------------------------------------------------------------
class OdbcPreparedStatement : public IPreparedStatement {
public:
    OdbcPreparedStatement(SQLHSTMT stmt, std::vector<ColumnDescriptor> params)
        : stmt_(stmt), params_(std::move(params)), buffers_(params_.size())
    {
        types_.reserve(params_.size());
        for (const auto& p : params_) types_.push_back(column_type(p));
    }

    ~OdbcPreparedStatement() override {
        if (stmt_ != SQL_NULL_HSTMT) {
            SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
        }
    }

    bool execute(const Row& values) override {
        if (values.size() != params_.size()) {
            last_error_ = "Row has " + std::to_string(values.size()) +
                          " values, statement expects " +
                          std::to_string(params_.size());
            return false;
        }

        SQLFreeStmt(stmt_, SQL_RESET_PARAMS);
        for (size_t i = 0; i < values.size(); ++i) {
            if (!bind(static_cast<SQLUSMALLINT>(i + 1), types_[i], values[i], buffers_[i])) {
                last_error_ = "Cannot bind parameter for column '" + params_[i].name +
                              "': " + OdbcConnection::get_diag(SQL_HANDLE_STMT, stmt_);
                return false;
            }
        }

        SQLRETURN ret = SQLExecute(stmt_);
        if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
            last_error_ = OdbcConnection::get_diag(SQL_HANDLE_STMT, stmt_);
            SQLFreeStmt(stmt_, SQL_CLOSE);
            return false;
        }
        SQLFreeStmt(stmt_, SQL_CLOSE);
        return true;
    }

    std::string last_error() const override { return last_error_; }

private:
    // Storage that must outlive SQLExecute
    struct ParamBuffer {
        std::vector<SQLWCHAR> text;
        std::vector<uint8_t>  bytes;
        int64_t              i64 = 0;
        int32_t              i32 = 0;
        int16_t              i16 = 0;
        unsigned char        bit = 0;
        double               f64 = 0.0;
        float                f32 = 0.0f;
        SQLLEN               ind = 0;
    };

    SQLRETURN bind_buffer(SQLUSMALLINT n, SQLSMALLINT c_type, SQLSMALLINT sql_type,
                          SQLULEN size, SQLPOINTER data, SQLLEN buf_len, SQLLEN* ind) {
        return SQLBindParameter(stmt_, n, SQL_PARAM_INPUT, c_type, sql_type,
                                size, 0, data, buf_len, ind);
    }

    bool bind(SQLUSMALLINT n, SqlType type, const RowValue& value, ParamBuffer& buf) {
        SQLRETURN ret;

        if (std::holds_alternative<NullValue>(value)) {
            buf.ind = SQL_NULL_DATA;
            // varchar does not convert implicitly to varbinary, even as NULL
            if (is_binary(type))
                ret = bind_buffer(n, SQL_C_BINARY, SQL_VARBINARY, 1, nullptr, 0, &buf.ind);
            else
                ret = bind_buffer(n, SQL_C_CHAR, SQL_VARCHAR, 1, nullptr, 0, &buf.ind);
        }
        else if (auto* b = std::get_if<bool>(&value)) {
            buf.bit = *b ? 1 : 0;
            buf.ind = 0;
            ret = bind_buffer(n, SQL_C_BIT, SQL_BIT, 1, &buf.bit, 0, &buf.ind);
        }
        else if (auto* v16 = std::get_if<int16_t>(&value)) {
            buf.i16 = *v16;
            buf.ind = 0;
            ret = bind_buffer(n, SQL_C_SSHORT, SQL_SMALLINT, 5, &buf.i16, 0, &buf.ind);
        }
        else if (auto* v32 = std::get_if<int32_t>(&value)) {
            buf.i32 = *v32;
            buf.ind = 0;
            ret = bind_buffer(n, SQL_C_SLONG, SQL_INTEGER, 10, &buf.i32, 0, &buf.ind);
        }
        else if (auto* v64 = std::get_if<int64_t>(&value)) {
            buf.i64 = *v64;
            buf.ind = 0;
            ret = bind_buffer(n, SQL_C_SBIGINT, SQL_BIGINT, 19, &buf.i64, 0, &buf.ind);
        }
        else if (auto* f = std::get_if<float>(&value)) {
            buf.f32 = *f;
            buf.ind = 0;
            ret = bind_buffer(n, SQL_C_FLOAT, SQL_REAL, 24, &buf.f32, 0, &buf.ind);
        }
        else if (auto* d = std::get_if<double>(&value)) {
            buf.f64 = *d;
            buf.ind = 0;
            ret = bind_buffer(n, SQL_C_DOUBLE, SQL_DOUBLE, 53, &buf.f64, 0, &buf.ind);
        }
        else if (auto* s = std::get_if<std::string>(&value)) {
            bool temporal = type == SqlType::DateTime || type == SqlType::SmallDateTime;
            buf.text = wide_text(temporal ? OdbcConnection::iso8601_datetime(*s) : *s);
            size_t units = buf.text.size() - 1;
            buf.ind = static_cast<SQLLEN>(units * sizeof(SQLWCHAR));
            bool wide = is_unicode(type) || type == SqlType::Xml || type == SqlType::Json;
            size_t limit = wide ? 4000 : 8000;
            SQLSMALLINT sql_type;
            if (wide) sql_type = units > limit ? SQL_WLONGVARCHAR : SQL_WVARCHAR;
            else      sql_type = units > limit ? SQL_LONGVARCHAR : SQL_VARCHAR;
            SQLULEN size = std::max<SQLULEN>(units, 1);
            ret = bind_buffer(n, SQL_C_WCHAR, sql_type, size, buf.text.data(),
                              static_cast<SQLLEN>(buf.text.size() * sizeof(SQLWCHAR)), &buf.ind);
        }
        else {
            buf.bytes = std::get<std::vector<uint8_t>>(value);
            buf.ind = static_cast<SQLLEN>(buf.bytes.size());
            SQLSMALLINT sql_type = buf.bytes.size() > 8000 ? SQL_LONGVARBINARY : SQL_VARBINARY;
            SQLULEN size = std::max<SQLULEN>(buf.bytes.size(), 1);
            ret = bind_buffer(n, SQL_C_BINARY, sql_type, size,
                              buf.bytes.data(), buf.ind, &buf.ind);
        }

        return SQL_SUCCEEDED(ret);
    }

    SQLHSTMT stmt_;
    std::vector<ColumnDescriptor> params_;
    std::vector<SqlType> types_;
    std::vector<ParamBuffer> buffers_;
    std::string last_error_;
};

// Result-set metadata of an executed statement
bool describe_columns(SQLHSTMT stmt, std::vector<ColumnDescriptor>& out, std::string& error) {
    SQLSMALLINT ncols = 0;
    if (!SQL_SUCCEEDED(SQLNumResultCols(stmt, &ncols))) {
        error = OdbcConnection::get_diag(SQL_HANDLE_STMT, stmt);
        return false;
    }

    out.clear();
    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(ncols); ++i) {
        SQLWCHAR    name[256] = {};
        SQLSMALLINT name_len = 0;
        SQLSMALLINT data_type = 0;
        SQLULEN     col_size = 0;
        SQLSMALLINT digits = 0;
        SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;

        SQLRETURN ret = SQLDescribeColW(stmt, i, name, 256, &name_len,
                                        &data_type, &col_size, &digits, &nullable);
        if (!SQL_SUCCEEDED(ret)) {
            error = OdbcConnection::get_diag(SQL_HANDLE_STMT, stmt);
            return false;
        }

        SQLCHAR     type_buf[128] = {};
        SQLSMALLINT type_len = 0;
        SQLLEN      unused = 0;
        SQLColAttribute(stmt, i, SQL_DESC_TYPE_NAME, type_buf, sizeof(type_buf),
                        &type_len, &unused);

        SQLLEN auto_unique = SQL_FALSE;
        SQLColAttribute(stmt, i, SQL_DESC_AUTO_UNIQUE_VALUE, nullptr, 0, nullptr,
                        &auto_unique);

        size_t len = std::min<size_t>(static_cast<size_t>(std::max<SQLSMALLINT>(name_len, 0)),
                                      255);
        out.push_back(OdbcConnection::describe_column(
            OdbcConnection::utf16_to_utf8(std::u16string(name, name + len)),
            reinterpret_cast<char*>(type_buf),
            col_size, digits, nullable != SQL_NO_NULLS, auto_unique == SQL_TRUE));
    }
    return true;
}

}  // namespace

// =========================================================================
// OdbcConnection
// =========================================================================

OdbcConnection::OdbcConnection() {
    alloc_handles();
}

OdbcConnection::~OdbcConnection() {
    if (in_transaction_) {
        LOG_WARN("Connection closed with an open transaction -- rolling back");
        rollback();
    }
    free_handles();
}

bool OdbcConnection::alloc_handles() {
    SQLRETURN ret;

    ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = "Failed to allocate ODBC environment handle";
        return false;
    }

    ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION,
                        reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3_80), 0);
    if (!SQL_SUCCEEDED(ret)) {
        SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION,
                      reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0);
    }

    ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = "Failed to allocate ODBC connection handle";
        return false;
    }
    return true;
}

void OdbcConnection::free_handles() {
    if (stmt_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
        stmt_ = SQL_NULL_HSTMT;
    }
    if (dbc_ != SQL_NULL_HDBC) {
        if (connected_) {
            SQLDisconnect(dbc_);
            connected_ = false;
        }
        SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
        dbc_ = SQL_NULL_HDBC;
    }
    if (env_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, env_);
        env_ = SQL_NULL_HENV;
    }
}

std::string OdbcConnection::utf16_to_utf8(const std::u16string& text) {
    std::string result;
    result.reserve(text.size());

    auto put = [&result](uint32_t cp) {
        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        uint32_t ch = text[i];
        if (ch >= 0xD800 && ch <= 0xDBFF) {
            // Surrogate pair for characters outside the BMP
            if (i + 1 < text.size() && text[i + 1] >= 0xDC00 && text[i + 1] <= 0xDFFF) {
                uint32_t low = text[i + 1];
                put(0x10000 + ((ch - 0xD800) << 10) + (low - 0xDC00));
                ++i;
            } else {
                put(0xFFFD);
            }
        } else if (ch >= 0xDC00 && ch <= 0xDFFF) {
            put(0xFFFD);
        } else {
            put(ch);
        }
    }
    return result;
}

std::u16string OdbcConnection::utf8_to_utf16(const std::string& text) {
    std::u16string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto b0 = static_cast<unsigned char>(text[i]);
        uint32_t cp = 0xFFFD;
        size_t extra = 0;
        uint32_t min_cp = 0;

        if (b0 < 0x80)                { cp = b0;        extra = 0; }
        else if ((b0 & 0xE0) == 0xC0) { cp = b0 & 0x1F; extra = 1; min_cp = 0x80; }
        else if ((b0 & 0xF0) == 0xE0) { cp = b0 & 0x0F; extra = 2; min_cp = 0x800; }
        else if ((b0 & 0xF8) == 0xF0) { cp = b0 & 0x07; extra = 3; min_cp = 0x10000; }
        else {
            result.push_back(u'\uFFFD');
            ++i;
            continue;
        }

        size_t j = 1;
        for (; j <= extra; ++j) {
            if (i + j >= text.size()) break;
            auto b = static_cast<unsigned char>(text[i + j]);
            if ((b & 0xC0) != 0x80) break;
            cp = (cp << 6) | (b & 0x3F);
        }
        if (j <= extra || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            // Truncated, overlong or out of range
            result.push_back(u'\uFFFD');
            i += j;
            continue;
        }
        i += j;

        if (cp >= 0x10000) {
            cp -= 0x10000;
            result.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            result.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            result.push_back(static_cast<char16_t>(cp));
        }
    }
    return result;
}

std::string OdbcConnection::iso8601_datetime(const std::string& text) {
    auto digits = [&text](size_t from, size_t count) {
        for (size_t k = from; k < from + count; ++k) {
            if (!std::isdigit(static_cast<unsigned char>(text[k]))) return false;
        }
        return true;
    };

    // yyyy-mm-dd hh:mi[...]
    if (text.size() < 16 || !digits(0, 4) || text[4] != '-' || !digits(5, 2) ||
        text[7] != '-' || !digits(8, 2) || text[10] != ' ' || !digits(11, 2) ||
        text[13] != ':' || !digits(14, 2)) {
        return text;
    }
    std::string result = text;
    result[10] = 'T';
    return result;
}

ColumnDescriptor OdbcConnection::describe_column(const std::string& name,
                                                 const std::string& type_name,
                                                 uint64_t col_size, int digits,
                                                 bool nullable, bool auto_unique) {
    ColumnDescriptor col;
    col.name        = name;
    col.is_nullable = nullable;
    col.is_identity = auto_unique;

    // The driver reports identity columns as e.g. "int identity" or
    // "numeric() identity"
    std::string type = type_name;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto strip = [&type](const std::string& suffix) {
        if (type.size() <= suffix.size() ||
            type.compare(type.size() - suffix.size(), suffix.size(), suffix) != 0)
            return false;
        type.resize(type.size() - suffix.size());
        return true;
    };
    if (strip(" identity")) col.is_identity = true;
    strip("()");
    col.type_name = type;

    const SqlTypeInfo* info = find_sql_type(type);
    if (!info) return col;

    if (info->params & kLength) {
        // 0 is the driver's "unlimited" marker for (MAX) types
        if (col_size == 0 || col_size > static_cast<uint64_t>(info->max_length))
            col.max_length = -1;
        else
            col.max_length = static_cast<int32_t>(col_size);
    }
    else if (info->params & kPrecisionScale) {
        col.precision = static_cast<uint8_t>(std::min<uint64_t>(col_size, 38));
        col.scale     = static_cast<uint8_t>(std::max(digits, 0));
    }
    else if (info->params & kFloatPrecision) {
        col.precision = static_cast<uint8_t>(std::min<uint64_t>(col_size, 53));
    }
    else if (info->params & kFractionalScale) {
        col.scale = static_cast<uint8_t>(std::max(digits, 0));
    }
    return col;
}

std::string OdbcConnection::build_connection_string(const ConnectionSettings& settings,
                                                    const std::string& database,
                                                    const std::string& driver) {
    // Braced values may contain ';'; a literal '}' is doubled
    auto braced = [](const std::string& v) {
        std::string out = "{";
        for (char c : v) {
            out += c;
            if (c == '}') out += '}';
        }
        return out + "}";
    };

    std::string conn_str = "DRIVER={" + driver + "};"
                           "SERVER=" + settings.server + ";";
    if (!database.empty()) {
        conn_str += "DATABASE=" + braced(database) + ";";
    }

    if (settings.auth_mode == AuthMode::SqlLogin) {
        conn_str += "UID=" + braced(settings.username) + ";"
                    "PWD=" + braced(settings.password) + ";";
    } else {
        conn_str += "Trusted_Connection=yes;";
    }

    conn_str += std::string("TrustServerCertificate=") +
                (settings.trust_server_certificate ? "yes" : "no") + ";"
                "APP=sqlxfer;";
    return conn_str;
}

bool OdbcConnection::connect(const ConnectionSettings& settings, const std::string& database) {
    if (dbc_ == SQL_NULL_HDBC) return false;

    server_ = settings.server;
    if (settings.timeout_seconds > 0) {
        SQLSetConnectAttr(dbc_, SQL_ATTR_LOGIN_TIMEOUT,
                          reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(settings.timeout_seconds)),
                          0);
    }

    if (settings.auth_mode == AuthMode::SqlLogin) {
        LOG_DEBUG("Using SQL Server Authentication for user: %s", settings.username.c_str());
    } else {
        LOG_DEBUG("Using integrated authentication");
    }

    static const char* const kDrivers[] = {
        "ODBC Driver 18 for SQL Server",
        "ODBC Driver 17 for SQL Server",
    };

    SQLRETURN ret = SQL_ERROR;
    std::string errors;
    for (const char* driver : kDrivers) {
        std::string conn_str = build_connection_string(settings, database, driver);
        LOG_DEBUG("Connecting with %s", driver);

        SQLCHAR out_conn[1024];
        SQLSMALLINT out_len;
        ret = SQLDriverConnect(dbc_, nullptr, sql_text(conn_str),
                               static_cast<SQLSMALLINT>(conn_str.size()),
                               out_conn, sizeof(out_conn), &out_len,
                               SQL_DRIVER_NOPROMPT);
        if (SQL_SUCCEEDED(ret)) break;

        if (!errors.empty()) errors += " | ";
        errors += get_diag(SQL_HANDLE_DBC, dbc_);
    }

    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = "Cannot connect to SQL Server '" + settings.server + "': " + errors;
        return false;
    }

    connected_ = true;

    ret = SQLAllocHandle(SQL_HANDLE_STMT, dbc_, &stmt_);
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = "Failed to allocate statement handle";
        return false;
    }

    LOG_INFO("Connected to SQL Server: %s (database '%s')", settings.server.c_str(),
             database.empty() ? "default" : database.c_str());
    return true;
}

bool OdbcConnection::execute(const std::string& sql) {
    if (!connected_) {
        last_error_ = "Not connected";
        return false;
    }

    LOG_DEBUG("Execute: %s", sql.c_str());

    SQLFreeStmt(stmt_, SQL_CLOSE);

    std::vector<SQLWCHAR> text = wide_text(sql);
    SQLRETURN ret = SQLExecDirectW(stmt_, text.data(), SQL_NTS);

    // DELETE/UPDATE touching no rows report SQL_NO_DATA
    if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
        last_error_ = get_diag(SQL_HANDLE_STMT, stmt_);
        LOG_DEBUG("SQL execution failed: %s", last_error_.c_str());
        return false;
    }
    return true;
}

bool OdbcConnection::query_scalar(const std::string& sql, std::string& result) {
    if (!execute(sql)) return false;

    result.clear();
    SQLRETURN ret = SQLFetch(stmt_);
    if (ret == SQL_NO_DATA) {
        SQLFreeStmt(stmt_, SQL_CLOSE);
        return true;
    }
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = get_diag(SQL_HANDLE_STMT, stmt_);
        SQLFreeStmt(stmt_, SQL_CLOSE);
        return false;
    }

    RowValue value;
    bool ok = fetch_text(stmt_, 1, value);
    if (!ok) last_error_ = get_diag(SQL_HANDLE_STMT, stmt_);
    SQLFreeStmt(stmt_, SQL_CLOSE);

    if (auto* s = std::get_if<std::string>(&value)) result = *s;
    return ok;
}

bool OdbcConnection::query_scalar_int(const std::string& sql, int64_t& result) {
    if (!execute(sql)) return false;

    result = 0;
    SQLRETURN ret = SQLFetch(stmt_);
    if (ret == SQL_NO_DATA) {
        SQLFreeStmt(stmt_, SQL_CLOSE);
        return true;
    }
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = get_diag(SQL_HANDLE_STMT, stmt_);
        SQLFreeStmt(stmt_, SQL_CLOSE);
        return false;
    }

    SQLLEN indicator = 0;
    ret = SQLGetData(stmt_, 1, SQL_C_SBIGINT, &result, sizeof(result), &indicator);
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = get_diag(SQL_HANDLE_STMT, stmt_);
        SQLFreeStmt(stmt_, SQL_CLOSE);
        return false;
    }
    if (indicator == SQL_NULL_DATA) result = 0;

    SQLFreeStmt(stmt_, SQL_CLOSE);
    return true;
}

std::unique_ptr<IRowCursor> OdbcConnection::open_cursor(const std::string& sql) {
    if (!connected_) {
        last_error_ = "Not connected";
        return nullptr;
    }

    SQLHSTMT stmt = SQL_NULL_HSTMT;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc_, &stmt))) {
        last_error_ = get_diag(SQL_HANDLE_DBC, dbc_);
        return nullptr;
    }

    LOG_DEBUG("Query: %s", sql.c_str());
    std::vector<SQLWCHAR> text = wide_text(sql);
    SQLRETURN ret = SQLExecDirectW(stmt, text.data(), SQL_NTS);
    if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
        last_error_ = get_diag(SQL_HANDLE_STMT, stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        return nullptr;
    }

    std::vector<ColumnDescriptor> columns;
    if (!describe_columns(stmt, columns, last_error_)) {
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        return nullptr;
    }

    return std::make_unique<OdbcCursor>(stmt, std::move(columns));
}

std::unique_ptr<IPreparedStatement> OdbcConnection::prepare(
    const std::string& sql, const std::vector<ColumnDescriptor>& params) {
    if (!connected_) {
        last_error_ = "Not connected";
        return nullptr;
    }

    SQLHSTMT stmt = SQL_NULL_HSTMT;
    if (!SQL_SUCCEEDED(SQLAllocHandle(SQL_HANDLE_STMT, dbc_, &stmt))) {
        last_error_ = get_diag(SQL_HANDLE_DBC, dbc_);
        return nullptr;
    }

    LOG_DEBUG("Prepare: %s", sql.c_str());
    std::vector<SQLWCHAR> text = wide_text(sql);
    SQLRETURN ret = SQLPrepareW(stmt, text.data(), SQL_NTS);
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = get_diag(SQL_HANDLE_STMT, stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        return nullptr;
    }

    return std::make_unique<OdbcPreparedStatement>(stmt, params);
}

bool OdbcConnection::begin_transaction() {
    if (!connected_) {
        last_error_ = "Not connected";
        return false;
    }
    if (in_transaction_) {
        last_error_ = "A transaction is already open";
        return false;
    }

    SQLRETURN ret = SQLSetConnectAttr(dbc_, SQL_ATTR_AUTOCOMMIT,
                                      reinterpret_cast<SQLPOINTER>(SQL_AUTOCOMMIT_OFF),
                                      SQL_IS_UINTEGER);
    if (!SQL_SUCCEEDED(ret)) {
        last_error_ = get_diag(SQL_HANDLE_DBC, dbc_);
        return false;
    }
    in_transaction_ = true;
    LOG_DEBUG("Transaction started on %s", server_.c_str());
    return true;
}

bool OdbcConnection::commit() {
    return end_transaction(SQL_COMMIT);
}

bool OdbcConnection::rollback() {
    return end_transaction(SQL_ROLLBACK);
}

bool OdbcConnection::end_transaction(SQLSMALLINT completion) {
    if (!in_transaction_) {
        last_error_ = "No open transaction";
        return false;
    }

    SQLRETURN ret = SQLEndTran(SQL_HANDLE_DBC, dbc_, completion);
    bool ok = SQL_SUCCEEDED(ret);
    if (!ok) last_error_ = get_diag(SQL_HANDLE_DBC, dbc_);

    // After a failed COMMIT the server has rolled back; either way the
    // transaction is over and autocommit is restored
    in_transaction_ = false;
    SQLSetConnectAttr(dbc_, SQL_ATTR_AUTOCOMMIT,
                      reinterpret_cast<SQLPOINTER>(SQL_AUTOCOMMIT_ON), SQL_IS_UINTEGER);

    LOG_DEBUG("Transaction %s on %s%s", completion == SQL_COMMIT ? "committed" : "rolled back",
              server_.c_str(), ok ? "" : " (failed)");
    return ok;
}

std::string OdbcConnection::get_diag(SQLSMALLINT handle_type, SQLHANDLE handle) {
    SQLCHAR state[8], msg[1024];
    SQLINTEGER native;
    SQLSMALLINT len;
    std::string result;

    for (SQLSMALLINT i = 1; ; ++i) {
        SQLRETURN ret = SQLGetDiagRec(handle_type, handle, i,
                                      state, &native, msg, sizeof(msg), &len);
        if (!SQL_SUCCEEDED(ret)) break;
        if (!result.empty()) result += " | ";
        result += "[" + std::string(reinterpret_cast<char*>(state)) + "] " +
                  std::string(reinterpret_cast<char*>(msg));
    }
    if (result.empty()) result = "unknown ODBC error";
    return result;
}

// =========================================================================
// Factory
// =========================================================================

ConnectionFactory odbc_connection_factory() {
    return [](const ConnectionSettings& settings,
              const std::string& database) -> std::unique_ptr<IConnection> {
        auto conn = std::make_unique<OdbcConnection>();
        if (!conn->connect(settings, database)) {
            throw ConnectionError(conn->last_error());
        }
        return conn;
    };
}

}  // namespace sqlxfer
