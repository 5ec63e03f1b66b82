#include "sqlxfer/source_reader.h"
#include "sqlxfer/error.h"
#include "sqlxfer/identifier.h"
#include "sqlxfer/logging.h"

namespace sqlxfer {

namespace {

std::string describe(const std::string& source, bool is_query) {
    if (!is_query) return "table '" + parse_qualified_name(source).display() + "'";
    std::string q = trim_query(source);
    if (q.size() > 80) q = q.substr(0, 77) + "...";
    return "query '" + q + "'";
}

void require_source(const std::string& source, bool is_query) {
    if (is_query) {
        if (trim_query(source).empty()) throw ConfigError("Source query is empty");
    } else if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ConfigError("Source table name is empty");
    }
}

}  // namespace

SourceReader::SourceReader(ConnectionSettings settings, ConnectionFactory factory)
    : settings_(std::move(settings)), factory_(std::move(factory))
{
}

std::string SourceReader::count_sql(const std::string& source, bool is_query) {
    if (is_query)
        return "SELECT COUNT_BIG(*) FROM (" + trim_query(source) + ") AS src";
    return "SELECT COUNT_BIG(*) FROM " + parse_qualified_name(source).quoted();
}

std::string SourceReader::preview_sql(const std::string& source, bool is_query,
                                      int64_t max_rows) {
    std::string top = "SELECT TOP (" + std::to_string(max_rows) + ") * FROM ";
    if (is_query)
        return top + "(" + trim_query(source) + ") AS src";
    return top + parse_qualified_name(source).quoted();
}

std::string SourceReader::select_sql(const std::string& source, bool is_query) {
    if (is_query) return trim_query(source);
    return "SELECT * FROM " + parse_qualified_name(source).quoted();
}

IConnection& SourceReader::connection(const std::string& database) {
    if (!conn_ || database != database_) {
        conn_.reset();
        conn_ = factory_(settings_, database);
        database_ = database;
    }
    return *conn_;
}

void SourceReader::require_table(IConnection& conn, const std::string& database,
                                 const std::string& table) {
    QualifiedName qn = parse_qualified_name(table);
    std::string exists;
    if (!conn.query_scalar(
            "SELECT CASE WHEN OBJECT_ID(" + quote_nliteral(qn.quoted()) +
            ") IS NOT NULL THEN 'Y' ELSE 'N' END", exists)) {
        throw SourceError("Cannot look up table '" + qn.display() + "': " +
                          conn.last_error());
    }
    if (exists != "Y") {
        throw SourceError("Table '" + qn.display() + "' does not exist in database '" +
                          database + "'");
    }
}

int64_t SourceReader::row_count(const std::string& database, const std::string& source,
                                bool is_query) {
    require_source(source, is_query);

    IConnection& conn = connection(database);
    if (!is_query) require_table(conn, database, source);

    int64_t count = 0;
    if (!conn.query_scalar_int(count_sql(source, is_query), count)) {
        throw SourceError("Cannot count rows of " + describe(source, is_query) + ": " +
                          conn.last_error());
    }

    LOG_DEBUG("Row count of %s: %lld", describe(source, is_query).c_str(),
              static_cast<long long>(count));
    return count;
}

PreviewResult SourceReader::preview(const std::string& database, const std::string& source,
                                    bool is_query, int64_t max_rows) {
    require_source(source, is_query);
    if (max_rows <= 0) {
        throw ConfigError("Preview row limit must be positive, got " +
                          std::to_string(max_rows));
    }

    IConnection& conn = connection(database);
    if (!is_query) require_table(conn, database, source);

    auto cursor = conn.open_cursor(preview_sql(source, is_query, max_rows));
    if (!cursor) {
        throw SourceError("Cannot preview " + describe(source, is_query) + ": " +
                          conn.last_error());
    }

    PreviewResult result;
    result.columns = cursor->columns();

    Row row;
    while (static_cast<int64_t>(result.rows.size()) < max_rows && cursor->next(row)) {
        result.rows.push_back(std::move(row));
    }
    if (cursor->failed()) {
        throw SourceError("Cannot preview " + describe(source, is_query) + ": " +
                          cursor->last_error());
    }
    return result;
}

std::unique_ptr<IRowCursor> SourceReader::open_cursor(const std::string& database,
                                                      const std::string& source,
                                                      bool is_query) {
    require_source(source, is_query);

    IConnection& conn = connection(database);
    if (!is_query) require_table(conn, database, source);

    auto cursor = conn.open_cursor(select_sql(source, is_query));
    if (!cursor) {
        throw SourceError("Cannot read " + describe(source, is_query) + ": " +
                          conn.last_error());
    }
    LOG_DEBUG("Opened source cursor: %zu columns", cursor->columns().size());
    return cursor;
}

}  // namespace sqlxfer
