#include "sqlxfer/schema_resolver.h"
#include "sqlxfer/error.h"
#include "sqlxfer/logging.h"
#include "sqlxfer/sql_types.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace sqlxfer {

namespace {

std::string fold_case(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

SchemaResolver::SchemaResolver(IConnection& destination)
    : conn_(destination)
{
}

bool SchemaResolver::table_exists(const QualifiedName& table) {
    std::string exists;
    if (!conn_.query_scalar(
            "SELECT CASE WHEN OBJECT_ID(" + quote_nliteral(table.quoted()) +
            ", N'U') IS NOT NULL THEN 'Y' ELSE 'N' END", exists)) {
        throw SchemaError("Cannot look up destination table '" + table.display() +
                          "': " + conn_.last_error());
    }
    return exists == "Y";
}

std::vector<std::string> SchemaResolver::identity_columns(const QualifiedName& table) {
    std::vector<std::string> names;
    std::string sql =
        "SELECT c.name FROM sys.columns c "
        "WHERE c.object_id = OBJECT_ID(" + quote_nliteral(table.quoted()) + ") "
        "AND c.is_identity = 1";

    bool ok = conn_.query_rows(sql, [&](const Row& row) {
        if (!row.empty()) {
            if (auto* s = std::get_if<std::string>(&row[0])) names.push_back(*s);
        }
        return true;
    });
    if (!ok) {
        throw SchemaError("Cannot read identity columns of '" + table.display() +
                          "': " + conn_.last_error());
    }
    return names;
}

void SchemaResolver::validate_columns(const std::vector<ColumnDescriptor>& columns,
                                      bool keep_identity) {
    if (columns.empty()) {
        throw SchemaError("Source returns no columns");
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& name = columns[i].name;
        if (name.empty()) {
            throw SchemaError("Source column " + std::to_string(i + 1) +
                              " has no name; alias every computed column");
        }
        if (!seen.insert(fold_case(name)).second) {
            throw SchemaError("Duplicate source column name '" + name + "'");
        }
    }

    if (!keep_identity) return;

    // A table has at most one IDENTITY column
    const ColumnDescriptor* identity = nullptr;
    for (const auto& col : columns) {
        if (!col.is_identity) continue;
        if (identity) {
            throw SchemaError("Source columns '" + identity->name + "' and '" + col.name +
                              "' are both identity columns and a table can have only one; "
                              "transfer without keeping identity values, or CAST one of "
                              "them in the query");
        }
        identity = &col;
    }
}

std::string SchemaResolver::build_create_table(const QualifiedName& table,
                                               const std::vector<ColumnDescriptor>& columns,
                                               bool keep_identity) {
    validate_columns(columns, keep_identity);

    std::string sql = "CREATE TABLE " + table.quoted() + " (\n";
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& col = columns[i];
        bool identity = keep_identity && col.is_identity;

        sql += "    " + quote_identifier(col.name) + " " + format_column_type(col);
        if (identity) sql += " IDENTITY(1,1)";
        sql += (col.is_nullable && !identity) ? " NULL" : " NOT NULL";
        sql += (i + 1 < columns.size()) ? ",\n" : "\n";
    }
    sql += ")";
    return sql;
}

SchemaPlan SchemaResolver::resolve(const QualifiedName& table,
                                   const std::vector<ColumnDescriptor>& columns,
                                   bool keep_identity) {
    validate_columns(columns);

    SchemaPlan plan;
    plan.table = table;
    plan.table_exists = table_exists(table);

    if (plan.table_exists) {
        plan.identity_columns = identity_columns(table);
        LOG_INFO("Destination table %s exists (%zu identity column(s))",
                 table.display().c_str(), plan.identity_columns.size());
        return plan;
    }

    plan.create_sql = build_create_table(table, columns, keep_identity);
    if (keep_identity) {
        for (const auto& col : columns) {
            if (col.is_identity) plan.identity_columns.push_back(col.name);
        }
    }
    LOG_INFO("Destination table %s does not exist; it will be created with %zu columns",
             table.display().c_str(), columns.size());
    LOG_DEBUG("%s", plan.create_sql.c_str());
    return plan;
}

}  // namespace sqlxfer
