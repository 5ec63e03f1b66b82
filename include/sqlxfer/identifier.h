#pragma once

#include <string>

namespace sqlxfer {

// Schema-qualified object name, e.g. dbo.Orders
struct QualifiedName {
    std::string schema_name = "dbo";
    std::string name;

    // "[dbo].[Orders]"
    std::string quoted() const;

    // "dbo.Orders"
    std::string display() const { return schema_name + "." + name; }
};

// Parse "table", "schema.table" or "[schema].[table]". Throws ConfigError
// on an empty name.
QualifiedName parse_qualified_name(const std::string& text);

// [name] with ] doubled
std::string quote_identifier(const std::string& identifier);

// N'value' with ' doubled
std::string quote_nliteral(const std::string& value);

// Strip trailing whitespace and statement terminators from a query
std::string trim_query(const std::string& query);

}  // namespace sqlxfer
