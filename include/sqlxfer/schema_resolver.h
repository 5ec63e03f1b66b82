#pragma once

#include "sqlxfer/db_connection.h"
#include "sqlxfer/identifier.h"
#include "sqlxfer/types.h"

#include <string>
#include <vector>

namespace sqlxfer {

// Outcome of resolving one destination table against the source columns
struct SchemaPlan {
    QualifiedName            table;
    bool                     table_exists = false;
    std::string              create_sql;        // empty when the table exists
    std::vector<std::string> identity_columns;  // of the destination table
};

// -------------------------------------------------------------------------
// SchemaResolver -- maps source column metadata to a destination table
//
// Works on an open connection to the destination database. Raises
// SchemaError for unmapped types, invalid column names and failed
// catalog lookups.
// -------------------------------------------------------------------------
class SchemaResolver {
public:
    explicit SchemaResolver(IConnection& destination);

    // Catalog lookup: does the user table exist?
    bool table_exists(const QualifiedName& table);

    // Names of the identity columns of an existing table
    std::vector<std::string> identity_columns(const QualifiedName& table);

    // Decide between reusing the table and creating it
    SchemaPlan resolve(const QualifiedName& table,
                       const std::vector<ColumnDescriptor>& columns,
                       bool keep_identity);

    // Non-empty, case-insensitively unique column names; with keep_identity,
    // at most one identity column
    static void validate_columns(const std::vector<ColumnDescriptor>& columns,
                                 bool keep_identity = false);

    // CREATE TABLE statement, columns in source order. Source identity
    // columns are declared IDENTITY(1,1) when keep_identity is set.
    static std::string build_create_table(const QualifiedName& table,
                                          const std::vector<ColumnDescriptor>& columns,
                                          bool keep_identity);

private:
    IConnection& conn_;
};

}  // namespace sqlxfer
