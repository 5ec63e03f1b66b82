#pragma once

#include "sqlxfer/db_connection.h"
#include "sqlxfer/identifier.h"
#include "sqlxfer/types.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlxfer {

// -------------------------------------------------------------------------
// WriteSession -- one destination transaction
//
// The CREATE TABLE of a new destination, the DELETE of a Replace, every
// loaded batch and the identity insert toggling all run inside it. A
// session that is destroyed without commit() is rolled back, which also
// drops a table it created.
// -------------------------------------------------------------------------
class WriteSession {
public:
    ~WriteSession();

    WriteSession(const WriteSession&) = delete;
    WriteSession& operator=(const WriteSession&) = delete;

    // Run the CREATE TABLE statement; no-op for an empty statement.
    // Throws SchemaError when the DDL fails.
    void create_table(const std::string& create_sql);

    // Delete every existing row (Replace)
    void clear();

    // Insert a batch of source rows; returns rows loaded so far.
    // Throws TransferError on the first row the destination rejects.
    int64_t load_batch(const std::vector<Row>& rows);

    // SET IDENTITY_INSERT ON/OFF for the destination table
    void set_identity_insert(bool enabled);

    void commit();

    // Discard all work; safe to call more than once
    void rollback();

    bool    is_open() const { return open_; }
    bool    created_table() const { return created_table_; }
    int64_t rows_loaded() const { return rows_loaded_; }

    // Destination columns receiving values, in insert order
    const std::vector<ColumnDescriptor>& insert_columns() const { return insert_columns_; }

    // INSERT statement used for every row
    std::string insert_sql() const;

private:
    friend class DestinationWriter;

    WriteSession(IConnection& conn, QualifiedName table,
                 const std::vector<ColumnDescriptor>& source_columns,
                 const std::vector<std::string>& skip_columns);

    IConnection&                        conn_;
    QualifiedName                       table_;
    std::vector<ColumnDescriptor>       insert_columns_;
    std::vector<size_t>                 source_index_;
    std::unique_ptr<IPreparedStatement> insert_;
    bool                                open_            = false;
    bool                                identity_insert_ = false;
    bool                                created_table_   = false;
    int64_t                             rows_loaded_     = 0;
};

// -------------------------------------------------------------------------
// DestinationWriter -- DDL and transactional loading on the destination
// -------------------------------------------------------------------------
class DestinationWriter {
public:
    explicit DestinationWriter(IConnection& destination);

    // Open a transaction for loading `columns` into `table`.
    // Columns named in skip_columns (case-insensitive) receive no values.
    std::unique_ptr<WriteSession> begin_write(const QualifiedName& table,
                                              const std::vector<ColumnDescriptor>& columns,
                                              const std::vector<std::string>& skip_columns = {});

private:
    IConnection& conn_;
};

}  // namespace sqlxfer
