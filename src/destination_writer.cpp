#include "sqlxfer/destination_writer.h"
#include "sqlxfer/error.h"
#include "sqlxfer/logging.h"

#include <algorithm>
#include <cctype>

namespace sqlxfer {

namespace {

bool same_name(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

// =========================================================================
// WriteSession
// =========================================================================

WriteSession::WriteSession(IConnection& conn, QualifiedName table,
                           const std::vector<ColumnDescriptor>& source_columns,
                           const std::vector<std::string>& skip_columns)
    : conn_(conn), table_(std::move(table))
{
    for (size_t i = 0; i < source_columns.size(); ++i) {
        const auto& col = source_columns[i];
        bool skip = std::any_of(skip_columns.begin(), skip_columns.end(),
                                [&](const std::string& s) { return same_name(s, col.name); });
        if (skip) {
            LOG_DEBUG("Column '%s' is generated by the destination; source values dropped",
                      col.name.c_str());
            continue;
        }
        insert_columns_.push_back(col);
        source_index_.push_back(i);
    }
}

WriteSession::~WriteSession() {
    if (open_) {
        LOG_WARN("Write session on %s closed without commit -- rolling back",
                 table_.display().c_str());
        rollback();
    }
}

std::string WriteSession::insert_sql() const {
    if (insert_columns_.empty()) {
        return "INSERT INTO " + table_.quoted() + " DEFAULT VALUES";
    }

    std::string cols, params;
    for (size_t i = 0; i < insert_columns_.size(); ++i) {
        if (i > 0) {
            cols += ", ";
            params += ", ";
        }
        cols += quote_identifier(insert_columns_[i].name);
        params += "?";
    }
    return "INSERT INTO " + table_.quoted() + " (" + cols + ") VALUES (" + params + ")";
}

void WriteSession::create_table(const std::string& create_sql) {
    if (create_sql.empty()) return;
    if (!open_) {
        throw TransferError("Write session on " + table_.display() + " is not open");
    }

    if (!conn_.execute(create_sql)) {
        throw SchemaError("Cannot create destination table " + table_.display() + ": " +
                          conn_.last_error());
    }
    created_table_ = true;
    LOG_INFO("Destination table %s created (uncommitted)", table_.display().c_str());
}

void WriteSession::clear() {
    if (!open_) {
        throw TransferError("Write session on " + table_.display() + " is not open");
    }
    if (!conn_.execute("DELETE FROM " + table_.quoted())) {
        throw TransferError("Cannot clear " + table_.display() + ": " + conn_.last_error());
    }
    LOG_INFO("Existing rows of %s deleted (uncommitted)", table_.display().c_str());
}

int64_t WriteSession::load_batch(const std::vector<Row>& rows) {
    if (!open_) {
        throw TransferError("Write session on " + table_.display() + " is not open");
    }

    if (!insert_) {
        insert_ = conn_.prepare(insert_sql(), insert_columns_);
        if (!insert_) {
            throw TransferError("Cannot prepare insert into " + table_.display() + ": " +
                                conn_.last_error());
        }
    }

    Row params(insert_columns_.size());
    for (const auto& row : rows) {
        for (size_t i = 0; i < source_index_.size(); ++i) {
            size_t src = source_index_[i];
            if (src >= row.size()) {
                throw TransferError("Source row has " + std::to_string(row.size()) +
                                    " values, expected at least " + std::to_string(src + 1));
            }
            params[i] = row[src];
        }

        if (!insert_->execute(params)) {
            throw TransferError("Row " + std::to_string(rows_loaded_ + 1) +
                                " rejected by " + table_.display() + ": " +
                                insert_->last_error());
        }
        ++rows_loaded_;
    }

    LOG_DEBUG("Loaded batch of %zu rows into %s (%lld total)", rows.size(),
              table_.display().c_str(), static_cast<long long>(rows_loaded_));
    return rows_loaded_;
}

void WriteSession::set_identity_insert(bool enabled) {
    if (!open_) {
        throw TransferError("Write session on " + table_.display() + " is not open");
    }
    if (!conn_.execute("SET IDENTITY_INSERT " + table_.quoted() +
                       (enabled ? " ON" : " OFF"))) {
        throw TransferError(std::string("Cannot switch IDENTITY_INSERT ") +
                            (enabled ? "on" : "off") + " for " + table_.display() +
                            ": " + conn_.last_error());
    }
    identity_insert_ = enabled;
    LOG_DEBUG("IDENTITY_INSERT %s for %s", enabled ? "ON" : "OFF",
              table_.display().c_str());
}

void WriteSession::commit() {
    if (!open_) {
        throw TransferError("Write session on " + table_.display() + " is not open");
    }
    if (identity_insert_) set_identity_insert(false);

    insert_.reset();
    open_ = false;
    if (!conn_.commit()) {
        throw TransferError("Commit on " + table_.display() + " failed: " +
                            conn_.last_error());
    }
    LOG_INFO("Committed %lld rows into %s", static_cast<long long>(rows_loaded_),
             table_.display().c_str());
}

void WriteSession::rollback() {
    if (!open_) return;
    open_ = false;
    insert_.reset();

    // IDENTITY_INSERT is a session setting the rollback does not undo
    if (identity_insert_) {
        identity_insert_ = false;
        if (!conn_.execute("SET IDENTITY_INSERT " + table_.quoted() + " OFF")) {
            LOG_WARN("Cannot switch IDENTITY_INSERT off for %s: %s",
                     table_.display().c_str(), conn_.last_error().c_str());
        }
    }

    if (!conn_.rollback()) {
        LOG_ERROR("Rollback on %s failed: %s", table_.display().c_str(),
                  conn_.last_error().c_str());
        return;
    }
    LOG_INFO("Rolled back %lld loaded rows on %s%s", static_cast<long long>(rows_loaded_),
             table_.display().c_str(), created_table_ ? " (table creation undone)" : "");
}

// =========================================================================
// DestinationWriter
// =========================================================================

DestinationWriter::DestinationWriter(IConnection& destination)
    : conn_(destination)
{
}

std::unique_ptr<WriteSession> DestinationWriter::begin_write(
    const QualifiedName& table,
    const std::vector<ColumnDescriptor>& columns,
    const std::vector<std::string>& skip_columns) {
    std::unique_ptr<WriteSession> session(
        new WriteSession(conn_, table, columns, skip_columns));

    if (!conn_.begin_transaction()) {
        throw TransferError("Cannot start a transaction on the destination: " +
                            conn_.last_error());
    }
    session->open_ = true;
    return session;
}

}  // namespace sqlxfer
