#include "sqlxfer/transfer_orchestrator.h"
#include "sqlxfer/destination_writer.h"
#include "sqlxfer/error.h"
#include "sqlxfer/identifier.h"
#include "sqlxfer/logging.h"
#include "sqlxfer/schema_resolver.h"
#include "sqlxfer/source_reader.h"

#include <chrono>

namespace sqlxfer {

TransferOrchestrator::TransferOrchestrator(ConnectionSettings source,
                                           ConnectionSettings destination,
                                           ConnectionFactory factory)
    : source_(std::move(source)),
      destination_(std::move(destination)),
      factory_(std::move(factory))
{
}

void TransferOrchestrator::validate(const TransferRequest& request) {
    if (request.is_query()) {
        if (trim_query(request.source_query).empty())
            throw ConfigError("Source query is required in query mode");
    } else {
        if (request.source_table.find_first_not_of(" \t\r\n") == std::string::npos)
            throw ConfigError("Source table is required in table mode");
        parse_qualified_name(request.source_table);
    }

    if (request.destination_table.find_first_not_of(" \t\r\n") == std::string::npos)
        throw ConfigError("Destination table is required");
    parse_qualified_name(request.destination_table);
}

void TransferOrchestrator::enter(TransferState state, const std::string& status) {
    progress_.state  = state;
    progress_.status = status;
    publish();
}

void TransferOrchestrator::publish() {
    if (sink_) sink_->publish(progress_);
}

void TransferOrchestrator::check_cancelled(const std::string& where) {
    if (cancel_ && cancel_->is_cancelled()) {
        throw CancellationError("cancelled " + where);
    }
}

TransferResult TransferOrchestrator::run(const TransferRequest& request,
                                         IProgressSink* sink,
                                         const CancellationToken* cancel) {
    sink_     = sink;
    cancel_   = cancel;
    progress_ = TransferProgress{};

    auto start_time = std::chrono::steady_clock::now();

    LOG_INFO("========================================");
    LOG_INFO("sqlxfer - SQL Server Data Transfer");
    LOG_INFO("========================================");
    LOG_INFO("Source:      %s / %s", source_.server.c_str(),
             request.source_database.c_str());
    LOG_INFO("%s %s", request.is_query() ? "Query:      " : "Table:      ",
             request.source_expression().c_str());
    LOG_INFO("Destination: %s / %s / %s", destination_.server.c_str(),
             request.destination_database.c_str(), request.destination_table.c_str());
    LOG_INFO("Action:      %s%s",
             request.action == TransferAction::Replace ? "replace" : "append",
             request.keep_identity ? " (keep identity)" : "");
    LOG_INFO("========================================");

    TransferResult result = execute(request);

    auto end_time = std::chrono::steady_clock::now();
    result.elapsed_seconds =
        std::chrono::duration<double>(end_time - start_time).count();

    LOG_INFO("========================================");
    if (result.success) {
        LOG_INFO("SUCCESS: %lld rows transferred", static_cast<long long>(result.transferred_rows));
    } else if (result.cancelled) {
        LOG_WARN("CANCELLED: destination left unchanged");
    } else {
        LOG_ERROR("FAILED (%s): %s", to_string(result.error_kind), result.error_message.c_str());
    }
    LOG_INFO("Time:    %.2f seconds", result.elapsed_seconds);
    LOG_INFO("========================================");
    return result;
}

TransferResult TransferOrchestrator::execute(const TransferRequest& request) {
    TransferResult result;

    // Destruction order matters: the session uses dest_conn, the cursor
    // runs on the reader's connection
    SourceReader                  reader(source_, factory_);
    std::unique_ptr<IConnection>  dest_conn;
    std::unique_ptr<IRowCursor>   cursor;
    std::unique_ptr<WriteSession> session;

    try {
        LOG_INFO("Step 1: Validating request...");
        enter(TransferState::Validating, "Validating request");
        validate(request);
        check_cancelled("before counting");

        LOG_INFO("Step 2: Counting source rows...");
        enter(TransferState::Counting, "Counting source rows");
        progress_.total_rows = reader.row_count(request.source_database,
                                                request.source_expression(),
                                                request.is_query());
        result.total_rows = progress_.total_rows;
        LOG_INFO("Source rows: %lld", static_cast<long long>(progress_.total_rows));
        check_cancelled("before schema preparation");

        LOG_INFO("Step 3: Preparing destination schema...");
        enter(TransferState::PreparingSchema, "Preparing destination schema");
        cursor = reader.open_cursor(request.source_database,
                                    request.source_expression(),
                                    request.is_query());

        dest_conn = factory_(destination_, request.destination_database);
        QualifiedName dest_table = parse_qualified_name(request.destination_table);

        SchemaResolver resolver(*dest_conn);
        SchemaPlan plan = resolver.resolve(dest_table, cursor->columns(),
                                           request.keep_identity);

        // Without identity preservation the destination generates its own keys
        std::vector<std::string> skip;
        if (!request.keep_identity) skip = plan.identity_columns;

        // The table is created inside the load transaction, so a failed or
        // cancelled run leaves no table behind
        DestinationWriter writer(*dest_conn);
        session = writer.begin_write(dest_table, cursor->columns(), skip);
        session->create_table(plan.create_sql);
        check_cancelled("before loading");

        if (request.action == TransferAction::Replace) {
            LOG_INFO("Step 4: Clearing destination table...");
            enter(TransferState::ClearingDestination, "Clearing destination table");
            session->clear();
        }

        if (request.keep_identity && !plan.identity_columns.empty()) {
            session->set_identity_insert(true);
        }

        LOG_INFO("Step 5: Loading rows in batches of %lld...",
                 static_cast<long long>(kBatchSize));
        enter(TransferState::Loading, "Loading rows");

        std::vector<Row> batch;
        batch.reserve(static_cast<size_t>(kBatchSize));
        int64_t batch_no = 0;
        for (;;) {
            check_cancelled("before batch " + std::to_string(batch_no + 1) + " (" +
                            std::to_string(progress_.transferred_rows) + " rows loaded)");

            batch.clear();
            Row row;
            while (static_cast<int64_t>(batch.size()) < kBatchSize && cursor->next(row)) {
                batch.push_back(std::move(row));
            }
            if (cursor->failed()) {
                throw TransferError("Reading source rows failed: " + cursor->last_error());
            }
            if (batch.empty()) break;

            ++batch_no;
            progress_.transferred_rows = session->load_batch(batch);
            progress_.status = "Transferred " + std::to_string(progress_.transferred_rows) +
                               " of " + std::to_string(progress_.total_rows) + " rows";
            LOG_DEBUG("Batch %lld: %d%% | %lld rows transferred",
                      static_cast<long long>(batch_no), progress_.percentage(),
                      static_cast<long long>(progress_.transferred_rows));
            publish();

            if (static_cast<int64_t>(batch.size()) < kBatchSize) break;
        }
        cursor.reset();

        LOG_INFO("Step 6: Committing...");
        enter(TransferState::Committing, "Committing");
        session->commit();
        result.table_created = session->created_table();
        session.reset();

        result.success          = true;
        result.transferred_rows = progress_.transferred_rows;
        result.final_state      = TransferState::Succeeded;

        // Committed: a throwing sink no longer changes the outcome
        progress_.is_complete = true;
        progress_.is_success  = true;
        try {
            enter(TransferState::Succeeded, "Transfer completed: " +
                                            std::to_string(progress_.transferred_rows) + " rows");
        } catch (const std::exception& e) {
            LOG_WARN("Progress sink failed on the final snapshot: %s", e.what());
        }
        return result;
    }
    catch (const XferError& e) {
        result.error_kind    = e.kind();
        result.error_message = e.what();
    }
    catch (const std::exception& e) {
        result.error_kind    = ErrorKind::Internal;
        result.error_message = std::string("Unexpected error: ") + e.what();
    }

    if (session) {
        session->rollback();
        session.reset();
    }
    cursor.reset();

    result.cancelled   = (result.error_kind == ErrorKind::Cancelled);
    result.final_state = result.cancelled ? TransferState::Cancelled : TransferState::Failed;

    progress_.is_complete   = true;
    progress_.is_success    = false;
    progress_.error_kind    = result.error_kind;
    progress_.error_message = result.error_message;
    progress_.state         = result.final_state;
    progress_.status        = result.cancelled ? "Transfer cancelled" : "Transfer failed";

    try {
        publish();
    } catch (const std::exception& e) {
        LOG_WARN("Progress sink failed on the final snapshot: %s", e.what());
    }
    return result;
}

}  // namespace sqlxfer
