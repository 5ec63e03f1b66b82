#include "sqlxfer/cli.h"
#include "sqlxfer/error.h"
#include "sqlxfer/export_writer.h"
#include "sqlxfer/logging.h"
#include "sqlxfer/odbc_connection.h"
#include "sqlxfer/progress.h"
#include "sqlxfer/server_browser.h"
#include "sqlxfer/source_reader.h"
#include "sqlxfer/transfer_orchestrator.h"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

namespace {

using namespace sqlxfer;

CancellationToken g_cancel;

void on_sigint(int) {
    g_cancel.cancel();
}

int exit_code_for(const TransferResult& result) {
    if (result.success) return kExitOk;
    switch (result.error_kind) {
    case ErrorKind::Cancelled: return kExitCancelled;
    case ErrorKind::Config:    return kExitConfig;
    case ErrorKind::Internal:  return kExitUnexpected;
    default:                   return kExitFailed;
    }
}

int run_transfer(const Options& opts) {
    TransferRequest request = opts.to_request();
    TransferOrchestrator orchestrator(opts.source, opts.destination,
                                      odbc_connection_factory());

    std::signal(SIGINT, on_sigint);

    // The transfer runs on a worker; this thread renders its progress
    ProgressChannel channel;
    TransferResult result;
    std::thread worker = start_worker(
        [&] { return orchestrator.run(request, &channel, &g_cancel); }, channel, result);

    TransferProgress p;
    int last_pct = -1;
    while (channel.pop(p)) {
        if (p.state != TransferState::Loading || p.is_complete) continue;
        if (p.percentage() == last_pct) continue;
        last_pct = p.percentage();
        LOG_INFO("Progress: %d%% | %lld / %lld rows", last_pct,
                 static_cast<long long>(p.transferred_rows),
                 static_cast<long long>(p.total_rows));
    }
    worker.join();
    std::signal(SIGINT, SIG_DFL);

    if (result.success) {
        std::cout << "Transferred " << result.transferred_rows << " rows into "
                  << request.destination_database << "." << request.destination_table
                  << (result.table_created ? " (table created)" : "") << "\n";
    } else if (result.cancelled) {
        std::cerr << "Transfer cancelled; the destination was left unchanged.\n";
    } else {
        std::cerr << "Error: " << result.error_message << "\n";
    }
    return exit_code_for(result);
}

int run_count(const Options& opts) {
    SourceReader reader(opts.source, odbc_connection_factory());
    bool is_query = !opts.source_query.empty();
    int64_t count = reader.row_count(opts.source_database,
                                     is_query ? opts.source_query : opts.source_table,
                                     is_query);
    std::cout << count << "\n";
    return kExitOk;
}

int run_preview(const Options& opts) {
    SourceReader reader(opts.source, odbc_connection_factory());
    bool is_query = !opts.source_query.empty();
    PreviewResult preview = reader.preview(opts.source_database,
                                           is_query ? opts.source_query : opts.source_table,
                                           is_query, opts.max_rows);
    export_preview(preview, opts.format, opts.output_path);
    return kExitOk;
}

int run_list_databases(const Options& opts) {
    ServerBrowser browser(opts.source, odbc_connection_factory());
    auto databases = browser.list_databases();

    std::cout << "\n";
    std::cout << std::left << std::setw(40) << "DATABASE"
              << std::setw(16) << "STATE"
              << std::setw(14) << "RECOVERY"
              << std::right << std::setw(10) << "SIZE (MB)" << "\n";
    std::cout << std::string(80, '-') << "\n";
    for (const auto& db : databases) {
        std::cout << std::left << std::setw(40) << db.name
                  << std::setw(16) << db.state
                  << std::setw(14) << db.recovery_model
                  << std::right << std::setw(10) << db.size_mb << "\n";
    }
    std::cout << "\nFound " << databases.size() << " database(s).\n";
    return kExitOk;
}

int run_list_tables(const Options& opts) {
    ServerBrowser browser(opts.source, odbc_connection_factory());
    auto tables = browser.list_tables(opts.source_database);

    std::cout << "\n";
    std::cout << std::left << std::setw(50) << "TABLE NAME"
              << std::right << std::setw(10) << "COLUMNS" << "\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& tbl : tables) {
        std::cout << std::left << std::setw(50) << tbl.full_name()
                  << std::right << std::setw(10) << tbl.column_count << "\n";
    }
    std::cout << "\nFound " << tables.size() << " table(s).\n";
    return kExitOk;
}

int run_test_connection(const Options& opts) {
    int rc = kExitOk;

    auto check = [&](const char* label, const ConnectionSettings& settings) {
        ServerBrowser browser(settings, odbc_connection_factory());
        std::string error;
        if (browser.test_connection(&error)) {
            std::cout << label << " " << settings.server << ": OK\n";
        } else {
            std::cout << label << " " << settings.server << ": FAILED\n";
            std::cerr << "  " << error << "\n";
            rc = kExitFailed;
        }
    };

    check("Source     ", opts.source);
    if (opts.destination_given) check("Destination", opts.destination);
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace sqlxfer;

    if (argc < 2) {
        print_usage();
        return kExitConfig;
    }

    try {
        Options opts = parse_args(argc, argv);
        if (opts.show_help) {
            print_usage();
            return kExitOk;
        }

        auto& log = Logger::instance();
        log.set_level(opts.log_level);
        if (opts.verbose) log.set_verbose(true);
        if (opts.quiet) log.set_console_level(LogLevel::Warn);
        if (!opts.log_file.empty()) log.set_log_file(opts.log_file);

        switch (opts.command) {
        case Command::Transfer:       return run_transfer(opts);
        case Command::Count:          return run_count(opts);
        case Command::Preview:        return run_preview(opts);
        case Command::ListDatabases:  return run_list_databases(opts);
        case Command::ListTables:     return run_list_tables(opts);
        case Command::TestConnection: return run_test_connection(opts);
        case Command::None:           break;
        }
        print_usage();
        return kExitConfig;

    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        std::cerr << "Run 'sqlxfer --help' for usage information.\n";
        return kExitConfig;
    } catch (const XferError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailed;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitUnexpected;
    }
}
