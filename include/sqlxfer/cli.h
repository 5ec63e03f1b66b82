#pragma once

#include "sqlxfer/export_writer.h"
#include "sqlxfer/logging.h"
#include "sqlxfer/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlxfer {

enum class Command {
    None,
    Transfer,
    Count,
    Preview,
    ListDatabases,
    ListTables,
    TestConnection,
};

// Process exit codes
constexpr int kExitOk          = 0;
constexpr int kExitFailed      = 1;
constexpr int kExitConfig      = 2;
constexpr int kExitUnexpected  = 3;
constexpr int kExitCancelled   = 4;

struct Options {
    Command      command = Command::None;
    bool         show_help = false;

    // Servers
    ConnectionSettings source;
    ConnectionSettings destination;       // defaults to the source server
    bool         destination_given = false;

    // Transfer request
    std::string  source_database;
    std::string  source_table;
    std::string  source_query;
    std::string  destination_database;
    std::string  destination_table;
    TransferAction action = TransferAction::Append;
    bool         keep_identity = false;

    // Preview
    int64_t      max_rows = kDefaultPreviewRows;
    std::string  output_path;             // empty = stdout
    ExportFormat format = ExportFormat::Table;

    // Logging
    bool         verbose = false;
    bool         quiet   = false;
    LogLevel     log_level = LogLevel::Info;
    std::string  log_file;

    // Validate the options the selected command needs
    void validate() const;

    // Request for Command::Transfer; the destination table defaults to
    // the source table name
    TransferRequest to_request() const;
};

// Parse a command line. Throws ConfigError on invalid input.
// Unset users/passwords are taken from SQLXFER_SOURCE_USER,
// SQLXFER_SOURCE_PASSWORD, SQLXFER_DEST_USER and SQLXFER_DEST_PASSWORD.
Options parse_args(int argc, char* argv[]);

Command parse_command(const std::string& name);

void print_usage();

}  // namespace sqlxfer
