#include "sqlxfer/cli.h"
#include "sqlxfer/error.h"
#include "sqlxfer/identifier.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace sqlxfer {

static std::string next_arg(int& i, int argc, char* argv[], const char* flag) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string("Missing value for flag: ") + flag);
    }
    return argv[++i];
}

static int64_t parse_int(const std::string& value, const char* flag) {
    char* end = nullptr;
    long long v = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0') {
        throw ConfigError(std::string("Expected a number for ") + flag + ", got '" +
                          value + "'");
    }
    return static_cast<int64_t>(v);
}

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

Command parse_command(const std::string& name) {
    if (name == "transfer")        return Command::Transfer;
    if (name == "count")           return Command::Count;
    if (name == "preview")         return Command::Preview;
    if (name == "list-databases")  return Command::ListDatabases;
    if (name == "list-tables")     return Command::ListTables;
    if (name == "test-connection") return Command::TestConnection;
    throw ConfigError("Unknown command: " + name +
                      ". Expected transfer|count|preview|list-databases|"
                      "list-tables|test-connection");
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    bool dest_user_given = false;
    bool dest_timeout_given = false;
    bool dest_cert_given = false;

    int first = 1;
    if (argc > 1 && argv[1][0] != '-') {
        opts.command = parse_command(argv[1]);
        first = 2;
    }

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            return opts;
        }

        // Source server
        else if (arg == "--source-server" || arg == "-S")
            opts.source.server = next_arg(i, argc, argv, "--source-server");
        else if (arg == "--source-user" || arg == "-U")
            opts.source.username = next_arg(i, argc, argv, "--source-user");
        else if (arg == "--source-password" || arg == "-P")
            opts.source.password = next_arg(i, argc, argv, "--source-password");
        else if (arg == "--source-timeout")
            opts.source.timeout_seconds = static_cast<int32_t>(
                parse_int(next_arg(i, argc, argv, "--source-timeout"), "--source-timeout"));
        else if (arg == "--source-strict-cert")
            opts.source.trust_server_certificate = false;

        // Destination server
        else if (arg == "--dest-server") {
            opts.destination.server = next_arg(i, argc, argv, "--dest-server");
            opts.destination_given = true;
        }
        else if (arg == "--dest-user") {
            opts.destination.username = next_arg(i, argc, argv, "--dest-user");
            dest_user_given = true;
        }
        else if (arg == "--dest-password")
            opts.destination.password = next_arg(i, argc, argv, "--dest-password");
        else if (arg == "--dest-timeout") {
            opts.destination.timeout_seconds = static_cast<int32_t>(
                parse_int(next_arg(i, argc, argv, "--dest-timeout"), "--dest-timeout"));
            dest_timeout_given = true;
        }
        else if (arg == "--dest-strict-cert") {
            opts.destination.trust_server_certificate = false;
            dest_cert_given = true;
        }

        // What to move
        else if (arg == "--source-db")     opts.source_database      = next_arg(i, argc, argv, "--source-db");
        else if (arg == "--table")         opts.source_table         = next_arg(i, argc, argv, "--table");
        else if (arg == "--query")         opts.source_query         = next_arg(i, argc, argv, "--query");
        else if (arg == "--dest-db")       opts.destination_database = next_arg(i, argc, argv, "--dest-db");
        else if (arg == "--dest-table")    opts.destination_table    = next_arg(i, argc, argv, "--dest-table");
        else if (arg == "--action") {
            auto v = next_arg(i, argc, argv, "--action");
            std::transform(v.begin(), v.end(), v.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (v == "append")       opts.action = TransferAction::Append;
            else if (v == "replace") opts.action = TransferAction::Replace;
            else throw ConfigError("Unknown action: " + v + ". Expected append|replace");
        }
        else if (arg == "--keep-identity") opts.keep_identity = true;

        // Preview output
        else if (arg == "--max-rows")
            opts.max_rows = parse_int(next_arg(i, argc, argv, "--max-rows"), "--max-rows");
        else if (arg == "--out")           opts.output_path = next_arg(i, argc, argv, "--out");
        else if (arg == "--format")
            opts.format = parse_export_format(next_arg(i, argc, argv, "--format"));

        // Logging
        else if (arg == "--verbose" || arg == "-v") opts.verbose = true;
        else if (arg == "--quiet" || arg == "-q")   opts.quiet = true;
        else if (arg == "--log")           opts.log_file = next_arg(i, argc, argv, "--log");
        else if (arg == "--log-level")
            opts.log_level = parse_log_level(next_arg(i, argc, argv, "--log-level"));

        else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }

    // Credentials from the environment keep them out of the process list
    if (opts.source.username.empty())
        opts.source.username = env_or_empty("SQLXFER_SOURCE_USER");
    if (opts.source.password.empty())
        opts.source.password = env_or_empty("SQLXFER_SOURCE_PASSWORD");
    if (!dest_user_given) {
        std::string user = env_or_empty("SQLXFER_DEST_USER");
        if (!user.empty()) {
            opts.destination.username = user;
            dest_user_given = true;
        }
    }
    if (opts.destination.password.empty())
        opts.destination.password = env_or_empty("SQLXFER_DEST_PASSWORD");

    // Without --dest-server the destination is the source server
    if (!opts.destination_given) {
        opts.destination.server = opts.source.server;
        if (!dest_user_given) {
            opts.destination.username = opts.source.username;
            opts.destination.password = opts.source.password;
        }
        if (!dest_timeout_given)
            opts.destination.timeout_seconds = opts.source.timeout_seconds;
        if (!dest_cert_given)
            opts.destination.trust_server_certificate = opts.source.trust_server_certificate;
    }

    opts.source.auth_mode = opts.source.username.empty() ? AuthMode::Integrated
                                                         : AuthMode::SqlLogin;
    opts.destination.auth_mode = opts.destination.username.empty() ? AuthMode::Integrated
                                                                   : AuthMode::SqlLogin;

    opts.validate();
    return opts;
}

void Options::validate() const {
    if (command == Command::None)
        throw ConfigError("A command is required");
    if (source.server.empty())
        throw ConfigError("--source-server is required");
    if (source.timeout_seconds < 0 || destination.timeout_seconds < 0)
        throw ConfigError("Timeouts must not be negative");
    if (verbose && quiet)
        throw ConfigError("--verbose and --quiet are mutually exclusive");

    switch (command) {
    case Command::Transfer:
    case Command::Count:
    case Command::Preview:
        if (source_database.empty())
            throw ConfigError("--source-db is required");
        if (source_table.empty() == source_query.empty())
            throw ConfigError("Exactly one of --table or --query is required");
        break;
    case Command::ListTables:
        if (source_database.empty())
            throw ConfigError("--source-db is required");
        break;
    default:
        break;
    }

    if (command == Command::Transfer) {
        if (destination_database.empty())
            throw ConfigError("--dest-db is required");
        if (!source_query.empty() && destination_table.empty())
            throw ConfigError("--dest-table is required when transferring a query");
    }

    if (command == Command::Preview && max_rows <= 0)
        throw ConfigError("--max-rows must be positive");
}

TransferRequest Options::to_request() const {
    TransferRequest req;
    req.source_database      = source_database;
    req.mode                 = source_query.empty() ? TransferMode::Table : TransferMode::Query;
    req.source_table         = source_table;
    req.source_query         = source_query;
    req.destination_database = destination_database;
    req.destination_table    = destination_table;
    req.action               = action;
    req.keep_identity        = keep_identity;

    if (req.destination_table.empty() && req.mode == TransferMode::Table) {
        req.destination_table = parse_qualified_name(source_table).display();
    }
    return req;
}

void print_usage() {
    std::cout << R"(
sqlxfer - SQL Server Data Transfer

USAGE:
    sqlxfer <command> --source-server <SERVER> [OPTIONS]

COMMANDS:
    transfer          Copy a table or query result into a destination table
    count             Print the number of rows a table or query yields
    preview           Show the first rows of a table or query
    list-databases    List user databases on the source server
    list-tables       List base tables of --source-db
    test-connection   Check the source (and destination) login

SOURCE SERVER:
    --source-server, -S SERVER    Source SQL Server instance
    --source-user, -U USER        SQL login (default: integrated auth)
    --source-password, -P PASS    Password (or set SQLXFER_SOURCE_PASSWORD)
    --source-timeout SECONDS      Login timeout (default: 30)
    --source-strict-cert          Validate the server certificate

DESTINATION SERVER (defaults to the source server):
    --dest-server SERVER          Destination SQL Server instance
    --dest-user USER              SQL login (or set SQLXFER_DEST_USER)
    --dest-password PASS          Password (or set SQLXFER_DEST_PASSWORD)
    --dest-timeout SECONDS        Login timeout (default: 30)
    --dest-strict-cert            Validate the server certificate

WHAT TO MOVE:
    --source-db NAME              Source database
    --table schema.table          Source table (e.g. dbo.Orders)
    --query "SELECT ..."          Source query (instead of --table)
    --dest-db NAME                Destination database
    --dest-table schema.table     Destination table (default: source table name)
    --action append|replace       Keep or delete existing rows (default: append)
    --keep-identity               Preserve identity values

PREVIEW:
    --max-rows N                  Rows to show (default: 10)
    --format table|csv|jsonl      Output format (default: table)
    --out PATH                    Write to a file instead of stdout

LOGGING:
    --verbose, -v                 Enable verbose output
    --quiet, -q                   Only warnings and errors on the console
    --log FILE                    Write log to file
    --log-level LEVEL             trace|debug|info|warn|error|off (default: info)

EXIT CODES:
    0 success, 1 operation failed, 2 configuration error,
    3 unexpected error, 4 cancelled

EXAMPLES:
    sqlxfer transfer -S prod01 --source-db Sales --table dbo.Customers \
            --dest-server report01 --dest-db Archive --action replace
    sqlxfer count -S prod01 --source-db Sales \
            --query "SELECT TOP 100 * FROM Orders WHERE Total > 500"
    sqlxfer preview -S prod01 --source-db Sales --table dbo.Orders --format csv --out orders.csv

)";
}

}  // namespace sqlxfer
