#include "fake_connection.h"

#include "sqlxfer/error.h"
#include "sqlxfer/identifier.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

namespace sqlxfer {
namespace fake {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string table_key(const std::string& schema, const std::string& name) {
    return quote_identifier(schema) + "." + quote_identifier(name);
}

// "[a]]b]" at pos -> "a]b"; pos ends past the closing bracket
std::string read_bracketed(const std::string& s, size_t& pos) {
    std::string out;
    if (pos >= s.size() || s[pos] != '[') return out;
    ++pos;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == ']') {
            if (pos < s.size() && s[pos] == ']') {
                out += ']';
                ++pos;
            } else {
                break;
            }
        } else {
            out += c;
        }
    }
    return out;
}

// N'...' literal whose N is at pos
std::string read_nliteral(const std::string& s, size_t pos) {
    std::string out;
    pos += 2;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '\'') {
            if (pos < s.size() && s[pos] == '\'') {
                out += '\'';
                ++pos;
            } else {
                break;
            }
        } else {
            out += c;
        }
    }
    return out;
}

const char kWrapSuffix[] = ") AS src";

class FakeCursor : public IRowCursor {
public:
    FakeCursor(FakeResult result, int64_t fail_after)
        : result_(std::move(result)), fail_after_(fail_after) {}

    const std::vector<ColumnDescriptor>& columns() const override { return result_.columns; }

    bool next(Row& row) override {
        if (failed_) return false;
        if (fail_after_ >= 0 && pos_ >= static_cast<size_t>(fail_after_)) {
            failed_ = true;
            error_ = "[08S01] Communication link failure";
            return false;
        }
        if (pos_ >= result_.rows.size()) return false;
        row = result_.rows[pos_++];
        return true;
    }

    bool failed() const override { return failed_; }
    std::string last_error() const override { return error_; }

private:
    FakeResult  result_;
    int64_t     fail_after_;
    size_t      pos_ = 0;
    bool        failed_ = false;
    std::string error_;
};

class FakeConnection;

class FakeInsert : public IPreparedStatement {
public:
    FakeInsert(FakeConnection& conn, std::string key, std::vector<std::string> columns)
        : conn_(conn), key_(std::move(key)), columns_(std::move(columns)) {}

    bool execute(const Row& values) override;
    std::string last_error() const override { return error_; }

private:
    bool fail(const std::string& msg) {
        error_ = msg;
        return false;
    }

    FakeConnection&          conn_;
    std::string              key_;
    std::vector<std::string> columns_;
    std::string              error_;
};

class FakeConnection : public IConnection {
public:
    FakeConnection(FakeServer& server, std::string database)
        : server_(server), database_(std::move(database))
    {
        ++server_.open_connections;
    }

    ~FakeConnection() override {
        if (in_tx_) rollback();
        --server_.open_connections;
    }

    bool execute(const std::string& sql) override {
        server_.statements.push_back(sql);

        if (starts_with(sql, "CREATE TABLE ")) return create_table(sql);

        if (starts_with(sql, "DELETE FROM ")) {
            FakeTable* t = table(sql.substr(12));
            if (!t) return fail("Invalid object name '" + sql.substr(12) + "'");
            t->rows.clear();
            return true;
        }

        if (starts_with(sql, "SET IDENTITY_INSERT ")) {
            size_t sp = sql.rfind(' ');
            std::string key = sql.substr(20, sp - 20);
            std::string mode = sql.substr(sp + 1);
            FakeTable* t = table(key);
            if (!t) return fail("Invalid object name '" + key + "'");
            if (t->identity_index() < 0)
                return fail("Table '" + t->name + "' does not have the identity property");
            if (mode == "ON") identity_insert_.insert(key);
            else identity_insert_.erase(key);
            return true;
        }

        return fail("Unsupported statement: " + sql);
    }

    bool query_scalar(const std::string& sql, std::string& result) override {
        server_.statements.push_back(sql);
        result.clear();

        size_t p = sql.find("OBJECT_ID(N'");
        if (starts_with(sql, "SELECT CASE WHEN OBJECT_ID(") && p != std::string::npos) {
            result = table(read_nliteral(sql, p + 10)) ? "Y" : "N";
            return true;
        }
        return fail("Unsupported scalar query: " + sql);
    }

    bool query_scalar_int(const std::string& sql, int64_t& result) override {
        server_.statements.push_back(sql);
        result = 0;

        if (sql == "SELECT 1") {
            result = 1;
            return true;
        }

        const std::string count = "SELECT COUNT_BIG(*) FROM ";
        if (starts_with(sql, count)) {
            FakeResult r;
            if (!resolve_source(sql.substr(count.size()), r)) return false;
            result = static_cast<int64_t>(r.rows.size());
            return true;
        }
        return fail("Unsupported scalar query: " + sql);
    }

    std::unique_ptr<IRowCursor> open_cursor(const std::string& sql) override {
        server_.statements.push_back(sql);

        auto q = db().queries.find(sql);
        if (q != db().queries.end()) {
            return std::make_unique<FakeCursor>(q->second, server_.cursor_fail_after);
        }

        const std::string top = "SELECT TOP (";
        if (starts_with(sql, top)) {
            size_t close = sql.find(')', top.size());
            int64_t n = std::stoll(sql.substr(top.size(), close - top.size()));
            const std::string from = " * FROM ";
            std::string rest = sql.substr(close + 1);
            FakeResult r;
            if (!starts_with(rest, from) || !resolve_source(rest.substr(from.size()), r)) {
                if (last_error_.empty()) last_error_ = "Incorrect syntax";
                return nullptr;
            }
            if (static_cast<int64_t>(r.rows.size()) > n) r.rows.resize(static_cast<size_t>(n));
            return std::make_unique<FakeCursor>(std::move(r), -1);
        }

        const std::string scan = "SELECT * FROM ";
        if (starts_with(sql, scan)) {
            FakeResult r;
            if (!resolve_source(sql.substr(scan.size()), r)) return nullptr;
            return std::make_unique<FakeCursor>(std::move(r), server_.cursor_fail_after);
        }

        if (starts_with(sql, "SELECT c.name FROM sys.columns")) {
            FakeResult r;
            r.columns.push_back(column("name", "nvarchar", false, 128));
            size_t p = sql.find("OBJECT_ID(N'");
            FakeTable* t = p == std::string::npos ? nullptr : table(read_nliteral(sql, p + 10));
            if (t && t->identity_index() >= 0) {
                r.rows.push_back(Row{t->columns[t->identity_index()].name});
            }
            return std::make_unique<FakeCursor>(std::move(r), -1);
        }

        if (starts_with(sql, "SELECT d.name")) {
            FakeResult r;
            r.columns = {column("name", "nvarchar", false, 128),
                         column("state_desc", "nvarchar", true, 60),
                         column("recovery_model_desc", "nvarchar", true, 60),
                         column("size_mb", "bigint")};
            for (const auto& db : server_.databases) {
                if (db.first == "master") continue;
                r.rows.push_back(Row{db.first, std::string("ONLINE"), std::string("FULL"),
                                     int64_t{16}});
            }
            return std::make_unique<FakeCursor>(std::move(r), -1);
        }

        if (starts_with(sql, "SELECT t.TABLE_SCHEMA")) {
            FakeResult r;
            r.columns = {column("TABLE_SCHEMA", "nvarchar", true, 128),
                         column("TABLE_NAME", "nvarchar", false, 128),
                         column("column_count", "int")};
            for (const auto& entry : db().tables) {
                const FakeTable& t = entry.second;
                r.rows.push_back(Row{t.schema_name, t.name,
                                     static_cast<int32_t>(t.columns.size())});
            }
            return std::make_unique<FakeCursor>(std::move(r), -1);
        }

        last_error_ = "Incorrect syntax near '" + sql.substr(0, 20) + "'";
        return nullptr;
    }

    std::unique_ptr<IPreparedStatement> prepare(
        const std::string& sql, const std::vector<ColumnDescriptor>&) override {
        server_.statements.push_back(sql);

        const std::string ins = "INSERT INTO ";
        if (!starts_with(sql, ins)) {
            fail("Unsupported prepared statement: " + sql);
            return nullptr;
        }

        size_t pos = ins.size();
        std::string schema = read_bracketed(sql, pos);
        ++pos;
        std::string name = read_bracketed(sql, pos);
        std::string key = table_key(schema, name);
        if (!table(key)) {
            fail("Invalid object name '" + key + "'");
            return nullptr;
        }

        std::vector<std::string> columns;
        if (sql.compare(pos, 2, " (") == 0) {
            pos += 2;
            while (pos < sql.size() && sql[pos] == '[') {
                columns.push_back(read_bracketed(sql, pos));
                if (sql.compare(pos, 2, ", ") == 0) pos += 2;
                else break;
            }
        }
        return std::make_unique<FakeInsert>(*this, key, columns);
    }

    bool begin_transaction() override {
        if (in_tx_) return fail("A transaction is already open");
        server_.statements.push_back("BEGIN TRANSACTION");
        snapshot_ = db().tables;
        in_tx_ = true;
        ++server_.open_transactions;
        return true;
    }

    bool commit() override {
        if (!in_tx_) return fail("No open transaction");
        server_.statements.push_back("COMMIT");
        in_tx_ = false;
        --server_.open_transactions;
        if (server_.fail_commit) {
            db().tables = snapshot_;
            snapshot_.clear();
            return fail("The transaction log for the database is full");
        }
        snapshot_.clear();
        return true;
    }

    bool rollback() override {
        if (!in_tx_) return fail("No open transaction");
        server_.statements.push_back("ROLLBACK");
        db().tables = snapshot_;
        snapshot_.clear();
        in_tx_ = false;
        --server_.open_transactions;
        return true;
    }

    bool in_transaction() const override { return in_tx_; }
    std::string last_error() const override { return last_error_; }

    FakeServer& server() { return server_; }
    FakeDatabase& db() { return server_.databases[database_]; }
    bool identity_insert_on(const std::string& key) const {
        return identity_insert_.count(key) > 0;
    }

    FakeTable* table(const std::string& key) {
        auto it = db().tables.find(key);
        return it == db().tables.end() ? nullptr : &it->second;
    }

private:
    bool fail(const std::string& msg) {
        last_error_ = msg;
        return false;
    }

    // "(query) AS src" or "[schema].[name]"
    bool resolve_source(const std::string& src, FakeResult& out) {
        if (starts_with(src, "(") && ends_with(src, kWrapSuffix)) {
            std::string inner = src.substr(1, src.size() - 1 - (sizeof(kWrapSuffix) - 1));
            auto q = db().queries.find(inner);
            if (q == db().queries.end()) return fail("Incorrect syntax near '" + inner + "'");
            out = q->second;
            return true;
        }

        FakeTable* t = table(src);
        if (!t) return fail("Invalid object name '" + src + "'");
        out.columns = t->columns;
        out.rows = t->rows;
        return true;
    }

    bool create_table(const std::string& sql) {
        if (server_.fail_ddl) return fail("CREATE TABLE permission denied in database");

        size_t pos = 13;
        FakeTable t;
        t.schema_name = read_bracketed(sql, pos);
        ++pos;
        t.name = read_bracketed(sql, pos);
        std::string key = table_key(t.schema_name, t.name);
        if (table(key)) return fail("There is already an object named '" + t.name + "'");

        std::istringstream in(sql.substr(pos));
        std::string line;
        while (std::getline(in, line)) {
            size_t p = line.find_first_not_of(' ');
            if (p == std::string::npos || line[p] != '[') continue;

            ColumnDescriptor col;
            col.name = read_bracketed(line, p);
            std::string rest = line.substr(p + 1);
            if (!rest.empty() && rest.back() == ',') rest.pop_back();

            col.is_identity = rest.find(" IDENTITY(1,1)") != std::string::npos;
            col.is_nullable = !ends_with(rest, " NOT NULL");
            std::string type = rest.substr(0, rest.find(' '));
            t.declared_types.push_back(type);
            col.type_name = lower(type.substr(0, type.find('(')));
            t.columns.push_back(col);
        }

        db().tables[key] = t;
        return true;
    }

    FakeServer&                      server_;
    std::string                      database_;
    bool                             in_tx_ = false;
    std::map<std::string, FakeTable> snapshot_;
    std::set<std::string>            identity_insert_;
    std::string                      last_error_;
};

bool FakeInsert::execute(const Row& values) {
    FakeServer& server = conn_.server();
    ++server.insert_count;
    if (server.fail_insert_at == server.insert_count) {
        return fail("Violation of PRIMARY KEY constraint 'PK_test'");
    }

    FakeTable* t = conn_.table(key_);
    if (!t) return fail("Invalid object name '" + key_ + "'");
    if (values.size() != columns_.size()) return fail("Parameter count mismatch");

    Row row(t->columns.size(), NullValue{});
    int id_idx = t->identity_index();
    bool explicit_identity = false;

    for (size_t i = 0; i < columns_.size(); ++i) {
        int idx = t->column_index(columns_[i]);
        if (idx < 0) return fail("Invalid column name '" + columns_[i] + "'");
        if (idx == id_idx) {
            if (!conn_.identity_insert_on(key_)) {
                return fail("Cannot insert explicit value for identity column in table '" +
                            t->name + "' when IDENTITY_INSERT is set to OFF");
            }
            explicit_identity = true;
        }
        row[static_cast<size_t>(idx)] = values[i];
    }

    if (id_idx >= 0) {
        auto id = static_cast<size_t>(id_idx);
        if (explicit_identity) {
            t->next_identity = std::max(t->next_identity, value_as_int64(row[id]) + 1);
        } else {
            row[id] = t->next_identity++;
        }
    }

    for (size_t i = 0; i < t->columns.size(); ++i) {
        if (!t->columns[i].is_nullable && std::holds_alternative<NullValue>(row[i])) {
            return fail("Cannot insert the value NULL into column '" + t->columns[i].name + "'");
        }
    }

    t->rows.push_back(std::move(row));
    if (server.on_insert) server.on_insert(server.insert_count);
    return true;
}

}  // namespace

int FakeTable::identity_index() const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].is_identity) return static_cast<int>(i);
    }
    return -1;
}

int FakeTable::column_index(const std::string& col) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (lower(columns[i].name) == lower(col)) return static_cast<int>(i);
    }
    return -1;
}

FakeServer::FakeServer() {
    databases["master"];
}

FakeTable& FakeServer::add_table(const std::string& database, const std::string& schema,
                                 const std::string& name, std::vector<ColumnDescriptor> columns,
                                 std::vector<Row> rows) {
    FakeTable t;
    t.schema_name = schema;
    t.name = name;
    t.columns = std::move(columns);
    t.rows = std::move(rows);

    int id_idx = t.identity_index();
    if (id_idx >= 0) {
        for (const auto& r : t.rows) {
            t.next_identity = std::max(t.next_identity,
                                       value_as_int64(r[static_cast<size_t>(id_idx)]) + 1);
        }
    }

    auto& slot = databases[database].tables[table_key(schema, name)];
    slot = std::move(t);
    return slot;
}

void FakeServer::add_query(const std::string& database, const std::string& sql,
                           std::vector<ColumnDescriptor> columns, std::vector<Row> rows) {
    FakeResult r;
    r.columns = std::move(columns);
    r.rows = std::move(rows);
    databases[database].queries[sql] = std::move(r);
}

FakeTable* FakeServer::find_table(const std::string& database, const std::string& schema,
                                  const std::string& name) {
    auto db = databases.find(database);
    if (db == databases.end()) return nullptr;
    auto it = db->second.tables.find(table_key(schema, name));
    return it == db->second.tables.end() ? nullptr : &it->second;
}

int64_t FakeServer::row_count(const std::string& database, const std::string& schema,
                              const std::string& name) {
    FakeTable* t = find_table(database, schema, name);
    return t ? static_cast<int64_t>(t->rows.size()) : -1;
}

ConnectionFactory FakeServer::factory() {
    return [this](const ConnectionSettings& settings,
                  const std::string& database) -> std::unique_ptr<IConnection> {
        if (unreachable_servers.count(settings.server)) {
            throw ConnectionError("Cannot connect to SQL Server '" + settings.server +
                                  "': [08001] server was not found or was not accessible");
        }
        if (!databases.count(database)) {
            throw ConnectionError("Cannot open database '" + database +
                                  "' requested by the login");
        }
        return std::make_unique<FakeConnection>(*this, database);
    };
}

ColumnDescriptor column(const std::string& name, const std::string& type, bool nullable,
                        int32_t max_length, uint8_t precision, uint8_t scale, bool identity) {
    ColumnDescriptor c;
    c.name        = name;
    c.type_name   = type;
    c.is_nullable = nullable;
    c.max_length  = max_length;
    c.precision   = precision;
    c.scale       = scale;
    c.is_identity = identity;
    return c;
}

}  // namespace fake
}  // namespace sqlxfer
