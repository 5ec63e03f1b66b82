#include "sqlxfer/csv_writer.h"
#include "sqlxfer/db_connection.h"
#include "sqlxfer/logging.h"

namespace sqlxfer {

CsvWriter::CsvWriter(const std::string& delimiter)
    : delimiter_(delimiter.empty() ? "," : delimiter)
{
}

CsvWriter::~CsvWriter() {
    if (open_) close();
}

bool CsvWriter::open(const std::string& path, const std::vector<ColumnDescriptor>& columns) {
    out_ = &target_.open(path);
    column_count_ = columns.size();

    // UTF-8 BOM for Excel compatibility; not on a terminal
    if (!target_.is_stdout()) out_->write("\xEF\xBB\xBF", 3);

    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) *out_ << delimiter_;
        *out_ << escape_csv(columns[i].name);
    }
    *out_ << "\r\n";

    open_ = true;
    LOG_DEBUG("CSV writer opened: %s (%zu columns)",
              target_.is_stdout() ? "<stdout>" : path.c_str(), columns.size());
    return out_->good();
}

bool CsvWriter::write_row(const Row& row) {
    if (!open_) return false;

    for (size_t i = 0; i < row.size() && i < column_count_; ++i) {
        if (i > 0) *out_ << delimiter_;
        *out_ << format_value(row[i]);
    }
    *out_ << "\r\n";

    ++rows_written_;
    return out_->good();
}

bool CsvWriter::close() {
    if (!open_) return true;

    out_->flush();
    bool ok = out_->good();
    target_.close();
    out_ = nullptr;
    open_ = false;

    LOG_DEBUG("CSV writer closed: %llu rows written",
              static_cast<unsigned long long>(rows_written_));
    return ok;
}

std::string CsvWriter::format_value(const RowValue& val) const {
    if (auto* s = std::get_if<std::string>(&val)) return escape_csv(*s);
    return value_as_string(val);
}

std::string CsvWriter::escape_csv(const std::string& s) const {
    bool needs_quoting = false;
    for (char c : s) {
        if (c == '"' || c == '\n' || c == '\r' || c == delimiter_[0]) {
            needs_quoting = true;
            break;
        }
    }

    if (!needs_quoting) return s;

    std::string result = "\"";
    for (char c : s) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

}  // namespace sqlxfer
