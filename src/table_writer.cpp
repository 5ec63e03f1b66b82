#include "sqlxfer/table_writer.h"
#include "sqlxfer/db_connection.h"

#include <algorithm>

namespace sqlxfer {

TableWriter::TableWriter(size_t max_width)
    : max_width_(std::max<size_t>(max_width, 4))
{
}

TableWriter::~TableWriter() {
    if (open_) close();
}

bool TableWriter::open(const std::string& path, const std::vector<ColumnDescriptor>& columns) {
    target_.open(path);
    header_.clear();
    rows_.clear();
    for (const auto& col : columns) header_.push_back(col.name);
    open_ = true;
    return true;
}

std::string TableWriter::cell(const RowValue& val) const {
    if (std::holds_alternative<NullValue>(val)) return "NULL";

    std::string s = value_as_string(val);
    std::replace(s.begin(), s.end(), '\n', ' ');
    std::replace(s.begin(), s.end(), '\r', ' ');
    std::replace(s.begin(), s.end(), '\t', ' ');
    if (s.size() > max_width_) s = s.substr(0, max_width_ - 3) + "...";
    return s;
}

bool TableWriter::write_row(const Row& row) {
    if (!open_) return false;

    std::vector<std::string> cells;
    for (size_t i = 0; i < header_.size(); ++i) {
        cells.push_back(i < row.size() ? cell(row[i]) : "");
    }
    rows_.push_back(std::move(cells));
    return true;
}

bool TableWriter::close() {
    if (!open_) return true;
    open_ = false;

    std::vector<size_t> widths;
    for (const auto& h : header_) widths.push_back(std::min(h.size(), max_width_));
    for (const auto& r : rows_) {
        for (size_t i = 0; i < r.size(); ++i) widths[i] = std::max(widths[i], r[i].size());
    }

    std::ostream& out = *target_.stream();
    auto print_line = [&](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) out << " | ";
            std::string c = cells[i].size() > max_width_ ? cells[i].substr(0, max_width_)
                                                         : cells[i];
            out << c;
            if (i + 1 < cells.size()) out << std::string(widths[i] - c.size(), ' ');
        }
        out << "\n";
    };

    print_line(header_);
    for (size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) out << "-+-";
        out << std::string(widths[i], '-');
    }
    out << "\n";
    for (const auto& r : rows_) print_line(r);
    out << "(" << rows_.size() << " row" << (rows_.size() == 1 ? "" : "s") << ")\n";

    out.flush();
    bool ok = out.good();
    target_.close();
    return ok;
}

}  // namespace sqlxfer
