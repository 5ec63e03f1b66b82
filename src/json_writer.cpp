#include "sqlxfer/json_writer.h"
#include "sqlxfer/db_connection.h"
#include "sqlxfer/logging.h"

#include <cmath>
#include <cstdio>

namespace sqlxfer {

JsonWriter::JsonWriter() = default;

JsonWriter::~JsonWriter() {
    if (open_) close();
}

bool JsonWriter::open(const std::string& path, const std::vector<ColumnDescriptor>& columns) {
    out_ = &target_.open(path);

    names_.clear();
    for (const auto& col : columns) names_.push_back(escape_json(col.name));

    open_ = true;
    LOG_DEBUG("JSON Lines writer opened: %s (%zu columns)",
              target_.is_stdout() ? "<stdout>" : path.c_str(), columns.size());
    return out_->good();
}

bool JsonWriter::write_row(const Row& row) {
    if (!open_) return false;

    *out_ << "{";
    for (size_t i = 0; i < row.size() && i < names_.size(); ++i) {
        if (i > 0) *out_ << ",";
        *out_ << "\"" << names_[i] << "\":" << format_value(row[i]);
    }
    *out_ << "}\n";

    ++rows_written_;
    return out_->good();
}

bool JsonWriter::close() {
    if (!open_) return true;

    out_->flush();
    bool ok = out_->good();
    target_.close();
    out_ = nullptr;
    open_ = false;

    LOG_DEBUG("JSON Lines writer closed: %llu rows written",
              static_cast<unsigned long long>(rows_written_));
    return ok;
}

std::string JsonWriter::format_value(const RowValue& val) const {
    if (std::holds_alternative<NullValue>(val)) return "null";
    if (auto* b = std::get_if<bool>(&val)) return *b ? "true" : "false";
    if (auto* s = std::get_if<std::string>(&val)) return "\"" + escape_json(*s) + "\"";
    if (std::holds_alternative<std::vector<uint8_t>>(val))
        return "\"" + value_as_string(val) + "\"";

    // JSON has no NaN or infinity
    if (auto* d = std::get_if<double>(&val)) {
        if (!std::isfinite(*d)) return "null";
    }
    if (auto* f = std::get_if<float>(&val)) {
        if (!std::isfinite(*f)) return "null";
    }
    return value_as_string(val);
}

std::string JsonWriter::escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '"':  result += "\\\""; break;
        case '\\': result += "\\\\"; break;
        case '\b': result += "\\b";  break;
        case '\f': result += "\\f";  break;
        case '\n': result += "\\n";  break;
        case '\r': result += "\\r";  break;
        case '\t': result += "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                result += buf;
            } else {
                result += c;
            }
        }
    }
    return result;
}

}  // namespace sqlxfer
