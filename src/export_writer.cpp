#include "sqlxfer/export_writer.h"
#include "sqlxfer/csv_writer.h"
#include "sqlxfer/error.h"
#include "sqlxfer/json_writer.h"
#include "sqlxfer/logging.h"
#include "sqlxfer/table_writer.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace sqlxfer {

std::ostream& OutputTarget::open(const std::string& path) {
    close();
    if (path.empty() || path == "-") {
        out_ = &std::cout;
        return *out_;
    }

    file_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        throw ConfigError("Cannot open output file: " + path);
    }
    out_ = &file_;
    return *out_;
}

void OutputTarget::close() {
    if (file_.is_open()) file_.close();
    out_ = nullptr;
}

std::unique_ptr<IExportWriter> create_writer(ExportFormat format,
                                             const std::string& delimiter) {
    switch (format) {
    case ExportFormat::Table:
        return std::make_unique<TableWriter>();
    case ExportFormat::CSV:
        return std::make_unique<CsvWriter>(delimiter);
    case ExportFormat::JSONL:
        return std::make_unique<JsonWriter>();
    }
    throw ConfigError("Unknown output format");
}

ExportFormat parse_export_format(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "table" || v == "text")  return ExportFormat::Table;
    if (v == "csv")                   return ExportFormat::CSV;
    if (v == "jsonl" || v == "json")  return ExportFormat::JSONL;
    throw ConfigError("Unknown format: " + name + ". Expected table|csv|jsonl");
}

uint64_t export_preview(const PreviewResult& preview, ExportFormat format,
                        const std::string& path) {
    auto writer = create_writer(format);
    writer->open(path, preview.columns);
    for (const auto& row : preview.rows) {
        if (!writer->write_row(row)) {
            throw ConfigError("Cannot write preview output to " +
                              (path.empty() ? std::string("stdout") : path));
        }
    }
    if (!writer->close()) {
        throw ConfigError("Cannot finish preview output to " +
                          (path.empty() ? std::string("stdout") : path));
    }
    if (!path.empty() && path != "-") {
        LOG_INFO("Preview written: %llu rows to %s",
                 static_cast<unsigned long long>(writer->rows_written()), path.c_str());
    }
    return writer->rows_written();
}

}  // namespace sqlxfer
