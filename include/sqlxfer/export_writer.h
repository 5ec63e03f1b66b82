#pragma once

#include "sqlxfer/types.h"

#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace sqlxfer {

enum class ExportFormat {
    Table,   // aligned text for the terminal
    CSV,
    JSONL,
};

// -------------------------------------------------------------------------
// IExportWriter -- common interface for preview output formats
// -------------------------------------------------------------------------
class IExportWriter {
public:
    virtual ~IExportWriter() = default;

    // Open the output ("-" or empty = stdout) and write header info
    virtual bool open(const std::string& path,
                      const std::vector<ColumnDescriptor>& columns) = 0;

    // Write a single row
    virtual bool write_row(const Row& row) = 0;

    // Flush buffered data and close the output
    virtual bool close() = 0;

    // Get the number of rows written
    virtual uint64_t rows_written() const = 0;
};

// Output target shared by the writers: a file, or stdout for "-"
class OutputTarget {
public:
    // Throws ConfigError when the file cannot be created
    std::ostream& open(const std::string& path);
    void close();

    bool is_stdout() const { return out_ != nullptr && !file_.is_open(); }
    std::ostream* stream() const { return out_; }

private:
    std::ofstream file_;
    std::ostream* out_ = nullptr;
};

// Factory function to create the appropriate writer based on format
std::unique_ptr<IExportWriter> create_writer(ExportFormat format,
                                             const std::string& delimiter = ",");

// Parse "table|csv|jsonl"; throws ConfigError otherwise
ExportFormat parse_export_format(const std::string& name);

// Write all preview rows through a writer of the given format
uint64_t export_preview(const PreviewResult& preview, ExportFormat format,
                        const std::string& path);

}  // namespace sqlxfer
