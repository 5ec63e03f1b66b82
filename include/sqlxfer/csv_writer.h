#pragma once

#include "sqlxfer/export_writer.h"

#include <string>

namespace sqlxfer {

class CsvWriter : public IExportWriter {
public:
    explicit CsvWriter(const std::string& delimiter = ",");
    ~CsvWriter() override;

    bool open(const std::string& path,
              const std::vector<ColumnDescriptor>& columns) override;
    bool write_row(const Row& row) override;
    bool close() override;
    uint64_t rows_written() const override { return rows_written_; }

    // RFC 4180 quoting: fields holding the delimiter, quotes or line breaks
    std::string escape_csv(const std::string& s) const;

private:
    std::string format_value(const RowValue& val) const;

    std::string   delimiter_;
    OutputTarget  target_;
    std::ostream* out_ = nullptr;
    size_t        column_count_ = 0;
    uint64_t      rows_written_ = 0;
    bool          open_ = false;
};

}  // namespace sqlxfer
