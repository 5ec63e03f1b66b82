#pragma once

#include "sqlxfer/export_writer.h"

#include <string>
#include <vector>

namespace sqlxfer {

// Aligned text table; rows are buffered so column widths fit every value
class TableWriter : public IExportWriter {
public:
    explicit TableWriter(size_t max_width = 40);
    ~TableWriter() override;

    bool open(const std::string& path,
              const std::vector<ColumnDescriptor>& columns) override;
    bool write_row(const Row& row) override;
    bool close() override;
    uint64_t rows_written() const override { return rows_.size(); }

private:
    std::string cell(const RowValue& val) const;

    size_t                                max_width_;
    OutputTarget                          target_;
    std::vector<std::string>              header_;
    std::vector<std::vector<std::string>> rows_;
    bool                                  open_ = false;
};

}  // namespace sqlxfer
