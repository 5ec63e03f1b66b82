#pragma once

#include "sqlxfer/export_writer.h"

#include <string>
#include <vector>

namespace sqlxfer {

// JSON Lines writer -- one JSON object per line
class JsonWriter : public IExportWriter {
public:
    JsonWriter();
    ~JsonWriter() override;

    bool open(const std::string& path,
              const std::vector<ColumnDescriptor>& columns) override;
    bool write_row(const Row& row) override;
    bool close() override;
    uint64_t rows_written() const override { return rows_written_; }

    static std::string escape_json(const std::string& s);

private:
    std::string format_value(const RowValue& val) const;

    OutputTarget             target_;
    std::ostream*            out_ = nullptr;
    std::vector<std::string> names_;
    uint64_t                 rows_written_ = 0;
    bool                     open_ = false;
};

}  // namespace sqlxfer
