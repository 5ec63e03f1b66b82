#include "sqlxfer/db_connection.h"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace sqlxfer {

bool IConnection::query_rows(const std::string& sql, const RowCallback& callback,
                             int64_t max_rows) {
    auto cursor = open_cursor(sql);
    if (!cursor) return false;

    int64_t row_count = 0;
    Row row;
    while (cursor->next(row)) {
        if (!callback(row)) break;

        ++row_count;
        if (max_rows > 0 && row_count >= max_rows) break;
    }
    return !cursor->failed();
}

std::string value_as_string(const RowValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, NullValue>) {
            return "";
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "1" : "0";
        }
        else if constexpr (std::is_same_v<T, float>) {
            std::ostringstream oss;
            oss << std::setprecision(7) << arg;
            return oss.str();
        }
        else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        }
        else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            std::ostringstream oss;
            oss << "0x";
            for (auto b : arg)
                oss << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                    << static_cast<int>(b);
            return oss.str();
        }
        else {
            return std::to_string(arg);
        }
    }, value);
}

int64_t value_as_int64(const RowValue& value) {
    return std::visit([](auto&& arg) -> int64_t {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, NullValue> ||
                      std::is_same_v<T, std::vector<uint8_t>>) {
            return 0;
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            char* end = nullptr;
            long long v = std::strtoll(arg.c_str(), &end, 10);
            return end == arg.c_str() ? 0 : static_cast<int64_t>(v);
        }
        else {
            return static_cast<int64_t>(arg);
        }
    }, value);
}

}  // namespace sqlxfer
