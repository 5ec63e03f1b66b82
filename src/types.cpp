#include "sqlxfer/types.h"

#include <algorithm>

namespace sqlxfer {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Validating:          return "validating";
        case TransferState::Counting:            return "counting";
        case TransferState::PreparingSchema:     return "preparing-schema";
        case TransferState::ClearingDestination: return "clearing-destination";
        case TransferState::Loading:             return "loading";
        case TransferState::Committing:          return "committing";
        case TransferState::Succeeded:           return "succeeded";
        case TransferState::Failed:              return "failed";
        case TransferState::Cancelled:           return "cancelled";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Config:     return "config";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Source:     return "source";
        case ErrorKind::Schema:     return "schema";
        case ErrorKind::Transfer:   return "transfer";
        case ErrorKind::Cancelled:  return "cancelled";
        case ErrorKind::Internal:   return "internal";
    }
    return "unknown";
}

int TransferProgress::percentage() const {
    if (is_complete && is_success) return 100;
    if (total_rows <= 0) return 0;
    // Rows appended to the source after counting must not push past 100
    int64_t done = std::min(std::max<int64_t>(transferred_rows, 0), total_rows);
    return static_cast<int>(done * 100 / total_rows);
}

}  // namespace sqlxfer
