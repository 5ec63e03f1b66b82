#pragma once

#include "sqlxfer/db_connection.h"
#include "sqlxfer/progress.h"
#include "sqlxfer/types.h"

#include <string>

namespace sqlxfer {

// -------------------------------------------------------------------------
// TransferOrchestrator -- moves one table or query result between servers
//
//   Validating -> Counting -> PreparingSchema -> [ClearingDestination]
//              -> Loading -> Committing -> Succeeded
//
// Any phase may end in Failed or Cancelled. The CREATE TABLE of a new
// destination, the DELETE of a Replace and every batch share one
// destination transaction, so a failed or cancelled run leaves the
// destination exactly as it was.
//
// run() never throws for transfer failures; they are reported through the
// returned TransferResult and the final progress snapshot.
// -------------------------------------------------------------------------
class TransferOrchestrator {
public:
    TransferOrchestrator(ConnectionSettings source,
                         ConnectionSettings destination,
                         ConnectionFactory factory);

    // One transfer at a time per instance. sink and cancel may be null.
    TransferResult run(const TransferRequest& request,
                       IProgressSink* sink = nullptr,
                       const CancellationToken* cancel = nullptr);

    // Throws ConfigError for an incomplete or malformed request
    static void validate(const TransferRequest& request);

private:
    TransferResult execute(const TransferRequest& request);

    void enter(TransferState state, const std::string& status);
    void publish();
    void check_cancelled(const std::string& where);

    ConnectionSettings       source_;
    ConnectionSettings       destination_;
    ConnectionFactory        factory_;

    IProgressSink*           sink_   = nullptr;
    const CancellationToken* cancel_ = nullptr;
    TransferProgress         progress_;
};

}  // namespace sqlxfer
