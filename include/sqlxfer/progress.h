#pragma once

#include "sqlxfer/types.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace sqlxfer {

// -------------------------------------------------------------------------
// IProgressSink -- receives TransferProgress snapshots from the transfer
// thread. Implementations must return promptly.
// -------------------------------------------------------------------------
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void publish(const TransferProgress& progress) = 0;
};

class CallbackProgressSink : public IProgressSink {
public:
    using Callback = std::function<void(const TransferProgress&)>;

    explicit CallbackProgressSink(Callback cb) : cb_(std::move(cb)) {}

    void publish(const TransferProgress& progress) override {
        if (cb_) cb_(progress);
    }

private:
    Callback cb_;
};

// -------------------------------------------------------------------------
// ProgressChannel -- bounded snapshot queue between the transfer thread
// and an observer thread
//
// publish() never blocks: when the queue is full the oldest intermediate
// snapshot is dropped. Terminal snapshots (is_complete) are never dropped.
// -------------------------------------------------------------------------
class ProgressChannel : public IProgressSink {
public:
    explicit ProgressChannel(size_t capacity = 64);

    void publish(const TransferProgress& progress) override;

    // Blocks until a snapshot is available. Returns false once the channel
    // is closed and drained.
    bool pop(TransferProgress& progress);

    // No more snapshots will be published
    void close();

    size_t size() const;
    size_t dropped() const;

private:
    std::deque<TransferProgress> queue_;
    size_t                       capacity_;
    size_t                       dropped_ = 0;
    mutable std::mutex           mu_;
    std::condition_variable      not_empty_;
    bool                         closed_ = false;
};

// Runs `job` on a new thread and closes `channel` when it returns or throws.
// A thrown exception becomes an Internal failure in `result`. Join the
// returned thread before reading `result`.
std::thread start_worker(std::function<TransferResult()> job,
                         ProgressChannel& channel, TransferResult& result);

// -------------------------------------------------------------------------
// CancellationToken -- cooperative cancellation flag
//
// cancel() is lock-free and may be called from any thread or from a
// signal handler.
// -------------------------------------------------------------------------
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace sqlxfer
