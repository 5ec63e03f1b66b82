#include "sqlxfer/progress.h"

#include <algorithm>

namespace sqlxfer {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{
}

void ProgressChannel::publish(const TransferProgress& progress) {
    std::unique_lock<std::mutex> lk(mu_);
    if (closed_) return;

    if (queue_.size() >= capacity_) {
        auto victim = std::find_if(queue_.begin(), queue_.end(),
                                   [](const TransferProgress& p) { return !p.is_complete; });
        if (victim != queue_.end()) {
            queue_.erase(victim);
            ++dropped_;
        } else if (!progress.is_complete) {
            // Full of terminal snapshots; the newcomer is the one to lose
            ++dropped_;
            return;
        }
    }

    queue_.push_back(progress);
    lk.unlock();
    not_empty_.notify_one();
}

bool ProgressChannel::pop(TransferProgress& progress) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [&] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return false;
    progress = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void ProgressChannel::close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    not_empty_.notify_all();
}

size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

std::thread start_worker(std::function<TransferResult()> job,
                         ProgressChannel& channel, TransferResult& result) {
    return std::thread([job = std::move(job), &channel, &result] {
        try {
            result = job();
        } catch (const std::exception& e) {
            result = TransferResult{};
            result.error_kind    = ErrorKind::Internal;
            result.error_message = std::string("Unexpected error: ") + e.what();
            result.final_state   = TransferState::Failed;
        }
        channel.close();
    });
}

}  // namespace sqlxfer
