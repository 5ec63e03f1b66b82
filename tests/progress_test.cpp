#include "sqlxfer/progress.h"

#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

using namespace sqlxfer;

namespace {

TransferProgress loading(int64_t done, int64_t total) {
    TransferProgress p;
    p.state            = TransferState::Loading;
    p.transferred_rows = done;
    p.total_rows       = total;
    return p;
}

TransferProgress finished(int64_t done, int64_t total) {
    TransferProgress p = loading(done, total);
    p.state       = TransferState::Succeeded;
    p.is_complete = true;
    p.is_success  = true;
    return p;
}

}  // namespace

TEST(TransferProgressTest, PercentageIsFloored) {
    EXPECT_EQ(loading(0, 1000).percentage(), 0);
    EXPECT_EQ(loading(250, 1000).percentage(), 25);
    EXPECT_EQ(loading(999, 1000).percentage(), 99);
    EXPECT_EQ(loading(1000, 1000).percentage(), 100);
}

TEST(TransferProgressTest, UnknownTotalReportsZero) {
    EXPECT_EQ(loading(0, 0).percentage(), 0);
    EXPECT_EQ(loading(12, 0).percentage(), 0);
}

TEST(TransferProgressTest, ClampedToTotal) {
    EXPECT_EQ(loading(1500, 1000).percentage(), 100);
    EXPECT_EQ(loading(-5, 1000).percentage(), 0);
}

TEST(TransferProgressTest, SuccessIsAlwaysComplete) {
    EXPECT_EQ(finished(0, 0).percentage(), 100);
    EXPECT_EQ(finished(900, 1000).percentage(), 100);

    TransferProgress failed = finished(900, 1000);
    failed.is_success = false;
    EXPECT_EQ(failed.percentage(), 90);
}

TEST(TransferStateTest, TerminalStates) {
    EXPECT_TRUE(is_terminal(TransferState::Succeeded));
    EXPECT_TRUE(is_terminal(TransferState::Failed));
    EXPECT_TRUE(is_terminal(TransferState::Cancelled));
    EXPECT_FALSE(is_terminal(TransferState::Loading));
    EXPECT_STREQ(to_string(TransferState::PreparingSchema), "preparing-schema");
    EXPECT_STREQ(to_string(ErrorKind::Connection), "connection");
}

TEST(ProgressChannelTest, DeliversInOrder) {
    ProgressChannel channel;
    channel.publish(loading(1, 3));
    channel.publish(loading(2, 3));
    channel.close();

    TransferProgress p;
    ASSERT_TRUE(channel.pop(p));
    EXPECT_EQ(p.transferred_rows, 1);
    ASSERT_TRUE(channel.pop(p));
    EXPECT_EQ(p.transferred_rows, 2);
    EXPECT_FALSE(channel.pop(p));
}

TEST(ProgressChannelTest, FullChannelDropsOldestIntermediate) {
    ProgressChannel channel(2);
    channel.publish(loading(1, 10));
    channel.publish(loading(2, 10));
    channel.publish(loading(3, 10));

    EXPECT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel.dropped(), 1u);

    TransferProgress p;
    ASSERT_TRUE(channel.pop(p));
    EXPECT_EQ(p.transferred_rows, 2);
}

TEST(ProgressChannelTest, TerminalSnapshotIsNeverDropped) {
    ProgressChannel channel(1);
    channel.publish(loading(5, 10));
    channel.publish(finished(10, 10));
    channel.publish(loading(7, 10));
    channel.close();

    TransferProgress p;
    ASSERT_TRUE(channel.pop(p));
    EXPECT_TRUE(p.is_complete);
    EXPECT_EQ(p.transferred_rows, 10);
    EXPECT_FALSE(channel.pop(p));
    EXPECT_EQ(channel.dropped(), 2u);
}

TEST(ProgressChannelTest, PublishAfterCloseIsIgnored) {
    ProgressChannel channel;
    channel.close();
    channel.publish(loading(1, 1));
    EXPECT_EQ(channel.size(), 0u);
}

TEST(ProgressChannelTest, PopWaitsForPublisher) {
    ProgressChannel channel;
    std::thread producer([&] {
        for (int64_t i = 1; i <= 100; ++i) channel.publish(loading(i, 100));
        channel.publish(finished(100, 100));
        channel.close();
    });

    TransferProgress p;
    int64_t last = 0;
    bool saw_terminal = false;
    while (channel.pop(p)) {
        EXPECT_GE(p.transferred_rows, last);
        last = p.transferred_rows;
        saw_terminal = p.is_complete;
    }
    producer.join();

    EXPECT_TRUE(saw_terminal);
    EXPECT_EQ(last, 100);
}

TEST(CancellationTokenTest, CancelAndReset) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
    token.reset();
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTokenTest, VisibleAcrossThreads) {
    CancellationToken token;
    std::thread t([&] { token.cancel(); });
    t.join();
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CallbackProgressSinkTest, ForwardsSnapshots) {
    std::vector<int64_t> seen;
    CallbackProgressSink sink([&](const TransferProgress& p) {
        seen.push_back(p.transferred_rows);
    });
    sink.publish(loading(3, 9));
    sink.publish(loading(6, 9));
    EXPECT_EQ(seen, (std::vector<int64_t>{3, 6}));

    CallbackProgressSink empty(nullptr);
    EXPECT_NO_THROW(empty.publish(loading(1, 1)));
}

TEST(StartWorkerTest, ClosesChannelWhenTheJobFinishes) {
    ProgressChannel channel;
    TransferResult result;
    std::thread worker = start_worker([&] {
        channel.publish(finished(3, 3));
        TransferResult r;
        r.success          = true;
        r.transferred_rows = 3;
        return r;
    }, channel, result);

    TransferProgress p;
    int seen = 0;
    while (channel.pop(p)) ++seen;
    worker.join();

    EXPECT_EQ(seen, 1);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.transferred_rows, 3);
}

TEST(StartWorkerTest, ThrowingJobStillClosesChannel) {
    ProgressChannel channel;
    TransferResult result;
    std::thread worker = start_worker([&]() -> TransferResult {
        channel.publish(loading(1, 10));
        throw std::runtime_error("driver crashed");
    }, channel, result);

    TransferProgress p;
    while (channel.pop(p)) {
    }
    worker.join();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Internal);
    EXPECT_EQ(result.final_state, TransferState::Failed);
    EXPECT_NE(result.error_message.find("driver crashed"), std::string::npos);
}
