// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZSnap snapshot streaming for multi-group Raft.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <memory>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "common/Error.hpp"
#include "common/TransportConfig.hpp"
#include "transport/SnapshotSender.hpp"
#include "transport/Types.hpp"
#include "transport/TestDoubles.hpp"

using zsnap::Chunk;
using zsnap::Error;
using zsnap::ErrorCode;
using zsnap::SnapshotSender;
using zsnap::SubmitResult;
using ::testing::_;
using ::testing::Invoke;

namespace {

struct Status {
    std::uint64_t groupId;
    std::uint64_t nodeId;
    bool rejected;
};

class StatusLog {
public:
    zsnap::StatusHandler handler() {
        return [this](std::uint64_t groupId, std::uint64_t nodeId, bool rejected) {
            std::lock_guard<std::mutex> lock {m};
            statuses.push_back(Status{groupId, nodeId, rejected});
            cv.notify_all();
        };
    }

    std::vector<Status> waitFor(std::size_t n) {
        std::unique_lock<std::mutex> lock {m};
        cv.wait_for(lock, std::chrono::seconds{5}, [this, n] { return statuses.size() >= n; });
        return statuses;
    }
private:
    std::mutex m;
    std::condition_variable cv;
    std::vector<Status> statuses;
};

zsnap::SnapshotDescriptor snapshot(std::uint64_t groupId, std::uint64_t fileSize) {
    zsnap::SnapshotDescriptor s;
    s.groupId = groupId;
    s.nodeId = 3;
    s.from = 1;
    s.index = 42;
    s.term = 2;
    s.filepath = "/snapshots/" + std::to_string(groupId);
    s.fileSize = fileSize;
    return s;
}

class SnapshotSenderTest : public ::testing::Test {
protected:
    FakePeer peer;
    FakeConnectionFactory factory {peer};
    MockChunkLoader loader;
    StatusLog log;
    zsnap::TransportConfig config {9, 4, 2};
};

} // namespace

TEST_F(SnapshotSenderTest, BatchTransferReportsSuccess) {
    EXPECT_CALL(loader, load(_, _)).Times(3).WillRepeatedly(Invoke(loadFrom({"AAAA", "BBBB", "CC"})));
    SnapshotSender sender {config, factory, loader, log.handler()};
    sender.sendSnapshot(snapshot(5, 10), "peer-3:50061");

    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_EQ(statuses[0].groupId, 5);
    EXPECT_EQ(statuses[0].nodeId, 3);
    EXPECT_FALSE(statuses[0].rejected);
    EXPECT_EQ(peer.payloads(), (std::vector<std::string>{"AAAA", "BBBB", "CC"}));
    EXPECT_EQ(peer.addresses, std::vector<std::string>{"peer-3:50061"});
    sender.stop();
    EXPECT_EQ(peer.closed, 1);
    EXPECT_EQ(sender.inflight(), 0);
}

TEST_F(SnapshotSenderTest, BatchConnectFailureIsRejected) {
    peer.connectError = Error {ErrorCode::ServiceTemporarilyUnavailable, "Could not connect to service @peer-3"};
    SnapshotSender sender {config, factory, loader, log.handler()};
    sender.sendSnapshot(snapshot(5, 10), "peer-3:50061");

    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_TRUE(statuses[0].rejected);
    EXPECT_EQ(peer.sentCount(), 0);
}

TEST_F(SnapshotSenderTest, BatchSendFailureIsRejected) {
    EXPECT_CALL(loader, load(_, _)).WillRepeatedly(Invoke(loadFrom({"AAAA", "BBBB", "CC"})));
    peer.failAt = 0;
    SnapshotSender sender {config, factory, loader, log.handler()};
    sender.sendSnapshot(snapshot(5, 10), "peer-3:50061");

    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_TRUE(statuses[0].rejected);
}

TEST_F(SnapshotSenderTest, HooksApplyToNewTransfers) {
    EXPECT_CALL(loader, load(_, _)).WillRepeatedly(Invoke(loadFrom({"AAAA", "BBBB", "CC"})));
    std::mutex m;
    std::vector<std::uint64_t> observed;
    SnapshotSender sender {config, factory, loader, log.handler()};
    sender.setPreSendHook([](const Chunk& c) { return std::make_pair(c, c.chunkId != 0); });
    sender.setPostSendObserver([&](const Chunk& c) {
        std::lock_guard<std::mutex> lock {m};
        observed.push_back(c.chunkId);
    });
    sender.sendSnapshot(snapshot(5, 10), "peer-3:50061");

    ASSERT_EQ(log.waitFor(1).size(), 1);
    sender.stop();
    EXPECT_EQ(peer.payloads(), (std::vector<std::string>{"BBBB", "CC"}));
    std::lock_guard<std::mutex> lock {m};
    EXPECT_EQ(observed, (std::vector<std::uint64_t>{1, 2}));
}

TEST_F(SnapshotSenderTest, StreamSinkCarriesGeneratedChunks) {
    SnapshotSender sender {config, factory, loader, log.handler()};
    auto sink = sender.getStreamSink(7, 3, "peer-3:50061");
    ASSERT_TRUE(sink.has_value()) << sink.error();
    EXPECT_EQ(sink->sourceGroupId(), 7);
    EXPECT_EQ(sink->destinationNodeId(), 3);

    for (std::uint64_t i = 0; i < 5; ++i) {
        ASSERT_EQ(sink->receive(streamChunk(i, "chunk-" + std::to_string(i))), SubmitResult::Accepted);
    }
    ASSERT_EQ(sink->receive(streamChunk(5, "", zsnap::LastChunkCount)), SubmitResult::Accepted);

    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_EQ(statuses[0].groupId, 7);
    EXPECT_FALSE(statuses[0].rejected);
    EXPECT_EQ(peer.sentCount(), 6);
}

TEST_F(SnapshotSenderTest, StreamPoisonIsRejected) {
    SnapshotSender sender {config, factory, loader, log.handler()};
    auto sink = sender.getStreamSink(7, 3, "peer-3:50061");
    ASSERT_TRUE(sink.has_value());
    ASSERT_EQ(sink->receive(zsnap::poisonChunk(7, 3)), SubmitResult::Accepted);

    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_TRUE(statuses[0].rejected);
    EXPECT_EQ(peer.sentCount(), 0);
}

TEST_F(SnapshotSenderTest, StreamConnectFailureIsRejected) {
    peer.connectError = Error {ErrorCode::ServiceTemporarilyUnavailable, "Could not connect to service @peer-3"};
    SnapshotSender sender {config, factory, loader, log.handler()};
    auto sink = sender.getStreamSink(7, 3, "peer-3:50061");
    ASSERT_FALSE(sink.has_value());
    EXPECT_EQ(sink.error().code, ErrorCode::ServiceTemporarilyUnavailable);

    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_TRUE(statuses[0].rejected);
}

TEST_F(SnapshotSenderTest, StopReleasesStalledTransfers) {
    peer.hold = true;
    SnapshotSender sender {config, factory, loader, log.handler()};
    auto sink = sender.getStreamSink(7, 3, "peer-3:50061");
    ASSERT_TRUE(sink.has_value());
    std::vector<SubmitResult> results;
    std::thread generator([&] {
        for (std::uint64_t i = 0; i < 50; ++i) {
            results.push_back(sink->receive(streamChunk(i, "chunk-" + std::to_string(i))));
            if (results.back() != SubmitResult::Accepted) {
                return;
            }
        }
    });
    ASSERT_TRUE(peer.waitForWaiting(1));
    EXPECT_EQ(sender.inflight(), 1);

    sender.stop();
    generator.join();
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results.back(), SubmitResult::RejectedByShutdown);
    const auto statuses = log.waitFor(1);
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_TRUE(statuses[0].rejected);
    EXPECT_EQ(sender.inflight(), 0);
    EXPECT_EQ(sink->receive(streamChunk(99, "late")), SubmitResult::RejectedByShutdown);
}

TEST_F(SnapshotSenderTest, FinishedStreamsAreReleased) {
    peer.failAt = 0;
    // Every connection holds a copy of the hook, so the token's use count
    // tracks how many connections are alive.
    auto token = std::make_shared<int>(0);
    SnapshotSender sender {config, factory, loader, log.handler()};
    sender.setPreSendHook([token](const Chunk& c) { return std::make_pair(c, true); });
    ASSERT_EQ(token.use_count(), 2);

    for (std::uint64_t n = 0; n < 5; ++n) {
        auto sink = sender.getStreamSink(7, 3, "peer-3:50061");
        ASSERT_TRUE(sink.has_value());
        for (std::uint64_t i = 0; i < 50; ++i) {
            if (sink->receive(streamChunk(i, std::string(1024, 'x'))) != SubmitResult::Accepted) {
                break;
            }
        }
        ASSERT_EQ(log.waitFor(n + 1).size(), n + 1);
        std::lock_guard<std::mutex> lock {peer.m};
        peer.failAt = 0;
    }
    sender.stop();

    EXPECT_EQ(sender.inflight(), 0);
    EXPECT_EQ(token.use_count(), 2);
    for (const auto& s : log.waitFor(5)) {
        EXPECT_TRUE(s.rejected);
    }
}

TEST_F(SnapshotSenderTest, SinkOutlivesReapedTransfer) {
    peer.failAt = 0;
    SnapshotSender sender {config, factory, loader, log.handler()};
    auto sink = sender.getStreamSink(7, 3, "peer-3:50061");
    ASSERT_TRUE(sink.has_value());
    ASSERT_EQ(sink->receive(streamChunk(0, "chunk-0")), SubmitResult::Accepted);
    ASSERT_EQ(log.waitFor(1).size(), 1);
    sender.stop();
    EXPECT_EQ(sender.inflight(), 0);

    EXPECT_EQ(sink->destinationNodeId(), 3);
    EXPECT_EQ(sink->receive(streamChunk(1, "chunk-1")), SubmitResult::RejectedByShutdown);
}
