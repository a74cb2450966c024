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
#include <cstdint>
#include <string>
#include "common/Error.hpp"
#include "server/SnapshotReceiver.hpp"
#include "transport/Types.hpp"

using zsnap::Chunk;
using zsnap::ErrorCode;
using zsnap::SnapshotReceiver;

namespace {
    Chunk chunk(std::uint64_t id, std::uint64_t count) {
        Chunk c;
        c.groupId = 4;
        c.nodeId = 2;
        c.from = 1;
        c.deploymentId = 9;
        c.index = 77;
        c.chunkId = id;
        c.chunkCount = count;
        c.data = "payload";
        return c;
    }
} // namespace

TEST(SnapshotReceiverTest, BatchStreamCompletesOnLastChunk) {
    SnapshotReceiver receiver {9};
    EXPECT_EQ(receiver.record(chunk(0, 3)), false);
    EXPECT_EQ(receiver.record(chunk(1, 3)), false);
    EXPECT_FALSE(receiver.done());
    EXPECT_EQ(receiver.record(chunk(2, 3)), true);
    EXPECT_TRUE(receiver.done());
    EXPECT_EQ(receiver.received(), 3);
}

TEST(SnapshotReceiverTest, StreamedSnapshotCompletesOnSentinel) {
    SnapshotReceiver receiver {9};
    EXPECT_EQ(receiver.record(chunk(0, 0)), false);
    EXPECT_EQ(receiver.record(chunk(1, 0)), false);
    EXPECT_EQ(receiver.record(chunk(2, zsnap::LastChunkCount)), true);
    EXPECT_TRUE(receiver.done());
}

TEST(SnapshotReceiverTest, RejectsChunkAfterLast) {
    SnapshotReceiver receiver {9};
    ASSERT_EQ(receiver.record(chunk(0, 1)), true);
    auto r = receiver.record(chunk(1, 1));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArg);
}

TEST(SnapshotReceiverTest, RejectsForeignDeployment) {
    SnapshotReceiver receiver {10};
    auto r = receiver.record(chunk(0, 3));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(receiver.received(), 0);
}

TEST(SnapshotReceiverTest, RejectsOutOfOrderChunk) {
    SnapshotReceiver receiver {9};
    ASSERT_TRUE(receiver.record(chunk(0, 3)).has_value());
    auto r = receiver.record(chunk(2, 3));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(r.error().what, "out of order chunk 2, want 1");
}

TEST(SnapshotReceiverTest, RejectsChunkOfAnotherSnapshot) {
    SnapshotReceiver receiver {9};
    ASSERT_TRUE(receiver.record(chunk(0, 3)).has_value());
    auto other = chunk(1, 3);
    other.index = 78;
    auto r = receiver.record(other);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().what, "chunk belongs to another snapshot");
}

TEST(SnapshotReceiverTest, PoisonAbortsStream) {
    SnapshotReceiver receiver {9};
    ASSERT_TRUE(receiver.record(chunk(0, 0)).has_value());
    auto poison = zsnap::poisonChunk(4, 2);
    poison.deploymentId = 9;
    auto r = receiver.record(poison);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::StreamSnapshotFailed);
    EXPECT_FALSE(receiver.done());
}
