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
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include "transport/BoundedChannel.hpp"

using zsnap::BoundedChannel;

namespace {
    auto never() {
        return [] { return false; };
    }
} // namespace

TEST(BoundedChannelTest, ZeroCapacityThrows) {
    EXPECT_THROW(BoundedChannel<int>{0}, std::invalid_argument);
}

TEST(BoundedChannelTest, FifoOrder) {
    BoundedChannel<int> ch {3};
    EXPECT_TRUE(ch.send(1, never()));
    EXPECT_TRUE(ch.send(2, never()));
    EXPECT_TRUE(ch.send(3, never()));
    EXPECT_EQ(ch.size(), 3);
    EXPECT_EQ(ch.receive(never()), 1);
    EXPECT_EQ(ch.receive(never()), 2);
    EXPECT_EQ(ch.receive(never()), 3);
    EXPECT_EQ(ch.size(), 0);
}

TEST(BoundedChannelTest, TrySendFailsWhenFull) {
    BoundedChannel<int> ch {2};
    EXPECT_TRUE(ch.trySend(1));
    EXPECT_TRUE(ch.trySend(2));
    EXPECT_FALSE(ch.trySend(3));
    EXPECT_EQ(ch.size(), 2);
    EXPECT_EQ(ch.capacity(), 2);
}

TEST(BoundedChannelTest, SendBlocksUntilSpace) {
    BoundedChannel<int> ch {1};
    ASSERT_TRUE(ch.trySend(1));
    std::atomic<bool> sent {false};
    std::thread producer([&] {
        EXPECT_TRUE(ch.send(2, never()));
        sent = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{50L});
    EXPECT_FALSE(sent.load());
    EXPECT_EQ(ch.receive(never()), 1);
    producer.join();
    EXPECT_TRUE(sent.load());
    EXPECT_EQ(ch.receive(never()), 2);
}

TEST(BoundedChannelTest, InterruptReleasesBlockedSender) {
    BoundedChannel<int> ch {1};
    ASSERT_TRUE(ch.trySend(1));
    std::atomic<bool> interrupted {false};
    std::optional<bool> result;
    std::thread producer([&] {
        result = ch.send(2, [&] { return interrupted.load(); });
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{20L});
    interrupted = true;
    ch.wake();
    producer.join();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(*result);
    EXPECT_EQ(ch.size(), 1);
}

TEST(BoundedChannelTest, InterruptedSendRejectsEvenWithSpace) {
    BoundedChannel<int> ch {4};
    EXPECT_FALSE(ch.send(1, [] { return true; }));
    EXPECT_EQ(ch.size(), 0);
}

TEST(BoundedChannelTest, InterruptReleasesBlockedReceiver) {
    BoundedChannel<int> ch {1};
    std::atomic<bool> interrupted {false};
    std::optional<int> result = 42;
    std::thread consumer([&] {
        result = ch.receive([&] { return interrupted.load(); });
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{20L});
    interrupted = true;
    ch.wake();
    consumer.join();
    EXPECT_FALSE(result.has_value());
}

TEST(BoundedChannelTest, InterruptWinsOverQueuedValues) {
    BoundedChannel<int> ch {2};
    ASSERT_TRUE(ch.trySend(1));
    EXPECT_FALSE(ch.receive([] { return true; }).has_value());
    EXPECT_EQ(ch.size(), 1);
}

TEST(BoundedChannelTest, ClearDropsQueuedValuesAndFreesSpace) {
    BoundedChannel<int> ch {2};
    ASSERT_TRUE(ch.trySend(1));
    ASSERT_TRUE(ch.trySend(2));
    EXPECT_EQ(ch.clear(), 2);
    EXPECT_EQ(ch.size(), 0);
    EXPECT_TRUE(ch.trySend(3));
    EXPECT_EQ(ch.receive(never()), 3);
}
