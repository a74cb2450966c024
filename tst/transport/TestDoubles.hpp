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
#ifndef TST_TRANSPORT_TEST_DOUBLES_H
#define TST_TRANSPORT_TEST_DOUBLES_H

#include <gmock/gmock.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "transport/ChunkLoader.hpp"
#include "transport/SnapshotConnection.hpp"
#include "transport/Types.hpp"

// The far end of FakeConnection. Shared by every connection a
// FakeConnectionFactory hands out.
struct FakePeer {
    std::mutex m;
    std::condition_variable_any cv;
    std::vector<zsnap::Chunk> sent;
    std::vector<std::string> addresses;
    // Send number that fails, counting from 0.
    std::optional<std::size_t> failAt;
    // While true every send waits, until released or the stop token fires.
    bool hold = false;
    std::size_t waiting = 0;
    int closed = 0;
    std::optional<zsnap::Error> connectError;

    void release() {
        std::lock_guard<std::mutex> lock {m};
        hold = false;
        cv.notify_all();
    }

    std::size_t sentCount() {
        std::lock_guard<std::mutex> lock {m};
        return sent.size();
    }

    std::vector<std::string> payloads() {
        std::lock_guard<std::mutex> lock {m};
        std::vector<std::string> result;
        for (const auto& c : sent) {
            result.push_back(c.data);
        }
        return result;
    }

    bool waitForWaiting(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
        std::unique_lock<std::mutex> lock {m};
        return cv.wait_for(lock, timeout, [this, n] { return waiting >= n; });
    }
};

class FakeConnection : public zsnap::SnapshotConnection {
public:
    FakeConnection(FakePeer& p, std::stop_token s) : peer {p}, stop {std::move(s)} {}

    std::expected<std::monostate, zsnap::Error> send(const zsnap::Chunk& chunk) override {
        std::unique_lock<std::mutex> lock {peer.m};
        ++peer.waiting;
        peer.cv.notify_all();
        const auto released = peer.cv.wait(lock, stop, [this] { return !peer.hold; });
        --peer.waiting;
        if (!released) {
            return std::unexpected {zsnap::Error{zsnap::ErrorCode::Cancelled, "send cancelled"}};
        }
        if (peer.failAt.has_value() && peer.sent.size() == *peer.failAt) {
            peer.failAt.reset();
            return std::unexpected {zsnap::Error{zsnap::ErrorCode::ServiceTemporarilyUnavailable, "peer went away"}};
        }
        peer.sent.push_back(chunk);
        peer.cv.notify_all();
        return {};
    }

    void close() override {
        std::lock_guard<std::mutex> lock {peer.m};
        ++peer.closed;
    }
private:
    FakePeer& peer;
    std::stop_token stop;
};

class FakeConnectionFactory : public zsnap::ConnectionFactory {
public:
    explicit FakeConnectionFactory(FakePeer& p) : peer {p} {}

    std::expected<std::unique_ptr<zsnap::SnapshotConnection>, zsnap::Error> getConnection(
        std::stop_token stop, const std::string& address) override {
        std::lock_guard<std::mutex> lock {peer.m};
        peer.addresses.push_back(address);
        if (peer.connectError.has_value()) {
            return std::unexpected {*peer.connectError};
        }
        return std::make_unique<FakeConnection>(peer, std::move(stop));
    }
private:
    FakePeer& peer;
};

class MockChunkLoader : public zsnap::ChunkLoader {
public:
    MOCK_METHOD((std::expected<std::size_t, zsnap::Error>), load, (const zsnap::Chunk& chunk, std::string& buffer), (override));
};

// Loader action writing payloads[chunk.chunkId] into the buffer.
inline auto loadFrom(std::vector<std::string> payloads) {
    return [payloads](const zsnap::Chunk& chunk, std::string& buffer) -> std::expected<std::size_t, zsnap::Error> {
        const auto& p = payloads.at(chunk.chunkId);
        if (buffer.size() < p.size()) {
            buffer.resize(p.size());
        }
        buffer.replace(0, p.size(), p);
        return p.size();
    };
}

inline zsnap::Chunk streamChunk(std::uint64_t id, std::string data, std::uint64_t count = 0) {
    zsnap::Chunk c;
    c.groupId = 1;
    c.nodeId = 2;
    c.from = 1;
    c.chunkId = id;
    c.chunkCount = count;
    c.chunkSize = data.size();
    c.data = std::move(data);
    return c;
}

#endif // TST_TRANSPORT_TEST_DOUBLES_H
