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
#include "transport/Connection.hpp"
#include "transport/Splitter.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zsnap {

namespace {

// Broken invariants between splitting, queue sizing and ordering end the
// process.
[[noreturn]] void fatal(const std::string& msg) {
    spdlog::critical(msg);
    std::abort();
}

} // namespace

std::ostream& operator<<(std::ostream& os, const SubmitResult& r) {
    switch (r) {
        case SubmitResult::Accepted: return os << "Accepted";
        case SubmitResult::RejectedByFailure: return os << "RejectedByFailure";
        case SubmitResult::RejectedByShutdown: return os << "RejectedByShutdown";
    }
    std::unreachable();
}

Connection::Connection(
    std::uint64_t groupId,
    std::uint64_t nodeId,
    Mode mode,
    std::size_t capacity,
    const TransportConfig& c,
    ConnectionFactory& f,
    ChunkLoader& l,
    std::stop_token s)
    : group {groupId},
      node {nodeId},
      transferMode {mode},
      config {c},
      factory {f},
      loader {l},
      stopped {std::move(s)},
      queue {mode == Mode::Streaming ? c.streamingQueueCapacity : capacity},
      stopWaker {stopped, [this] { queue.wake(); }},
      failWaker {failedSource.get_token(), [this] { queue.wake(); }} {}

std::expected<std::monostate, Error> Connection::connect(const std::string& address) {
    auto result = factory.getConnection(stopped, address);
    if (!result.has_value()) {
        spdlog::error("failed to get a connection to {}, {}", address, result.error().what);
        return std::unexpected {result.error()};
    }
    conn = std::move(result.value());
    return {};
}

void Connection::submitWhole(const SnapshotDescriptor& snapshot) {
    if (transferMode != Mode::Batch) {
        throw std::logic_error("Connection::submitWhole: not a batch connection");
    }
    auto chunks = splitSnapshot(snapshot, config.chunkSize);
    if (chunks.size() != queue.capacity()) {
        fatal("cap of queue is " + std::to_string(queue.capacity()) +
              ", want " + std::to_string(chunks.size()));
    }
    for (auto& chunk : chunks) {
        if (!queue.trySend(std::move(chunk))) {
            fatal("batch queue of " + describeNode(group, node) + " is already full");
        }
    }
}

SubmitResult Connection::submit(Chunk chunk) {
    const auto accepted = queue.send(std::move(chunk), [this] {
        return stopped.stop_requested() || failedSource.stop_requested();
    });
    if (accepted) {
        return SubmitResult::Accepted;
    }
    if (stopped.stop_requested()) {
        return SubmitResult::RejectedByShutdown;
    }
    return SubmitResult::RejectedByFailure;
}

std::expected<std::monostate, Error> Connection::process() {
    if (!conn) {
        throw std::logic_error("Connection::process: not connected");
    }
    PreSendHook pre;
    PostSendObserver post;
    {
        std::lock_guard<std::mutex> lock {hookMutex};
        if (started) {
            throw std::logic_error("Connection::process: already started");
        }
        started = true;
        pre = preSendHook;
        post = postSendObserver;
    }
    auto result = transferMode == Mode::Streaming
        ? streamSnapshot(pre)
        : processSavedSnapshot(pre, post);
    if (!result.has_value()) {
        const auto code = result.error().code;
        if (code != ErrorCode::Stopped && code != ErrorCode::StreamSnapshotFailed) {
            // Releases producers blocked on a full queue.
            failedSource.request_stop();
        }
    }
    return result;
}

std::expected<std::monostate, Error> Connection::streamSnapshot(const PreSendHook& pre) {
    std::uint64_t next = 0;
    for (;;) {
        auto chunk = queue.receive([this] { return stopped.stop_requested(); });
        if (!chunk.has_value()) {
            return std::unexpected {stoppedError()};
        }
        chunk->deploymentId = config.deploymentId;
        if (chunk->isPoison()) {
            spdlog::info("{}: poison chunk received", describeNode(group, node));
            return std::unexpected {streamSnapshotError()};
        }
        checkOrder(*chunk, next++);
        auto sent = sendChunk(*chunk, pre);
        if (!sent.has_value() && sent.error().code != ErrorCode::ChunkSendSkipped) {
            if (stopped.stop_requested()) {
                return std::unexpected {stoppedError()};
            }
            spdlog::error("stream snapshot chunk to {} failed, {}",
                describeNode(chunk->groupId, chunk->nodeId), sent.error().what);
            return sent;
        }
        if (chunk->isLastStreamed()) {
            spdlog::info("{}: streamed {} chunks", describeNode(group, node), next);
            return {};
        }
    }
}

std::expected<std::monostate, Error> Connection::processSavedSnapshot(const PreSendHook& pre, const PostSendObserver& post) {
    std::vector<Chunk> chunks;
    for (;;) {
        auto chunk = queue.receive([this] { return stopped.stop_requested(); });
        if (!chunk.has_value()) {
            return std::unexpected {stoppedError()};
        }
        if (chunks.empty() && chunk->chunkId != 0) {
            fatal("chunk alignment error");
        }
        checkOrder(*chunk, chunks.size());
        const auto last = chunk->isLastSaved();
        chunks.push_back(std::move(*chunk));
        if (last) {
            return sendChunks(std::move(chunks), pre, post);
        }
    }
}

std::expected<std::monostate, Error> Connection::sendChunks(std::vector<Chunk> chunks, const PreSendHook& pre, const PostSendObserver& post) {
    for (auto& chunk : chunks) {
        if (stopped.stop_requested()) {
            return std::unexpected {stoppedError()};
        }
        std::string buffer(config.chunkSize, '\0');
        auto loaded = loader.load(chunk, buffer);
        if (!loaded.has_value()) {
            spdlog::error("failed to read the snapshot chunk, {}", loaded.error().what);
            return std::unexpected {loaded.error()};
        }
        buffer.resize(loaded.value());
        chunk.data = std::move(buffer);
        chunk.deploymentId = config.deploymentId;
        auto sent = sendChunk(chunk, pre);
        if (sent.has_value() && post) {
            post(chunk);
        }
        chunk.data.clear();
        chunk.data.shrink_to_fit();
        if (!sent.has_value() && sent.error().code != ErrorCode::ChunkSendSkipped) {
            if (stopped.stop_requested()) {
                return std::unexpected {stoppedError()};
            }
            spdlog::debug("snapshot to {} failed, {}", describeNode(chunk.groupId, chunk.nodeId), sent.error().what);
            return sent;
        }
    }
    spdlog::info("{}: sent {} snapshot chunks", describeNode(group, node), chunks.size());
    return {};
}

std::expected<std::monostate, Error> Connection::sendChunk(const Chunk& chunk, const PreSendHook& pre) {
    if (pre) {
        auto [updated, shouldSend] = pre(chunk);
        if (!shouldSend) {
            spdlog::debug("{}: chunk {} not sent", describeNode(chunk.groupId, chunk.nodeId), chunk.chunkId);
            return std::unexpected {chunkSendSkippedError()};
        }
        return conn->send(updated);
    }
    return conn->send(chunk);
}

void Connection::checkOrder(const Chunk& chunk, std::uint64_t expected) const {
    if (chunk.chunkId != expected) {
        fatal(describeNode(group, node) + ": out of order chunk " + std::to_string(chunk.chunkId) +
              ", want " + std::to_string(expected));
    }
}

void Connection::close() {
    if (conn) {
        conn->close();
        conn.reset();
    }
    if (const auto dropped = queue.clear(); dropped > 0) {
        spdlog::debug("{}: dropped {} queued chunks", describeNode(group, node), dropped);
    }
}

void Connection::setPreSendHook(PreSendHook hook) {
    std::lock_guard<std::mutex> lock {hookMutex};
    if (started) {
        throw std::logic_error("Connection::setPreSendHook: transfer already started");
    }
    preSendHook = std::move(hook);
}

void Connection::setPostSendObserver(PostSendObserver observer) {
    std::lock_guard<std::mutex> lock {hookMutex};
    if (started) {
        throw std::logic_error("Connection::setPostSendObserver: transfer already started");
    }
    postSendObserver = std::move(observer);
}

} // namespace zsnap
