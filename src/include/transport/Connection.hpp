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
#ifndef TRANSPORT_CONNECTION_H
#define TRANSPORT_CONNECTION_H

#include "common/Error.hpp"
#include "common/TransportConfig.hpp"
#include "transport/BoundedChannel.hpp"
#include "transport/ChunkLoader.hpp"
#include "transport/SnapshotConnection.hpp"
#include "transport/Types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace zsnap {

enum class Mode {
    // The whole snapshot is on disk; it is split and queued in one go.
    Batch,
    // Chunks are produced live by a generator writing into a Sink.
    Streaming
};

enum class SubmitResult {
    Accepted,
    // The consumer already failed; stop producing.
    RejectedByFailure,
    // Shutdown was requested; stop producing.
    RejectedByShutdown
};

std::ostream& operator<<(std::ostream& os, const SubmitResult& r);

// Returns the chunk to send in place of the given one, and whether to send it.
using PreSendHook = std::function<std::pair<Chunk, bool>(const Chunk&)>;
// Called with every chunk sent successfully by the batch path.
using PostSendObserver = std::function<void(const Chunk&)>;

// Moves one snapshot to one peer. Producers submit chunks into a bounded
// queue; process() drains it into the peer connection until the last chunk is
// sent, the producer aborts, a send fails or the shared stop token fires.
// A Connection carries exactly one transfer and is not reused.
class Connection {
public:
    Connection(
        std::uint64_t groupId,
        std::uint64_t nodeId,
        Mode mode,
        std::size_t capacity,
        const TransportConfig& config,
        ConnectionFactory& factory,
        ChunkLoader& loader,
        std::stop_token stopped);
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // No retry on failure.
    std::expected<std::monostate, Error> connect(const std::string& address);
    // Batch mode only. Aborts the process when the snapshot does not split
    // into exactly capacity() chunks.
    void submitWhole(const SnapshotDescriptor& snapshot);
    // Blocks while the queue is full.
    SubmitResult submit(Chunk chunk);
    std::expected<std::monostate, Error> process();
    // Closes the peer connection and drops chunks still queued.
    void close();

    // Hooks must be set before process() starts.
    void setPreSendHook(PreSendHook hook);
    void setPostSendObserver(PostSendObserver observer);

    [[nodiscard]] std::uint64_t groupId() const { return group; }
    [[nodiscard]] std::uint64_t nodeId() const { return node; }
    [[nodiscard]] Mode mode() const { return transferMode; }
    [[nodiscard]] std::size_t capacity() const { return queue.capacity(); }
    [[nodiscard]] std::size_t queued() const { return queue.size(); }
    [[nodiscard]] bool failed() const { return failedSource.stop_requested(); }
private:
    std::expected<std::monostate, Error> streamSnapshot(const PreSendHook& pre);
    std::expected<std::monostate, Error> processSavedSnapshot(const PreSendHook& pre, const PostSendObserver& post);
    std::expected<std::monostate, Error> sendChunks(std::vector<Chunk> chunks, const PreSendHook& pre, const PostSendObserver& post);
    std::expected<std::monostate, Error> sendChunk(const Chunk& chunk, const PreSendHook& pre);
    void checkOrder(const Chunk& chunk, std::uint64_t expected) const;
    std::uint64_t group;
    std::uint64_t node;
    Mode transferMode;
    TransportConfig config;
    ConnectionFactory& factory;
    ChunkLoader& loader;
    std::stop_token stopped;
    std::stop_source failedSource;
    BoundedChannel<Chunk> queue;
    std::unique_ptr<SnapshotConnection> conn;
    std::mutex hookMutex;
    bool started = false;
    PreSendHook preSendHook;
    PostSendObserver postSendObserver;
    std::stop_callback<std::function<void()>> stopWaker;
    std::stop_callback<std::function<void()>> failWaker;
};

} // namespace zsnap

#endif // TRANSPORT_CONNECTION_H
