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
#ifndef TRANSPORT_SNAPSHOT_SENDER_H
#define TRANSPORT_SNAPSHOT_SENDER_H

#include "transport/Connection.hpp"
#include "transport/Sink.hpp"
#include "transport/ChunkLoader.hpp"
#include "transport/SnapshotConnection.hpp"
#include "common/TransportConfig.hpp"
#include "common/Error.hpp"
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace zsnap {

// Reports how a transfer ended. rejected is true unless every chunk was sent.
// A peer that accepts every chunk and then fails the call when it is closed
// is only logged: the transfer is still reported with rejected == false.
using StatusHandler = std::function<void(std::uint64_t groupId, std::uint64_t nodeId, bool rejected)>;

// Runs snapshot transfers on their own threads. All connections share one
// stop source, fired by stop(). No retry: each call is one transfer.
class SnapshotSender {
public:
    SnapshotSender(const TransportConfig& c, ConnectionFactory& f, ChunkLoader& l, StatusHandler h);
    ~SnapshotSender();
    SnapshotSender(const SnapshotSender&) = delete;
    SnapshotSender& operator=(const SnapshotSender&) = delete;
    SnapshotSender(SnapshotSender&&) = delete;
    SnapshotSender& operator=(SnapshotSender&&) = delete;

    void sendSnapshot(const SnapshotDescriptor& snapshot, const std::string& address);
    std::expected<Sink, Error> getStreamSink(std::uint64_t groupId, std::uint64_t nodeId, const std::string& address);
    void setPreSendHook(PreSendHook hook);
    void setPostSendObserver(PostSendObserver observer);
    void stop();
    // Transfers still running. Finished ones are reaped on the way.
    [[nodiscard]] std::size_t inflight();
private:
    struct Job {
        std::shared_ptr<Connection> connection;
        std::thread worker;
        std::atomic<bool> done {false};
    };
    std::shared_ptr<Connection> newConnection(std::uint64_t groupId, std::uint64_t nodeId, Mode mode, std::size_t capacity);
    void finish(Job& job, const std::expected<std::monostate, Error>& result);
    void reap();
    TransportConfig config;
    ConnectionFactory& factory;
    ChunkLoader& loader;
    StatusHandler statusHandler;
    std::stop_source stopSource;
    std::mutex m;
    PreSendHook preSendHook;
    PostSendObserver postSendObserver;
    std::list<std::unique_ptr<Job>> jobs;
};

} // namespace zsnap

#endif // TRANSPORT_SNAPSHOT_SENDER_H
