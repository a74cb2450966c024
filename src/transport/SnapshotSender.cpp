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
#include "transport/SnapshotSender.hpp"
#include "transport/Splitter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace zsnap {

SnapshotSender::SnapshotSender(const TransportConfig& c, ConnectionFactory& f, ChunkLoader& l, StatusHandler h)
    : config {c}, factory {f}, loader {l}, statusHandler {std::move(h)} {}

SnapshotSender::~SnapshotSender() {
    stop();
}

std::shared_ptr<Connection> SnapshotSender::newConnection(std::uint64_t groupId, std::uint64_t nodeId, Mode mode, std::size_t capacity) {
    auto c = std::make_shared<Connection>(groupId, nodeId, mode, capacity, config, factory, loader, stopSource.get_token());
    if (preSendHook) {
        c->setPreSendHook(preSendHook);
    }
    if (postSendObserver) {
        c->setPostSendObserver(postSendObserver);
    }
    return c;
}

void SnapshotSender::sendSnapshot(const SnapshotDescriptor& snapshot, const std::string& address) {
    std::lock_guard<std::mutex> lock {m};
    reap();
    auto job = std::make_unique<Job>();
    job->connection = newConnection(snapshot.groupId, snapshot.nodeId, Mode::Batch,
        chunkCount(snapshot, config.chunkSize));
    auto* j = job.get();
    jobs.push_back(std::move(job));
    j->worker = std::thread([this, j, snapshot, address] {
        auto& c = *j->connection;
        auto connected = c.connect(address);
        if (!connected.has_value()) {
            finish(*j, connected);
            return;
        }
        c.submitWhole(snapshot);
        auto result = c.process();
        c.close();
        finish(*j, result);
    });
}

std::expected<Sink, Error> SnapshotSender::getStreamSink(std::uint64_t groupId, std::uint64_t nodeId, const std::string& address) {
    std::shared_ptr<Connection> c;
    {
        std::lock_guard<std::mutex> lock {m};
        c = newConnection(groupId, nodeId, Mode::Streaming, config.streamingQueueCapacity);
    }
    auto connected = c->connect(address);
    if (!connected.has_value()) {
        statusHandler(groupId, nodeId, true);
        return std::unexpected {connected.error()};
    }
    std::lock_guard<std::mutex> lock {m};
    reap();
    auto job = std::make_unique<Job>();
    job->connection = std::move(c);
    auto* j = job.get();
    jobs.push_back(std::move(job));
    j->worker = std::thread([this, j] {
        auto& conn = *j->connection;
        auto result = conn.process();
        conn.close();
        finish(*j, result);
    });
    return Sink {j->connection};
}

void SnapshotSender::finish(Job& job, const std::expected<std::monostate, Error>& result) {
    const auto& c = *job.connection;
    if (result.has_value()) {
        spdlog::info("snapshot to {} sent", describeNode(c.groupId(), c.nodeId()));
    } else {
        spdlog::error("snapshot to {} failed, {}", describeNode(c.groupId(), c.nodeId()), result.error().what);
    }
    statusHandler(c.groupId(), c.nodeId(), !result.has_value());
    job.done = true;
}

// Caller holds m. A streaming connection outlives its job while the
// generator still holds the Sink.
void SnapshotSender::reap() {
    for (auto it = jobs.begin(); it != jobs.end();) {
        auto& job = **it;
        if (job.done) {
            if (job.worker.joinable()) {
                job.worker.join();
            }
            it = jobs.erase(it);
        } else {
            ++it;
        }
    }
}

void SnapshotSender::setPreSendHook(PreSendHook hook) {
    std::lock_guard<std::mutex> lock {m};
    preSendHook = std::move(hook);
}

void SnapshotSender::setPostSendObserver(PostSendObserver observer) {
    std::lock_guard<std::mutex> lock {m};
    postSendObserver = std::move(observer);
}

void SnapshotSender::stop() {
    stopSource.request_stop();
    std::lock_guard<std::mutex> lock {m};
    for (auto& job : jobs) {
        if (job->worker.joinable()) {
            job->worker.join();
        }
    }
}

std::size_t SnapshotSender::inflight() {
    std::lock_guard<std::mutex> lock {m};
    reap();
    return static_cast<std::size_t>(std::count_if(jobs.begin(), jobs.end(),
        [](const std::unique_ptr<Job>& j) { return !j->done; }));
}

} // namespace zsnap
