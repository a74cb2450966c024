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
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <string>
#include <system_error>
#include <spdlog/spdlog.h>
#include "common/TransportConfig.hpp"
#include "server/SnapshotServiceImpl.hpp"
#include "transport/ChunkLoader.hpp"
#include "transport/GrpcSnapshotConnection.hpp"
#include "transport/SnapshotSender.hpp"

using zsnap::Chunk;
using zsnap::FileChunkLoader;
using zsnap::GrpcConnectionFactory;
using zsnap::SnapshotDescriptor;
using zsnap::SnapshotSender;
using zsnap::SnapshotServer;
using zsnap::SnapshotServiceImpl;
using zsnap::TransportConfig;

int main(int argc, char** argv) {
    if (argc < 2) {
        spdlog::error("usage: {} <snapshot file> [listen address]", argv[0]);
        return 1;
    }
    const std::string snapshotPath {argv[1]};
    const std::string listenAddress {argc > 2 ? argv[2] : "localhost:50061"};
    std::error_code ec;
    const auto size = std::filesystem::file_size(snapshotPath, ec);
    if (ec) {
        spdlog::error("cannot stat {}: {}", snapshotPath, ec.message());
        return 1;
    }
    spdlog::info("ZSnap! Sending {} ({} bytes) to {}", snapshotPath, size, listenAddress);

    const TransportConfig config {1};
    std::atomic<std::uint64_t> bytes {0};
    SnapshotServiceImpl service {config.deploymentId, [&bytes](const Chunk& c) {
        bytes += c.data.size();
    }};
    SnapshotServer server {listenAddress, service, config.maxMessageSize()};

    std::promise<bool> outcome;
    FileChunkLoader loader {config.chunkSize};
    GrpcConnectionFactory factory {config};
    SnapshotSender sender {config, factory, loader, [&outcome](std::uint64_t, std::uint64_t, bool rejected) {
        outcome.set_value(rejected);
    }};

    SnapshotDescriptor snapshot;
    snapshot.groupId = 1;
    snapshot.nodeId = 2;
    snapshot.from = 1;
    snapshot.filepath = snapshotPath;
    snapshot.fileSize = size;
    sender.sendSnapshot(snapshot, listenAddress);

    const auto rejected = outcome.get_future().get();
    spdlog::info("transfer {}, receiver got {} bytes", rejected ? "rejected" : "done", bytes.load());
    sender.stop();
    server.shutdown();
    return rejected ? 1 : 0;
}
