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
#ifndef TRANSPORT_CONFIG_H
#define TRANSPORT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace zsnap {

constexpr std::uint64_t defaultSnapshotChunkSize = 2UL * 1024 * 1024;
constexpr std::size_t defaultStreamingQueueCapacity = 16;
constexpr std::uint64_t chunkMetadataHeadroom = 64UL * 1024;

struct TransportConfig {
    TransportConfig(
        std::uint64_t deployment,
        std::uint64_t chunk = defaultSnapshotChunkSize,
        std::size_t streamingCapacity = defaultStreamingQueueCapacity,
        std::chrono::milliseconds channel = std::chrono::milliseconds{2000L},
        std::chrono::milliseconds snapshot = std::chrono::minutes{10L}
    );
    // Stamped on every chunk right before it is sent.
    std::uint64_t deploymentId;
    std::uint64_t chunkSize;
    std::size_t streamingQueueCapacity;
    std::chrono::milliseconds channelTimeout;
    std::chrono::milliseconds snapshotTimeout;

    // Largest message a chunk of chunkSize bytes needs on the wire, metadata
    // included. Receivers size their gRPC limit with it.
    [[nodiscard]] int maxMessageSize() const;
};

} // namespace zsnap

#endif // TRANSPORT_CONFIG_H
