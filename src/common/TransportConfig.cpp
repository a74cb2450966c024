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
#include "common/TransportConfig.hpp"
#include <stdexcept>
#include <chrono>
#include <algorithm>
#include <limits>

namespace zsnap {

TransportConfig::TransportConfig(
    std::uint64_t deployment,
    std::uint64_t chunk,
    std::size_t streamingCapacity,
    std::chrono::milliseconds channel,
    std::chrono::milliseconds snapshot)
    : deploymentId(deployment),
      chunkSize(chunk),
      streamingQueueCapacity(streamingCapacity),
      channelTimeout(channel),
      snapshotTimeout(snapshot) {
    if (chunk == 0) {
        throw std::invalid_argument("Chunk size must be > zero.");
    }
    if (streamingCapacity == 0) {
        throw std::invalid_argument("Streaming queue capacity must be > zero.");
    }
    if (channel < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Channel timeout must be >= zero.");
    }
    if (snapshot < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Snapshot timeout must be >= zero.");
    }
}

int TransportConfig::maxMessageSize() const {
    constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(limit, std::min(chunkSize, limit) + chunkMetadataHeadroom));
}

} // namespace zsnap
