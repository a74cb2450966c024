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
#ifndef SERVER_SNAPSHOT_RECEIVER_H
#define SERVER_SNAPSHOT_RECEIVER_H

#include "transport/Types.hpp"
#include "common/Error.hpp"
#include <cstdint>
#include <expected>
#include <optional>

namespace zsnap {

// Tracks the chunks of one incoming snapshot stream.
class SnapshotReceiver {
public:
    explicit SnapshotReceiver(std::uint64_t deploymentId);
    // Returns true once the chunk completing the snapshot was recorded.
    std::expected<bool, Error> record(const Chunk& chunk);
    [[nodiscard]] bool done() const { return complete; }
    [[nodiscard]] std::uint64_t received() const { return next; }
private:
    std::uint64_t deploymentId;
    std::optional<Chunk> first;
    std::uint64_t next = 0;
    bool complete = false;
};

} // namespace zsnap

#endif // SERVER_SNAPSHOT_RECEIVER_H
