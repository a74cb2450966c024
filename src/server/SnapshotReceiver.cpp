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
#include "server/SnapshotReceiver.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace zsnap {

SnapshotReceiver::SnapshotReceiver(std::uint64_t d) : deploymentId {d} {}

std::expected<bool, Error> SnapshotReceiver::record(const Chunk& chunk) {
    if (complete) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "chunk received after the last one"}};
    }
    if (chunk.deploymentId != deploymentId) {
        spdlog::error("{}: deployment id {} does not match local {}",
            describeNode(chunk.groupId, chunk.nodeId), chunk.deploymentId, deploymentId);
        return std::unexpected {Error{ErrorCode::InvalidArg, "deployment id mismatch"}};
    }
    if (chunk.isPoison()) {
        return std::unexpected {streamSnapshotError()};
    }
    if (chunk.chunkId != next) {
        return std::unexpected {Error{ErrorCode::InvalidArg,
            "out of order chunk " + std::to_string(chunk.chunkId) + ", want " + std::to_string(next)}};
    }
    if (first.has_value() && (chunk.groupId != first->groupId || chunk.nodeId != first->nodeId ||
                              chunk.from != first->from || chunk.index != first->index)) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "chunk belongs to another snapshot"}};
    }
    if (!first.has_value()) {
        first = chunk;
        first->data.clear();
    }
    ++next;
    complete = chunk.isLastStreamed() || chunk.isLastSaved();
    return complete;
}

} // namespace zsnap
