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
#include "server/SnapshotServiceImpl.hpp"
#include "server/SnapshotReceiver.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace zsnap {

SnapshotServiceImpl::SnapshotServiceImpl(std::uint64_t d, ChunkHandler h)
    : deploymentId {d}, handler {std::move(h)} {}

grpc::Status SnapshotServiceImpl::sendSnapshot(
    grpc::ServerContext* /*context*/,
    grpc::ServerReader<proto::SnapshotChunk>* reader,
    proto::SnapshotAck* reply) {
    SnapshotReceiver receiver {deploymentId};
    proto::SnapshotChunk message;
    while (reader->Read(&message)) {
        const Chunk chunk {message};
        auto recorded = receiver.record(chunk);
        if (!recorded.has_value()) {
            spdlog::error("{}: rejected snapshot chunk {}, {}",
                describeNode(chunk.groupId, chunk.nodeId), chunk.chunkId, recorded.error().what);
            return toGrpcStatus(recorded.error());
        }
        if (handler) {
            handler(chunk);
        }
    }
    reply->set_chunks(receiver.received());
    if (!receiver.done()) {
        return toGrpcStatus(Error{ErrorCode::InvalidArg,
            "snapshot stream ended after " + std::to_string(receiver.received()) + " chunks"});
    }
    return grpc::Status::OK;
}

} // namespace zsnap
