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
#ifndef SRC_SERVER_SNAPSHOTSERVICEIMPL_HPP
#define SRC_SERVER_SNAPSHOTSERVICEIMPL_HPP

#include <cstdint>
#include <functional>
#include <grpcpp/grpcpp.h>
#include "proto/snapshot.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "transport/Types.hpp"

namespace zsnap {

// Called for every chunk that passed validation. May run on several gRPC
// threads at once, one per incoming stream.
using ChunkHandler = std::function<void(const Chunk&)>;

class SnapshotServiceImpl final : public proto::SnapshotService::Service {
public:
    SnapshotServiceImpl(std::uint64_t deploymentId, ChunkHandler h);
    grpc::Status sendSnapshot(
        grpc::ServerContext* context,
        grpc::ServerReader<proto::SnapshotChunk>* reader,
        proto::SnapshotAck* reply) override;
private:
    std::uint64_t deploymentId;
    ChunkHandler handler;
};

using SnapshotServer = RPCServer<SnapshotServiceImpl>;

} // namespace zsnap

#endif // SRC_SERVER_SNAPSHOTSERVICEIMPL_HPP
