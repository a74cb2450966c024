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
#ifndef TRANSPORT_GRPC_SNAPSHOT_CONNECTION_H
#define TRANSPORT_GRPC_SNAPSHOT_CONNECTION_H

#include "transport/SnapshotConnection.hpp"
#include "common/TransportConfig.hpp"
#include "common/Error.hpp"
#include <grpcpp/grpcpp.h>
#include <proto/snapshot.grpc.pb.h>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <variant>

namespace zsnap {

// One client-streaming sendSnapshot call. Each send() writes one message.
class GrpcSnapshotConnection : public SnapshotConnection {
public:
    GrpcSnapshotConnection(std::shared_ptr<grpc::Channel> c, std::chrono::milliseconds timeout, std::stop_token stop);
    GrpcSnapshotConnection(const GrpcSnapshotConnection&) = delete;
    GrpcSnapshotConnection& operator=(const GrpcSnapshotConnection&) = delete;
    ~GrpcSnapshotConnection() override;
    std::expected<std::monostate, Error> send(const Chunk& chunk) override;
    void close() override;
    // Chunks the peer acknowledged; set only when close() ended with OK.
    [[nodiscard]] std::uint64_t acknowledged() const { return ack.chunks(); }
private:
    grpc::Status finish();
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<proto::SnapshotService::Stub> stub;
    grpc::ClientContext context;
    proto::SnapshotAck ack;
    std::unique_ptr<grpc::ClientWriter<proto::SnapshotChunk>> writer;
    bool finished = false;
    std::stop_callback<std::function<void()>> canceller;
};

class GrpcConnectionFactory : public ConnectionFactory {
public:
    explicit GrpcConnectionFactory(const TransportConfig& c);
    std::expected<std::unique_ptr<SnapshotConnection>, Error> getConnection(
        std::stop_token stop, const std::string& address) override;
private:
    TransportConfig config;
};

} // namespace zsnap

#endif // TRANSPORT_GRPC_SNAPSHOT_CONNECTION_H
