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
#include "transport/GrpcSnapshotConnection.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "proto/snapshot.grpc.pb.h"
#include <spdlog/spdlog.h>
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <utility>

namespace zsnap {

GrpcSnapshotConnection::GrpcSnapshotConnection(std::shared_ptr<grpc::Channel> c, std::chrono::milliseconds timeout, std::stop_token stop)
    : channel {std::move(c)},
      stub {proto::SnapshotService::NewStub(channel)},
      canceller {stop, [this] { context.TryCancel(); }} {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
    writer = stub->sendSnapshot(&context, &ack);
}

GrpcSnapshotConnection::~GrpcSnapshotConnection() {
    if (!finished) {
        context.TryCancel();
        auto status = finish();
        spdlog::debug("snapshot stream dropped before close: {}", status.error_message());
    }
}

std::expected<std::monostate, Error> GrpcSnapshotConnection::send(const Chunk& chunk) {
    if (finished) {
        return std::unexpected {Error{ErrorCode::Cancelled, "snapshot stream already finished"}};
    }
    if (writer->Write(chunk.toProto())) {
        return {};
    }
    auto result = toExpected(finish());
    if (result.has_value()) {
        return std::unexpected {Error{ErrorCode::Unknown, "snapshot stream closed by peer"}};
    }
    return result;
}

void GrpcSnapshotConnection::close() {
    if (finished) {
        return;
    }
    writer->WritesDone();
    auto result = toExpected(finish());
    if (!result.has_value()) {
        spdlog::error("snapshot stream finished with {}", result.error().what);
    }
}

grpc::Status GrpcSnapshotConnection::finish() {
    finished = true;
    return writer->Finish();
}

GrpcConnectionFactory::GrpcConnectionFactory(const TransportConfig& c) : config {c} {}

std::expected<std::unique_ptr<SnapshotConnection>, Error> GrpcConnectionFactory::getConnection(
    std::stop_token stop, const std::string& address) {
    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + config.channelTimeout)) {
        return std::unexpected {Error{ErrorCode::ServiceTemporarilyUnavailable, "Could not connect to service @" + address}};
    }
    if (stop.stop_requested()) {
        return std::unexpected {stoppedError()};
    }
    return std::make_unique<GrpcSnapshotConnection>(std::move(channel), config.snapshotTimeout, std::move(stop));
}

} // namespace zsnap
