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
#ifndef TRANSPORT_SNAPSHOT_CONNECTION_H
#define TRANSPORT_SNAPSHOT_CONNECTION_H

#include "transport/Types.hpp"
#include "common/Error.hpp"
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <variant>

namespace zsnap {

// An open channel to one peer that takes one chunk at a time.
class SnapshotConnection {
public:
    virtual ~SnapshotConnection() = default;
    virtual std::expected<std::monostate, Error> send(const Chunk& chunk) = 0;
    virtual void close() = 0;
};

class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;
    // stop cancels any call the returned connection has in flight.
    virtual std::expected<std::unique_ptr<SnapshotConnection>, Error> getConnection(
        std::stop_token stop, const std::string& address) = 0;
};

} // namespace zsnap

#endif // TRANSPORT_SNAPSHOT_CONNECTION_H
