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
#ifndef TRANSPORT_SINK_H
#define TRANSPORT_SINK_H

#include "transport/Connection.hpp"
#include "transport/Types.hpp"
#include <cstdint>
#include <memory>

namespace zsnap {

// What a live snapshot generator writes its chunks into. Shares ownership of
// the connection, so it stays usable after the transfer has ended.
class Sink {
public:
    explicit Sink(std::shared_ptr<Connection> c);
    SubmitResult receive(Chunk chunk);
    // Group the snapshot belongs to.
    [[nodiscard]] std::uint64_t sourceGroupId() const;
    // Node that is meant to receive the chunks.
    [[nodiscard]] std::uint64_t destinationNodeId() const;
private:
    std::shared_ptr<Connection> connection;
};

} // namespace zsnap

#endif // TRANSPORT_SINK_H
