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
#include "transport/Sink.hpp"
#include <utility>

namespace zsnap {

Sink::Sink(std::shared_ptr<Connection> c) : connection {std::move(c)} {}

SubmitResult Sink::receive(Chunk chunk) {
    return connection->submit(std::move(chunk));
}

std::uint64_t Sink::sourceGroupId() const {
    return connection->groupId();
}

std::uint64_t Sink::destinationNodeId() const {
    return connection->nodeId();
}

} // namespace zsnap
