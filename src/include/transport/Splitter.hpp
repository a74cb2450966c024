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
#ifndef TRANSPORT_SPLITTER_H
#define TRANSPORT_SPLITTER_H

#include "transport/Types.hpp"
#include <cstdint>
#include <vector>

namespace zsnap {

// Number of chunks a file of fileSize bytes is cut into. Never zero.
std::uint64_t fileChunkCount(std::uint64_t fileSize, std::uint64_t chunkSize);

// Total number of chunks splitSnapshot produces for the snapshot.
std::uint64_t chunkCount(const SnapshotDescriptor& snapshot, std::uint64_t chunkSize);

// Cuts the snapshot file, then every external file, into payload-less chunk
// records numbered 0..chunkCount-1. Payloads are loaded at send time.
std::vector<Chunk> splitSnapshot(const SnapshotDescriptor& snapshot, std::uint64_t chunkSize);

} // namespace zsnap

#endif // TRANSPORT_SPLITTER_H
