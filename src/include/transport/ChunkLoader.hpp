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
#ifndef TRANSPORT_CHUNK_LOADER_H
#define TRANSPORT_CHUNK_LOADER_H

#include "transport/Types.hpp"
#include "common/Error.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace zsnap {

// Fills the payload of a chunk record from durable storage.
class ChunkLoader {
public:
    virtual ~ChunkLoader() = default;
    // Writes the chunk's bytes to the front of buffer and returns how many
    // were written. buffer may be a reused one of any size.
    virtual std::expected<std::size_t, Error> load(const Chunk& chunk, std::string& buffer) = 0;
};

class FileChunkLoader : public ChunkLoader {
public:
    explicit FileChunkLoader(std::uint64_t chunkSize);
    std::expected<std::size_t, Error> load(const Chunk& chunk, std::string& buffer) override;
private:
    std::uint64_t chunkSize;
};

} // namespace zsnap

#endif // TRANSPORT_CHUNK_LOADER_H
