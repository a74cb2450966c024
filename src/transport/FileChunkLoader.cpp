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
#include "transport/ChunkLoader.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>
#include <string>

namespace zsnap {

FileChunkLoader::FileChunkLoader(std::uint64_t size) : chunkSize {size} {
    if (size == 0) {
        throw std::invalid_argument("FileChunkLoader: chunk size must be > zero");
    }
}

std::expected<std::size_t, Error> FileChunkLoader::load(const Chunk& chunk, std::string& buffer) {
    std::ifstream in {chunk.filepath, std::ios::binary};
    if (!in) {
        return std::unexpected {Error{ErrorCode::IOError, "failed to open " + chunk.filepath}};
    }
    const auto offset = chunk.fileChunkId * chunkSize;
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) {
        return std::unexpected {Error{ErrorCode::IOError,
            "failed to seek to " + std::to_string(offset) + " in " + chunk.filepath}};
    }
    if (buffer.size() < chunk.chunkSize) {
        buffer.resize(chunk.chunkSize);
    }
    in.read(buffer.data(), static_cast<std::streamsize>(chunk.chunkSize));
    const auto n = static_cast<std::size_t>(in.gcount());
    if (n != chunk.chunkSize) {
        spdlog::debug("short read on {}: got {} bytes, want {}", chunk.filepath, n, chunk.chunkSize);
        return std::unexpected {Error{ErrorCode::IOError,
            "short read on " + chunk.filepath + " at offset " + std::to_string(offset)}};
    }
    return n;
}

} // namespace zsnap
