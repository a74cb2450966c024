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
#include "transport/Splitter.hpp"
#include "transport/Types.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace zsnap {

namespace {

void appendFileChunks(
    std::vector<Chunk>& chunks,
    const SnapshotDescriptor& snapshot,
    const std::string& filepath,
    std::uint64_t fileSize,
    const SnapshotFile* file,
    std::uint64_t chunkSize,
    std::uint64_t total) {
    const auto count = fileChunkCount(fileSize, chunkSize);
    for (std::uint64_t i = 0; i < count; ++i) {
        auto c = Chunk {};
        c.groupId = snapshot.groupId;
        c.nodeId = snapshot.nodeId;
        c.from = snapshot.from;
        c.index = snapshot.index;
        c.term = snapshot.term;
        c.chunkId = chunks.size();
        c.chunkCount = total;
        c.fileChunkId = i;
        c.fileChunkCount = count;
        c.filepath = filepath;
        c.fileSize = fileSize;
        c.chunkSize = i + 1 == count ? fileSize - i * chunkSize : chunkSize;
        if (file != nullptr) {
            c.hasFileInfo = true;
            c.fileInfo = *file;
        }
        chunks.push_back(std::move(c));
    }
}

} // namespace

std::uint64_t fileChunkCount(std::uint64_t fileSize, std::uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("fileChunkCount: chunk size must be > zero");
    }
    return std::max<std::uint64_t>(1, (fileSize + chunkSize - 1) / chunkSize);
}

std::uint64_t chunkCount(const SnapshotDescriptor& snapshot, std::uint64_t chunkSize) {
    auto total = fileChunkCount(snapshot.fileSize, chunkSize);
    for (const auto& f : snapshot.files) {
        total += fileChunkCount(f.fileSize, chunkSize);
    }
    return total;
}

std::vector<Chunk> splitSnapshot(const SnapshotDescriptor& snapshot, std::uint64_t chunkSize) {
    const auto total = chunkCount(snapshot, chunkSize);
    std::vector<Chunk> chunks;
    chunks.reserve(total);
    appendFileChunks(chunks, snapshot, snapshot.filepath, snapshot.fileSize, nullptr, chunkSize, total);
    for (const auto& f : snapshot.files) {
        appendFileChunks(chunks, snapshot, f.filepath, f.fileSize, &f, chunkSize, total);
    }
    return chunks;
}

} // namespace zsnap
