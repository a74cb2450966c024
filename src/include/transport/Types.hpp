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
#ifndef TRANSPORT_TYPES_H
#define TRANSPORT_TYPES_H

#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <proto/snapshot.pb.h>

namespace zsnap {

// Chunk count of a chunk that aborts a streamed snapshot. Carries no payload.
constexpr std::uint64_t PoisonChunkCount = std::numeric_limits<std::uint64_t>::max();
// Chunk count of the last chunk of a streamed snapshot.
constexpr std::uint64_t LastChunkCount = std::numeric_limits<std::uint64_t>::max() - 1;

constexpr std::uint64_t chunkBinVersion = 1;

struct SnapshotFile {
    std::string filepath;
    std::uint64_t fileSize = 0;
    std::uint64_t fileId = 0;
    std::string metadata;

    SnapshotFile() = default;
    SnapshotFile(std::string path, std::uint64_t size, std::uint64_t id, std::string meta = {});
    explicit SnapshotFile(const proto::SnapshotFile& f);
    proto::SnapshotFile toProto() const;

    bool operator==(const SnapshotFile& other) const = default;
};

// A fully materialised snapshot, as handed to the batch path.
struct SnapshotDescriptor {
    std::uint64_t groupId = 0;
    std::uint64_t nodeId = 0;
    std::uint64_t from = 0;
    std::uint64_t index = 0;
    std::uint64_t term = 0;
    std::string filepath;
    std::uint64_t fileSize = 0;
    std::vector<SnapshotFile> files;
};

struct Chunk {
    std::uint64_t groupId = 0;
    std::uint64_t nodeId = 0;
    std::uint64_t from = 0;
    std::uint64_t deploymentId = 0;
    std::uint64_t binVer = chunkBinVersion;
    std::uint64_t chunkId = 0;
    std::uint64_t chunkCount = 0;
    std::uint64_t chunkSize = 0;
    std::uint64_t fileChunkId = 0;
    std::uint64_t fileChunkCount = 0;
    std::string filepath;
    std::uint64_t fileSize = 0;
    std::uint64_t index = 0;
    std::uint64_t term = 0;
    bool hasFileInfo = false;
    SnapshotFile fileInfo;
    std::string data;

    Chunk() = default;
    explicit Chunk(const proto::SnapshotChunk& c);
    proto::SnapshotChunk toProto() const;

    [[nodiscard]] bool isPoison() const { return chunkCount == PoisonChunkCount; }
    [[nodiscard]] bool isLastStreamed() const { return chunkCount == LastChunkCount; }
    // Last chunk of a batch transfer.
    [[nodiscard]] bool isLastSaved() const { return chunkId + 1 == chunkCount; }

    bool operator==(const Chunk& other) const = default;
};

Chunk poisonChunk(std::uint64_t groupId, std::uint64_t nodeId);

// [group:node] tag used in log lines.
std::string describeNode(std::uint64_t groupId, std::uint64_t nodeId);

} // namespace zsnap

#endif // TRANSPORT_TYPES_H
