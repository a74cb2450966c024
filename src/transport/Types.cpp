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
#include "transport/Types.hpp"
#include "proto/snapshot.pb.h"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace zsnap {

SnapshotFile::SnapshotFile(std::string path, std::uint64_t size, std::uint64_t id, std::string meta)
    : filepath {std::move(path)}, fileSize {size}, fileId {id}, metadata {std::move(meta)} {}

SnapshotFile::SnapshotFile(const proto::SnapshotFile& f)
    : filepath {f.filepath()}, fileSize {f.file_size()}, fileId {f.file_id()}, metadata {f.metadata()} {}

proto::SnapshotFile SnapshotFile::toProto() const {
    auto f = proto::SnapshotFile {};
    f.set_filepath(filepath);
    f.set_file_size(fileSize);
    f.set_file_id(fileId);
    f.set_metadata(metadata);
    return f;
}

Chunk::Chunk(const proto::SnapshotChunk& c)
    : groupId {c.group_id()},
      nodeId {c.node_id()},
      from {c.from()},
      deploymentId {c.deployment_id()},
      binVer {c.bin_ver()},
      chunkId {c.chunk_id()},
      chunkCount {c.chunk_count()},
      chunkSize {c.chunk_size()},
      fileChunkId {c.file_chunk_id()},
      fileChunkCount {c.file_chunk_count()},
      filepath {c.filepath()},
      fileSize {c.file_size()},
      index {c.index()},
      term {c.term()},
      hasFileInfo {c.has_file_info()},
      data {c.data()} {
    if (c.has_file_info()) {
        fileInfo = SnapshotFile {c.file_info()};
    }
}

proto::SnapshotChunk Chunk::toProto() const {
    auto c = proto::SnapshotChunk {};
    c.set_group_id(groupId);
    c.set_node_id(nodeId);
    c.set_from(from);
    c.set_deployment_id(deploymentId);
    c.set_bin_ver(binVer);
    c.set_chunk_id(chunkId);
    c.set_chunk_count(chunkCount);
    c.set_chunk_size(chunkSize);
    c.set_file_chunk_id(fileChunkId);
    c.set_file_chunk_count(fileChunkCount);
    c.set_filepath(filepath);
    c.set_file_size(fileSize);
    c.set_index(index);
    c.set_term(term);
    if (hasFileInfo) {
        *c.mutable_file_info() = fileInfo.toProto();
    }
    c.set_data(data);
    return c;
}

Chunk poisonChunk(std::uint64_t groupId, std::uint64_t nodeId) {
    auto c = Chunk {};
    c.groupId = groupId;
    c.nodeId = nodeId;
    c.chunkCount = PoisonChunkCount;
    return c;
}

std::string describeNode(std::uint64_t groupId, std::uint64_t nodeId) {
    return fmt::format("[{:05d}:{:05d}]", groupId, nodeId);
}

} // namespace zsnap
