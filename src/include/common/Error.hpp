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
#ifndef SRC_COMMON_ERROR_HPP
#define SRC_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <proto/snapshot.pb.h>

namespace zsnap {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    ServiceTemporarilyUnavailable = 2,
    Timeout = 3,
    Cancelled = 4,
    Internal = 5,
    // The shared shutdown signal fired.
    Stopped = 6,
    // The producer gave up by submitting a poison chunk.
    StreamSnapshotFailed = 7,
    // The pre-send hook decided not to send a chunk. Not a failure.
    ChunkSendSkipped = 8,
    IOError = 9,
    Unknown = 128
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;

    Error(const ErrorCode& c, std::string w);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& error);

    bool operator==(const Error& other) const {
        return code == other.code && what == other.what;
    }
};

std::ostream& operator<<(std::ostream& os, const Error& error);

// "connection stopped"
Error stoppedError();
// "stream snapshot failed"
Error streamSnapshotError();
Error chunkSendSkippedError();

} // namespace zsnap

#endif // SRC_COMMON_ERROR_HPP
