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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>

namespace zsnap {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::ServiceTemporarilyUnavailable: return "ServiceTemporarilyUnavailable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Stopped: return "Stopped";
        case ErrorCode::StreamSnapshotFailed: return "StreamSnapshotFailed";
        case ErrorCode::ChunkSendSkipped: return "ChunkSendSkipped";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.code << ": " << error.what;
    return os;
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)} {}
Error::Error(const proto::ErrorDetails& error)
    : code {static_cast<ErrorCode>(error.code())}, what {error.what()} {}

Error stoppedError() {
    return Error {ErrorCode::Stopped, "connection stopped"};
}

Error streamSnapshotError() {
    return Error {ErrorCode::StreamSnapshotFailed, "stream snapshot failed"};
}

Error chunkSendSkippedError() {
    return Error {ErrorCode::ChunkSendSkipped, "chunk send skipped"};
}

} // namespace zsnap
