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
#ifndef TRANSPORT_BOUNDED_CHANNEL_H
#define TRANSPORT_BOUNDED_CHANNEL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace zsnap {

// FIFO queue of fixed capacity. Every blocking call takes an interrupted()
// predicate that is re-evaluated on each wake-up; whoever makes it true must
// call wake() afterwards so that blocked callers see it.
template<typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity);
    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Blocks while full. Returns false, leaving the channel untouched, once
    // interrupted() holds.
    template<typename Interrupted>
    bool send(T value, Interrupted interrupted);
    // Never blocks. Returns false when full.
    bool trySend(T value);
    // Blocks while empty. Interruption wins over queued values.
    template<typename Interrupted>
    std::optional<T> receive(Interrupted interrupted);
    void wake();
    // Drops every queued value and returns how many there were.
    std::size_t clear();
    [[nodiscard]] std::size_t capacity() const noexcept { return cap; }
    [[nodiscard]] std::size_t size() const;
private:
    mutable std::mutex m;
    std::condition_variable cv;
    std::deque<T> queue;
    const std::size_t cap;
};

template<typename T>
BoundedChannel<T>::BoundedChannel(std::size_t capacity) : cap {capacity} {
    if (capacity == 0) {
        throw std::invalid_argument("BoundedChannel: capacity must be > zero");
    }
}

template<typename T>
template<typename Interrupted>
bool BoundedChannel<T>::send(T value, Interrupted interrupted) {
    std::unique_lock<std::mutex> lock(m);
    while (queue.size() >= cap && !interrupted()) {
        cv.wait(lock);
    }
    if (interrupted()) {
        return false;
    }
    queue.push_back(std::move(value));
    cv.notify_all();
    return true;
}

template<typename T>
bool BoundedChannel<T>::trySend(T value) {
    std::unique_lock<std::mutex> lock(m);
    if (queue.size() >= cap) {
        return false;
    }
    queue.push_back(std::move(value));
    cv.notify_all();
    return true;
}

template<typename T>
template<typename Interrupted>
std::optional<T> BoundedChannel<T>::receive(Interrupted interrupted) {
    std::unique_lock<std::mutex> lock(m);
    while (queue.empty() && !interrupted()) {
        cv.wait(lock);
    }
    if (interrupted()) {
        return std::nullopt;
    }
    T value = std::move(queue.front());
    queue.pop_front();
    cv.notify_all();
    return value;
}

template<typename T>
void BoundedChannel<T>::wake() {
    // Taking the lock orders the wake-up after any waiter's predicate check.
    std::lock_guard<std::mutex> lock(m);
    cv.notify_all();
}

template<typename T>
std::size_t BoundedChannel<T>::clear() {
    std::lock_guard<std::mutex> lock(m);
    const auto n = queue.size();
    std::deque<T> {}.swap(queue);
    cv.notify_all();
    return n;
}

template<typename T>
std::size_t BoundedChannel<T>::size() const {
    std::lock_guard<std::mutex> lock(m);
    return queue.size();
}

} // namespace zsnap

#endif // TRANSPORT_BOUNDED_CHANNEL_H
