/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <deque>
#include <optional>
#include <vector>

namespace util {

/**
 * @brief A fixed-capacity FIFO hand-off between producers and consumers.
 *
 * Pushing never blocks: a push into a full or closed channel is rejected and
 * the value stays with the caller. Popping waits until an element arrives,
 * the channel is closed, or the deadline passes. Every pushed element is
 * delivered to at most one consumer.
 */
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t capacity) : m_capacity_(capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  /**
   * @return true if value was moved into the channel. On false, value is
   * left untouched.
   */
  [[nodiscard]] bool TryPush(T& value) {
    absl::MutexLock lk(&m_mtx_);
    if (m_closed_ || m_queue_.size() >= m_capacity_) return false;

    m_queue_.emplace_back(std::move(value));
    return true;
  }

  /**
   * @return std::nullopt on timeout, or once the channel is closed and
   * empty.
   */
  std::optional<T> PopUntil(absl::Time deadline) {
    absl::MutexLock lk(&m_mtx_);
    m_mtx_.AwaitWithDeadline(
        absl::Condition(this, &BoundedChannel::IsReadableLocked_), deadline);

    if (m_queue_.empty()) return std::nullopt;

    T value = std::move(m_queue_.front());
    m_queue_.pop_front();
    return value;
  }

  /**
   * @brief Close the channel and hand every element still inside it back to
   * the caller. Later pushes are rejected. Closing twice returns an empty
   * vector the second time.
   */
  std::vector<T> CloseAndDrain() {
    absl::MutexLock lk(&m_mtx_);
    m_closed_ = true;

    std::vector<T> remaining;
    remaining.reserve(m_queue_.size());
    while (!m_queue_.empty()) {
      remaining.emplace_back(std::move(m_queue_.front()));
      m_queue_.pop_front();
    }
    return remaining;
  }

  [[nodiscard]] size_t Size() const {
    absl::MutexLock lk(&m_mtx_);
    return m_queue_.size();
  }

  [[nodiscard]] bool Closed() const {
    absl::MutexLock lk(&m_mtx_);
    return m_closed_;
  }

  [[nodiscard]] size_t Capacity() const { return m_capacity_; }

 private:
  bool IsReadableLocked_() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(m_mtx_) {
    return m_closed_ || !m_queue_.empty();
  }

  const size_t m_capacity_;

  mutable absl::Mutex m_mtx_;
  std::deque<T> m_queue_ ABSL_GUARDED_BY(m_mtx_);
  bool m_closed_ ABSL_GUARDED_BY(m_mtx_){false};
};

}  // namespace util
