/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace workpool::core {

// Multi-producer multi-consumer blocking queue.
//
// A bounded channel blocks senders while `capacity` items are queued. Blocked
// senders are admitted strictly in arrival order (ticketed), so a sender that
// started waiting first is the first one to enqueue once a slot frees.
//
// Receivers are counted through the Receiver handle. Once every handle is gone
// sends fail with SendResult::NoReceivers instead of blocking forever.
template <class T>
class Channel {
public:
  enum class SendResult { Ok, Closed, NoReceivers };

  class Receiver {
  public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<Channel> ch) : ch_(std::move(ch)) {
      if (ch_) ch_->attach_();
    }

    ~Receiver() { reset(); }

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& o) noexcept : ch_(std::move(o.ch_)) {}

    Receiver& operator=(Receiver&& o) noexcept {
      if (this == &o) return *this;
      reset();
      ch_ = std::move(o.ch_);
      return *this;
    }

    // Blocks until an item arrives. nullopt once the channel is closed and drained.
    std::optional<T> recv() { return ch_ ? ch_->recv_() : std::nullopt; }

    void reset() noexcept {
      if (!ch_) return;
      ch_->detach_();
      ch_.reset();
    }

    explicit operator bool() const noexcept { return static_cast<bool>(ch_); }

  private:
    std::shared_ptr<Channel> ch_;
  };

  explicit Channel(std::optional<std::size_t> capacity = std::nullopt) : cap_(capacity) {
    if (cap_ && *cap_ == 0) cap_ = 1;
  }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  SendResult send(T v) {
    std::unique_lock lk(mtx_);
    if (closed_) return SendResult::Closed;

    if (cap_) {
      const std::uint64_t ticket = next_ticket_++;
      waiting_.push_back(ticket);
      cv_space_.wait(lk, [&] {
        return closed_ || receivers_ == 0 || (waiting_.front() == ticket && q_.size() < *cap_);
      });
      waiting_.erase(std::find(waiting_.begin(), waiting_.end(), ticket));
      if (!waiting_.empty()) cv_space_.notify_all();
    }

    if (closed_) return SendResult::Closed;
    if (receivers_ == 0) return SendResult::NoReceivers;

    q_.push_back(std::move(v));
    lk.unlock();
    cv_data_.notify_one();
    return SendResult::Ok;
  }

  // No further sends. Queued items can still be received.
  void close() noexcept {
    {
      std::lock_guard lk(mtx_);
      closed_ = true;
    }
    cv_data_.notify_all();
    cv_space_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard lk(mtx_);
    return q_.size();
  }

  std::size_t receivers() const {
    std::lock_guard lk(mtx_);
    return receivers_;
  }

  std::optional<std::size_t> capacity() const noexcept { return cap_; }

  bool closed() const {
    std::lock_guard lk(mtx_);
    return closed_;
  }

private:
  std::optional<T> recv_() {
    std::unique_lock lk(mtx_);
    cv_data_.wait(lk, [&] { return closed_ || !q_.empty(); });
    if (q_.empty()) return std::nullopt;

    T v = std::move(q_.front());
    q_.pop_front();
    lk.unlock();
    if (cap_) cv_space_.notify_all();
    return v;
  }

  void attach_() {
    std::lock_guard lk(mtx_);
    ++receivers_;
  }

  void detach_() noexcept {
    {
      std::lock_guard lk(mtx_);
      --receivers_;
      if (receivers_ != 0) return;
    }
    cv_space_.notify_all();
  }

  mutable std::mutex mtx_;
  std::condition_variable cv_data_;
  std::condition_variable cv_space_;

  std::deque<T> q_;
  std::optional<std::size_t> cap_;

  std::size_t receivers_ = 0;
  bool closed_ = false;

  std::uint64_t next_ticket_ = 0;
  std::deque<std::uint64_t> waiting_;
};

} // namespace workpool::core
