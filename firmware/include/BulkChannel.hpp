// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

// Bounded FIFO of bulk IN packets between a device producer and the host
class BulkChannel {
public:
  using Packet = std::vector<std::uint8_t>;

  explicit BulkChannel(std::size_t depth) : m_depth{depth} {}

  // false when the channel is full, the packet is dropped
  bool push(Packet packet) {
    {
      std::lock_guard lock{m_mutex};
      if (m_packets.size() >= m_depth) {
        return false;
      }
      m_packets.push_back(std::move(packet));
    }
    m_cv.notify_one();
    return true;
  }

  std::optional<Packet> pop(std::chrono::milliseconds wait) {
    std::unique_lock lock{m_mutex};
    if (!m_cv.wait_for(lock, wait, [this] { return !m_packets.empty(); })) {
      return std::nullopt;
    }
    auto packet = std::move(m_packets.front());
    m_packets.pop_front();
    return packet;
  }

  void clear() {
    std::lock_guard lock{m_mutex};
    m_packets.clear();
  }

  std::size_t size() const {
    std::lock_guard lock{m_mutex};
    return m_packets.size();
  }

private:
  std::size_t m_depth;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<Packet> m_packets;
};
