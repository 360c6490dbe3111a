// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <utils.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Wire {

// Appends little endian fields to a payload buffer
class Writer {
public:
  template <std::unsigned_integral T> Writer &put(T val) {
    const auto bytes = le_bytes(val);
    m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
    return *this;
  }

  Writer &put_bytes(std::span<const std::uint8_t> bytes) {
    m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
    return *this;
  }

  std::size_t size() const noexcept { return m_buf.size(); }
  std::vector<std::uint8_t> take() && { return std::move(m_buf); }

private:
  std::vector<std::uint8_t> m_buf;
};

// Bounds checked cursor over a received payload, every getter returns
// nullopt instead of reading past the end
class Reader {
public:
  explicit Reader(std::span<const std::uint8_t> data) noexcept : m_data{data} {}

  template <std::unsigned_integral T> std::optional<T> get() noexcept {
    if (remaining() < sizeof(T)) {
      return std::nullopt;
    }
    const auto val = range_cast<T>(m_data.subspan(m_pos, sizeof(T)));
    m_pos += sizeof(T);
    return val;
  }

  std::optional<std::span<const std::uint8_t>>
  get_bytes(std::size_t n) noexcept {
    if (remaining() < n) {
      return std::nullopt;
    }
    auto res = m_data.subspan(m_pos, n);
    m_pos += n;
    return res;
  }

  std::size_t position() const noexcept { return m_pos; }
  std::size_t remaining() const noexcept { return m_data.size() - m_pos; }

private:
  std::span<const std::uint8_t> m_data;
  std::size_t m_pos{};
};

} // namespace Wire
