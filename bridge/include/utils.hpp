// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <fwd.hpp>

#include <array>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <ranges>
#include <type_traits>

#include <fmt/format.h>
#include <range/v3/range/concepts.hpp>
#include <range/v3/range/traits.hpp>
#include <range/v3/view/chunk.hpp>

// All multi-byte words on the wire and in the bridge flash are little endian

template <typename R>
concept byte_range =
    rg::input_range<std::remove_reference_t<R>> &&
    rg::sized_range<std::remove_reference_t<R>> &&
    std::unsigned_integral<rg::range_value_t<std::remove_reference_t<R>>> &&
    sizeof(rg::range_value_t<std::remove_reference_t<R>>) == 1;

// cast a byte range into a builtin integer, where the byte range
// holds a representation in little endian format
template <std::unsigned_integral T, byte_range R>
constexpr auto range_cast(R &&r) noexcept {
  T tmp{};
  auto it = rg::begin(r);
  const auto end = rg::end(r);
  for (size_t i = 0; i != sizeof(T) && it != end; ++i, ++it) {
    tmp |= static_cast<T>(static_cast<T>(*it) << i * 8);
  }
  return tmp;
}

// converts a builtin integer into its little endian byte representation
template <std::unsigned_integral T>
constexpr auto le_bytes(T val) noexcept {
  std::array<std::uint8_t, sizeof(T)> res{};
  for (auto &b : res) {
    b = static_cast<std::uint8_t>(val & 0xFF);
    val = static_cast<T>(val >> 8);
  }
  return res;
}

// Hex + ASCII byte dump, one line per bytes_per_line bytes. Short lines are
// padded so the ASCII column stays aligned.
struct OstreamDumper {
  explicit OstreamDumper(std::ostream &os, std::size_t bytes_per_line = 16)
      : os{os}, bytes_per_line{bytes_per_line} {}

  template <std::ranges::forward_range Rng>
    requires(std::integral<rg::range_value_t<Rng>> &&
             sizeof(rg::range_value_t<Rng>) == 1)
  void dump_memory(uint32_t addr, Rng &&data) {
    for (auto &&line : data | ranges::views::chunk(bytes_per_line)) {
      dump_line(addr, line);
      addr += static_cast<uint32_t>(bytes_per_line);
      os << '\n';
    }
  }

  template <std::ranges::forward_range Rng>
    requires(std::integral<rg::range_value_t<Rng>> &&
             sizeof(rg::range_value_t<Rng>) == 1)
  void dump_line(uint32_t addr, Rng &&data) {
    std::ostream_iterator<char> out(os);
    fmt::format_to(out, "0x{:06x} | ", addr);
    std::size_t count = 0;
    for (auto v : data) {
      fmt::format_to(out, "{:02x} ", static_cast<std::uint8_t>(v));
      ++count;
    }
    for (auto pad = count; pad < bytes_per_line; ++pad) {
      fmt::format_to(out, "   ");
    }
    fmt::format_to(out, "| ");
    for (auto v : data) {
      const int val = v & 0xFF;
      os << (std::isprint(val) ? static_cast<char>(val) : '.');
    }
    for (auto pad = count; pad < bytes_per_line; ++pad) {
      os << ' ';
    }
    fmt::format_to(out, " |");
  }

private:
  std::ostream &os;
  std::size_t bytes_per_line{};
};
