// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Status.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

// Addressing bytes put on the bus ahead of the data phase.
// ctrl_mask low byte: bit n set = repeated START after byte n,
//           high byte: bit n set = STOP after byte n
struct Preamble {
  static constexpr std::size_t MAX_LENGTH = 8;

  std::array<std::uint8_t, MAX_LENGTH> buffer{};
  std::uint8_t length{};
  std::uint16_t ctrl_mask{};

  static Result<Preamble> make(std::span<const std::uint8_t> bytes,
                               std::uint16_t ctrl_mask = 0);
  static Result<Preamble> make(std::initializer_list<std::uint8_t> bytes,
                               std::uint16_t ctrl_mask = 0) {
    return make(std::span<const std::uint8_t>{bytes.begin(), bytes.size()},
                ctrl_mask);
  }

  std::span<const std::uint8_t> bytes() const noexcept {
    return std::span{buffer}.first(length);
  }
};

// Control payload layout of a bus transaction:
//   numBytes(u32) | timeout(u32) | preambleLength(u8) | ctrlMask(u16) |
//   preamble[preambleLength] | writeData[numBytes] (writes only)
namespace BusPayload {
constexpr std::size_t HEADER_SIZE = 4 + 4 + 1 + 2;
static_assert(HEADER_SIZE == 11);

constexpr std::size_t data_offset(std::size_t preamble_length) noexcept {
  return HEADER_SIZE + preamble_length;
}

// single bulk packet the device can hand back for a read
constexpr std::uint32_t MAX_READ_BYTES = 4096;
} // namespace BusPayload

enum class TransactionKind { READ, WRITE };

struct BusTransaction {
  TransactionKind kind{TransactionKind::READ};
  std::uint32_t num_bytes{};
  std::uint32_t timeout_ms{};
  Preamble preamble{};
  // offset of the write data inside the decoded payload
  std::size_t data_offset{};
  std::span<const std::uint8_t> write_data{};
};

Result<std::vector<std::uint8_t>> encode_read(Preamble const &preamble,
                                              std::uint32_t num_bytes,
                                              std::uint32_t timeout_ms);

Result<std::vector<std::uint8_t>>
encode_write(Preamble const &preamble, std::span<const std::uint8_t> data,
             std::uint32_t timeout_ms);

// The returned write_data refers into payload
Result<BusTransaction> decode_transaction(std::span<const std::uint8_t> payload,
                                          TransactionKind kind);
