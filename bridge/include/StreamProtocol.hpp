// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BusTransaction.hpp>
#include <Status.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

struct StreamRegister {
  std::uint8_t address{};
  std::uint8_t page{};
  std::uint8_t num_bytes{2};

  // number of 16-bit words the register occupies in a stream packet
  constexpr std::size_t words() const noexcept {
    return num_bytes < 2 ? 1 : num_bytes / 2;
  }
};

using StreamRegisterSet = std::vector<StreamRegister>;
using RegisterSetPtr = std::shared_ptr<const StreamRegisterSet>;

struct StreamRequest {
  std::uint32_t captures_per_ready{1};
  std::uint32_t num_buffers{1};
  std::uint32_t timeout_ms{};
  std::uint8_t dut_address{};
  StreamRegisterSet registers;
};

namespace StreamPayload {
// fixed part: captures(u32) | buffers(u32) | timeout(u32) | dut(u8) | count(u16)
constexpr std::size_t HEADER_SIZE = 4 + 4 + 4 + 1 + 2;
constexpr std::size_t REGISTER_SIZE = 3;
// device side bulk buffer
constexpr std::size_t MAX_PACKET_BYTES = 12288;
} // namespace StreamPayload

std::size_t words_per_capture(StreamRegisterSet const &regs) noexcept;

inline std::size_t packet_bytes(StreamRequest const &req) noexcept {
  return 2 * words_per_capture(req.registers) * req.captures_per_ready;
}

Status validate(StreamRequest const &req);

Result<std::vector<std::uint8_t>> encode_stream_request(StreamRequest const &req);

Result<StreamRequest> decode_stream_request(std::span<const std::uint8_t> payload);

// Register pointer write followed by a repeated START and the read address
Result<Preamble> register_read_preamble(std::uint8_t dut_address,
                                        StreamRegister const &reg);
