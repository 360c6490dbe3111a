// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Commands.hpp>
#include <StreamProtocol.hpp>
#include <Wire.hpp>

#include <numeric>

#include <fmt/format.h>

std::size_t words_per_capture(StreamRegisterSet const &regs) noexcept {
  return std::accumulate(
      regs.begin(), regs.end(), std::size_t{0},
      [](std::size_t acc, StreamRegister const &r) { return acc + r.words(); });
}

Status validate(StreamRequest const &req) {
  if (req.registers.empty()) {
    return Status::Error(Err::CONFIGURATION, "empty stream register set");
  }
  if (req.captures_per_ready == 0 || req.num_buffers == 0) {
    return Status::Error(Err::CONFIGURATION,
                         "stream capture and buffer counts must be non-zero");
  }
  for (const auto &reg : req.registers) {
    if (reg.num_bytes != 1 && reg.num_bytes != 2 && reg.num_bytes != 4) {
      return Status::Error(
          Err::CONFIGURATION,
          fmt::format("register 0x{:02x} (page {}) has unsupported width {}",
                      reg.address, reg.page, reg.num_bytes),
          reg.num_bytes);
    }
  }
  if (req.registers.size() > 0xFFFF) {
    return Status::Error(Err::CONFIGURATION, "too many stream registers",
                         static_cast<std::int64_t>(req.registers.size()));
  }
  if (const auto bytes = packet_bytes(req);
      bytes > StreamPayload::MAX_PACKET_BYTES) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("stream packet of {} bytes exceeds the {} byte buffer",
                    bytes, StreamPayload::MAX_PACKET_BYTES),
        static_cast<std::int64_t>(bytes));
  }
  const auto payload = StreamPayload::HEADER_SIZE +
                       req.registers.size() * StreamPayload::REGISTER_SIZE;
  if (payload > Usb::MAX_CONTROL_PAYLOAD) {
    return Status::Error(Err::CONFIGURATION,
                         "stream register set does not fit a control transfer",
                         static_cast<std::int64_t>(payload));
  }
  return Status::Ok();
}

Result<std::vector<std::uint8_t>> encode_stream_request(StreamRequest const &req) {
  if (auto st = validate(req); !st) {
    return st;
  }
  Wire::Writer w;
  w.put(req.captures_per_ready)
      .put(req.num_buffers)
      .put(req.timeout_ms)
      .put(req.dut_address)
      .put(static_cast<std::uint16_t>(req.registers.size()));
  for (const auto &reg : req.registers) {
    w.put(reg.address).put(reg.page).put(reg.num_bytes);
  }
  return std::move(w).take();
}

Result<StreamRequest> decode_stream_request(std::span<const std::uint8_t> payload) {
  Wire::Reader r{payload};
  const auto captures = r.get<std::uint32_t>();
  const auto buffers = r.get<std::uint32_t>();
  const auto timeout = r.get<std::uint32_t>();
  const auto dut = r.get<std::uint8_t>();
  const auto count = r.get<std::uint16_t>();
  if (!captures || !buffers || !timeout || !dut || !count) {
    return Status::Error(Err::CONFIGURATION, "stream request header truncated",
                         static_cast<std::int64_t>(payload.size()));
  }
  StreamRequest req{*captures, *buffers, *timeout, *dut, {}};
  req.registers.reserve(*count);
  for (std::uint16_t i = 0; i < *count; ++i) {
    const auto address = r.get<std::uint8_t>();
    const auto page = r.get<std::uint8_t>();
    const auto width = r.get<std::uint8_t>();
    if (!address || !page || !width) {
      return Status::Error(Err::CONFIGURATION,
                           fmt::format("stream register {} truncated", i), i);
    }
    req.registers.push_back(StreamRegister{*address, *page, *width});
  }
  if (auto st = validate(req); !st) {
    return st;
  }
  return req;
}

Result<Preamble> register_read_preamble(std::uint8_t dut_address,
                                        StreamRegister const &reg) {
  const auto addr_w = static_cast<std::uint8_t>(dut_address << 1);
  const auto addr_r = static_cast<std::uint8_t>(addr_w | 0x01);
  // repeated START after byte 2, ahead of the read address
  return Preamble::make({addr_w, reg.page, reg.address, addr_r}, 0x0004);
}
