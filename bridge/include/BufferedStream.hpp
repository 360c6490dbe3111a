// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ControlEndpoint.hpp>
#include <LinkConfig.hpp>
#include <Status.hpp>
#include <StreamProtocol.hpp>
#include <Timeouts.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

enum class StreamState { IDLE, ARMED, STREAMING, TIMED_OUT };

constexpr std::string_view stream_state_to_string(StreamState s) noexcept {
  switch (s) {
  case StreamState::IDLE:
    return "IDLE";
  case StreamState::ARMED:
    return "ARMED";
  case StreamState::STREAMING:
    return "STREAMING";
  case StreamState::TIMED_OUT:
    return "TIMED_OUT";
  }
  return "UNKNOWN";
}

// One completed device buffer. Keeps the register set it was captured with
// so it can be interpreted after a newer session replaced the active one.
struct StreamPacket {
  std::uint32_t sequence{};
  std::uint32_t captures{};
  RegisterSetPtr registers;
  std::vector<std::uint16_t> words;
};

// One value per register per capture, registers wider than 16 bits combine
// their words low word first
Result<std::vector<std::uint32_t>>
convert_buffer_data_to_u32(StreamRegisterSet const &regs,
                           std::span<const std::uint16_t> words);

inline Result<std::vector<std::uint32_t>>
convert_buffer_data_to_u32(StreamPacket const &packet) {
  return convert_buffer_data_to_u32(*packet.registers, packet.words);
}

// Host side of a buffered register stream. Capture is paced by the device's
// data-ready signal, the host polls completed buffers at its own rate.
class BufferedStream {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  BufferedStream(ControlEndpoint &ep, LinkContext &ctx,
                 std::chrono::milliseconds poll = Timeouts::STREAM_POLL,
                 NowFn now = &Clock::now)
      : m_ep{ep}, m_ctx{ctx}, m_poll{poll}, m_now{std::move(now)} {}

  Status start(StreamRegisterSet registers, std::uint8_t dut_address,
               std::uint32_t captures_per_ready, std::uint32_t num_buffers,
               std::chrono::milliseconds timeout);

  // Next completed buffer, or an empty optional when none is ready yet or
  // the session is over. Never waits longer than the poll timeout.
  Result<std::optional<StreamPacket>> get_packet();

  // Buffers captured but not yet retrieved are dropped by the device
  Status stop();

  StreamState state() const;
  RegisterSetPtr registers() const;
  std::uint32_t delivered() const;

private:
  void finish(StreamState next);
  Status send_stop();

  ControlEndpoint &m_ep;
  LinkContext &m_ctx;
  std::chrono::milliseconds m_poll;
  NowFn m_now;

  mutable std::mutex m_mutex;
  StreamState m_state{StreamState::IDLE};
  RegisterSetPtr m_registers;
  std::uint32_t m_captures{};
  std::uint32_t m_num_buffers{};
  std::uint32_t m_delivered{};
  std::size_t m_packet_bytes{};
  std::chrono::milliseconds m_timeout{};
  Clock::time_point m_last_progress{};
};
