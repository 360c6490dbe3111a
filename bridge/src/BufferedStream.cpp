// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <BufferedStream.hpp>
#include <Log.hpp>
#include <utils.hpp>

#include <array>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/transform.hpp>

using Direction = ControlEndpoint::Direction;

Result<std::vector<std::uint32_t>>
convert_buffer_data_to_u32(StreamRegisterSet const &regs,
                           std::span<const std::uint16_t> words) {
  for (const auto &reg : regs) {
    if (reg.num_bytes != 1 && reg.num_bytes != 2 && reg.num_bytes != 4) {
      return Status::Error(
          Err::CONFIGURATION,
          fmt::format("register 0x{:02x} (page {}) has unsupported width {}",
                      reg.address, reg.page, reg.num_bytes),
          reg.num_bytes);
    }
  }
  const auto per_capture = words_per_capture(regs);
  if (per_capture == 0 || words.size() % per_capture != 0) {
    return Status::Error(
        Err::LAYOUT_MISMATCH,
        fmt::format("{} buffer words do not split into captures of {} words",
                    words.size(), per_capture),
        static_cast<std::int64_t>(words.size()));
  }
  std::vector<std::uint32_t> res;
  res.reserve(words.size() / per_capture * regs.size());
  for (std::size_t pos = 0; pos < words.size();) {
    for (const auto &reg : regs) {
      std::uint32_t val{};
      for (std::size_t w = 0; w < reg.words(); ++w) {
        val |= static_cast<std::uint32_t>(words[pos + w]) << (16 * w);
      }
      res.push_back(val);
      pos += reg.words();
    }
  }
  return res;
}

Status BufferedStream::start(StreamRegisterSet registers,
                             std::uint8_t dut_address,
                             std::uint32_t captures_per_ready,
                             std::uint32_t num_buffers,
                             std::chrono::milliseconds timeout) {
  std::lock_guard lock{m_mutex};
  if (m_state == StreamState::ARMED || m_state == StreamState::STREAMING) {
    return Status::Error(Err::INVALID_STATE, "a stream is already active");
  }
  if (timeout.count() <= 0 || timeout.count() > 0xFFFF'FFFF) {
    return Status::Error(Err::CONFIGURATION, "invalid stream timeout",
                         timeout.count());
  }
  StreamRequest req{captures_per_ready, num_buffers,
                    static_cast<std::uint32_t>(timeout.count()), dut_address,
                    std::move(registers)};
  auto payload = encode_stream_request(req);
  if (!payload) {
    return payload.status();
  }

  // a new session always gets a new set, packets of the previous session
  // keep referring to theirs
  m_registers = std::make_shared<const StreamRegisterSet>(
      std::move(req.registers));
  m_captures = captures_per_ready;
  m_num_buffers = num_buffers;
  m_delivered = 0;
  m_timeout = timeout;
  m_packet_bytes = 2 * words_per_capture(*m_registers) * captures_per_ready;
  m_state = StreamState::ARMED;
  m_ctx.stream_active = true;

  if (auto st = m_ep.transfer(Command::STREAM_START, Direction::OUT, *payload,
                              Timeouts::COMMAND);
      !st) {
    finish(StreamState::IDLE);
    return st;
  }
  m_state = StreamState::STREAMING;
  m_last_progress = m_now();
  Log::info("stream started: {} registers, {} captures per data ready, {} "
            "buffers",
            m_registers->size(), m_captures, m_num_buffers);
  return Status::Ok();
}

auto BufferedStream::get_packet() -> Result<std::optional<StreamPacket>> {
  std::lock_guard lock{m_mutex};
  if (m_state != StreamState::STREAMING) {
    return std::optional<StreamPacket>{};
  }

  auto data = m_ep.bulk_read(ControlEndpoint::BulkEndpoint::STREAM_IN,
                             m_packet_bytes, m_poll);
  if (!data) {
    return data.status();
  }
  if (!data->has_value()) {
    if (m_now() - m_last_progress > m_timeout) {
      Log::error("stream timed out after {} of {} buffers", m_delivered,
                 m_num_buffers);
      if (auto st = send_stop(); !st) {
        Log::error("failed to stop timed out stream: {}", st.to_string());
      }
      finish(StreamState::TIMED_OUT);
    }
    return std::optional<StreamPacket>{};
  }

  auto &bytes = **data;
  if (bytes.size() != m_packet_bytes) {
    return Status::Error(Err::LAYOUT_MISMATCH,
                         fmt::format("stream packet of {} bytes, expected {}",
                                     bytes.size(), m_packet_bytes),
                         static_cast<std::int64_t>(bytes.size()));
  }

  StreamPacket packet{m_delivered, m_captures, m_registers, {}};
  packet.words = bytes | rgv::chunk(2) | rgv::transform([](auto &&word) {
                   return range_cast<std::uint16_t>(word);
                 }) |
                 rg::to<std::vector>();
  ++m_delivered;
  m_last_progress = m_now();
  if (m_delivered == m_num_buffers) {
    Log::info("stream complete, {} buffers delivered", m_delivered);
    finish(StreamState::IDLE);
  }
  return std::make_optional(std::move(packet));
}

Status BufferedStream::stop() {
  std::lock_guard lock{m_mutex};
  if (m_state != StreamState::ARMED && m_state != StreamState::STREAMING) {
    m_state = StreamState::IDLE;
    return Status::Ok();
  }
  auto st = send_stop();
  finish(StreamState::IDLE);
  return st;
}

StreamState BufferedStream::state() const {
  std::lock_guard lock{m_mutex};
  return m_state;
}

RegisterSetPtr BufferedStream::registers() const {
  std::lock_guard lock{m_mutex};
  return m_registers;
}

std::uint32_t BufferedStream::delivered() const {
  std::lock_guard lock{m_mutex};
  return m_delivered;
}

void BufferedStream::finish(StreamState next) {
  m_state = next;
  m_ctx.stream_active = false;
}

Status BufferedStream::send_stop() {
  std::array<std::uint8_t, 4> dummy{};
  return m_ep.transfer(Command::STREAM_STOP, Direction::OUT, dummy,
                       Timeouts::COMMAND);
}
