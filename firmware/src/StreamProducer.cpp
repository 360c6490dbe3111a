// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Log.hpp>
#include <StreamProducer.hpp>

#include <array>
#include <chrono>

bool StreamProducer::arm(StreamRequest req) {
  std::lock_guard lock{m_mutex};
  if (m_request) {
    return false;
  }
  std::vector<Preamble> preambles;
  preambles.reserve(req.registers.size());
  for (const auto &reg : req.registers) {
    auto p = register_read_preamble(req.dut_address, reg);
    if (!p) {
      Log::error("stream arm: {}", p.status().to_string());
      return false;
    }
    preambles.push_back(*p);
  }
  m_stream_in.clear();
  m_preambles = std::move(preambles);
  m_request = std::move(req);
  m_produced = 0;
  m_overruns = 0;
  Log::debug("stream armed: {} registers, {} buffers", m_request->registers.size(),
             m_request->num_buffers);
  return true;
}

void StreamProducer::stop() {
  std::lock_guard lock{m_mutex};
  m_request.reset();
  m_stream_in.clear();
}

void StreamProducer::on_data_ready() {
  std::lock_guard lock{m_mutex};
  if (!m_request) {
    return;
  }
  auto buffer = capture(*m_request);
  if (!buffer) {
    return;
  }
  if (!m_stream_in.push(std::move(*buffer))) {
    ++m_overruns;
    Log::debug("stream overrun {}", m_overruns);
    return;
  }
  if (++m_produced == m_request->num_buffers) {
    Log::debug("stream finished after {} buffers", m_produced);
    m_request.reset();
  }
}

auto StreamProducer::capture(StreamRequest const &req)
    -> std::optional<std::vector<std::uint8_t>> {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(packet_bytes(req));
  const std::chrono::milliseconds timeout{req.timeout_ms};
  for (std::uint32_t c = 0; c < req.captures_per_ready; ++c) {
    for (std::size_t i = 0; i < req.registers.size(); ++i) {
      const auto &reg = req.registers[i];
      std::array<std::uint8_t, 4> raw{};
      const auto bytes = std::span{raw}.first(reg.num_bytes);
      if (const auto st = m_bus.read(m_preambles[i], bytes, timeout);
          st != BusStatus::OK) {
        Log::error("stream capture of register 0x{:02x} failed: {}",
                   reg.address, bus_status_str(st));
        return std::nullopt;
      }
      // a single byte register still occupies a full word
      buffer.insert(buffer.end(), bytes.begin(), bytes.end());
      if (reg.num_bytes == 1) {
        buffer.push_back(0);
      }
    }
  }
  return buffer;
}

bool StreamProducer::active() const {
  std::lock_guard lock{m_mutex};
  return m_request.has_value();
}

std::uint32_t StreamProducer::produced() const {
  std::lock_guard lock{m_mutex};
  return m_produced;
}

std::uint32_t StreamProducer::overruns() const {
  std::lock_guard lock{m_mutex};
  return m_overruns;
}
