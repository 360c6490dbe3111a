// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BulkChannel.hpp>
#include <I2CExecutor.hpp>
#include <StreamProtocol.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

// Device side of a buffered stream. Each data-ready event captures
// captures_per_ready passes over the register set into one buffer.
class StreamProducer {
public:
  StreamProducer(I2CExecutor &bus, BulkChannel &stream_in)
      : m_bus{bus}, m_stream_in{stream_in} {}

  // false when a stream is already running
  bool arm(StreamRequest req);

  // Drops buffers the host did not retrieve yet
  void stop();

  void on_data_ready();

  bool active() const;
  std::uint32_t produced() const;
  std::uint32_t overruns() const;

private:
  std::optional<std::vector<std::uint8_t>> capture(StreamRequest const &req);

  I2CExecutor &m_bus;
  BulkChannel &m_stream_in;

  mutable std::mutex m_mutex;
  std::optional<StreamRequest> m_request;
  std::vector<Preamble> m_preambles;
  std::uint32_t m_produced{};
  std::uint32_t m_overruns{};
};
