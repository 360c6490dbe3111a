// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BulkChannel.hpp>
#include <BusTransaction.hpp>
#include <DeviceState.hpp>
#include <FaultLog.hpp>
#include <II2CBus.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <source_location>
#include <span>

// Executes decoded bus transactions with 1 + retry count attempts. Faults
// surviving the retries are written to the fault log.
class I2CExecutor {
public:
  I2CExecutor(II2CBus &bus, DeviceState &state, FaultLog &log,
              BulkChannel &i2c_in)
      : m_bus{bus}, m_state{state}, m_log{log}, m_i2c_in{i2c_in} {}

  // Control payloads as received from the host. Malformed payloads are
  // refused with BAD_ARGUMENT before the bus is touched.
  BusStatus handle_read(std::span<const std::uint8_t> payload);
  BusStatus handle_write(std::span<const std::uint8_t> payload);

  BusStatus set_bit_rate(std::uint32_t bit_rate);

  // Used by the stream producer, does not touch the I2C bulk endpoint
  BusStatus read(Preamble const &preamble, std::span<std::uint8_t> out,
                 std::chrono::milliseconds timeout);

  unsigned attempts() const noexcept {
    return std::min(m_state.i2c_retry_count.load(), I2C::MAX_RETRY_COUNT) + 1;
  }

private:
  template <typename F> BusStatus with_retries(F &&attempt);
  void log_fault(BusStatus st, std::source_location loc =
                                   std::source_location::current());

  II2CBus &m_bus;
  DeviceState &m_state;
  FaultLog &m_log;
  BulkChannel &m_i2c_in;
  std::mutex m_bus_mutex;
};
