// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <I2CExecutor.hpp>
#include <Log.hpp>
#include <fwd.hpp>

#include <algorithm>
#include <vector>

template <typename F> BusStatus I2CExecutor::with_retries(F &&attempt) {
  auto st = BusStatus::BAD_ARGUMENT;
  for (unsigned i = 0; i < attempts(); ++i) {
    st = attempt();
    if (st == BusStatus::OK || st == BusStatus::BAD_ARGUMENT) {
      return st;
    }
    Log::debug("bus attempt {}/{} failed: {}", i + 1, attempts(),
               bus_status_str(st));
  }
  return st;
}

BusStatus I2CExecutor::handle_read(std::span<const std::uint8_t> payload) {
  // data of an earlier transaction the host never collected
  m_i2c_in.clear();
  auto t = decode_transaction(payload, TransactionKind::READ);
  if (!t) {
    Log::error("rejected bus read: {}", t.status().to_string());
    return BusStatus::BAD_ARGUMENT;
  }
  std::vector<std::uint8_t> data(t->num_bytes);
  const auto st = read(t->preamble, data, std::chrono::milliseconds{t->timeout_ms});
  if (st == BusStatus::OK && !m_i2c_in.push(std::move(data))) {
    Log::error("I2C bulk endpoint full, read data dropped");
    return BusStatus::BUSY;
  }
  return st;
}

BusStatus I2CExecutor::handle_write(std::span<const std::uint8_t> payload) {
  m_i2c_in.clear();
  auto t = decode_transaction(payload, TransactionKind::WRITE);
  if (!t) {
    Log::error("rejected bus write: {}", t.status().to_string());
    return BusStatus::BAD_ARGUMENT;
  }
  std::lock_guard lock{m_bus_mutex};
  const auto st = with_retries([&] {
    return m_bus.write(t->preamble, t->write_data,
                       std::chrono::milliseconds{t->timeout_ms});
  });
  if (st != BusStatus::OK && st != BusStatus::BAD_ARGUMENT) {
    log_fault(st);
  }
  return st;
}

BusStatus I2CExecutor::read(Preamble const &preamble,
                            std::span<std::uint8_t> out,
                            std::chrono::milliseconds timeout) {
  std::lock_guard lock{m_bus_mutex};
  const auto st =
      with_retries([&] { return m_bus.read(preamble, out, timeout); });
  if (st != BusStatus::OK && st != BusStatus::BAD_ARGUMENT) {
    log_fault(st);
  }
  return st;
}

BusStatus I2CExecutor::set_bit_rate(std::uint32_t bit_rate) {
  const auto rate = std::clamp(bit_rate, I2C::MIN_BIT_RATE, I2C::MAX_BIT_RATE);
  std::lock_guard lock{m_bus_mutex};
  const auto st = m_bus.init(rate);
  if (st != BusStatus::OK) {
    log_fault(st);
    return st;
  }
  m_state.i2c_bit_rate = rate;
  return st;
}

void I2CExecutor::log_fault(BusStatus st, std::source_location loc) {
  Log::error("bus fault: {}", bus_status_str(st));
  if (!m_log.log_error(FileIdentifier::I2C_EXECUTOR, to_underlying(st), loc)) {
    Log::error("bus fault 0x{:x} could not be recorded", to_underlying(st));
  }
}
