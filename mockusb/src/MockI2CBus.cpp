// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <MockI2CBus.hpp>

#include <algorithm>

namespace {
constexpr std::size_t DEVICE_SIZE = 256 * MockI2CBus::PAGE_SIZE;
}

BusStatus MockI2CBus::init(std::uint32_t bit_rate) {
  std::lock_guard lock{m_mutex};
  if (m_fail_init) {
    return BusStatus::INIT_FAILED;
  }
  m_bit_rate = bit_rate;
  return BusStatus::OK;
}

BusStatus MockI2CBus::read(Preamble const &preamble,
                           std::span<std::uint8_t> out,
                           std::chrono::milliseconds) {
  std::lock_guard lock{m_mutex};
  ++m_attempts;
  if (auto st = injected_failure()) {
    return *st;
  }
  const auto target = decode_target(preamble);
  if (!target) {
    return BusStatus::BAD_ARGUMENT;
  }
  const auto it = m_devices.find(target->address);
  if (it == m_devices.end()) {
    return BusStatus::NACK;
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = it->second[(target->offset + i) % DEVICE_SIZE];
  }
  return BusStatus::OK;
}

BusStatus MockI2CBus::write(Preamble const &preamble,
                            std::span<const std::uint8_t> data,
                            std::chrono::milliseconds) {
  std::lock_guard lock{m_mutex};
  ++m_attempts;
  if (auto st = injected_failure()) {
    return *st;
  }
  const auto target = decode_target(preamble);
  if (!target) {
    return BusStatus::BAD_ARGUMENT;
  }
  const auto it = m_devices.find(target->address);
  if (it == m_devices.end()) {
    return BusStatus::NACK;
  }
  for (std::size_t i = 0; i < data.size(); ++i) {
    it->second[(target->offset + i) % DEVICE_SIZE] = data[i];
  }
  return BusStatus::OK;
}

void MockI2CBus::add_device(std::uint8_t address) {
  std::lock_guard lock{m_mutex};
  m_devices.try_emplace(address, DEVICE_SIZE, std::uint8_t{0});
}

void MockI2CBus::set_registers(std::uint8_t address, std::uint8_t page,
                               std::uint8_t reg,
                               std::span<const std::uint8_t> bytes) {
  std::lock_guard lock{m_mutex};
  auto &mem =
      m_devices.try_emplace(address, DEVICE_SIZE, std::uint8_t{0}).first->second;
  const auto offset = page * PAGE_SIZE + reg;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    mem[(offset + i) % DEVICE_SIZE] = bytes[i];
  }
}

std::vector<std::uint8_t> MockI2CBus::registers(std::uint8_t address,
                                                std::uint8_t page,
                                                std::uint8_t reg,
                                                std::size_t n) const {
  std::lock_guard lock{m_mutex};
  std::vector<std::uint8_t> res;
  if (const auto it = m_devices.find(address); it != m_devices.end()) {
    const auto offset = page * PAGE_SIZE + reg;
    for (std::size_t i = 0; i < n; ++i) {
      res.push_back(it->second[(offset + i) % DEVICE_SIZE]);
    }
  }
  return res;
}

void MockI2CBus::fail_next(BusStatus st, unsigned times) {
  std::lock_guard lock{m_mutex};
  m_failure = st;
  m_fail_count = times;
}

void MockI2CBus::fail_init(bool val) {
  std::lock_guard lock{m_mutex};
  m_fail_init = val;
}

unsigned MockI2CBus::attempts() const {
  std::lock_guard lock{m_mutex};
  return m_attempts;
}

std::uint32_t MockI2CBus::bit_rate() const {
  std::lock_guard lock{m_mutex};
  return m_bit_rate;
}

std::optional<BusStatus> MockI2CBus::injected_failure() {
  if (m_fail_count == 0 || !m_failure) {
    return std::nullopt;
  }
  --m_fail_count;
  return m_failure;
}

auto MockI2CBus::decode_target(Preamble const &preamble) const
    -> std::optional<Target> {
  const auto bytes = preamble.bytes();
  if (bytes.size() < 2) {
    return std::nullopt;
  }
  Target t{static_cast<std::uint8_t>(bytes[0] >> 1), 0};
  if (bytes.size() >= 3) {
    t.offset = bytes[1] * PAGE_SIZE + bytes[2];
  } else {
    t.offset = bytes[1];
  }
  return t;
}
