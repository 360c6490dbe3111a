// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <II2CBus.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

// Simulated I2C segment with paged register devices. A transaction
// addresses a device with preamble byte 0, for preambles of 3 or more bytes
// byte 1 selects the page and byte 2 the register, a 2 byte preamble
// selects a register of page 0. Register access auto-increments.
class MockI2CBus : public II2CBus {
public:
  static constexpr std::size_t PAGE_SIZE = 256;

  BusStatus init(std::uint32_t bit_rate) override;
  BusStatus read(Preamble const &preamble, std::span<std::uint8_t> out,
                 std::chrono::milliseconds timeout) override;
  BusStatus write(Preamble const &preamble, std::span<const std::uint8_t> data,
                  std::chrono::milliseconds timeout) override;

  void add_device(std::uint8_t address);
  void set_registers(std::uint8_t address, std::uint8_t page, std::uint8_t reg,
                     std::span<const std::uint8_t> bytes);
  std::vector<std::uint8_t> registers(std::uint8_t address, std::uint8_t page,
                                      std::uint8_t reg, std::size_t n) const;

  // next `times` attempts fail with st
  void fail_next(BusStatus st, unsigned times = 1);
  void fail_init(bool val);

  unsigned attempts() const;
  std::uint32_t bit_rate() const;

private:
  struct Target {
    std::uint8_t address{};
    std::size_t offset{};
  };

  std::optional<BusStatus> injected_failure();
  std::optional<Target> decode_target(Preamble const &preamble) const;

  mutable std::mutex m_mutex;
  std::map<std::uint8_t, std::vector<std::uint8_t>> m_devices;
  std::optional<BusStatus> m_failure;
  unsigned m_fail_count{};
  bool m_fail_init{false};
  unsigned m_attempts{};
  std::uint32_t m_bit_rate{};
};
