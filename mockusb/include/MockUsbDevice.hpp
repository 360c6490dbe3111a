// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Commands.hpp>
#include <Firmware.hpp>
#include <IUsbDevice.hpp>
#include <MockI2CBus.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

// Bridge board simulated in-process: control and bulk traffic is routed
// into the firmware model, the data-ready line is driven by a ticker thread
// or manually.
class MockUsbDevice : public IUsbDevice {
public:
  struct TransferRecord {
    std::uint8_t request{};
    Direction dir{Direction::OUT};
    std::uint16_t value{};
    std::uint16_t index{};
    std::size_t length{};
  };

  explicit MockUsbDevice(std::shared_ptr<MockI2CBus> bus = nullptr,
                         std::unique_ptr<FlashImage> flash = nullptr);
  ~MockUsbDevice() override;

  MockUsbDevice(const MockUsbDevice &) = delete;
  MockUsbDevice &operator=(const MockUsbDevice &) = delete;

  OpenStatus open() override;
  void reset() override;
  void close() override;

  TransferStatus control_transfer(Setup const &setup,
                                  std::span<std::uint8_t> data,
                                  std::chrono::milliseconds timeout) override;

  TransferStatus bulk_read(BulkEndpoint ep, std::span<std::uint8_t> data,
                           std::size_t &transferred,
                           std::chrono::milliseconds timeout) override;

  static void ensure_running();

  static std::shared_ptr<MockUsbDevice> Create();

  // results of the next open() calls, OK once the script runs out
  void script_open(std::vector<OpenStatus> results);
  void fail_control(Command cmd, TransferStatus st, unsigned times = 1);

  std::vector<TransferRecord> transfers() const;
  std::size_t transfer_count(Command cmd) const;
  void clear_transfers();

  unsigned open_calls() const noexcept { return m_open_calls; }
  unsigned reset_calls() const noexcept { return m_reset_calls; }
  bool is_open() const noexcept { return m_open; }

  void fire_data_ready(unsigned times = 1);
  void start_data_ready(std::chrono::microseconds period);
  void stop_data_ready();

  Firmware &firmware() noexcept { return m_firmware; }
  MockI2CBus &bus() noexcept { return *m_bus; }

private:
  struct Failure {
    TransferStatus status{};
    unsigned times{};
  };

  std::shared_ptr<MockI2CBus> m_bus;
  Firmware m_firmware;

  mutable std::mutex m_mutex;
  std::deque<OpenStatus> m_open_script;
  std::map<std::uint8_t, Failure> m_failures;
  std::vector<TransferRecord> m_transfers;
  std::atomic<bool> m_open{false};
  std::atomic<unsigned> m_open_calls{0};
  std::atomic<unsigned> m_reset_calls{0};

  std::jthread m_ticker;
};
