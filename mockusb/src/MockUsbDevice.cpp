// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Log.hpp>
#include <MockUsbDevice.hpp>
#include <fwd.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <string>

#include <fmt/format.h>

namespace {
volatile sig_atomic_t s_interrupted = 0;

void catch_signals(int sig) {
  s_interrupted = 1;
  signal(sig, catch_signals);
}

void register_signal_handler(int sig, sighandler_t handler) {
  if (::signal(sig, handler) == SIG_ERR) {
    std::cerr << fmt::format("Warning: can't register signal handler for {}!\n",
                             sig);
  }
}

// default sensor of the simulated board
constexpr std::uint8_t MOCK_SENSOR_ADDRESS = 0x48;
} // namespace

void MockUsbDevice::ensure_running() {
  if (s_interrupted) {
    throw IUsbDevice::Interrupted{};
  }
}

__attribute__((weak)) IUsbDevice::Ptr IUsbDevice::Create(UsbId) {
  auto dev = MockUsbDevice::Create();
  if (const auto image = std::getenv("MOCK_FLASH_IMAGE"); image) {
    std::ifstream ifs(image, std::ios::binary);
    if (!ifs) {
      Log::error("mock flash image {} can't be opened", image);
    } else {
      const auto n = dev->firmware().flash().load(ifs);
      Log::info("loaded {} bytes of mock flash from {}", n, image);
    }
  }
  if (const auto period = std::getenv("MOCK_DATA_READY_US"); period) {
    dev->start_data_ready(std::chrono::microseconds{std::stoul(period)});
  }
  return dev;
}

std::shared_ptr<MockUsbDevice> MockUsbDevice::Create() {
  register_signal_handler(SIGINT, catch_signals);
  register_signal_handler(SIGTERM, catch_signals);
  auto bus = std::make_shared<MockI2CBus>();
  bus->add_device(MOCK_SENSOR_ADDRESS);
  return std::make_shared<MockUsbDevice>(std::move(bus));
}

MockUsbDevice::MockUsbDevice(std::shared_ptr<MockI2CBus> bus,
                             std::unique_ptr<FlashImage> flash)
    : m_bus{bus ? std::move(bus) : std::make_shared<MockI2CBus>()},
      m_firmware{*m_bus, Firmware::DEFAULT_REVISION, std::move(flash)} {}

MockUsbDevice::~MockUsbDevice() { stop_data_ready(); }

auto MockUsbDevice::open() -> OpenStatus {
  ensure_running();
  ++m_open_calls;
  std::lock_guard lock{m_mutex};
  if (!m_open_script.empty()) {
    const auto st = m_open_script.front();
    m_open_script.pop_front();
    if (st != OpenStatus::OK) {
      return st;
    }
  }
  m_open = true;
  return OpenStatus::OK;
}

void MockUsbDevice::reset() {
  ++m_reset_calls;
  m_firmware.reset();
}

void MockUsbDevice::close() { m_open = false; }

auto MockUsbDevice::control_transfer(Setup const &setup,
                                     std::span<std::uint8_t> data,
                                     std::chrono::milliseconds)
    -> TransferStatus {
  ensure_running();
  if (!m_open) {
    return TransferStatus::DISCONNECTED;
  }
  {
    std::lock_guard lock{m_mutex};
    m_transfers.push_back(TransferRecord{setup.request, setup.dir, setup.value,
                                         setup.index, data.size()});
    if (auto it = m_failures.find(setup.request);
        it != m_failures.end() && it->second.times > 0) {
      --it->second.times;
      return it->second.status;
    }
  }
  return m_firmware.handle_control(setup, data) ? TransferStatus::OK
                                                : TransferStatus::STALL;
}

auto MockUsbDevice::bulk_read(BulkEndpoint ep, std::span<std::uint8_t> data,
                              std::size_t &transferred,
                              std::chrono::milliseconds timeout)
    -> TransferStatus {
  ensure_running();
  transferred = 0;
  if (!m_open) {
    return TransferStatus::DISCONNECTED;
  }
  auto packet = m_firmware.endpoint(ep).pop(timeout);
  if (!packet) {
    return TransferStatus::TIMEOUT;
  }
  if (packet->size() > data.size()) {
    return TransferStatus::OVERFLOW;
  }
  std::copy(packet->begin(), packet->end(), data.begin());
  transferred = packet->size();
  return TransferStatus::OK;
}

void MockUsbDevice::script_open(std::vector<OpenStatus> results) {
  std::lock_guard lock{m_mutex};
  m_open_script.assign(results.begin(), results.end());
}

void MockUsbDevice::fail_control(Command cmd, TransferStatus st,
                                 unsigned times) {
  std::lock_guard lock{m_mutex};
  m_failures[to_underlying(cmd)] = Failure{st, times};
}

auto MockUsbDevice::transfers() const -> std::vector<TransferRecord> {
  std::lock_guard lock{m_mutex};
  return m_transfers;
}

std::size_t MockUsbDevice::transfer_count(Command cmd) const {
  std::lock_guard lock{m_mutex};
  return static_cast<std::size_t>(
      std::count_if(m_transfers.begin(), m_transfers.end(),
                    [req = to_underlying(cmd)](TransferRecord const &r) {
                      return r.request == req;
                    }));
}

void MockUsbDevice::clear_transfers() {
  std::lock_guard lock{m_mutex};
  m_transfers.clear();
}

void MockUsbDevice::fire_data_ready(unsigned times) {
  for (unsigned i = 0; i < times; ++i) {
    m_firmware.data_ready();
  }
}

void MockUsbDevice::start_data_ready(std::chrono::microseconds period) {
  stop_data_ready();
  m_ticker = std::jthread([this, period](std::stop_token stop) {
    auto next = std::chrono::steady_clock::now();
    while (!stop.stop_requested()) {
      next += period;
      std::this_thread::sleep_until(next);
      m_firmware.data_ready();
    }
  });
}

void MockUsbDevice::stop_data_ready() {
  if (m_ticker.joinable()) {
    m_ticker.request_stop();
    m_ticker.join();
  }
}
