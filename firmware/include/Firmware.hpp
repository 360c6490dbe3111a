// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BulkChannel.hpp>
#include <DeviceState.hpp>
#include <FaultLog.hpp>
#include <FlashImage.hpp>
#include <I2CExecutor.hpp>
#include <II2CBus.hpp>
#include <IUsbDevice.hpp>
#include <StreamProducer.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string_view>

// Vendor request dispatcher of the bridge firmware
class Firmware {
public:
  static constexpr std::string_view DEFAULT_REVISION = "SB-2.4.1";
  static constexpr std::size_t I2C_IN_DEPTH = 4;
  static constexpr std::size_t STREAM_IN_DEPTH = 8;

  explicit Firmware(II2CBus &bus, std::string_view revision = DEFAULT_REVISION,
                    std::unique_ptr<FlashImage> flash = nullptr);

  // false stalls the control endpoint
  bool handle_control(IUsbDevice::Setup const &setup,
                      std::span<std::uint8_t> data);

  BulkChannel &endpoint(IUsbDevice::BulkEndpoint ep) noexcept;

  // data-ready interrupt of the sensor
  void data_ready() { m_stream.on_data_ready(); }

  // USB bus reset
  void reset();

  FlashImage &flash() noexcept { return *m_flash; }
  FaultLog &fault_log() noexcept { return m_fault_log; }
  DeviceState const &state() const noexcept { return m_state; }
  StreamProducer const &stream() const noexcept { return m_stream; }

private:
  bool read_flash(IUsbDevice::Setup const &setup, std::span<std::uint8_t> data);
  bool firmware_info(std::span<std::uint8_t> data);
  bool bus_transaction(Command cmd, std::span<const std::uint8_t> data);
  bool start_stream(std::span<const std::uint8_t> data);
  void set_status(BusStatus st) noexcept;

  DeviceState m_state;
  std::unique_ptr<FlashImage> m_flash;
  FaultLog m_fault_log;
  BulkChannel m_i2c_in{I2C_IN_DEPTH};
  BulkChannel m_stream_in{STREAM_IN_DEPTH};
  I2CExecutor m_executor;
  StreamProducer m_stream;
  std::mutex m_control_mutex;
};
