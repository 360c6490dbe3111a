// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IUsbDevice.hpp>

#include <memory>

#include <libusb-1.0/libusb.h>

class UsbLibHandle {
public:
  using Ptr = std::shared_ptr<UsbLibHandle>;
  using Ref = std::weak_ptr<UsbLibHandle>;
  static Ptr instance();
  static Ref weak_instance();

  libusb_context *context() const noexcept { return m_ctx; }

private:
  void terminate();
  static void atexit_cleanup();

  static Ref handle;

  UsbLibHandle();
  ~UsbLibHandle();

  libusb_context *m_ctx{};
};

struct LibUsbDevice : public IUsbDevice {
  explicit LibUsbDevice(UsbId id);
  ~LibUsbDevice() override;

  static void ensure_running();
  static TransferStatus translate_error(int res);

  OpenStatus open() override;
  void reset() override;
  void close() override;

  TransferStatus control_transfer(Setup const &setup,
                                  std::span<std::uint8_t> data,
                                  std::chrono::milliseconds timeout) override;

  TransferStatus bulk_read(BulkEndpoint ep, std::span<std::uint8_t> data,
                           std::size_t &transferred,
                           std::chrono::milliseconds timeout) override;

private:
  UsbId m_id;
  UsbLibHandle::Ptr m_handle;
  libusb_device_handle *m_dev{};
  bool m_claimed{false};
};
