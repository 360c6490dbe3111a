// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "LibUsbDevice.hpp"

#include <Log.hpp>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <signal.h>

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

constexpr int INTERFACE = 0;

int to_ms(std::chrono::milliseconds t) {
  return static_cast<int>(
      std::min<std::chrono::milliseconds::rep>(t.count(),
                                               std::numeric_limits<int>::max()));
}
} // namespace

auto IUsbDevice::Create(UsbId id) -> Ptr {
  return std::make_shared<LibUsbDevice>(id);
}

auto LibUsbDevice::translate_error(int res) -> TransferStatus {
  switch (res) {
  case LIBUSB_SUCCESS:
    return TransferStatus::OK;
  case LIBUSB_ERROR_TIMEOUT:
    return TransferStatus::TIMEOUT;
  case LIBUSB_ERROR_PIPE:
    return TransferStatus::STALL;
  case LIBUSB_ERROR_BUSY:
    return TransferStatus::BUSY;
  case LIBUSB_ERROR_NO_DEVICE:
    return TransferStatus::DISCONNECTED;
  case LIBUSB_ERROR_OVERFLOW:
    return TransferStatus::OVERFLOW;
  default:
    return TransferStatus::ERROR;
  }
}

LibUsbDevice::LibUsbDevice(UsbId id)
    : m_id{id}, m_handle(UsbLibHandle::instance()) {}

LibUsbDevice::~LibUsbDevice() { close(); }

auto LibUsbDevice::open() -> OpenStatus {
  ensure_running();
  if (m_dev && m_claimed) {
    return OpenStatus::OK;
  }
  close();
  m_dev = libusb_open_device_with_vid_pid(m_handle->context(), m_id.vid,
                                          m_id.pid);
  if (!m_dev) {
    return OpenStatus::NOT_FOUND;
  }
  if (libusb_kernel_driver_active(m_dev, INTERFACE) == 1) {
    libusb_detach_kernel_driver(m_dev, INTERFACE);
  }
  if (const auto r = libusb_claim_interface(m_dev, INTERFACE); r < 0) {
    Log::info("claiming interface failed: {}",
              libusb_strerror(static_cast<libusb_error>(r)));
    if (r == LIBUSB_ERROR_BUSY) {
      // the handle is kept so that reset() can kick the board
      return OpenStatus::BUSY;
    }
    close();
    return OpenStatus::NOT_FOUND;
  }
  m_claimed = true;
  return OpenStatus::OK;
}

void LibUsbDevice::reset() {
  if (!m_dev) {
    return;
  }
  if (const auto r = libusb_reset_device(m_dev);
      r < 0 && r != LIBUSB_ERROR_NOT_FOUND) {
    Log::error("USB reset failed: {}",
               libusb_strerror(static_cast<libusb_error>(r)));
  }
  close();
}

void LibUsbDevice::close() {
  if (!m_dev) {
    return;
  }
  if (m_claimed) {
    libusb_release_interface(m_dev, INTERFACE);
  }
  libusb_close(m_dev);
  m_dev = nullptr;
  m_claimed = false;
}

auto LibUsbDevice::control_transfer(Setup const &setup,
                                    std::span<std::uint8_t> data,
                                    std::chrono::milliseconds timeout)
    -> TransferStatus {
  ensure_running();
  if (!m_dev || !m_claimed) {
    return TransferStatus::DISCONNECTED;
  }
  const std::uint8_t request_type =
      LIBUSB_REQUEST_TYPE_VENDOR | LIBUSB_RECIPIENT_DEVICE |
      (setup.dir == Direction::IN ? LIBUSB_ENDPOINT_IN : LIBUSB_ENDPOINT_OUT);
  const auto r = libusb_control_transfer(
      m_dev, request_type, setup.request, setup.value, setup.index,
      data.data(), static_cast<std::uint16_t>(data.size()), to_ms(timeout));
  if (r < 0) {
    return translate_error(r);
  }
  return static_cast<std::size_t>(r) == data.size() ? TransferStatus::OK
                                                    : TransferStatus::ERROR;
}

auto LibUsbDevice::bulk_read(BulkEndpoint ep, std::span<std::uint8_t> data,
                             std::size_t &transferred,
                             std::chrono::milliseconds timeout)
    -> TransferStatus {
  ensure_running();
  transferred = 0;
  if (!m_dev || !m_claimed) {
    return TransferStatus::DISCONNECTED;
  }
  int n = 0;
  const auto r = libusb_bulk_transfer(m_dev, static_cast<unsigned char>(ep),
                                      data.data(), static_cast<int>(data.size()),
                                      &n, to_ms(timeout));
  transferred = static_cast<std::size_t>(n);
  if (r == LIBUSB_ERROR_TIMEOUT && n > 0) {
    return TransferStatus::OK;
  }
  return translate_error(r);
}

void LibUsbDevice::ensure_running() {
  // Don't throw if there's already an exception in-flight
  if (s_interrupted && std::uncaught_exceptions() == 0) {
    throw Interrupted{};
  }
}

UsbLibHandle::UsbLibHandle() {
  LibUsbDevice::ensure_running();
  if (const auto r = libusb_init(&m_ctx); r < 0) {
    throw std::runtime_error(
        fmt::format("Failed to initialize USB library: {}",
                    libusb_strerror(static_cast<libusb_error>(r))));
  }
}

UsbLibHandle::~UsbLibHandle() { terminate(); }

UsbLibHandle::Ref UsbLibHandle::handle{};

void UsbLibHandle::terminate() {
  if (m_ctx) {
    libusb_exit(m_ctx);
    m_ctx = nullptr;
  }
}

void UsbLibHandle::atexit_cleanup() {
  if (auto p = weak_instance().lock(); p) {
    p->terminate();
  }
}

auto UsbLibHandle::weak_instance() -> Ref { return handle; }

auto UsbLibHandle::instance() -> Ptr {
  LibUsbDevice::ensure_running();

  if (auto p = handle.lock(); p) {
    return p;
  }
  auto p = Ptr(new UsbLibHandle{}, [](UsbLibHandle *p) { delete p; });
  register_signal_handler(SIGINT, catch_signals);
  register_signal_handler(SIGTERM, catch_signals);
  const auto regexit = std::atexit(atexit_cleanup);
  const auto regqexit = std::at_quick_exit(atexit_cleanup);
  if (regexit || regqexit) {
    std::cerr << "Failed to register atexit cleanup function!\n";
  }
  handle = p;
  return p;
}
