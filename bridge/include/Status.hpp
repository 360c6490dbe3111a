// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

enum class Err : std::uint8_t {
  OK = 0,
  CONFIGURATION,   ///< caller argument violates a precondition, no I/O done
  COMMUNICATION,   ///< control/bulk exchange failed or was rejected
  DEVICE_FAULT,    ///< bus transaction failed on the device after retries
  NO_DEVICE,       ///< connect attempts exhausted
  INVALID_STATE,   ///< operation not allowed in the current session state
  LAYOUT_MISMATCH, ///< device and host disagree on a binary layout
};

constexpr std::string_view err_to_string(Err e) noexcept {
  switch (e) {
  case Err::OK:
    return "OK";
  case Err::CONFIGURATION:
    return "ConfigurationError";
  case Err::COMMUNICATION:
    return "CommunicationFailure";
  case Err::DEVICE_FAULT:
    return "DeviceFault";
  case Err::NO_DEVICE:
    return "NoDevice";
  case Err::INVALID_STATE:
    return "InvalidState";
  case Err::LAYOUT_MISMATCH:
    return "LayoutMismatch";
  }
  return "Unknown";
}

struct [[nodiscard]] Status {
  Err code = Err::OK;
  std::int64_t detail = 0;
  std::string msg;

  bool ok() const noexcept { return code == Err::OK; }
  explicit operator bool() const noexcept { return ok(); }

  static Status Ok() { return Status{}; }

  static Status Error(Err err, std::string message, std::int64_t detail = 0) {
    return Status{err, detail, std::move(message)};
  }

  std::string to_string() const {
    if (ok()) {
      return "OK";
    }
    return fmt::format("{}: {} (detail: {})", err_to_string(code), msg,
                       detail);
  }
};

// Value or failed Status, a failed Status never carries Err::OK
template <typename T> class [[nodiscard]] Result {
public:
  Result(T value) : m_data{std::in_place_index<0>, std::move(value)} {}
  Result(Status st) : m_data{std::in_place_index<1>, std::move(st)} {
    if (std::get<1>(m_data).ok()) {
      throw std::logic_error("Result constructed from a success Status");
    }
  }

  bool ok() const noexcept { return m_data.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  T &value() & { return std::get<0>(m_data); }
  T const &value() const & { return std::get<0>(m_data); }
  T &&value() && { return std::get<0>(std::move(m_data)); }

  T &operator*() & { return value(); }
  T const &operator*() const & { return value(); }
  T *operator->() { return &value(); }
  T const *operator->() const { return &value(); }

  Status status() const { return ok() ? Status::Ok() : std::get<1>(m_data); }
  Err code() const noexcept {
    return ok() ? Err::OK : std::get<1>(m_data).code;
  }

private:
  std::variant<T, Status> m_data;
};
