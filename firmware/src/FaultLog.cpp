// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <FaultLog.hpp>
#include <Log.hpp>
#include <Wire.hpp>
#include <utils.hpp>

#include <array>

namespace {
constexpr std::uint32_t LOG_END =
    Flash::LOG_BASE_ADDR + Flash::LOG_CAPACITY * Flash::LOG_RECORD_SIZE;
constexpr std::uint32_t BLANK_COUNT = 0xFFFF'FFFF;
} // namespace

FaultLog::FaultLog(FlashImage &flash, DeviceState const &state)
    : m_flash{flash}, m_state{state} {
  // a blank flash gets an empty log
  if (const auto cnt = count(); cnt && *cnt == BLANK_COUNT) {
    if (!write_count(0)) {
      Log::error("fault log: failed to format blank log area");
    }
  }
}

bool FaultLog::log_error(FileIdentifier file, std::uint32_t code,
                         std::source_location loc) {
  std::lock_guard lock{m_mutex};
  std::array<std::uint8_t, 4> raw{};
  if (!m_flash.read(Flash::LOG_COUNT_ADDR, raw)) {
    Log::error("fault log: count unreadable");
    return false;
  }
  const auto cnt = range_cast<std::uint32_t>(raw);
  const auto addr = static_cast<std::uint32_t>(
      Flash::LOG_BASE_ADDR + (cnt % Flash::LOG_CAPACITY) * Flash::LOG_RECORD_SIZE);

  Wire::Writer w;
  w.put(std::uint32_t{0})
      .put(static_cast<std::uint32_t>(loc.line()))
      .put(code)
      .put(m_state.boot_timestamp.load())
      .put(static_cast<std::uint32_t>(file))
      .put_bytes(m_state.revision);
  const auto record = std::move(w).take();

  Log::debug("fault log: record {} at 0x{:06x} ({}:{} code 0x{:x})", cnt, addr,
             file_identifier_str(static_cast<std::uint32_t>(file)), loc.line(),
             code);
  if (!m_flash.erase(addr, Flash::LOG_RECORD_SIZE) ||
      !m_flash.write(addr, record) || !write_count(cnt + 1)) {
    Log::error("fault log: failed to store fault 0x{:x} from {}:{}", code,
               file_identifier_str(static_cast<std::uint32_t>(file)),
               loc.line());
    return false;
  }
  return true;
}

std::optional<std::uint32_t> FaultLog::count() const {
  std::array<std::uint8_t, 4> raw{};
  if (!m_flash.read(Flash::LOG_COUNT_ADDR, raw)) {
    return std::nullopt;
  }
  return range_cast<std::uint32_t>(raw);
}

bool FaultLog::clear() {
  std::lock_guard lock{m_mutex};
  if (!m_flash.erase(Flash::LOG_COUNT_ADDR, LOG_END - Flash::LOG_COUNT_ADDR)) {
    Log::error("fault log: erase failed");
    return false;
  }
  return write_count(0);
}

bool FaultLog::write_count(std::uint32_t count) {
  return m_flash.write(Flash::LOG_COUNT_ADDR, le_bytes(count));
}
