// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <DeviceState.hpp>
#include <FileIdentifier.hpp>
#include <FlashImage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <source_location>

// Writer side of the flash resident error log. Records go to
// LOG_BASE_ADDR + (count % LOG_CAPACITY) * LOG_RECORD_SIZE, the stored
// count keeps growing past the capacity.
class FaultLog {
public:
  FaultLog(FlashImage &flash, DeviceState const &state);

  // Best effort, a failing flash write is reported and false returned
  bool log_error(FileIdentifier file, std::uint32_t code,
                 std::source_location loc = std::source_location::current());

  std::optional<std::uint32_t> count() const;

  bool clear();

private:
  bool write_count(std::uint32_t count);

  FlashImage &m_flash;
  DeviceState const &m_state;
  mutable std::mutex m_mutex;
};
