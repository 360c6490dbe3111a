// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ErrorLog.hpp>
#include <Log.hpp>
#include <utils.hpp>

#include <algorithm>
#include <ostream>

#include <fmt/format.h>
#include <range/v3/view/chunk.hpp>

namespace {
constexpr std::size_t LINE_OFFSET = 4;
constexpr std::size_t ERROR_CODE_OFFSET = 8;
constexpr std::size_t BOOT_TIME_OFFSET = 12;
constexpr std::size_t FILE_ID_OFFSET = 16;
constexpr std::size_t REVISION_OFFSET = 20;

static_assert(REVISION_OFFSET + Usb::FIRMWARE_REV_SIZE ==
              Flash::LOG_RECORD_SIZE);

std::uint32_t u32_at(std::span<const std::uint8_t> s, std::size_t offset) {
  return range_cast<std::uint32_t>(s.subspan(offset, 4));
}
} // namespace

std::optional<ErrorLogEntry>
ErrorLogEntry::parse(std::span<const std::uint8_t> record) {
  if (record.size() < Flash::LOG_RECORD_SIZE) {
    return std::nullopt;
  }
  ErrorLogEntry entry;
  entry.m_line = u32_at(record, LINE_OFFSET);
  entry.m_error_code = u32_at(record, ERROR_CODE_OFFSET);
  entry.m_boot_timestamp = u32_at(record, BOOT_TIME_OFFSET);
  entry.m_file_identifier = u32_at(record, FILE_ID_OFFSET);
  const auto rev = record.subspan(REVISION_OFFSET, Usb::FIRMWARE_REV_SIZE);
  // C string in a fixed field, anything after the terminator is padding
  const auto rev_end = std::find(rev.begin(), rev.end(), std::uint8_t{0});
  entry.m_firmware_revision.assign(rev.begin(), rev_end);
  return entry;
}

std::ostream &operator<<(std::ostream &os, ErrorLogEntry const &entry) {
  return os << fmt::format("file: {} line: {} error code: 0x{:x} boot "
                           "time: {} firmware: {}",
                           entry.file_identifier(), entry.line(),
                           entry.error_code(), entry.boot_timestamp(),
                           entry.firmware_revision());
}

Result<std::uint32_t> ErrorLogStore::count() {
  auto raw = m_flash.read_flash(Flash::LOG_COUNT_ADDR, 4);
  if (!raw) {
    return raw.status();
  }
  return range_cast<std::uint32_t>(*raw);
}

Result<std::vector<ErrorLogEntry>> ErrorLogStore::log() {
  auto cnt = count();
  if (!cnt) {
    return cnt.status();
  }
  std::vector<ErrorLogEntry> entries;
  if (*cnt == 0) {
    return entries;
  }
  if (*cnt > Flash::LOG_CAPACITY) {
    Log::info("error log count {} exceeds capacity, reading {} entries",
              *cnt, Flash::LOG_CAPACITY);
  }
  const auto clamped = std::min(*cnt, Flash::LOG_CAPACITY);

  auto raw = m_flash.read_flash_region(Flash::LOG_BASE_ADDR,
                                       clamped * Flash::LOG_RECORD_SIZE);
  if (!raw) {
    return raw.status();
  }
  entries.reserve(clamped);
  for (auto &&record : *raw | rgv::chunk(Flash::LOG_RECORD_SIZE)) {
    const auto bytes = std::span<const std::uint8_t>{
        &*rg::begin(record), static_cast<std::size_t>(rg::size(record))};
    auto entry = ErrorLogEntry::parse(bytes);
    if (!entry) {
      return Status::Error(
          Err::LAYOUT_MISMATCH,
          fmt::format("error log record {} truncated to {} bytes",
                      entries.size(), bytes.size()),
          static_cast<std::int64_t>(bytes.size()));
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}
