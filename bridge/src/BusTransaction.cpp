// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <BusTransaction.hpp>
#include <Commands.hpp>
#include <Wire.hpp>

#include <algorithm>

#include <fmt/format.h>

namespace {

Status truncated(std::string_view field, std::size_t offset) {
  return Status::Error(
      Err::CONFIGURATION,
      fmt::format("bus transaction payload truncated at {} (offset {})",
                  field, offset),
      static_cast<std::int64_t>(offset));
}

Wire::Writer encode_header(Preamble const &preamble, std::uint32_t num_bytes,
                           std::uint32_t timeout_ms) {
  Wire::Writer w;
  w.put(num_bytes).put(timeout_ms).put(preamble.length).put(preamble.ctrl_mask);
  w.put_bytes(preamble.bytes());
  return w;
}

} // namespace

Result<Preamble> Preamble::make(std::span<const std::uint8_t> bytes,
                                std::uint16_t ctrl_mask) {
  if (bytes.size() > MAX_LENGTH) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("preamble of {} bytes, max allowed {}", bytes.size(),
                    MAX_LENGTH),
        static_cast<std::int64_t>(bytes.size()));
  }
  Preamble p{};
  std::copy(bytes.begin(), bytes.end(), p.buffer.begin());
  p.length = static_cast<std::uint8_t>(bytes.size());
  p.ctrl_mask = ctrl_mask;
  return p;
}

Result<std::vector<std::uint8_t>> encode_read(Preamble const &preamble,
                                              std::uint32_t num_bytes,
                                              std::uint32_t timeout_ms) {
  if (preamble.length > Preamble::MAX_LENGTH) {
    return Status::Error(Err::CONFIGURATION, "invalid preamble length",
                         preamble.length);
  }
  if (num_bytes > BusPayload::MAX_READ_BYTES) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("bus read of {} bytes, max allowed {}", num_bytes,
                    BusPayload::MAX_READ_BYTES),
        num_bytes);
  }
  return encode_header(preamble, num_bytes, timeout_ms).take();
}

Result<std::vector<std::uint8_t>>
encode_write(Preamble const &preamble, std::span<const std::uint8_t> data,
             std::uint32_t timeout_ms) {
  if (preamble.length > Preamble::MAX_LENGTH) {
    return Status::Error(Err::CONFIGURATION, "invalid preamble length",
                         preamble.length);
  }
  const auto total = BusPayload::data_offset(preamble.length) + data.size();
  if (total > Usb::MAX_CONTROL_PAYLOAD) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("bus write payload of {} bytes exceeds the {} byte "
                    "control transfer maximum",
                    total, Usb::MAX_CONTROL_PAYLOAD),
        static_cast<std::int64_t>(total));
  }
  auto w = encode_header(preamble, static_cast<std::uint32_t>(data.size()),
                         timeout_ms);
  w.put_bytes(data);
  return std::move(w).take();
}

Result<BusTransaction> decode_transaction(std::span<const std::uint8_t> payload,
                                          TransactionKind kind) {
  Wire::Reader r{payload};
  BusTransaction t{};
  t.kind = kind;

  const auto num_bytes = r.get<std::uint32_t>();
  if (!num_bytes) {
    return truncated("numBytes", r.position());
  }
  const auto timeout = r.get<std::uint32_t>();
  if (!timeout) {
    return truncated("timeout", r.position());
  }
  const auto preamble_len = r.get<std::uint8_t>();
  if (!preamble_len) {
    return truncated("preambleLength", r.position());
  }
  if (*preamble_len > Preamble::MAX_LENGTH) {
    return Status::Error(
        Err::CONFIGURATION,
        fmt::format("preamble length {} exceeds {}", *preamble_len,
                    Preamble::MAX_LENGTH),
        *preamble_len);
  }
  const auto ctrl_mask = r.get<std::uint16_t>();
  if (!ctrl_mask) {
    return truncated("ctrlMask", r.position());
  }
  const auto preamble = r.get_bytes(*preamble_len);
  if (!preamble) {
    return truncated("preamble", r.position());
  }

  t.num_bytes = *num_bytes;
  t.timeout_ms = *timeout;
  t.preamble.length = *preamble_len;
  t.preamble.ctrl_mask = *ctrl_mask;
  std::copy(preamble->begin(), preamble->end(), t.preamble.buffer.begin());
  t.data_offset = r.position();
  if (t.data_offset != BusPayload::data_offset(t.preamble.length)) {
    return Status::Error(Err::LAYOUT_MISMATCH,
                         "bus transaction header size mismatch",
                         static_cast<std::int64_t>(t.data_offset));
  }

  if (kind == TransactionKind::READ) {
    if (t.num_bytes > BusPayload::MAX_READ_BYTES) {
      return Status::Error(Err::CONFIGURATION, "bus read length too large",
                           t.num_bytes);
    }
    return t;
  }
  const auto data = r.get_bytes(t.num_bytes);
  if (!data) {
    return truncated("writeData", r.position());
  }
  t.write_data = *data;
  return t;
}
