// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <FlashImage.hpp>

#include <algorithm>
#include <istream>
#include <iterator>

bool FlashImage::read(std::uint32_t address,
                      std::span<std::uint8_t> out) const {
  std::lock_guard lock{m_mutex};
  if (!in_range(address, out.size())) {
    return false;
  }
  std::copy_n(m_data.begin() + address, out.size(), out.begin());
  return true;
}

bool FlashImage::write(std::uint32_t address,
                       std::span<const std::uint8_t> data) {
  std::lock_guard lock{m_mutex};
  if (m_write_protected || !in_range(address, data.size())) {
    return false;
  }
  std::copy(data.begin(), data.end(), m_data.begin() + address);
  return true;
}

bool FlashImage::erase(std::uint32_t address, std::size_t length) {
  std::lock_guard lock{m_mutex};
  if (m_write_protected || !in_range(address, length)) {
    return false;
  }
  std::fill_n(m_data.begin() + address, length, ERASED);
  return true;
}

std::size_t FlashImage::load(std::istream &is) {
  std::lock_guard lock{m_mutex};
  is.read(reinterpret_cast<char *>(m_data.data()),
          static_cast<std::streamsize>(m_data.size()));
  return static_cast<std::size_t>(is.gcount());
}

void FlashImage::set_write_protected(bool val) noexcept {
  std::lock_guard lock{m_mutex};
  m_write_protected = val;
}
