// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <ControlEndpoint.hpp>
#include <Status.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

// Linear view of the bridge flash. Addresses are validated against
// Flash::ADDRESS_LIMIT and single transfers against Flash::MAX_TRANSFER
// before anything is put on the wire.
class FlashAccess {
public:
  explicit FlashAccess(ControlEndpoint &ep) : m_ep{ep} {}

  Result<std::vector<std::uint8_t>> read_flash(std::uint32_t address,
                                               std::size_t length);

  // Reads an arbitrary sized region as a sequence of read_flash() calls
  Result<std::vector<std::uint8_t>> read_flash_region(std::uint32_t address,
                                                      std::size_t length);

  Status clear_log();

private:
  ControlEndpoint &m_ep;
};
