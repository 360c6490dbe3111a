// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <BufferedStream.hpp>
#include <ControlEndpoint.hpp>
#include <LinkConfig.hpp>
#include <MockI2CBus.hpp>
#include <MockUsbDevice.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

constexpr std::uint8_t SENSOR = 0x48;

inline auto make_bus() {
  auto bus = std::make_shared<MockI2CBus>();
  bus->add_device(SENSOR);
  return bus;
}

struct TestObjects {
  TestObjects() : dev(std::make_shared<MockUsbDevice>(make_bus())) {
    dev->open();
  }
  std::shared_ptr<MockUsbDevice> dev;
  ControlEndpoint ep{dev};
  LinkContext ctx;
};
inline auto setup() { return TestObjects{}; }

// Manually advanced time source for the stream engine
struct FakeClock {
  BufferedStream::Clock::time_point now{};
  void advance(std::chrono::milliseconds d) { now += d; }
  BufferedStream::NowFn fn() {
    return [this] { return now; };
  }
};

inline LinkConfig fast_config() {
  LinkConfig cfg{};
  cfg.reconnect_wait = std::chrono::milliseconds{0};
  cfg.stream_poll = std::chrono::milliseconds{1};
  return cfg;
}

inline std::vector<std::uint8_t> pattern(std::size_t n, std::uint8_t seed = 0) {
  std::vector<std::uint8_t> res(n);
  for (std::size_t i = 0; i < n; ++i) {
    res[i] = static_cast<std::uint8_t>(seed + i * 7);
  }
  return res;
}
