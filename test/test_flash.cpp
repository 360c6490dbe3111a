// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <catch2/catch.hpp>

#include <Commands.hpp>
#include <FlashAccess.hpp>
#include <fwd.hpp>

#include "test_utils.hpp"

using TS = IUsbDevice::TransferStatus;

TEST_CASE("Flash read argument validation", "[flash]") {
  auto objs = setup();
  FlashAccess flash(objs.ep);

  SECTION("address beyond the flash") {
    auto res = flash.read_flash(0x4'0001, 4);
    REQUIRE(res.code() == Err::CONFIGURATION);
    REQUIRE(objs.dev->transfer_count(Command::READ_FLASH) == 0);
  }
  SECTION("length above the per-transfer maximum") {
    auto res = flash.read_flash(0, 4097);
    REQUIRE(res.code() == Err::CONFIGURATION);
    REQUIRE(objs.dev->transfer_count(Command::READ_FLASH) == 0);
  }
  SECTION("maximum transfer") {
    auto res = flash.read_flash(0, 4096);
    REQUIRE(res.ok());
    REQUIRE(res->size() == 4096);
    REQUIRE(objs.dev->transfer_count(Command::READ_FLASH) == 1);
  }
}

TEST_CASE("Flash read addressing", "[flash]") {
  auto objs = setup();
  FlashAccess flash(objs.ep);
  const auto data = pattern(16, 3);
  REQUIRE(objs.dev->firmware().flash().write(0x3'4567, data));

  auto res = flash.read_flash(0x3'4567, 16);
  REQUIRE(res.ok());
  REQUIRE(*res == data);

  const auto transfers = objs.dev->transfers();
  REQUIRE(transfers.size() == 1);
  REQUIRE(transfers[0].request == to_underlying(Command::READ_FLASH));
  REQUIRE(transfers[0].dir == IUsbDevice::Direction::IN);
  REQUIRE(transfers[0].value == 0x4567);
  REQUIRE(transfers[0].index == 0x0003);
  REQUIRE(transfers[0].length == 16);
}

TEST_CASE("Flash region read is chunked", "[flash]") {
  auto objs = setup();
  FlashAccess flash(objs.ep);
  const auto data = pattern(6000, 11);
  REQUIRE(objs.dev->firmware().flash().write(0x1000, data));

  auto res = flash.read_flash_region(0x1000, 6000);
  REQUIRE(res.ok());
  REQUIRE(*res == data);

  const auto transfers = objs.dev->transfers();
  REQUIRE(transfers.size() == 2);
  REQUIRE(transfers[0].length == 4096);
  REQUIRE(transfers[0].value == 0x1000);
  REQUIRE(transfers[1].length == 1904);
  REQUIRE(transfers[1].value == 0x2000);
}

TEST_CASE("Flash read failures are reported, not retried", "[flash]") {
  auto objs = setup();
  FlashAccess flash(objs.ep);
  objs.dev->fail_control(Command::READ_FLASH, TS::STALL);

  auto res = flash.read_flash(0, 32);
  REQUIRE(res.code() == Err::COMMUNICATION);
  REQUIRE(res.status().detail == static_cast<std::int64_t>(TS::STALL));
  REQUIRE(objs.dev->transfer_count(Command::READ_FLASH) == 1);

  REQUIRE(flash.read_flash(0, 32).ok());
}

TEST_CASE("Flash read past the end stalls on the device", "[flash]") {
  auto objs = setup();
  FlashAccess flash(objs.ep);
  auto res = flash.read_flash(0x3'FFF0, 32);
  REQUIRE(res.code() == Err::COMMUNICATION);
  REQUIRE(res.status().detail == static_cast<std::int64_t>(TS::STALL));
}

TEST_CASE("Clearing the fault log", "[flash]") {
  auto objs = setup();
  FlashAccess flash(objs.ep);
  auto &log = objs.dev->firmware().fault_log();
  REQUIRE(log.log_error(FileIdentifier::FIRMWARE, 0x11));
  REQUIRE(log.log_error(FileIdentifier::FIRMWARE, 0x12));
  REQUIRE(log.count() == 2u);

  REQUIRE(flash.clear_log().ok());
  REQUIRE(log.count() == 0u);

  const auto transfers = objs.dev->transfers();
  REQUIRE(transfers.size() == 1);
  REQUIRE(transfers[0].request == to_underlying(Command::CLEAR_FLASH_LOG));
  REQUIRE(transfers[0].dir == IUsbDevice::Direction::OUT);
  REQUIRE(transfers[0].length == 4);

  objs.dev->fail_control(Command::CLEAR_FLASH_LOG, TS::TIMEOUT);
  REQUIRE(flash.clear_log().code == Err::COMMUNICATION);
}
