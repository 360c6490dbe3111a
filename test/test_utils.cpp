// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <catch2/catch.hpp>

#include <Wire.hpp>
#include <utils.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <sstream>
#include <vector>

namespace {
// revision "SB-2.4.1", NUL padding, LE timestamp 0x56341265
constexpr std::array<std::uint8_t, 16> RECORD{0x53, 0x42, 0x2d, 0x32, 0x2e, 0x34,
                                              0x2e, 0x31, 0x00, 0x00, 0x00, 0x00,
                                              0x65, 0x12, 0x34, 0x56};
} // namespace

TEST_CASE("test dump hex line", "[utils][dump_line]") {
  SECTION("full line") {
    std::stringstream ss;
    OstreamDumper dumper(ss, 8);
    dumper.dump_line(0x1000, std::span{RECORD}.first(8));
    REQUIRE(ss.str() == "0x001000 | 53 42 2d 32 2e 34 2e 31 | SB-2.4.1 |");
  }
  SECTION("partial line") {
    std::stringstream ss;
    OstreamDumper dumper(ss);
    dumper.dump_line(0x40, std::span{RECORD}.first(6));
    REQUIRE(ss.str() ==
            "0x000040 | 53 42 2d 32 2e 34                               | "
            "SB-2.4           |");
  }
}

TEST_CASE("test dump memory", "[utils][dump_memory]") {
  SECTION("multiple full lines") {
    std::stringstream ss;
    OstreamDumper dumper(ss, 8);
    dumper.dump_memory(0x1000, RECORD);
    REQUIRE(ss.str() == "0x001000 | 53 42 2d 32 2e 34 2e 31 | SB-2.4.1 |\n"
                        "0x001008 | 00 00 00 00 65 12 34 56 | ....e.4V |\n");
  }
  SECTION("last line partial") {
    std::stringstream ss;
    OstreamDumper dumper(ss, 8);
    dumper.dump_memory(0x1000, std::span{RECORD}.first(13));
    REQUIRE(ss.str() == "0x001000 | 53 42 2d 32 2e 34 2e 31 | SB-2.4.1 |\n"
                        "0x001008 | 00 00 00 00 65          | ....e    |\n");
  }
  SECTION("nothing to dump") {
    std::stringstream ss;
    OstreamDumper dumper(ss, 8);
    dumper.dump_memory(0x1000, std::vector<std::uint8_t>{});
    REQUIRE(ss.str().empty());
  }
}

TEST_CASE("little endian conversions", "[utils][endian]") {
  REQUIRE(range_cast<std::uint32_t>(std::span{RECORD}.subspan(12)) ==
          0x56341265);
  REQUIRE(range_cast<std::uint16_t>(std::span{RECORD}.first(2)) == 0x4253);
  // short ranges leave the high bytes zero
  REQUIRE(range_cast<std::uint32_t>(std::span{RECORD}.subspan(12, 2)) ==
          0x1265);

  REQUIRE(le_bytes(std::uint32_t{0x0A0B0C0D}) ==
          std::array<std::uint8_t, 4>{0x0D, 0x0C, 0x0B, 0x0A});
  REQUIRE(le_bytes(std::uint16_t{0x1000}) ==
          std::array<std::uint8_t, 2>{0x00, 0x10});
  REQUIRE(range_cast<std::uint32_t>(le_bytes(std::uint32_t{0xDEADBEEF})) ==
          0xDEADBEEF);
}

TEST_CASE("wire reader", "[utils][wire]") {
  Wire::Reader r{RECORD};
  auto rev = r.get_bytes(12);
  REQUIRE(rev);
  REQUIRE(rev->size() == 12);
  REQUIRE((*rev)[0] == 0x53);
  REQUIRE(r.get<std::uint32_t>() == 0x56341265u);
  REQUIRE(r.remaining() == 0);

  SECTION("reads past the end fail without consuming") {
    REQUIRE_FALSE(r.get<std::uint8_t>());
    REQUIRE_FALSE(r.get_bytes(1));
    REQUIRE(r.position() == RECORD.size());
  }
  SECTION("partially available field") {
    Wire::Reader shortr{std::span{RECORD}.first(3)};
    REQUIRE(shortr.get<std::uint16_t>() == 0x4253u);
    REQUIRE_FALSE(shortr.get<std::uint16_t>());
    REQUIRE(shortr.remaining() == 1);
  }
}

TEST_CASE("wire writer", "[utils][wire]") {
  Wire::Writer w;
  w.put(std::uint16_t{0x0102}).put(std::uint8_t{0x48}).put(0xA0B0C0D0u);
  const std::array<std::uint8_t, 2> tail{0xEE, 0xFF};
  w.put_bytes(tail);
  REQUIRE(w.size() == 9);
  REQUIRE(std::move(w).take() ==
          std::vector<std::uint8_t>{0x02, 0x01, 0x48, 0xD0, 0xC0, 0xB0, 0xA0,
                                    0xEE, 0xFF});
}
