// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <catch2/catch.hpp>

#include <BufferedStream.hpp>
#include <Commands.hpp>
#include <StreamProtocol.hpp>

#include <chrono>
#include <span>
#include <vector>

#include "test_utils.hpp"

using namespace std::chrono_literals;
using TS = IUsbDevice::TransferStatus;

namespace {
struct StreamObjects : TestObjects {
  StreamObjects() {
    dev->bus().set_registers(SENSOR, 0, 0x10, std::vector<std::uint8_t>{0x34, 0x12});
    dev->bus().set_registers(SENSOR, 0, 0x20,
                             std::vector<std::uint8_t>{0x78, 0x56, 0x34, 0x12});
    dev->bus().set_registers(SENSOR, 2, 0x05, std::vector<std::uint8_t>{0xAB});
  }
  FakeClock clock;
  BufferedStream stream{ep, ctx, 1ms, clock.fn()};
};

const StreamRegisterSet WORD_AND_DWORD{{0x10, 0, 2}, {0x20, 0, 4}};
const StreamRegisterSet SINGLE_BYTE{{0x05, 2, 1}};
} // namespace

TEST_CASE("Stream delivers the requested number of buffers", "[stream]") {
  StreamObjects objs;
  REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 2, 5, 1000ms).ok());
  REQUIRE(objs.stream.state() == StreamState::STREAMING);
  REQUIRE(objs.ctx.stream_active.load());

  objs.dev->fire_data_ready(7);
  REQUIRE(objs.dev->firmware().stream().produced() == 5);

  for (std::uint32_t i = 0; i < 5; ++i) {
    auto packet = objs.stream.get_packet();
    REQUIRE(packet.ok());
    REQUIRE(packet->has_value());
    const auto &p = **packet;
    REQUIRE(p.sequence == i);
    REQUIRE(p.captures == 2);
    REQUIRE(p.words == std::vector<std::uint16_t>{0x1234, 0x5678, 0x1234,
                                                  0x1234, 0x5678, 0x1234});
    auto values = convert_buffer_data_to_u32(p);
    REQUIRE(values.ok());
    REQUIRE(*values ==
            std::vector<std::uint32_t>{0x1234, 0x12345678, 0x1234, 0x12345678});
  }
  REQUIRE(objs.stream.state() == StreamState::IDLE);
  REQUIRE_FALSE(objs.ctx.stream_active.load());
  REQUIRE(objs.stream.delivered() == 5);

  auto after = objs.stream.get_packet();
  REQUIRE(after.ok());
  REQUIRE_FALSE(after->has_value());
}

TEST_CASE("Stream poll without data", "[stream]") {
  StreamObjects objs;
  REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 3, 100ms).ok());

  auto packet = objs.stream.get_packet();
  REQUIRE(packet.ok());
  REQUIRE_FALSE(packet->has_value());
  REQUIRE(objs.stream.state() == StreamState::STREAMING);
}

TEST_CASE("Stream times out without data", "[stream]") {
  StreamObjects objs;
  REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 3, 100ms).ok());
  objs.dev->fire_data_ready();
  objs.clock.advance(80ms);
  REQUIRE(objs.stream.get_packet()->has_value());

  // the timeout restarts with every retrieved buffer
  objs.clock.advance(80ms);
  REQUIRE_FALSE(objs.stream.get_packet()->has_value());
  REQUIRE(objs.stream.state() == StreamState::STREAMING);

  objs.clock.advance(30ms);
  auto packet = objs.stream.get_packet();
  REQUIRE(packet.ok());
  REQUIRE_FALSE(packet->has_value());
  REQUIRE(objs.stream.state() == StreamState::TIMED_OUT);
  REQUIRE_FALSE(objs.ctx.stream_active.load());
  REQUIRE(objs.dev->transfer_count(Command::STREAM_STOP) == 1);
  REQUIRE_FALSE(objs.dev->firmware().stream().active());

  REQUIRE_FALSE(objs.stream.get_packet()->has_value());
  REQUIRE(objs.dev->transfer_count(Command::STREAM_STOP) == 1);

  SECTION("a new stream can be started after a timeout") {
    REQUIRE(objs.stream.start(SINGLE_BYTE, SENSOR, 1, 1, 100ms).ok());
    REQUIRE(objs.stream.state() == StreamState::STREAMING);
  }
}

TEST_CASE("Stop discards pending buffers", "[stream]") {
  StreamObjects objs;
  REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 5, 1000ms).ok());
  objs.dev->fire_data_ready(2);
  REQUIRE(objs.dev->firmware().endpoint(IUsbDevice::BulkEndpoint::STREAM_IN)
              .size() == 2);

  REQUIRE(objs.stream.stop().ok());
  REQUIRE(objs.stream.state() == StreamState::IDLE);
  REQUIRE_FALSE(objs.ctx.stream_active.load());
  REQUIRE(objs.dev->firmware().endpoint(IUsbDevice::BulkEndpoint::STREAM_IN)
              .size() == 0);
  REQUIRE_FALSE(objs.stream.get_packet()->has_value());

  objs.dev->fire_data_ready();
  REQUIRE(objs.dev->firmware().endpoint(IUsbDevice::BulkEndpoint::STREAM_IN)
              .size() == 0);
}

TEST_CASE("Packets keep their register set", "[stream]") {
  StreamObjects objs;
  REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 1, 1000ms).ok());
  objs.dev->fire_data_ready();
  auto first = objs.stream.get_packet();
  REQUIRE(first->has_value());
  const auto first_regs = objs.stream.registers();

  REQUIRE(objs.stream.start(SINGLE_BYTE, SENSOR, 3, 1, 1000ms).ok());
  objs.dev->fire_data_ready();
  auto second = objs.stream.get_packet();
  REQUIRE(second->has_value());

  REQUIRE(objs.stream.registers() != first_regs);
  REQUIRE((*first)->registers == first_regs);
  REQUIRE((*first)->registers->size() == 2);
  REQUIRE((*second)->registers->size() == 1);

  REQUIRE(*convert_buffer_data_to_u32(**first) ==
          std::vector<std::uint32_t>{0x1234, 0x12345678});
  REQUIRE(*convert_buffer_data_to_u32(**second) ==
          std::vector<std::uint32_t>{0xAB, 0xAB, 0xAB});
}

TEST_CASE("Stream start validation", "[stream]") {
  StreamObjects objs;

  SECTION("empty register set") {
    REQUIRE(objs.stream.start({}, SENSOR, 1, 1, 100ms).code ==
            Err::CONFIGURATION);
  }
  SECTION("unsupported register width") {
    REQUIRE(objs.stream.start({{0x10, 0, 3}}, SENSOR, 1, 1, 100ms).code ==
            Err::CONFIGURATION);
  }
  SECTION("zero captures") {
    REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 0, 1, 100ms).code ==
            Err::CONFIGURATION);
  }
  SECTION("zero buffers") {
    REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 0, 100ms).code ==
            Err::CONFIGURATION);
  }
  SECTION("packet larger than the device buffer") {
    REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 3000, 1, 100ms).code ==
            Err::CONFIGURATION);
  }
  REQUIRE(objs.stream.state() == StreamState::IDLE);
  REQUIRE(objs.dev->transfer_count(Command::STREAM_START) == 0);
}

TEST_CASE("Stream start failures", "[stream]") {
  StreamObjects objs;

  SECTION("already streaming") {
    REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 1, 100ms).ok());
    REQUIRE(objs.stream.start(SINGLE_BYTE, SENSOR, 1, 1, 100ms).code ==
            Err::INVALID_STATE);
    REQUIRE(objs.stream.state() == StreamState::STREAMING);
  }
  SECTION("device rejects the start command") {
    objs.dev->fail_control(Command::STREAM_START, TS::STALL);
    REQUIRE(objs.stream.start(WORD_AND_DWORD, SENSOR, 1, 1, 100ms).code ==
            Err::COMMUNICATION);
    REQUIRE(objs.stream.state() == StreamState::IDLE);
    REQUIRE_FALSE(objs.ctx.stream_active.load());
  }
}

TEST_CASE("Device side overruns drop captures", "[stream]") {
  StreamObjects objs;
  REQUIRE(objs.stream.start(SINGLE_BYTE, SENSOR, 1, 20, 1000ms).ok());
  objs.dev->fire_data_ready(Firmware::STREAM_IN_DEPTH + 2);
  REQUIRE(objs.dev->firmware().stream().produced() == Firmware::STREAM_IN_DEPTH);
  REQUIRE(objs.dev->firmware().stream().overruns() == 2);
}

TEST_CASE("Buffer data conversion", "[stream]") {
  const StreamRegisterSet regs{{0x01, 0, 1}, {0x02, 0, 2}, {0x03, 0, 4}};
  const std::vector<std::uint16_t> words{0x00AB, 0x1234, 0x5678, 0x9ABC,
                                         0x00CD, 0x4321, 0x0001, 0x0000};

  auto values = convert_buffer_data_to_u32(regs, words);
  REQUIRE(values.ok());
  REQUIRE(*values == std::vector<std::uint32_t>{0xAB, 0x1234, 0x9ABC5678, 0xCD,
                                                0x4321, 0x0001});

  auto bad = convert_buffer_data_to_u32(regs, std::span{words}.first(5));
  REQUIRE(bad.code() == Err::LAYOUT_MISMATCH);

  const StreamRegisterSet wide{{0x01, 0, 8}};
  const std::vector<std::uint16_t> four{0x0001, 0x0002, 0x0003, 0x0004};
  REQUIRE(convert_buffer_data_to_u32(wide, four).code() == Err::CONFIGURATION);
}

TEST_CASE("Stream start payload layout", "[stream][codec]") {
  StreamRequest req{2, 5, 1000, SENSOR, WORD_AND_DWORD};
  auto payload = encode_stream_request(req);
  REQUIRE(payload.ok());
  REQUIRE(payload->size() == StreamPayload::HEADER_SIZE + 2 * 3);
  const std::vector<std::uint8_t> expected{
      0x02, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0xE8, 0x03, 0x00,
      0x00, 0x48, 0x02, 0x00, 0x10, 0x00, 0x02, 0x20, 0x00, 0x04};
  REQUIRE(*payload == expected);

  auto decoded = decode_stream_request(*payload);
  REQUIRE(decoded.ok());
  REQUIRE(decoded->registers.size() == 2);
  REQUIRE(decoded->registers[1].num_bytes == 4);

  REQUIRE_FALSE(decode_stream_request(std::span{*payload}.first(20)).ok());
}
