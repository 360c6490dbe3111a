// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <catch2/catch.hpp>

#include <BusTransaction.hpp>
#include <Commands.hpp>
#include <I2CInterface.hpp>
#include <StreamProtocol.hpp>
#include <fwd.hpp>
#include <utils.hpp>

#include <array>
#include <vector>

#include "test_utils.hpp"

using TS = IUsbDevice::TransferStatus;

namespace {
std::uint32_t transaction_status(MockUsbDevice &dev) {
  std::array<std::uint8_t, 4> buf{};
  REQUIRE(dev.firmware().handle_control(
      {to_underlying(Command::GET_TRANSACTION_STATUS), IUsbDevice::Direction::IN},
      buf));
  return range_cast<std::uint32_t>(buf);
}

bool send(MockUsbDevice &dev, Command cmd, std::vector<std::uint8_t> payload) {
  return dev.firmware().handle_control(
      {to_underlying(cmd), IUsbDevice::Direction::OUT}, payload);
}
} // namespace

TEST_CASE("Bus payload layout", "[bus][codec]") {
  SECTION("read header is little endian") {
    auto p = Preamble::make({0x90, 0x01, 0x10, 0x91}, 0x0004);
    REQUIRE(p.ok());
    auto payload = encode_read(*p, 0x0102, 0x0A0B0C0D);
    REQUIRE(payload.ok());
    const std::vector<std::uint8_t> expected{
        0x02, 0x01, 0x00, 0x00, 0x0D, 0x0C, 0x0B, 0x0A, 0x04,
        0x04, 0x00, 0x90, 0x01, 0x10, 0x91};
    REQUIRE(*payload == expected);
  }
  SECTION("write data follows a 3 byte preamble at offset 14") {
    auto p = Preamble::make({0x90, 0x00, 0x20});
    const std::vector<std::uint8_t> data{0xAA, 0xBB, 0xCC};
    auto payload = encode_write(*p, data, 10);
    REQUIRE(payload.ok());
    REQUIRE(BusPayload::data_offset(3) == 14);
    REQUIRE(payload->size() == 17);
    REQUIRE((*payload)[14] == 0xAA);
    REQUIRE((*payload)[16] == 0xCC);

    auto t = decode_transaction(*payload, TransactionKind::WRITE);
    REQUIRE(t.ok());
    REQUIRE(t->data_offset == 14);
    REQUIRE(t->num_bytes == 3);
    REQUIRE(t->timeout_ms == 10);
    REQUIRE(t->preamble.length == 3);
    REQUIRE(std::vector<std::uint8_t>(t->write_data.begin(),
                                      t->write_data.end()) == data);
  }
  SECTION("empty preamble puts the data right after the header") {
    auto p = Preamble::make({});
    auto payload = encode_write(*p, std::vector<std::uint8_t>{0x55}, 1);
    REQUIRE(payload->size() == BusPayload::HEADER_SIZE + 1);
    REQUIRE(payload->back() == 0x55);
  }
}

TEST_CASE("Bus payload limits", "[bus][codec]") {
  SECTION("preamble longer than 8 bytes") {
    auto p = Preamble::make({1, 2, 3, 4, 5, 6, 7, 8, 9});
    REQUIRE(p.code() == Err::CONFIGURATION);
  }
  SECTION("read above the maximum") {
    auto p = Preamble::make({0x90});
    REQUIRE(encode_read(*p, 4096, 10).ok());
    REQUIRE(encode_read(*p, 4097, 10).code() == Err::CONFIGURATION);
  }
  SECTION("write payload above the control transfer maximum") {
    auto p = Preamble::make({});
    std::vector<std::uint8_t> data(Usb::MAX_CONTROL_PAYLOAD -
                                   BusPayload::HEADER_SIZE);
    REQUIRE(encode_write(*p, data, 10).ok());
    data.push_back(0);
    REQUIRE(encode_write(*p, data, 10).code() == Err::CONFIGURATION);
  }
}

TEST_CASE("Malformed payloads are refused before touching the bus",
          "[bus][codec]") {
  auto p = Preamble::make({0x90, 0x00, 0x20});
  const auto payload =
      *encode_write(*p, std::vector<std::uint8_t>{1, 2, 3, 4}, 10);

  SECTION("every truncation is rejected by the decoder") {
    for (std::size_t n = 0; n < payload.size(); ++n) {
      auto t = decode_transaction(std::span{payload}.first(n),
                                  TransactionKind::WRITE);
      REQUIRE_FALSE(t.ok());
    }
  }
  SECTION("oversized preamble length") {
    auto bad = payload;
    bad[8] = 9;
    REQUIRE(decode_transaction(bad, TransactionKind::WRITE).code() ==
            Err::CONFIGURATION);
  }
  SECTION("device answers BAD_ARGUMENT without bus activity") {
    auto objs = setup();
    auto truncated = payload;
    truncated.resize(payload.size() - 1);
    REQUIRE(send(*objs.dev, Command::I2C_WRITE_BYTES, truncated));
    REQUIRE(transaction_status(*objs.dev) ==
            static_cast<std::uint32_t>(BusStatus::BAD_ARGUMENT));
    REQUIRE(send(*objs.dev, Command::I2C_READ_BYTES, {0x01, 0x00}));
    REQUIRE(transaction_status(*objs.dev) ==
            static_cast<std::uint32_t>(BusStatus::BAD_ARGUMENT));
    REQUIRE(objs.dev->bus().attempts() == 0);
    REQUIRE(objs.dev->firmware().fault_log().count() == 0u);
  }
}

TEST_CASE("I2C register access", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);
  const std::vector<std::uint8_t> regs{0x11, 0x22, 0x33, 0x44};
  objs.dev->bus().set_registers(SENSOR, 1, 0x10, regs);

  SECTION("read") {
    auto p = register_read_preamble(SENSOR, StreamRegister{0x10, 1});
    auto res = i2c.read(*p, 4, 50);
    REQUIRE(res.ok());
    REQUIRE(*res == regs);
    REQUIRE(objs.dev->transfer_count(Command::I2C_READ_BYTES) == 1);
    REQUIRE(objs.dev->transfer_count(Command::GET_TRANSACTION_STATUS) == 1);
  }
  SECTION("write") {
    auto p = Preamble::make({SENSOR << 1, 0x01, 0x12});
    const std::vector<std::uint8_t> data{0xA5, 0x5A};
    REQUIRE(i2c.write(*p, data, 50).ok());
    REQUIRE(objs.dev->bus().registers(SENSOR, 1, 0x10, 4) ==
            std::vector<std::uint8_t>{0x11, 0x22, 0xA5, 0x5A});
  }
  SECTION("absent device") {
    auto p = register_read_preamble(0x21, StreamRegister{0x10, 1});
    auto res = i2c.read(*p, 4, 50);
    REQUIRE(res.code() == Err::DEVICE_FAULT);
    REQUIRE(res.status().detail == static_cast<std::int64_t>(BusStatus::NACK));
  }
}

TEST_CASE("Bus retries on the device", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);
  REQUIRE(i2c.set_retry_count(2).ok());
  REQUIRE(objs.dev->firmware().state().i2c_retry_count.load() == 2);
  auto p = register_read_preamble(SENSOR, StreamRegister{0x00, 0});

  SECTION("transient failures are absorbed") {
    objs.dev->bus().fail_next(BusStatus::TIMEOUT, 2);
    REQUIRE(i2c.read(*p, 2, 50).ok());
    REQUIRE(objs.dev->bus().attempts() == 3);
    REQUIRE(objs.dev->firmware().fault_log().count() == 0u);
  }
  SECTION("persistent failure is logged once") {
    objs.dev->bus().fail_next(BusStatus::TIMEOUT, 3);
    auto res = i2c.read(*p, 2, 50);
    REQUIRE(res.code() == Err::DEVICE_FAULT);
    REQUIRE(res.status().detail ==
            static_cast<std::int64_t>(BusStatus::TIMEOUT));
    REQUIRE(objs.dev->bus().attempts() == 3);
    REQUIRE(objs.dev->firmware().fault_log().count() == 1u);
  }
}

TEST_CASE("Retry count bound", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);

  SECTION("host refuses counts above the maximum") {
    auto st = i2c.set_retry_count(I2C::MAX_RETRY_COUNT + 1);
    REQUIRE(st.code == Err::CONFIGURATION);
    REQUIRE(objs.dev->transfer_count(Command::I2C_SET_RETRY_COUNT) == 0);
    REQUIRE(i2c.set_retry_count(0xFFFF'FFFF).code == Err::CONFIGURATION);
    REQUIRE(i2c.set_retry_count(I2C::MAX_RETRY_COUNT).ok());
    REQUIRE(objs.ctx.i2c_retry_count == I2C::MAX_RETRY_COUNT);
  }
  SECTION("device clamps a raw oversized count") {
    REQUIRE(send(*objs.dev, Command::I2C_SET_RETRY_COUNT,
                 {0xFF, 0xFF, 0xFF, 0xFF}));
    REQUIRE(objs.dev->firmware().state().i2c_retry_count.load() ==
            I2C::MAX_RETRY_COUNT);

    objs.dev->bus().set_registers(SENSOR, 0, 0x30,
                                  std::vector<std::uint8_t>{0x5A, 0xA5});
    objs.dev->bus().fail_next(BusStatus::TIMEOUT, 1);
    auto p = register_read_preamble(SENSOR, StreamRegister{0x30, 0});
    auto res = i2c.read(*p, 2, 50);
    REQUIRE(res.ok());
    REQUIRE(*res == std::vector<std::uint8_t>{0x5A, 0xA5});
    REQUIRE(objs.dev->bus().attempts() == 2);
  }
}

namespace {
std::size_t i2c_in_pending(MockUsbDevice &dev) {
  return dev.firmware().endpoint(IUsbDevice::BulkEndpoint::I2C_IN).size();
}
} // namespace

TEST_CASE("Uncollected read data does not leak into the next read",
          "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);
  objs.dev->bus().set_registers(SENSOR, 0, 0x40,
                                std::vector<std::uint8_t>{0xAA, 0xAA});
  objs.dev->bus().set_registers(SENSOR, 0, 0x50,
                                std::vector<std::uint8_t>{0xBB, 0xBB});
  auto reg_a = register_read_preamble(SENSOR, StreamRegister{0x40, 0});
  auto reg_b = register_read_preamble(SENSOR, StreamRegister{0x50, 0});

  SECTION("status readback failed") {
    objs.dev->fail_control(Command::GET_TRANSACTION_STATUS, TS::TIMEOUT);
    REQUIRE(i2c.read(*reg_a, 2, 50).code() == Err::COMMUNICATION);
  }
  SECTION("bulk read never issued") {
    REQUIRE(send(*objs.dev, Command::I2C_READ_BYTES, *encode_read(*reg_a, 2, 50)));
  }
  REQUIRE(i2c_in_pending(*objs.dev) == 1);

  auto res = i2c.read(*reg_b, 2, 50);
  REQUIRE(res.ok());
  REQUIRE(*res == std::vector<std::uint8_t>{0xBB, 0xBB});
  REQUIRE(i2c_in_pending(*objs.dev) == 0);
}

TEST_CASE("A write discards uncollected read data", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);
  auto reg_a = register_read_preamble(SENSOR, StreamRegister{0x40, 0});
  REQUIRE(send(*objs.dev, Command::I2C_READ_BYTES, *encode_read(*reg_a, 2, 50)));
  REQUIRE(i2c_in_pending(*objs.dev) == 1);

  auto p = Preamble::make({SENSOR << 1, 0x00, 0x60});
  const std::vector<std::uint8_t> data{0x01};
  REQUIRE(i2c.write(*p, data, 50).ok());
  REQUIRE(i2c_in_pending(*objs.dev) == 0);
}

TEST_CASE("USB failures are not retried", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);
  objs.dev->fail_control(Command::I2C_WRITE_BYTES, TS::TIMEOUT);
  auto p = Preamble::make({SENSOR << 1, 0x00, 0x00});
  const std::vector<std::uint8_t> data{1};

  auto st = i2c.write(*p, data, 50);
  REQUIRE(st.code == Err::COMMUNICATION);
  REQUIRE(st.detail == static_cast<std::int64_t>(TS::TIMEOUT));
  REQUIRE(objs.dev->transfer_count(Command::I2C_WRITE_BYTES) == 1);
  REQUIRE(objs.dev->transfer_count(Command::GET_TRANSACTION_STATUS) == 0);
  REQUIRE(objs.dev->bus().attempts() == 0);
}

TEST_CASE("Bus commands are refused while streaming", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);
  auto p = Preamble::make({SENSOR << 1, 0x00, 0x00});
  const std::vector<std::uint8_t> data{1};

  SECTION("host side") {
    objs.ctx.stream_active = true;
    REQUIRE(i2c.write(*p, data, 50).code == Err::INVALID_STATE);
    REQUIRE(i2c.read(*p, 1, 50).code() == Err::INVALID_STATE);
    REQUIRE(i2c.set_bit_rate(400'000).code == Err::INVALID_STATE);
    REQUIRE(objs.dev->transfers().empty());
  }
  SECTION("device side") {
    StreamRequest req{1, 4, 100, SENSOR, {StreamRegister{0x00, 0}}};
    REQUIRE(send(*objs.dev, Command::STREAM_START, *encode_stream_request(req)));
    REQUIRE(send(*objs.dev, Command::I2C_WRITE_BYTES, *encode_write(*p, data, 50)));
    REQUIRE(transaction_status(*objs.dev) ==
            static_cast<std::uint32_t>(BusStatus::BUSY));
    REQUIRE(objs.dev->bus().attempts() == 0);
  }
}

TEST_CASE("I2C bit rate", "[bus][i2c]") {
  auto objs = setup();
  I2CInterface i2c(objs.ep, objs.ctx);

  SECTION("clamped to the supported range") {
    REQUIRE(i2c.set_bit_rate(5'000'000).ok());
    REQUIRE(objs.ctx.i2c_bit_rate == I2C::MAX_BIT_RATE);
    REQUIRE(objs.dev->bus().bit_rate() == I2C::MAX_BIT_RATE);
    REQUIRE(i2c.set_bit_rate(10'000).ok());
    REQUIRE(objs.ctx.i2c_bit_rate == I2C::MIN_BIT_RATE);
    REQUIRE(objs.dev->firmware().state().i2c_bit_rate.load() == I2C::MIN_BIT_RATE);
  }
  SECTION("bus init failure") {
    objs.dev->bus().fail_init(true);
    auto st = i2c.set_bit_rate(400'000);
    REQUIRE(st.code == Err::DEVICE_FAULT);
    REQUIRE(st.detail == static_cast<std::int64_t>(BusStatus::INIT_FAILED));
    REQUIRE(objs.dev->firmware().fault_log().count() == 1u);
  }
}
