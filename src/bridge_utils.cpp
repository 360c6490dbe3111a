// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "bridge_utils.hpp"

#include <BusTransaction.hpp>
#include <utils.hpp>

#include <cctype>
#include <chrono>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/enumerate.hpp>

namespace {
std::uint8_t to_u8(unsigned val, std::string_view what) {
  if (val > 0xFF) {
    throw std::out_of_range(fmt::format("{} out of range: {}", what, val));
  }
  return static_cast<std::uint8_t>(val);
}

unsigned parse_number(std::string const &str) {
  std::size_t pos = 0;
  const auto val = std::stoul(str, &pos, 0);
  if (pos != str.size()) {
    throw std::invalid_argument(fmt::format("invalid number: {}", str));
  }
  return static_cast<unsigned>(val);
}

Preamble register_preamble(argparse::ArgumentParser const &args, bool read) {
  const auto dut = to_u8(args.get<unsigned>("--dut"), "device address");
  const auto page = to_u8(args.get<unsigned>("--page"), "page");
  const auto reg = to_u8(args.get<unsigned>("--reg"), "register");
  if (read) {
    return unwrap(register_read_preamble(dut, StreamRegister{reg, page}));
  }
  return unwrap(Preamble::make({static_cast<std::uint8_t>(dut << 1), page, reg}));
}
} // namespace

std::unique_ptr<AugmentedParser> get_parser() {
  std::unique_ptr<AugmentedParser> parser(new AugmentedParser{
      argparse::ArgumentParser{"sensorbridge", SENSORBRIDGE_VER,
                               argparse::default_arguments::all},
      0});

  auto *program = &parser->parser;
  auto &exec_group = program->add_mutually_exclusive_group();

  exec_group.add_argument("-l", "--error-log")
      .help("print the fault history stored in the bridge flash")
      .flag();
  exec_group.add_argument("--error-count")
      .help("print the raw number of faults recorded since the last clear")
      .flag();
  exec_group.add_argument("--clear-log")
      .help("erase the fault history")
      .flag();
  exec_group.add_argument("-d", "--dump-flash")
      .help("hex dump of a flash region, see --address and --length")
      .flag();
  exec_group.add_argument("-r", "--i2c-read")
      .help("read --length bytes from register --reg of device --dut")
      .flag();
  exec_group.add_argument("-w", "--i2c-write")
      .help("write --content to register --reg of device --dut")
      .flag();
  exec_group.add_argument("-s", "--stream")
      .help("buffered capture of the registers given with --register")
      .flag();

  program->add_argument("-V", "--verbose")
      .action([verbose = std::addressof(parser->verbosity)](const auto &) {
        *verbose += 1;
      })
      .append()
      .nargs(0)
      .help("print more information about the operation")
      .default_value(false)
      .implicit_value(true);

  program->add_argument("-a", "--address")
      .help("flash base address")
      .default_value(0u)
      .scan<'i', unsigned>();
  program->add_argument("-n", "--length")
      .help("number of bytes to dump or read")
      .default_value(256u)
      .scan<'i', unsigned>();

  program->add_argument("--dut")
      .help("7-bit I2C address of the sensor")
      .default_value(0x48u)
      .scan<'i', unsigned>();
  program->add_argument("--page")
      .help("register page")
      .default_value(0u)
      .scan<'i', unsigned>();
  program->add_argument("--reg")
      .help("register address")
      .default_value(0u)
      .scan<'i', unsigned>();
  program->add_argument("-c", "--content")
      .help("data to write as a hex string, e.g 0xAABB");
  program->add_argument("--bus-timeout")
      .help("bus timeout of one transaction attempt in ms")
      .default_value(100u)
      .scan<'i', unsigned>();

  program->add_argument("--register")
      .default_value<std::vector<std::string>>({})
      .append()
      .help("stream register as page:address[:width], width is 1, 2 or 4 "
            "bytes (default 2)");
  program->add_argument("--captures")
      .help("register set captures per data ready event")
      .default_value(1u)
      .scan<'i', unsigned>();
  program->add_argument("--buffers")
      .help("number of buffers to stream")
      .default_value(10u)
      .scan<'i', unsigned>();
  program->add_argument("--stream-timeout")
      .help("stream is abandoned when no buffer arrives for this many ms")
      .default_value(1000u)
      .scan<'i', unsigned>();

  program->add_argument("--vid")
      .help("USB vendor id of the bridge")
      .default_value(unsigned{UsbId{}.vid})
      .scan<'i', unsigned>();
  program->add_argument("--pid")
      .help("USB product id of the bridge")
      .default_value(unsigned{UsbId{}.pid})
      .scan<'i', unsigned>();
  program->add_argument("--attempts")
      .help("number of connection attempts")
      .default_value(LinkConfig{}.connect_attempts)
      .scan<'i', unsigned>();
  program->add_argument("--bit-rate")
      .help("I2C bit rate in bps, clamped by the bridge to [100k, 1M]")
      .default_value(LinkConfig{}.i2c_bit_rate)
      .scan<'i', std::uint32_t>();
  program->add_argument("--retries")
      .help(fmt::format("bus transaction retries on the bridge, at most {}",
                        I2C::MAX_RETRY_COUNT))
      .default_value(LinkConfig{}.i2c_retry_count)
      .scan<'i', std::uint32_t>();
  return parser;
}

LinkConfig link_config(argparse::ArgumentParser const &parser) {
  LinkConfig cfg{};
  cfg.usb_id.vid = static_cast<std::uint16_t>(parser.get<unsigned>("--vid"));
  cfg.usb_id.pid = static_cast<std::uint16_t>(parser.get<unsigned>("--pid"));
  cfg.connect_attempts = parser.get<unsigned>("--attempts");
  cfg.i2c_bit_rate = parser.get<std::uint32_t>("--bit-rate");
  cfg.i2c_retry_count = parser.get<std::uint32_t>("--retries");
  return cfg;
}

std::vector<std::uint8_t> parse_hex_bytes(std::string_view str) {
  if (str.starts_with("0x") || str.starts_with("0X")) {
    str.remove_prefix(2);
  }
  if (str.empty() || str.size() % 2 != 0) {
    throw std::invalid_argument("hex content must have an even number of "
                                "digits");
  }
  std::vector<std::uint8_t> res;
  for (auto &&digits : str | rgv::chunk(2)) {
    std::string byte(rg::begin(digits), rg::end(digits));
    if (!std::isxdigit(static_cast<unsigned char>(byte[0])) ||
        !std::isxdigit(static_cast<unsigned char>(byte[1]))) {
      throw std::invalid_argument(fmt::format("invalid hex digits: {}", byte));
    }
    res.push_back(static_cast<std::uint8_t>(std::stoul(byte, nullptr, 16)));
  }
  return res;
}

StreamRegister parse_register(std::string_view str) {
  std::vector<unsigned> fields;
  std::string s{str};
  std::size_t start = 0;
  while (true) {
    const auto end = s.find(':', start);
    fields.push_back(parse_number(s.substr(start, end - start)));
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  if (fields.size() < 2 || fields.size() > 3) {
    throw std::invalid_argument(
        fmt::format("register must be page:address[:width], got {}", str));
  }
  StreamRegister reg{to_u8(fields[1], "register"), to_u8(fields[0], "page")};
  if (fields.size() == 3) {
    reg.num_bytes = to_u8(fields[2], "register width");
  }
  return reg;
}

void print_error_log(std::ostream &os, Connection &conn) {
  const auto entries = unwrap(conn.error_log().log());
  os << fmt::format("{} fault(s) recorded\n", entries.size());
  for (const auto &[idx, entry] : entries | rgv::enumerate) {
    os << fmt::format("#{:<4} ", idx) << entry << '\n';
  }
}

void execDumpFlash(argparse::ArgumentParser const &args, Connection &conn) {
  const auto address = args.get<unsigned>("--address");
  const auto length = args.get<unsigned>("--length");
  const auto data = unwrap(conn.flash().read_flash_region(address, length));
  OstreamDumper dumper(std::cout);
  dumper.dump_memory(address, data);
}

void execI2CRead(argparse::ArgumentParser const &args, Connection &conn) {
  const auto preamble = register_preamble(args, true);
  const auto data = unwrap(conn.i2c().read(
      preamble, args.get<unsigned>("--length"),
      args.get<unsigned>("--bus-timeout")));
  OstreamDumper dumper(std::cout);
  dumper.dump_memory(args.get<unsigned>("--reg"), data);
}

void execI2CWrite(argparse::ArgumentParser const &args, Connection &conn) {
  const auto content = args.present("--content");
  if (!content) {
    throw std::invalid_argument("--i2c-write needs --content");
  }
  const auto data = parse_hex_bytes(*content);
  check(conn.i2c().write(register_preamble(args, false), data,
                         args.get<unsigned>("--bus-timeout")));
  Log::info("{} bytes written", data.size());
}

void execStream(argparse::ArgumentParser const &args, Connection &conn) {
  StreamRegisterSet regs;
  for (const auto &r : args.get<std::vector<std::string>>("--register")) {
    regs.push_back(parse_register(r));
  }
  auto &stream = conn.stream();
  check(stream.start(std::move(regs),
                     to_u8(args.get<unsigned>("--dut"), "device address"),
                     args.get<unsigned>("--captures"),
                     args.get<unsigned>("--buffers"),
                     std::chrono::milliseconds{
                         args.get<unsigned>("--stream-timeout")}));

  while (stream.state() == StreamState::STREAMING) {
    const auto packet = unwrap(stream.get_packet());
    if (!packet) {
      continue;
    }
    const auto values = unwrap(convert_buffer_data_to_u32(*packet));
    const auto per_capture = packet->registers->size();
    for (auto &&capture : values | rgv::chunk(per_capture)) {
      std::cout << packet->sequence;
      for (const auto val : capture) {
        std::cout << fmt::format(" 0x{:x}", val);
      }
      std::cout << '\n';
    }
  }
  if (stream.state() == StreamState::TIMED_OUT) {
    throw std::runtime_error(fmt::format(
        "stream timed out after {} buffers", stream.delivered()));
  }
}
