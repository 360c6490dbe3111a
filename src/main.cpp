// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <iostream>
#include <ostream>

#include "bridge_utils.hpp"

#include <Connection.hpp>
#include <IUsbDevice.hpp>
#include <Log.hpp>

#include <argparse/argparse.hpp>
#include <fmt/format.h>

int main(int argc, char *argv[]) try {
  auto pparser = get_parser();
  auto &aug_parser = *pparser;
  auto &parser = aug_parser.parser;
  parser.parse_args(argc, argv);
  Log::set_level(verbosity(aug_parser.verbosity));

  const auto cfg = link_config(parser);
  auto conn = unwrap(Connection::open(IUsbDevice::Create(cfg.usb_id), cfg));

  if (parser["--error-log"] == true) {
    print_error_log(std::cout, *conn);
  } else if (parser["--error-count"] == true) {
    std::cout << unwrap(conn->error_log().count()) << '\n';
  } else if (parser["--clear-log"] == true) {
    check(conn->error_log().clear());
  } else if (parser["--dump-flash"] == true) {
    execDumpFlash(parser, *conn);
  } else if (parser["--i2c-read"] == true) {
    execI2CRead(parser, *conn);
  } else if (parser["--i2c-write"] == true) {
    execI2CWrite(parser, *conn);
  } else if (parser["--stream"] == true) {
    execStream(parser, *conn);
  } else {
    const auto &ctx = conn->context();
    std::cout << fmt::format("Bridge firmware: {}\nBoot time: {}\n"
                             "I2C bit rate: {} bps\nI2C retries: {}\n",
                             ctx.firmware_revision, ctx.boot_timestamp,
                             ctx.i2c_bit_rate, ctx.i2c_retry_count);
  }
  return 0;
} catch (IUsbDevice::Interrupted const &e) {
  std::cerr << e.what() << '\n';
  return 0;
} catch (BridgeError const &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return e.code == Err::NO_DEVICE ? 2 : 1;
} catch (const std::exception &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return -1;
} catch (...) {
  std::cerr << "ERROR: Unknown exception occurred...\n";
  return -2;
}
