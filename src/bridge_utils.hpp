// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Connection.hpp>
#include <LinkConfig.hpp>
#include <Log.hpp>
#include <Status.hpp>
#include <StreamProtocol.hpp>

#include <argparse/argparse.hpp>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

struct AugmentedParser {
  argparse::ArgumentParser parser;
  int verbosity = 0;
};

struct BridgeError : std::runtime_error {
  explicit BridgeError(Status const &st)
      : std::runtime_error(st.to_string()), code{st.code} {}
  Err code;
};

inline void check(Status const &st) {
  if (!st) {
    throw BridgeError(st);
  }
}

template <typename T> T unwrap(Result<T> &&res) {
  if (!res) {
    throw BridgeError(res.status());
  }
  return std::move(res).value();
}

std::unique_ptr<AugmentedParser> get_parser();

LinkConfig link_config(argparse::ArgumentParser const &parser);

// "0xAABB.." into bytes
std::vector<std::uint8_t> parse_hex_bytes(std::string_view str);

// "page:address[:width]", numbers in C notation
StreamRegister parse_register(std::string_view str);

void print_error_log(std::ostream &os, Connection &conn);

void execDumpFlash(argparse::ArgumentParser const &args, Connection &conn);

void execI2CRead(argparse::ArgumentParser const &args, Connection &conn);

void execI2CWrite(argparse::ArgumentParser const &args, Connection &conn);

void execStream(argparse::ArgumentParser const &args, Connection &conn);
