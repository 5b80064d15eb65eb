#include <argparse/argparse.hpp>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"

namespace {

constexpr const char* kVersion = "0.1.0";

void AddSchemaFlag(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--schema")
      .required()
      .metavar("FILE")
      .help("TOML schema file describing the bit layout");
}

void AddValueFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--base")
      .default_value(0)
      .scan<'i', int>()
      .help("Numeral base of VALUE (2..36, 0 detects 0x/0o/0b prefixes)");
  cmd.add_argument("value").help("Value to decode");
}

void AddFormatFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--indent-step")
      .default_value(uint32_t{4})
      .scan<'u', uint32_t>()
      .help("Columns per nesting level");
  cmd.add_argument("--max-indent")
      .default_value(uint32_t{20})
      .scan<'u', uint32_t>()
      .help("Indent past which fields are printed on one line");
}

// -v selects debug, -vv trace; --log-level names a level explicitly.
auto ConfigureLogging(const argparse::ArgumentParser& program, int verbosity)
    -> bool {
  auto logger = spdlog::stderr_color_mt("bitview");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%l] %v");

  spdlog::level::level_enum level = spdlog::level::warn;
  if (verbosity == 1) {
    level = spdlog::level::debug;
  } else if (verbosity >= 2) {
    level = spdlog::level::trace;
  }
  if (auto name = program.present<std::string>("--log-level")) {
    level = spdlog::level::from_str(*name);
    if (level == spdlog::level::off && *name != "off") {
      bitview::driver::PrintError(
          std::format(
              "unknown log level '{}', use trace, debug, info, warn, error "
              "or off",
              *name));
      return false;
    }
  }
  spdlog::set_level(level);
  return true;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  // -v is taken by verbosity, so --version is declared by hand.
  argparse::ArgumentParser program(
      "bitview", kVersion, argparse::default_arguments::help);
  program.add_description("Decode and edit values through a bit layout");
  program.add_argument("--version")
      .default_value(false)
      .implicit_value(true)
      .help("Print the version and exit");
  int verbosity = 0;
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (-v debug, -vv trace)");
  program.add_argument("--log-level").metavar("LEVEL").help(
      "Log level: trace, debug, info, warn, error or off");

  // Subcommand: layout
  argparse::ArgumentParser layout_cmd("layout");
  layout_cmd.add_description("Print the compiled layout of a schema");
  AddSchemaFlag(layout_cmd);

  // Subcommand: decode
  argparse::ArgumentParser decode_cmd("decode");
  decode_cmd.add_description("Print the field tree of a value");
  AddSchemaFlag(decode_cmd);
  AddFormatFlags(decode_cmd);
  AddValueFlags(decode_cmd);

  // Subcommand: set
  argparse::ArgumentParser set_cmd("set");
  set_cmd.add_description(
      "Apply PATH=VALUE writes to a value and print the result");
  AddSchemaFlag(set_cmd);
  AddFormatFlags(set_cmd);
  AddValueFlags(set_cmd);
  set_cmd.add_argument("assignments")
      .nargs(argparse::nargs_pattern::at_least_one)
      .help("Writes: a dotted field path, bit N or range S:E, then =VALUE");

  // Subcommand: state
  argparse::ArgumentParser state_cmd("state");
  state_cmd.add_description("Print the persisted state of a value as JSON");
  AddSchemaFlag(state_cmd);
  AddValueFlags(state_cmd);

  // Subcommand: restore
  argparse::ArgumentParser restore_cmd("restore");
  restore_cmd.add_description("Rebuild a value from its JSON state");
  AddSchemaFlag(restore_cmd);
  AddFormatFlags(restore_cmd);
  restore_cmd.add_argument("state").help("JSON produced by 'bitview state'");

  program.add_subparser(layout_cmd);
  program.add_subparser(decode_cmd);
  program.add_subparser(set_cmd);
  program.add_subparser(state_cmd);
  program.add_subparser(restore_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    bitview::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (program.get<bool>("--version")) {
    std::cout << kVersion << "\n";
    return 0;
  }

  if (!ConfigureLogging(program, verbosity)) {
    return 1;
  }

  if (program.is_subcommand_used("layout")) {
    return bitview::driver::LayoutCommand(layout_cmd);
  }
  if (program.is_subcommand_used("decode")) {
    return bitview::driver::DecodeCommand(decode_cmd);
  }
  if (program.is_subcommand_used("set")) {
    return bitview::driver::SetCommand(set_cmd);
  }
  if (program.is_subcommand_used("state")) {
    return bitview::driver::StateCommand(state_cmd);
  }
  if (program.is_subcommand_used("restore")) {
    return bitview::driver::RestoreCommand(restore_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
