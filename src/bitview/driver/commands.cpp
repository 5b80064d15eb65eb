#include "commands.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "bitview/bit_field.hpp"
#include "bitview/common/diagnostic.hpp"
#include "bitview/common/error.hpp"
#include "bitview/config/schema_file.hpp"
#include "bitview/descriptor_arena.hpp"
#include "bitview/format.hpp"
#include "bitview/persisted_state.hpp"
#include "print.hpp"

namespace bitview::driver {

namespace {

// Target of one PATH=VALUE assignment.
struct Assignment {
  std::string path;
  std::string value;
};

auto LoadType(const argparse::ArgumentParser& cmd, DescriptorArena& arena)
    -> Result<TypeRef> {
  auto path = cmd.get<std::string>("--schema");
  auto file = config::LoadSchemaFile(path, arena);
  if (!file) {
    return std::unexpected(std::move(file).error());
  }
  return file->type;
}

auto ParseValue(const TypeRef& type, const std::string& text, int base)
    -> Result<BitField> {
  try {
    return BitField(type, text, base);
  } catch (const Error& e) {
    return std::unexpected(Diagnostic::Error(text, e));
  }
}

auto ReadOptions(const argparse::ArgumentParser& cmd) -> FormatOptions {
  return FormatOptions{
      .max_indent = cmd.get<uint32_t>("--max-indent"),
      .indent_step = cmd.get<uint32_t>("--indent-step"),
  };
}

auto ParseAssignment(std::string_view text) -> Result<Assignment> {
  size_t eq = text.find('=');
  if (eq == std::string_view::npos || eq == 0 || eq + 1 == text.size()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::string(text),
            "expected an assignment of the form PATH=VALUE"));
  }
  return Assignment{
      .path = std::string(text.substr(0, eq)),
      .value = std::string(text.substr(eq + 1)),
  };
}

auto ParseIndex(std::string_view text, std::string_view path) -> int64_t {
  int64_t index = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, index);
  if (text.empty() || ec != std::errc() || ptr != end) {
    ThrowIndexError(std::format("malformed bit index in '{}'", path));
  }
  return index;
}

// PATH is a bit index ("3"), a half-open range ("1:4") or a dotted field
// path ("status.ready").
auto ResolveTarget(BitField& value, std::string_view path) -> BitField {
  size_t colon = path.find(':');
  if (colon != std::string_view::npos) {
    return value.View(
        ParseIndex(path.substr(0, colon), path),
        ParseIndex(path.substr(colon + 1), path));
  }
  bool numeric = !path.empty() &&
                 (std::isdigit(static_cast<unsigned char>(path[0])) != 0 ||
                  path[0] == '-');
  if (numeric) {
    return value.View(ParseIndex(path, path));
  }
  return value.ViewPath(path);
}

auto ApplyAssignment(BitField& value, const Assignment& assignment)
    -> Result<void> {
  try {
    BitField target = ResolveTarget(value, assignment.path);
    BitField operand(nullptr, assignment.value, 0);
    if ((operand.Read() & ~target.TotalMask()) != 0) {
      PrintDiagnostic(
          Diagnostic::Warning(
              assignment.path,
              std::format(
                  "value {} is wider than the target; only bits of mask "
                  "0x{:X} are stored",
                  assignment.value, target.TotalMask())));
    }
    spdlog::debug(
        "{} <- {} ({})", assignment.path, operand.Read(), target.Repr());
    target.Write(operand.Read());
  } catch (const Error& e) {
    auto diag = Diagnostic::Error(assignment.path, e);
    if (e.Kind() == ErrorKind::kIndex && !value.Fields().empty()) {
      diag = std::move(diag).WithNote(
          fmt::format(
              "fields of '{}': {}", value.Name(),
              fmt::join(value.Fields(), ", ")));
    }
    return std::unexpected(std::move(diag));
  }
  return {};
}

}  // namespace

auto LayoutCommand(const argparse::ArgumentParser& cmd) -> int {
  DescriptorArena arena;
  auto type = LoadType(cmd, arena);
  if (!type) {
    PrintDiagnostic(type.error());
    return 1;
  }
  std::cout << FormatLayout(**type);
  return 0;
}

auto DecodeCommand(const argparse::ArgumentParser& cmd) -> int {
  DescriptorArena arena;
  auto type = LoadType(cmd, arena);
  if (!type) {
    PrintDiagnostic(type.error());
    return 1;
  }
  auto value =
      ParseValue(*type, cmd.get<std::string>("value"), cmd.get<int>("--base"));
  if (!value) {
    PrintDiagnostic(value.error());
    return 1;
  }
  std::cout << FormatValue(*value, ReadOptions(cmd)) << "\n";
  return 0;
}

auto SetCommand(const argparse::ArgumentParser& cmd) -> int {
  DescriptorArena arena;
  auto type = LoadType(cmd, arena);
  if (!type) {
    PrintDiagnostic(type.error());
    return 1;
  }
  auto value =
      ParseValue(*type, cmd.get<std::string>("value"), cmd.get<int>("--base"));
  if (!value) {
    PrintDiagnostic(value.error());
    return 1;
  }

  for (const auto& text : cmd.get<std::vector<std::string>>("assignments")) {
    auto assignment = ParseAssignment(text);
    if (!assignment) {
      PrintDiagnostic(assignment.error());
      return 1;
    }
    if (auto ok = ApplyAssignment(*value, *assignment); !ok) {
      PrintDiagnostic(ok.error());
      return 1;
    }
  }
  std::cout << FormatValue(*value, ReadOptions(cmd)) << "\n";
  return 0;
}

auto StateCommand(const argparse::ArgumentParser& cmd) -> int {
  DescriptorArena arena;
  auto type = LoadType(cmd, arena);
  if (!type) {
    PrintDiagnostic(type.error());
    return 1;
  }
  auto value =
      ParseValue(*type, cmd.get<std::string>("value"), cmd.get<int>("--base"));
  if (!value) {
    PrintDiagnostic(value.error());
    return 1;
  }
  std::cout << ToJson(value->State()) << "\n";
  return 0;
}

auto RestoreCommand(const argparse::ArgumentParser& cmd) -> int {
  DescriptorArena arena;
  auto type = LoadType(cmd, arena);
  if (!type) {
    PrintDiagnostic(type.error());
    return 1;
  }
  try {
    BitField value = BitField::FromState(
        ParseState(cmd.get<std::string>("state")), *type);
    std::cout << FormatValue(value, ReadOptions(cmd)) << "\n";
  } catch (const Error& e) {
    PrintDiagnostic(Diagnostic::Error("state", e));
    return 1;
  }
  return 0;
}

}  // namespace bitview::driver
