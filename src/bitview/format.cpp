#include "bitview/format.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "bitview/common/bit_utils.hpp"

namespace bitview {

namespace {

class ValueFormatter {
 public:
  explicit ValueFormatter(const FormatOptions& options) : options_(options) {
  }

  // `inline_start` omits the indent of the opening line; a multi-line value
  // then starts on a fresh line instead.
  void Format(const BitField& value, uint32_t indent, bool inline_start) {
    if (!value.Type()->HasFields() || indent >= options_.max_indent) {
      Pad(inline_start ? 0 : indent);
      fmt::format_to(Out(), "{}", FormatLine(value));
      return;
    }

    if (inline_start) {
      fmt::format_to(Out(), "\n");
    }
    Pad(indent);
    fmt::format_to(Out(), "{}", Body(value));

    const auto& fields = value.Type()->Fields();
    size_t width = 0;
    for (const auto& field : fields) {
      width = std::max(width, field.name.size());
    }
    uint64_t word = value.Read();
    for (const auto& field : fields) {
      BitField child(
          field.type,
          common::ExtractBits(word, field.range.start, field.range.Width()));
      fmt::format_to(Out(), "\n");
      Pad(indent + options_.indent_step);
      fmt::format_to(Out(), "{:<{}} = ", field.name, width);
      Format(child, indent + 2 * options_.indent_step, true);
    }
    fmt::format_to(Out(), "\n");
    Pad(indent);
    fmt::format_to(Out(), ">");
  }

  [[nodiscard]] auto Result() const -> std::string {
    return fmt::to_string(buffer_);
  }

  // Opening part of the one-line form, without the closing '>'.
  static auto Body(const BitField& value) -> std::string {
    uint64_t word = value.Read();
    std::string mask;
    if (value.Type()->IsBounded()) {
      mask = fmt::format(" & 0b{:b}", value.TotalMask());
    }
    return fmt::format(
        "<{} == 0x{:0{}X} == (0b{:0{}b}{})", word, word,
        value.ByteLength() * 2, word, value.BitSize(), mask);
  }

 private:
  auto Out() -> std::back_insert_iterator<fmt::memory_buffer> {
    return std::back_inserter(buffer_);
  }

  void Pad(uint32_t columns) {
    fmt::format_to(Out(), "{:{}}", "", columns);
  }

  FormatOptions options_;
  fmt::memory_buffer buffer_;
};

void AppendLayout(
    fmt::memory_buffer& out, const std::vector<MappingEntry>& entries,
    uint32_t indent) {
  size_t width = 0;
  for (const auto& entry : entries) {
    width = std::max(width, entry.name.size());
  }
  for (const auto& entry : entries) {
    fmt::format_to(
        std::back_inserter(out), "{:{}}{:<{}} [{}, {})  {} bit{}\n", "",
        indent, entry.name, width, entry.range.start, entry.range.end,
        entry.range.Width(), entry.range.Width() == 1 ? "" : "s");
    AppendLayout(out, entry.nested, indent + 2);
  }
}

}  // namespace

auto FormatLine(const BitField& value) -> std::string {
  return ValueFormatter::Body(value) + ">";
}

auto FormatValue(const BitField& value, const FormatOptions& options)
    -> std::string {
  ValueFormatter formatter(options);
  formatter.Format(value, 0, false);
  return formatter.Result();
}

auto FormatLayout(const TypeDescriptor& type) -> std::string {
  fmt::memory_buffer out;
  if (type.IsBounded()) {
    fmt::format_to(
        std::back_inserter(out), "{}: {} bits, mask 0x{:X}\n", type.Name(),
        type.TotalSize(), type.TotalMask());
  } else {
    fmt::format_to(
        std::back_inserter(out), "{}: unbounded ({} bits)\n", type.Name(),
        type.TotalSize());
  }
  AppendLayout(out, type.Mapping(), 2);
  return fmt::to_string(out);
}

}  // namespace bitview
