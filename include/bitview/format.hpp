#pragma once

#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "bitview/bit_field.hpp"
#include "bitview/type_descriptor.hpp"

namespace bitview {

struct FormatOptions {
  // Nesting depth (in columns) past which a value is printed on one line.
  uint32_t max_indent = 20;
  uint32_t indent_step = 4;
};

// One-line form: "<205 == 0xCD == (0b11001101 & 0b11111111)>". The mask
// part is omitted for unbounded values.
auto FormatLine(const BitField& value) -> std::string;

// Multi-line field tree:
//
//   <255 == 0xFF == (0b11111111 & 0b11111111)
//       first  = <1 == 0x01 == (0b1 & 0b1)>
//       nested =
//           <31 == 0x1F == (0b11111 & 0b11111)
//               inner = <1 == 0x01 == (0b1 & 0b1)>
//           >
//   >
//
// Values without fields fall back to FormatLine().
auto FormatValue(const BitField& value, const FormatOptions& options = {})
    -> std::string;

// Compiled layout: header line with size and mask, then one line per field
// with its bit range, nested blocks indented below their parent.
auto FormatLayout(const TypeDescriptor& type) -> std::string;

}  // namespace bitview

template <>
struct fmt::formatter<bitview::BitField> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const bitview::BitField& value, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", bitview::FormatLine(value));
  }
};
