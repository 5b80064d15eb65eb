#pragma once

#include <cstdint>
#include <string_view>

#include "bitview/bit_range.hpp"
#include "bitview/type_descriptor.hpp"

namespace bitview {

// Outcome of a lookup on a value of some type: the window the view covers,
// in the coordinates of the looked-up value, and the type of the view.
struct ResolvedView {
  BitRange range;
  TypeRef type;
};

// Mapped field by name. Throws IndexError when `name` is not mapped.
auto ResolveName(const TypeDescriptor& type, std::string_view name)
    -> ResolvedView;

// Dotted path of field names ("status.ready"); offsets accumulate through
// nested blocks. Throws IndexError on an empty segment or unmapped name.
auto ResolvePath(const TypeDescriptor& type, std::string_view path)
    -> ResolvedView;

// Ad-hoc window by bit index or range. The range is normalized first and
// must end at or below type.TotalSize(); otherwise IndexError.
auto ResolveRange(const TypeDescriptor& type, const RangeExpr& expr)
    -> ResolvedView;

}  // namespace bitview
