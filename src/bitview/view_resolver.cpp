#include "bitview/view_resolver.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <variant>

#include "bitview/common/error.hpp"

namespace bitview {

auto ResolveName(const TypeDescriptor& type, std::string_view name)
    -> ResolvedView {
  const FieldSpec* field = type.Find(name);
  if (field == nullptr) {
    if (!type.HasFields()) {
      ThrowIndexError(
          std::format(
              "'{}' has no field mapping (looked up '{}')", type.Name(),
              name));
    }
    ThrowIndexError(std::format("'{}' has no field '{}'", type.Name(), name));
  }
  return ResolvedView{.range = field->range, .type = field->type};
}

auto ResolvePath(const TypeDescriptor& type, std::string_view path)
    -> ResolvedView {
  const TypeDescriptor* current = &type;
  ResolvedView result{.range = {}, .type = nullptr};
  uint32_t offset = 0;

  size_t pos = 0;
  while (true) {
    size_t dot = path.find('.', pos);
    std::string_view segment = path.substr(
        pos, dot == std::string_view::npos ? std::string_view::npos
                                           : dot - pos);
    if (segment.empty()) {
      ThrowIndexError(std::format("empty segment in field path '{}'", path));
    }

    ResolvedView step = ResolveName(*current, segment);
    result = ResolvedView{
        .range = step.range.Shifted(offset), .type = step.type};
    offset = result.range.start;
    current = step.type.get();

    if (dot == std::string_view::npos) {
      break;
    }
    pos = dot + 1;
  }
  return result;
}

auto ResolveRange(const TypeDescriptor& type, const RangeExpr& expr)
    -> ResolvedView {
  BitRange range = NormalizeRange(expr);
  if (range.end > type.TotalSize()) {
    ThrowIndexError(
        std::format(
            "{} is outside the {}-bit value '{}'", ToString(range),
            type.TotalSize(), type.Name()));
  }

  std::string name =
      std::holds_alternative<int64_t>(expr)
          ? std::format("{}_index_{}", type.Name(), range.start)
          : std::format("{}_slice_{}_{}", type.Name(), range.start, range.end);
  return ResolvedView{.range = range, .type = type.Slice(range, name)};
}

}  // namespace bitview
