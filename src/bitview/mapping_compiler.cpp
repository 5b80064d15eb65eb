#include "bitview/mapping_compiler.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "absl/container/flat_hash_set.h"
#include "bitview/bit_range.hpp"
#include "bitview/common/bit_utils.hpp"
#include "bitview/common/error.hpp"

namespace bitview {

namespace {

constexpr std::string_view kDefaultTypeName = "BitField";

struct NormalizedEntry {
  std::string name;
  BitRange range;
  const Schema* block;
};

auto Qualify(std::string_view scope, std::string_view name) -> std::string {
  if (scope.empty()) {
    return std::string(name);
  }
  return std::format("{}.{}", scope, name);
}

void CheckName(
    std::string_view scope, const std::string& name,
    absl::flat_hash_set<std::string>& seen) {
  if (name.empty()) {
    ThrowValueError(
        std::format(
            "empty field name in '{}'",
            scope.empty() ? kDefaultTypeName : scope));
  }
  if (name.front() == '_') {
    ThrowValueError(
        std::format(
            "field name '{}' is reserved (names starting with '_' are "
            "schema keys)",
            Qualify(scope, name)));
  }
  if (!seen.insert(name).second) {
    ThrowValueError(
        std::format("field '{}' is declared twice", Qualify(scope, name)));
  }
}

void CheckBlock(std::string_view qualified, const Schema& block) {
  if (!block.IndexRange()) {
    ThrowValueError(
        std::format("nested block '{}' has no _index_", qualified));
  }
  if (block.DeclaredSize() || block.DeclaredMask()) {
    ThrowValueError(
        std::format(
            "nested block '{}' cannot declare _size_ or _mask_; they follow "
            "from its _index_",
            qualified));
  }
}

// Validate names, normalize ranges and track overlap for one mapping level.
auto NormalizeEntries(
    const std::vector<SchemaEntry>& entries, std::string_view scope,
    const CompileOptions& options) -> std::vector<NormalizedEntry> {
  std::vector<NormalizedEntry> result;
  result.reserve(entries.size());
  absl::flat_hash_set<std::string> seen;
  uint64_t touched = 0;

  for (const auto& entry : entries) {
    CheckName(scope, entry.name, seen);
    std::string qualified = Qualify(scope, entry.name);
    if (entry.IsNested()) {
      CheckBlock(qualified, *entry.block);
    }

    BitRange range;
    try {
      range = NormalizeRange(entry.range);
    } catch (const IndexError& e) {
      ThrowIndexError(std::format("field '{}': {}", qualified, e.what()));
    }

    uint64_t shared = touched & range.Mask();
    if (shared != 0) {
      if (options.reject_overlaps) {
        ThrowIndexError(
            std::format(
                "field '{}' overlaps other fields on bits {:#b}", qualified,
                shared));
      }
      spdlog::debug(
          "field '{}' overlaps other fields on bits {:#b}", qualified, shared);
    }
    touched |= range.Mask();

    result.push_back(
        NormalizedEntry{
            .name = entry.name,
            .range = range,
            .block = entry.IsNested() ? entry.block.get() : nullptr});
  }
  return result;
}

auto BuildFields(
    const std::vector<NormalizedEntry>& entries, uint64_t mask,
    std::string_view scope, const CompileOptions& options)
    -> std::vector<FieldSpec> {
  std::vector<FieldSpec> fields;
  fields.reserve(entries.size());

  for (const auto& entry : entries) {
    std::string qualified = Qualify(scope, entry.name);
    uint32_t width = entry.range.Width();
    uint64_t field_mask = SliceMask(mask, entry.range);

    if (entry.block == nullptr) {
      fields.push_back(
          FieldSpec{
              .name = entry.name,
              .range = entry.range,
              .type = TypeDescriptor::Unmapped(entry.name, width, field_mask)});
      continue;
    }

    // Nested block: children are relative to the block's own start.
    auto children =
        NormalizeEntries(entry.block->Entries(), qualified, options);
    for (const auto& child : children) {
      if (child.range.end > width) {
        ThrowIndexError(
            std::format(
                "field '{}' at {} lies outside its {}-bit block",
                Qualify(qualified, child.name), ToString(child.range), width));
      }
    }
    fields.push_back(
        FieldSpec{
            .name = entry.name,
            .range = entry.range,
            .type = std::make_shared<const TypeDescriptor>(
                entry.name, width, field_mask,
                BuildFields(children, field_mask, qualified, options))});
  }
  return fields;
}

struct Geometry {
  uint32_t size;
  uint64_t mask;
  bool bounded;
};

auto ResolveGeometry(
    const Schema& schema, const std::vector<NormalizedEntry>& entries)
    -> Geometry {
  auto size = schema.DeclaredSize();
  auto mask = schema.DeclaredMask();

  if (size) {
    if (*size <= 0) {
      ThrowValueError(std::format("_size_ must be positive, got {}", *size));
    }
    if (*size > static_cast<int64_t>(common::kMaxBitWidth)) {
      ThrowValueError(
          std::format(
              "_size_ {} exceeds the {}-bit storage word", *size,
              common::kMaxBitWidth));
    }
    auto bits = static_cast<uint32_t>(*size);
    if (!mask) {
      return {.size = bits, .mask = common::MakeBitMask(bits), .bounded = true};
    }
    if (common::BitLength(*mask) > bits) {
      ThrowValueError(
          std::format(
              "_mask_ {:#x} needs {} bits but _size_ is {}", *mask,
              common::BitLength(*mask), bits));
    }
    return {.size = bits, .mask = *mask, .bounded = true};
  }

  if (mask) {
    if (*mask == 0) {
      ThrowValueError("_mask_ selects no bits");
    }
    return {
        .size = common::BitLength(*mask), .mask = *mask, .bounded = true};
  }

  if (entries.empty()) {
    return {
        .size = common::kMaxBitWidth,
        .mask = common::MakeBitMask(common::kMaxBitWidth),
        .bounded = false};
  }

  uint32_t end = 0;
  for (const auto& entry : entries) {
    end = std::max(end, entry.range.end);
  }
  return {.size = end, .mask = common::MakeBitMask(end), .bounded = true};
}

}  // namespace

auto Compile(const Schema& schema, CompileOptions options) -> TypeRef {
  std::string name =
      schema.Name().empty() ? std::string(kDefaultTypeName) : schema.Name();

  if (schema.IndexRange()) {
    ThrowValueError(
        std::format(
            "'{}': _index_ is reserved for slicing nested blocks", name));
  }

  auto entries = NormalizeEntries(schema.Entries(), "", options);
  Geometry geometry = ResolveGeometry(schema, entries);

  for (const auto& entry : entries) {
    if (entry.range.end > geometry.size) {
      ThrowIndexError(
          std::format(
              "field '{}' at {} lies outside the {}-bit value", entry.name,
              ToString(entry.range), geometry.size));
    }
  }

  auto fields = BuildFields(entries, geometry.mask, "", options);
  spdlog::debug(
      "compiled '{}': size={} mask={:#x} fields={}", name, geometry.size,
      geometry.mask, fields.size());

  return std::make_shared<const TypeDescriptor>(
      std::move(name), geometry.size, geometry.mask, std::move(fields),
      geometry.bounded);
}

}  // namespace bitview
