#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "bitview/bit_range.hpp"

namespace bitview {

class TypeDescriptor;

using TypeRef = std::shared_ptr<const TypeDescriptor>;

// A compiled field: its window inside the enclosing value (or block) and the
// type of the view it produces. For a nested block, the view type carries
// the block's own fields with offsets relative to `range.start`.
struct FieldSpec {
  std::string name;
  BitRange range;
  TypeRef type;

  [[nodiscard]] auto IsNested() const -> bool;
  [[nodiscard]] auto Children() const -> const std::vector<FieldSpec>&;

  // Structural: compares the view type by content, not identity.
  auto operator==(const FieldSpec& other) const -> bool;

  template <typename H>
  friend auto AbslHashValue(H h, const FieldSpec& f) -> H {
    return H::combine(std::move(h), f.name, f.range, *f.type);
  }
};

// Read-only introspection record for formatting and tooling.
struct MappingEntry {
  std::string name;
  BitRange range;
  std::vector<MappingEntry> nested;

  auto operator==(const MappingEntry&) const -> bool = default;
};

// Compiled, immutable layout of a bitfield type.
//
// Invariants:
//   - every top-level field ends at or below TotalSize()
//   - BitLength(TotalMask()) <= TotalSize() <= 64
// An unbounded type (no size, mask or fields declared) spans the whole
// 64-bit storage word.
class TypeDescriptor final {
 public:
  TypeDescriptor(
      std::string name, uint32_t total_size, uint64_t total_mask,
      std::vector<FieldSpec> fields, bool bounded = true);

  TypeDescriptor(const TypeDescriptor&) = delete;
  auto operator=(const TypeDescriptor&) -> TypeDescriptor& = delete;

  // Type with no mapped fields.
  static auto Unmapped(std::string name, uint32_t total_size, uint64_t mask)
      -> TypeRef;

  // Type of a plain value with no declared geometry.
  static auto Unbounded() -> TypeRef;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto TotalSize() const -> uint32_t {
    return total_size_;
  }
  [[nodiscard]] auto TotalMask() const -> uint64_t {
    return total_mask_;
  }
  [[nodiscard]] auto IsBounded() const -> bool {
    return bounded_;
  }
  [[nodiscard]] auto Fields() const -> const std::vector<FieldSpec>& {
    return fields_;
  }
  [[nodiscard]] auto HasFields() const -> bool {
    return !fields_.empty();
  }

  // Returns nullptr when `name` is not mapped.
  [[nodiscard]] auto Find(std::string_view name) const -> const FieldSpec*;

  // Field names in declaration order.
  [[nodiscard]] auto FieldNames() const -> std::vector<std::string>;

  // Deep copy of the name -> range mapping in declaration order.
  [[nodiscard]] auto Mapping() const -> std::vector<MappingEntry>;

  // Type of an unnamed window of this type: width-sized, with this type's
  // mask sliced to the window and shifted to bit 0.
  // Precondition: range.end <= TotalSize().
  [[nodiscard]] auto Slice(const BitRange& range, std::string name) const
      -> TypeRef;

  // Structural equality; the display name is metadata and ignored.
  auto operator==(const TypeDescriptor& other) const -> bool;

  template <typename H>
  friend auto AbslHashValue(H h, const TypeDescriptor& t) -> H {
    return H::combine(
        std::move(h), t.total_size_, t.total_mask_, t.bounded_, t.fields_);
  }

 private:
  std::string name_;
  uint32_t total_size_;
  uint64_t total_mask_;
  bool bounded_;
  std::vector<FieldSpec> fields_;
  absl::flat_hash_map<std::string, size_t> index_;
};

// Mask of `range` taken from `mask`, shifted down to bit 0.
auto SliceMask(uint64_t mask, const BitRange& range) -> uint64_t;

}  // namespace bitview
