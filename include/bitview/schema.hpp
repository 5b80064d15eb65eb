#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bitview/bit_range.hpp"

namespace bitview {

class Schema;

// One declared mapping entry. For a nested block, `range` is the block's
// `_index_` and `block` holds its own sub-mapping.
struct SchemaEntry {
  std::string name;
  RangeExpr range;
  std::shared_ptr<const Schema> block;

  [[nodiscard]] auto IsNested() const -> bool {
    return block != nullptr;
  }
};

// Declarative description of a bit layout: an ordered mapping from field
// name to a bit, a range or a nested block, plus the optional `_size_` and
// `_mask_` of the whole value.
//
// Nothing is validated here; Compile() normalizes and checks the schema.
//
// Usage:
//   Schema control("Control");
//   control.Field("enable", 0)
//       .Field("mode", 1, 3)
//       .Nested("status", Schema().Index(RangePair{3, 8}).Field("ready", 0))
//       .Size(8);
class Schema {
 public:
  Schema() = default;
  explicit Schema(std::string name);

  auto Field(std::string name, int64_t bit) -> Schema&;
  auto Field(std::string name, int64_t start, int64_t end) -> Schema&;
  auto Field(std::string name, RangeExpr range) -> Schema&;

  // Attach a nested block. The block must carry its `_index_` (see Index()).
  auto Nested(std::string name, Schema block) -> Schema&;

  // `_index_`: the window a nested block occupies inside its parent.
  auto Index(RangeExpr range) -> Schema&;

  // `_size_`: bit count of the whole value.
  auto Size(int64_t bits) -> Schema&;

  // `_mask_`: bits of the value that may be set.
  auto Mask(uint64_t mask) -> Schema&;

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto Entries() const -> const std::vector<SchemaEntry>& {
    return entries_;
  }
  [[nodiscard]] auto IndexRange() const -> const std::optional<RangeExpr>& {
    return index_;
  }
  [[nodiscard]] auto DeclaredSize() const -> std::optional<int64_t> {
    return size_;
  }
  [[nodiscard]] auto DeclaredMask() const -> std::optional<uint64_t> {
    return mask_;
  }

 private:
  std::string name_;
  std::vector<SchemaEntry> entries_;
  std::optional<RangeExpr> index_;
  std::optional<int64_t> size_;
  std::optional<uint64_t> mask_;
};

}  // namespace bitview
