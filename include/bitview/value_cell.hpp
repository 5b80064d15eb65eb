#pragma once

#include <cstdint>

#include "bitview/common/bit_utils.hpp"

namespace bitview {

// Storage word shared by a root value and every view derived from it.
//
// A view is a window [offset, offset + width) onto the cell. Writing a view
// merges into the cell: the window's bits are cleared and the new value is
// OR-ed in at the window position. Every ancestor reads through the same
// cell, so the merge is visible at all levels at once and bits outside the
// window never change. Merging the same value twice is a no-op.
//
// The cell performs no locking. A root and its live views form one mutable
// aliasing group; mutating it from several threads needs external
// synchronization.
class ValueCell {
 public:
  explicit ValueCell(uint64_t word) : word_(word) {
  }

  [[nodiscard]] auto Word() const -> uint64_t {
    return word_;
  }

  // Window [offset, offset + width) shifted down to bit 0.
  [[nodiscard]] auto Load(uint32_t offset, uint32_t width) const -> uint64_t {
    return common::ExtractBits(word_, offset, width);
  }

  // Replace the window [offset, offset + width) with the low `width` bits of
  // value. Callers pass a value already masked to the view's own mask.
  void Merge(uint32_t offset, uint32_t width, uint64_t value) {
    word_ = common::InsertBits(word_, offset, width, value);
  }

 private:
  uint64_t word_;
};

}  // namespace bitview
