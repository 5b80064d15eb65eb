#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "bitview/common/bit_utils.hpp"

namespace bitview {

// Canonical half-open bit interval [start, end).
// Invariant (after normalization): start < end <= kMaxBitWidth.
struct BitRange {
  uint32_t start = 0;
  uint32_t end = 0;

  [[nodiscard]] auto Width() const -> uint32_t {
    return end - start;
  }

  // Mask of this range in the coordinates of the enclosing value.
  [[nodiscard]] auto Mask() const -> uint64_t {
    return common::MakeRangeMask(start, end);
  }

  [[nodiscard]] auto Overlaps(const BitRange& other) const -> bool {
    return start < other.end && other.start < end;
  }

  // Re-base this range onto a window starting at `offset`.
  [[nodiscard]] auto Shifted(uint32_t offset) const -> BitRange {
    return BitRange{.start = start + offset, .end = end + offset};
  }

  auto operator==(const BitRange&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, const BitRange& r) -> H {
    return H::combine(std::move(h), r.start, r.end);
  }
};

// Interval with an explicit end convention. `closed` makes `high` part of
// the range ([low, high]); otherwise it is excluded ([low, high)).
struct Interval {
  int64_t low = 0;
  int64_t high = 0;
  bool closed = false;
};

// (start, end) pair, end exclusive.
using RangePair = std::pair<int64_t, int64_t>;

// Any accepted range spelling: a single bit, a pair or an interval.
using RangeExpr = std::variant<int64_t, RangePair, Interval>;

// Normalize a range expression into a BitRange.
// Throws IndexError on negative bounds, empty or inverted ranges, and on
// bounds past the 64-bit storage word. There is no "from the end" indexing.
auto NormalizeRange(int64_t bit) -> BitRange;
auto NormalizeRange(int64_t start, int64_t end) -> BitRange;
auto NormalizeRange(const Interval& interval) -> BitRange;
auto NormalizeRange(const RangeExpr& expr) -> BitRange;

// "[3, 8)"
auto ToString(const BitRange& range) -> std::string;

// Source spelling: "3", "(3, 8)", "[3, 7]" or "[3, 8)".
auto ToString(const RangeExpr& expr) -> std::string;

}  // namespace bitview
