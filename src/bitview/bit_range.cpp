#include "bitview/bit_range.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <variant>

#include "bitview/common/bit_utils.hpp"
#include "bitview/common/error.hpp"

namespace bitview {

auto NormalizeRange(int64_t bit) -> BitRange {
  if (bit < 0) {
    ThrowIndexError(std::format("bit index {} is negative", bit));
  }
  if (bit >= static_cast<int64_t>(common::kMaxBitWidth)) {
    ThrowIndexError(
        std::format(
            "bit index {} exceeds the {}-bit storage word", bit,
            common::kMaxBitWidth));
  }
  return NormalizeRange(bit, bit + 1);
}

auto NormalizeRange(int64_t start, int64_t end) -> BitRange {
  if (start < 0 || end < 0) {
    ThrowIndexError(
        std::format("range ({}, {}) has a negative bound", start, end));
  }
  if (end <= start) {
    ThrowIndexError(
        std::format("range ({}, {}) is empty or inverted", start, end));
  }
  if (end > static_cast<int64_t>(common::kMaxBitWidth)) {
    ThrowIndexError(
        std::format(
            "range ({}, {}) exceeds the {}-bit storage word", start, end,
            common::kMaxBitWidth));
  }
  return BitRange{
      .start = static_cast<uint32_t>(start),
      .end = static_cast<uint32_t>(end)};
}

auto NormalizeRange(const Interval& interval) -> BitRange {
  if (interval.closed) {
    // [low, high] covers high as well; guard the +1 against overflow.
    if (interval.high == INT64_MAX) {
      ThrowIndexError(
          std::format(
              "interval [{}, {}] exceeds the {}-bit storage word",
              interval.low, interval.high, common::kMaxBitWidth));
    }
    return NormalizeRange(interval.low, interval.high + 1);
  }
  return NormalizeRange(interval.low, interval.high);
}

auto NormalizeRange(const RangeExpr& expr) -> BitRange {
  if (const auto* bit = std::get_if<int64_t>(&expr)) {
    return NormalizeRange(*bit);
  }
  if (const auto* pair = std::get_if<RangePair>(&expr)) {
    return NormalizeRange(pair->first, pair->second);
  }
  return NormalizeRange(std::get<Interval>(expr));
}

auto ToString(const BitRange& range) -> std::string {
  return std::format("[{}, {})", range.start, range.end);
}

auto ToString(const RangeExpr& expr) -> std::string {
  if (const auto* bit = std::get_if<int64_t>(&expr)) {
    return std::format("{}", *bit);
  }
  if (const auto* pair = std::get_if<RangePair>(&expr)) {
    return std::format("({}, {})", pair->first, pair->second);
  }
  const auto& interval = std::get<Interval>(expr);
  return std::format(
      "[{}, {}{}", interval.low, interval.high, interval.closed ? "]" : ")");
}

}  // namespace bitview
