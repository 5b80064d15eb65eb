#pragma once

#include <bit>
#include <cstdint>

namespace bitview::common {

// Widest value a single storage word can hold.
inline constexpr uint32_t kMaxBitWidth = 64;

// Make bit mask with safety for 64-bit width
constexpr auto MakeBitMask(uint32_t bit_width) -> uint64_t {
  return (bit_width >= 64) ? ~0ULL : (1ULL << bit_width) - 1;
}

// Mask covering bits [start, end). Precondition: start <= end <= 64.
constexpr auto MakeRangeMask(uint32_t start, uint32_t end) -> uint64_t {
  if (start >= 64) {
    return 0;
  }
  return MakeBitMask(end - start) << start;
}

// Number of bits needed to represent value (0 for 0).
constexpr auto BitLength(uint64_t value) -> uint32_t {
  return static_cast<uint32_t>(std::bit_width(value));
}

// Extract bits [start, start + width) shifted down to bit 0.
constexpr auto ExtractBits(uint64_t word, uint32_t start, uint32_t width)
    -> uint64_t {
  if (start >= 64) {
    return 0;
  }
  return (word >> start) & MakeBitMask(width);
}

// Replace bits [start, start + width) of word with the low bits of value.
// Bits outside the window are preserved.
constexpr auto InsertBits(
    uint64_t word, uint32_t start, uint32_t width, uint64_t value)
    -> uint64_t {
  if (start >= 64) {
    return word;
  }
  uint64_t window = MakeRangeMask(start, start + width);
  return (word & ~window) | ((value << start) & window);
}

}  // namespace bitview::common
