#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/hash/hash.h"
#include "bitview/bit_range.hpp"
#include "bitview/persisted_state.hpp"
#include "bitview/type_descriptor.hpp"
#include "bitview/value_cell.hpp"
#include "bitview/view_resolver.hpp"

namespace bitview {

// Loosely typed operand coming from configuration files or the command
// line. Only the integer alternatives (bool, int64_t, uint64_t) are
// compatible with a bitfield.
using Scalar =
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string>;

// Name of the alternative held by `value`, for error messages.
auto ScalarTypeName(const Scalar& value) -> const char*;

// A fixed-width unsigned value described by a TypeDescriptor.
//
// A BitField is either a root, which owns its storage word, or a view onto a
// window of a root created by View()/operator[]. Views write through: storing
// into a view updates the root and every other view over the same bits, and
// never touches bits outside the view's window.
//
//   auto type =
//       Compile(Schema("Control").Field("enable", 0).Field("mode", 1, 3));
//   BitField reg(type, 0b101);
//   reg["mode"] = 3;           // reg.Read() == 0b111
//   auto mode = reg.View("mode");
//   mode.Write(0);             // reg.Read() == 0b001
//
// Copying (copy construction, copy assignment, Copy()) produces a detached
// root holding the same value; only moves keep a view attached. Assigning a
// BitField to a temporary view is ill-formed; store through it with Write()
// or an integer assignment instead.
//
// Not thread-safe: a root and its views share one mutable word.
class BitField {
 public:
  // Plain value with no declared geometry.
  explicit BitField(uint64_t value = 0);

  BitField(TypeRef type, uint64_t value);
  explicit BitField(TypeRef type) : BitField(std::move(type), uint64_t{0}) {
  }

  // Numeral text. `base` is 2..36, or 0 to pick the base from a 0x/0o/0b
  // prefix (decimal otherwise). A prefix matching an explicit base and `_`
  // digit separators are accepted.
  // Throws ValueError on malformed text, OverflowError past 64 bits.
  BitField(TypeRef type, std::string_view text, int base);

  // Big-endian bytes; no byte-order conversion is performed.
  // Throws OverflowError when more than 8 significant bytes are given.
  BitField(TypeRef type, std::span<const std::byte> bytes);

  BitField(const BitField& other);
  auto operator=(const BitField& other) & -> BitField&;
  BitField(BitField&&) noexcept = default;
  auto operator=(BitField&&) & noexcept -> BitField& = default;
  ~BitField() = default;

  // Integer assignment stores through views.
  template <std::integral T>
  auto operator=(T value) -> BitField& {
    Write(value);
    return *this;
  }

  [[nodiscard]] auto Read() const -> uint64_t;

  explicit operator uint64_t() const {
    return Read();
  }
  explicit operator bool() const {
    return Read() != 0;
  }

  // Store `value` masked to this value's mask. Negative signed inputs are
  // taken in two's complement before masking.
  template <std::integral T>
  void Write(T value) {
    Store(static_cast<uint64_t>(value));
  }

  // Throws TypeError unless `value` holds an integer alternative.
  void Write(const Scalar& value);

  [[nodiscard]] auto Type() const -> const TypeRef& {
    return type_;
  }
  [[nodiscard]] auto Name() const -> const std::string& {
    return type_->Name();
  }
  [[nodiscard]] auto TotalSize() const -> uint32_t {
    return type_->TotalSize();
  }
  [[nodiscard]] auto TotalMask() const -> uint64_t {
    return type_->TotalMask();
  }

  // Bits needed to display the value: the size for bounded types, the bit
  // length of the current value otherwise.
  [[nodiscard]] auto BitSize() const -> uint32_t;

  // Bytes needed for BitSize() bits, at least 1.
  [[nodiscard]] auto ByteLength() const -> uint32_t;

  [[nodiscard]] auto IsView() const -> bool {
    return parent_range_.has_value();
  }

  // Window this view occupies inside the value it was looked up on.
  [[nodiscard]] auto ParentRange() const -> const std::optional<BitRange>& {
    return parent_range_;
  }

  [[nodiscard]] auto Fields() const -> std::vector<std::string> {
    return type_->FieldNames();
  }

  // Live views. Throw IndexError for unmapped names and for ranges that are
  // negative, empty or outside TotalSize().
  auto View(std::string_view name) -> BitField;
  auto View(int64_t bit) -> BitField;
  auto View(int64_t start, int64_t end) -> BitField;
  auto View(const RangeExpr& range) -> BitField;

  // View of a dotted field path, e.g. "status.ready".
  auto ViewPath(std::string_view path) -> BitField;

  auto operator[](std::string_view name) -> BitField {
    return View(name);
  }
  auto operator[](int64_t bit) -> BitField {
    return View(bit);
  }

  // Read-only lookups returning the current field value.
  [[nodiscard]] auto Get(std::string_view name) const -> uint64_t;
  [[nodiscard]] auto Get(const RangeExpr& range) const -> uint64_t;

  // Store through a lookup key; equivalent to View(key).Write(value).
  template <std::integral T>
  void Set(std::string_view name, T value) {
    View(name).Write(value);
  }
  template <std::integral T>
  void Set(int64_t bit, T value) {
    View(bit).Write(value);
  }
  template <std::integral T>
  void Set(int64_t start, int64_t end, T value) {
    View(start, end).Write(value);
  }
  void Set(std::string_view name, const Scalar& value) {
    View(name).Write(value);
  }

  // In-place arithmetic. `+=`/`-=` throw ValueError when the result would be
  // negative and OverflowError when it needs more than TotalSize() bits.
  template <std::integral T>
  auto operator+=(T value) -> BitField& {
    AddInPlace(ToDelta(value));
    return *this;
  }
  template <std::integral T>
  auto operator-=(T value) -> BitField& {
    AddInPlace(Negate(ToDelta(value)));
    return *this;
  }
  template <std::integral T>
  auto operator&=(T value) -> BitField& {
    Store(Read() & static_cast<uint64_t>(value));
    return *this;
  }
  template <std::integral T>
  auto operator|=(T value) -> BitField& {
    Store(Read() | static_cast<uint64_t>(value));
    return *this;
  }
  template <std::integral T>
  auto operator^=(T value) -> BitField& {
    Store(Read() ^ static_cast<uint64_t>(value));
    return *this;
  }

  // Same-type results for +, -, &, |, ^ (new roots). `+` wraps modulo the
  // width; `-` throws ValueError below zero.
  template <std::integral T>
  [[nodiscard]] auto Plus(T value) const -> BitField {
    return Add(ToDelta(value));
  }
  template <std::integral T>
  [[nodiscard]] auto Minus(T value) const -> BitField {
    return Add(Negate(ToDelta(value)));
  }

  // Integer-vs-scalar comparison. Equals() is false for incompatible
  // operands; Compare() throws TypeError for them.
  [[nodiscard]] auto Equals(const Scalar& other) const -> bool;
  [[nodiscard]] auto Compare(const Scalar& other) const -> std::strong_ordering;

  [[nodiscard]] auto Hash() const -> size_t;

  // Detached root with the same type and value.
  [[nodiscard]] auto Copy() const -> BitField;

  // {value, size, mask} of a root. Throws ValueError on a view.
  [[nodiscard]] auto State() const -> PersistedState;

  // Rebuild a root from its persisted state. When `type` is given its size
  // and mask must match the state. Throws ValueError on any inconsistency.
  static auto FromState(const PersistedState& state, TypeRef type = nullptr)
      -> BitField;

  // "Name(x=0x2A, base=16)"; views are wrapped in angle brackets.
  [[nodiscard]] auto Repr() const -> std::string;

  friend auto operator==(const BitField& a, const BitField& b) -> bool {
    return a.Read() == b.Read() && a.TotalSize() == b.TotalSize() &&
           a.TotalMask() == b.TotalMask();
  }
  friend auto operator<=>(const BitField& a, const BitField& b)
      -> std::weak_ordering {
    return a.Read() <=> b.Read();
  }

  template <std::integral T>
  friend auto operator==(const BitField& a, T b) -> bool {
    return std::cmp_equal(a.Read(), b);
  }
  template <std::integral T>
  friend auto operator<=>(const BitField& a, T b) -> std::strong_ordering {
    if (std::cmp_less(a.Read(), b)) {
      return std::strong_ordering::less;
    }
    if (std::cmp_equal(a.Read(), b)) {
      return std::strong_ordering::equal;
    }
    return std::strong_ordering::greater;
  }

  template <typename H>
  friend auto AbslHashValue(H h, const BitField& f) -> H {
    return H::combine(std::move(h), f.Read(), f.TotalSize(), f.TotalMask());
  }

 private:
  // Signed integer operand split into sign and magnitude.
  struct Delta {
    bool negative;
    uint64_t magnitude;
  };

  template <std::integral T>
  static constexpr auto ToDelta(T value) -> Delta {
    if constexpr (std::is_signed_v<T>) {
      if (value < 0) {
        // -(value + 1) + 1 avoids overflow at the minimum value.
        return Delta{
            .negative = true,
            .magnitude = static_cast<uint64_t>(-(value + 1)) + 1};
      }
    }
    return Delta{.negative = false, .magnitude = static_cast<uint64_t>(value)};
  }

  static constexpr auto Negate(Delta delta) -> Delta {
    if (delta.magnitude == 0) {
      return delta;
    }
    return Delta{.negative = !delta.negative, .magnitude = delta.magnitude};
  }

  BitField(
      TypeRef type, std::shared_ptr<ValueCell> cell, uint32_t offset,
      BitRange parent_range);

  auto MakeView(const ResolvedView& resolved) -> BitField;

  // Mask `value` to this value and merge it into the shared cell.
  void Store(uint64_t value);

  void AddInPlace(Delta delta);
  [[nodiscard]] auto Add(Delta delta) const -> BitField;

  TypeRef type_;
  std::shared_ptr<ValueCell> cell_;
  // Absolute offset of this window inside the cell.
  uint32_t offset_ = 0;
  std::optional<BitRange> parent_range_;
};

template <std::integral T>
auto operator+(const BitField& a, T b) -> BitField {
  return a.Plus(b);
}
template <std::integral T>
auto operator-(const BitField& a, T b) -> BitField {
  return a.Minus(b);
}
template <std::integral T>
auto operator&(const BitField& a, T b) -> BitField {
  return BitField(a.Type(), a.Read() & static_cast<uint64_t>(b));
}
template <std::integral T>
auto operator|(const BitField& a, T b) -> BitField {
  return BitField(a.Type(), a.Read() | static_cast<uint64_t>(b));
}
template <std::integral T>
auto operator^(const BitField& a, T b) -> BitField {
  return BitField(a.Type(), a.Read() ^ static_cast<uint64_t>(b));
}

// Multiplication and shifts leave the field's geometry; they yield plain
// integers (modulo 2^64).
template <std::integral T>
auto operator*(const BitField& a, T b) -> uint64_t {
  return a.Read() * static_cast<uint64_t>(b);
}
inline auto operator<<(const BitField& a, uint32_t shift) -> uint64_t {
  return shift >= 64 ? 0 : a.Read() << shift;
}
inline auto operator>>(const BitField& a, uint32_t shift) -> uint64_t {
  return shift >= 64 ? 0 : a.Read() >> shift;
}

}  // namespace bitview

template <>
struct std::hash<bitview::BitField> {
  auto operator()(const bitview::BitField& f) const noexcept -> size_t {
    return f.Hash();
  }
};
