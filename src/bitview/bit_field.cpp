#include "bitview/bit_field.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "absl/hash/hash.h"
#include "bitview/common/bit_utils.hpp"
#include "bitview/common/error.hpp"

namespace bitview {

namespace {

auto DigitValue(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'Z') {
    return c - 'A' + 10;
  }
  return -1;
}

auto PrefixBase(std::string_view text) -> int {
  if (text.size() < 2 || text[0] != '0') {
    return 0;
  }
  switch (std::tolower(static_cast<unsigned char>(text[1]))) {
    case 'x':
      return 16;
    case 'o':
      return 8;
    case 'b':
      return 2;
    default:
      return 0;
  }
}

auto Trim(std::string_view text) -> std::string_view {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

// Parses an unsigned numeral with optional base prefix and `_` separators.
// `_` may appear only between two digits or right after a prefix.
auto ParseNumeral(std::string_view text, int base) -> uint64_t {
  if (base != 0 && (base < 2 || base > 36)) {
    ThrowValueError(
        std::format("numeral base must be 0 or 2..36, got {}", base));
  }

  std::string_view digits = Trim(text);
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
  } else if (!digits.empty() && digits.front() == '-') {
    ThrowValueError(
        std::format("bitfield value cannot be negative: '{}'", text));
  }

  bool prefixed = false;
  int prefix_base = PrefixBase(digits);
  if (prefix_base != 0 && (base == 0 || base == prefix_base)) {
    base = prefix_base;
    digits.remove_prefix(2);
    prefixed = true;
  } else if (base == 0) {
    base = 10;
    // "010" is ambiguous without a prefix.
    if (digits.size() > 1 && digits.front() == '0' &&
        digits.find_first_not_of("0_") != std::string_view::npos) {
      ThrowValueError(
          std::format("invalid numeral '{}': leading zeros need a prefix",
                      text));
    }
  }

  if (digits.empty()) {
    ThrowValueError(
        std::format("invalid numeral '{}' for base {}", text, base));
  }

  uint64_t value = 0;
  bool previous_digit = prefixed;
  const auto ubase = static_cast<uint64_t>(base);
  for (char c : digits) {
    if (c == '_') {
      if (!previous_digit) {
        ThrowValueError(
            std::format("misplaced '_' in numeral '{}'", text));
      }
      previous_digit = false;
      continue;
    }
    int digit = DigitValue(c);
    if (digit < 0 || digit >= base) {
      ThrowValueError(
          std::format("invalid digit '{}' in numeral '{}' for base {}", c,
                      text, base));
    }
    if (value > (UINT64_MAX - static_cast<uint64_t>(digit)) / ubase) {
      ThrowOverflowError(
          std::format("numeral '{}' does not fit in {} bits", text,
                      common::kMaxBitWidth));
    }
    value = value * ubase + static_cast<uint64_t>(digit);
    previous_digit = true;
  }
  if (!previous_digit) {
    ThrowValueError(std::format("misplaced '_' in numeral '{}'", text));
  }
  return value;
}

auto FromBigEndian(std::span<const std::byte> bytes) -> uint64_t {
  auto first = std::ranges::find_if(
      bytes, [](std::byte b) { return b != std::byte{0}; });
  auto significant = static_cast<size_t>(std::distance(first, bytes.end()));
  if (significant > sizeof(uint64_t)) {
    ThrowOverflowError(
        std::format(
            "{} significant bytes do not fit in {} bits", significant,
            common::kMaxBitWidth));
  }
  uint64_t value = 0;
  for (auto it = first; it != bytes.end(); ++it) {
    value = (value << 8) | std::to_integer<uint64_t>(*it);
  }
  return value;
}

// Integer payload of a scalar, or nullopt for the non-integer alternatives.
auto IntegerOf(const Scalar& value)
    -> std::optional<std::variant<int64_t, uint64_t>> {
  if (const auto* b = std::get_if<bool>(&value)) {
    return uint64_t{*b ? 1U : 0U};
  }
  if (const auto* i = std::get_if<int64_t>(&value)) {
    return *i;
  }
  if (const auto* u = std::get_if<uint64_t>(&value)) {
    return *u;
  }
  return std::nullopt;
}

auto Ordering(uint64_t lhs, const std::variant<int64_t, uint64_t>& rhs)
    -> std::strong_ordering {
  return std::visit(
      [lhs](auto r) -> std::strong_ordering {
        if (std::cmp_less(lhs, r)) {
          return std::strong_ordering::less;
        }
        if (std::cmp_equal(lhs, r)) {
          return std::strong_ordering::equal;
        }
        return std::strong_ordering::greater;
      },
      rhs);
}

auto ResolveType(TypeRef type) -> TypeRef {
  return type ? std::move(type) : TypeDescriptor::Unbounded();
}

}  // namespace

auto ScalarTypeName(const Scalar& value) -> const char* {
  switch (value.index()) {
    case 0:
      return "none";
    case 1:
      return "bool";
    case 2:
      return "int64";
    case 3:
      return "uint64";
    case 4:
      return "double";
    case 5:
      return "string";
    default:
      return "unknown";
  }
}

BitField::BitField(uint64_t value)
    : BitField(TypeDescriptor::Unbounded(), value) {
}

BitField::BitField(TypeRef type, uint64_t value)
    : type_(ResolveType(std::move(type))),
      cell_(std::make_shared<ValueCell>(value & type_->TotalMask())) {
}

BitField::BitField(TypeRef type, std::string_view text, int base)
    : BitField(std::move(type), ParseNumeral(text, base)) {
}

BitField::BitField(TypeRef type, std::span<const std::byte> bytes)
    : BitField(std::move(type), FromBigEndian(bytes)) {
}

BitField::BitField(const BitField& other)
    : type_(other.type_),
      cell_(std::make_shared<ValueCell>(other.Read())) {
}

auto BitField::operator=(const BitField& other) & -> BitField& {
  if (this != &other) {
    uint64_t value = other.Read();
    type_ = other.type_;
    cell_ = std::make_shared<ValueCell>(value);
    offset_ = 0;
    parent_range_.reset();
  }
  return *this;
}

BitField::BitField(
    TypeRef type, std::shared_ptr<ValueCell> cell, uint32_t offset,
    BitRange parent_range)
    : type_(std::move(type)),
      cell_(std::move(cell)),
      offset_(offset),
      parent_range_(parent_range) {
}

auto BitField::Read() const -> uint64_t {
  return cell_->Load(offset_, TotalSize()) & TotalMask();
}

void BitField::Store(uint64_t value) {
  cell_->Merge(offset_, TotalSize(), value & TotalMask());
}

void BitField::Write(const Scalar& value) {
  auto integer = IntegerOf(value);
  if (!integer) {
    ThrowTypeError(
        std::format(
            "cannot assign a {} to bitfield '{}'", ScalarTypeName(value),
            Name()));
  }
  std::visit([this](auto v) { Write(v); }, *integer);
}

auto BitField::BitSize() const -> uint32_t {
  if (type_->IsBounded()) {
    return TotalSize();
  }
  return std::max(common::BitLength(Read()), uint32_t{1});
}

auto BitField::ByteLength() const -> uint32_t {
  return std::max((BitSize() + 7) / 8, uint32_t{1});
}

auto BitField::MakeView(const ResolvedView& resolved) -> BitField {
  return BitField(
      resolved.type, cell_, offset_ + resolved.range.start, resolved.range);
}

auto BitField::View(std::string_view name) -> BitField {
  return MakeView(ResolveName(*type_, name));
}

auto BitField::View(int64_t bit) -> BitField {
  return MakeView(ResolveRange(*type_, RangeExpr{bit}));
}

auto BitField::View(int64_t start, int64_t end) -> BitField {
  return MakeView(ResolveRange(*type_, RangeExpr{RangePair{start, end}}));
}

auto BitField::View(const RangeExpr& range) -> BitField {
  return MakeView(ResolveRange(*type_, range));
}

auto BitField::ViewPath(std::string_view path) -> BitField {
  return MakeView(ResolvePath(*type_, path));
}

auto BitField::Get(std::string_view name) const -> uint64_t {
  ResolvedView resolved = ResolveName(*type_, name);
  return cell_->Load(offset_ + resolved.range.start, resolved.range.Width()) &
         resolved.type->TotalMask();
}

auto BitField::Get(const RangeExpr& range) const -> uint64_t {
  ResolvedView resolved = ResolveRange(*type_, range);
  return cell_->Load(offset_ + resolved.range.start, resolved.range.Width()) &
         resolved.type->TotalMask();
}

void BitField::AddInPlace(Delta delta) {
  uint64_t current = Read();
  if (delta.negative) {
    if (delta.magnitude > current) {
      ThrowValueError(
          std::format(
              "bitfield '{}' cannot become negative ({} - {})", Name(),
              current, delta.magnitude));
    }
    Store(current - delta.magnitude);
    return;
  }

  uint64_t result = current + delta.magnitude;
  if (result < current || common::BitLength(result) > TotalSize()) {
    ThrowOverflowError(
        std::format(
            "{} + {} does not fit in the {}-bit bitfield '{}'", current,
            delta.magnitude, TotalSize(), Name()));
  }
  Store(result);
}

auto BitField::Add(Delta delta) const -> BitField {
  uint64_t current = Read();
  if (delta.negative) {
    if (delta.magnitude > current) {
      ThrowValueError(
          std::format(
              "bitfield '{}' cannot become negative ({} - {})", Name(),
              current, delta.magnitude));
    }
    return BitField(type_, current - delta.magnitude);
  }
  // Unsigned addition wraps modulo 2^64; the constructor masks to the width.
  return BitField(type_, current + delta.magnitude);
}

auto BitField::Equals(const Scalar& other) const -> bool {
  auto integer = IntegerOf(other);
  return integer && Ordering(Read(), *integer) == std::strong_ordering::equal;
}

auto BitField::Compare(const Scalar& other) const -> std::strong_ordering {
  auto integer = IntegerOf(other);
  if (!integer) {
    ThrowTypeError(
        std::format(
            "cannot order bitfield '{}' against a {}", Name(),
            ScalarTypeName(other)));
  }
  return Ordering(Read(), *integer);
}

auto BitField::Hash() const -> size_t {
  return absl::HashOf(*this);
}

auto BitField::Copy() const -> BitField {
  return BitField(type_, Read());
}

auto BitField::State() const -> PersistedState {
  if (IsView()) {
    ThrowValueError(
        std::format(
            "'{}' is a view of {}; only a root value can be persisted "
            "(take a Copy() first)",
            Name(), ToString(*parent_range_)));
  }
  return PersistedState{
      .value = Read(), .size = TotalSize(), .mask = TotalMask()};
}

auto BitField::FromState(const PersistedState& state, TypeRef type)
    -> BitField {
  if (state.size == 0 || state.size > common::kMaxBitWidth) {
    ThrowValueError(
        std::format("persisted size {} is outside 1..64 bits", state.size));
  }
  if (common::BitLength(state.mask) > state.size) {
    ThrowValueError(
        std::format(
            "persisted mask 0x{:X} does not fit in {} bits", state.mask,
            state.size));
  }
  if ((state.value & ~state.mask) != 0) {
    ThrowValueError(
        std::format(
            "persisted value 0x{:X} has bits outside mask 0x{:X}", state.value,
            state.mask));
  }
  if (type) {
    if (type->TotalSize() != state.size || type->TotalMask() != state.mask) {
      ThrowValueError(
          std::format(
              "persisted geometry ({} bits, mask 0x{:X}) does not match '{}' "
              "({} bits, mask 0x{:X})",
              state.size, state.mask, type->Name(), type->TotalSize(),
              type->TotalMask()));
    }
  } else {
    type = TypeDescriptor::Unmapped("BitField", state.size, state.mask);
  }
  return BitField(std::move(type), state.value);
}

auto BitField::Repr() const -> std::string {
  std::string body = std::format(
      "{}(x=0x{:0{}X}, base=16)", Name(), Read(), ByteLength() * 2);
  if (IsView()) {
    return std::format("<{}>", body);
  }
  return body;
}

}  // namespace bitview
