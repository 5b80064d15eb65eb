#include <gtest/gtest.h>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "bitview/bit_field.hpp"
#include "bitview/common/error.hpp"
#include "bitview/mapping_compiler.hpp"
#include "bitview/schema.hpp"

namespace bitview {
namespace {

class BitFieldTest : public ::testing::Test {
 protected:
  TypeRef byte_ = Compile(Schema("Byte").Size(8));
  TypeRef control_ = Compile(
      Schema("Control").Field("enable", 0).Field("mode", 1, 3).Size(8));
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(BitFieldTest, IntegerConstructionMasksToType) {
  BitField value(byte_, 0x1FF);
  EXPECT_EQ(value.Read(), 0xFFU);
  EXPECT_FALSE(value.IsView());
}

TEST_F(BitFieldTest, PlainValueIsUnbounded) {
  BitField value(42);
  EXPECT_EQ(value.Read(), 42U);
  EXPECT_FALSE(value.Type()->IsBounded());
  EXPECT_EQ(value.Name(), "BitField");
  EXPECT_TRUE(value.Fields().empty());
}

TEST_F(BitFieldTest, DefaultValueIsZero) {
  BitField value(control_);
  EXPECT_EQ(value.Read(), 0U);
  EXPECT_FALSE(static_cast<bool>(value));
}

TEST_F(BitFieldTest, NumeralWithExplicitBase) {
  EXPECT_EQ(BitField(byte_, "ff", 16).Read(), 0xFFU);
  EXPECT_EQ(BitField(byte_, "0xff", 16).Read(), 0xFFU);
  EXPECT_EQ(BitField(byte_, "101", 2).Read(), 5U);
  EXPECT_EQ(BitField(byte_, "z", 36).Read(), 35U);
}

TEST_F(BitFieldTest, NumeralWithAutoDetectedBase) {
  EXPECT_EQ(BitField(byte_, "0x2A", 0).Read(), 42U);
  EXPECT_EQ(BitField(byte_, "0o52", 0).Read(), 42U);
  EXPECT_EQ(BitField(byte_, "0b101010", 0).Read(), 42U);
  EXPECT_EQ(BitField(byte_, "42", 0).Read(), 42U);
  EXPECT_EQ(BitField(byte_, "0", 0).Read(), 0U);
  EXPECT_EQ(BitField(byte_, " +7 ", 0).Read(), 7U);
}

TEST_F(BitFieldTest, NumeralSeparators) {
  EXPECT_EQ(BitField(nullptr, "1_000", 10).Read(), 1000U);
  EXPECT_EQ(BitField(nullptr, "0x_dead_beef", 0).Read(), 0xDEADBEEFU);
  EXPECT_THROW(BitField(nullptr, "1__0", 10), ValueError);
  EXPECT_THROW(BitField(nullptr, "_10", 10), ValueError);
  EXPECT_THROW(BitField(nullptr, "10_", 10), ValueError);
}

TEST_F(BitFieldTest, MalformedNumeralsAreValueErrors) {
  EXPECT_THROW(BitField(byte_, "", 10), ValueError);
  EXPECT_THROW(BitField(byte_, "12z", 10), ValueError);
  EXPECT_THROW(BitField(byte_, "2", 2), ValueError);
  EXPECT_THROW(BitField(byte_, "-5", 10), ValueError);
  EXPECT_THROW(BitField(byte_, "0x", 0), ValueError);
  EXPECT_THROW(BitField(byte_, "010", 0), ValueError);
  EXPECT_THROW(BitField(byte_, "10", 1), ValueError);
  EXPECT_THROW(BitField(byte_, "10", 37), ValueError);
}

TEST_F(BitFieldTest, NumeralPast64BitsOverflows) {
  EXPECT_EQ(
      BitField(nullptr, "0xFFFFFFFFFFFFFFFF", 0).Read(), UINT64_MAX);
  EXPECT_THROW(BitField(nullptr, "0x1_0000_0000_0000_0000", 0), OverflowError);
  EXPECT_THROW(BitField(nullptr, "18446744073709551616", 10), OverflowError);
}

TEST_F(BitFieldTest, BigEndianBytes) {
  std::array<std::byte, 3> bytes = {
      std::byte{0x00}, std::byte{0x12}, std::byte{0x34}};
  std::span<const std::byte> view(bytes);
  EXPECT_EQ(BitField(nullptr, view).Read(), 0x1234U);
  EXPECT_EQ(BitField(byte_, view).Read(), 0x34U);
}

TEST_F(BitFieldTest, MoreThanEightSignificantBytesOverflow) {
  std::array<std::byte, 10> padded{};
  padded[9] = std::byte{0x01};
  EXPECT_EQ(BitField(nullptr, std::span<const std::byte>(padded)).Read(), 1U);

  std::array<std::byte, 9> wide{};
  wide[0] = std::byte{0x01};
  EXPECT_THROW(
      BitField(nullptr, std::span<const std::byte>(wide)), OverflowError);
}

// =============================================================================
// Read / write
// =============================================================================

TEST_F(BitFieldTest, WriteMasksToWidth) {
  BitField value(byte_, 0);
  value.Write(0x1234);
  EXPECT_EQ(value.Read(), 0x34U);
  value = 7;
  EXPECT_EQ(value.Read(), 7U);
}

TEST_F(BitFieldTest, NegativeWriteUsesTwosComplement) {
  BitField value(byte_, 0);
  value.Write(-1);
  EXPECT_EQ(value.Read(), 0xFFU);
}

TEST_F(BitFieldTest, ScalarWriteAcceptsOnlyIntegers) {
  BitField value(byte_, 0);
  value.Write(Scalar{int64_t{5}});
  EXPECT_EQ(value.Read(), 5U);
  value.Write(Scalar{true});
  EXPECT_EQ(value.Read(), 1U);
  value.Write(Scalar{uint64_t{0x1AB}});
  EXPECT_EQ(value.Read(), 0xABU);

  EXPECT_THROW(value.Write(Scalar{1.5}), TypeError);
  EXPECT_THROW(value.Write(Scalar{std::string("3")}), TypeError);
  EXPECT_THROW(value.Write(Scalar{}), TypeError);
  EXPECT_EQ(value.Read(), 0xABU);
}

TEST_F(BitFieldTest, MaskedOutBitsStayClear) {
  auto sparse = Compile(Schema("Sparse").Size(8).Mask(0b1010'1010));
  BitField value(sparse, 0xFF);
  EXPECT_EQ(value.Read(), 0b1010'1010U);
  value |= 0b0101'0101;
  EXPECT_EQ(value.Read(), 0b1010'1010U);
}

TEST_F(BitFieldTest, BitSizeAndByteLength) {
  EXPECT_EQ(BitField(control_).BitSize(), 8U);
  EXPECT_EQ(BitField(control_).ByteLength(), 1U);
  EXPECT_EQ(BitField(Compile(Schema("W").Size(12))).ByteLength(), 2U);
  EXPECT_EQ(BitField(0).BitSize(), 1U);
  EXPECT_EQ(BitField(0x1FF).BitSize(), 9U);
  EXPECT_EQ(BitField(0x1FF).ByteLength(), 2U);
}

// =============================================================================
// Arithmetic
// =============================================================================

TEST_F(BitFieldTest, PlusWrapsModuloWidth) {
  BitField value(byte_, 250);
  BitField sum = value + 10;
  EXPECT_EQ(sum.Read(), 4U);
  EXPECT_EQ(sum.Type(), byte_);
  EXPECT_EQ(value.Read(), 250U);
}

TEST_F(BitFieldTest, InPlaceAddOverflowsPastWidth) {
  BitField value(byte_, 250);
  EXPECT_THROW(value += 10, OverflowError);
  EXPECT_EQ(value.Read(), 250U);
  value += 5;
  EXPECT_EQ(value.Read(), 255U);
}

TEST_F(BitFieldTest, SubtractionBelowZeroIsValueError) {
  BitField value(byte_, 3);
  EXPECT_THROW(value - 4, ValueError);
  EXPECT_THROW(value -= 4, ValueError);
  EXPECT_EQ((value - 3).Read(), 0U);
  value -= 1;
  EXPECT_EQ(value.Read(), 2U);
}

TEST_F(BitFieldTest, NegativeInPlaceResultIsCheckedFirst) {
  BitField value(byte_, 3);
  EXPECT_THROW(value += -4, ValueError);
  EXPECT_THROW(value -= INT64_MIN, OverflowError);
  value += -3;
  EXPECT_EQ(value.Read(), 0U);
}

TEST_F(BitFieldTest, BitwiseOperatorsKeepType) {
  BitField value(byte_, 0b1100);
  EXPECT_EQ((value & 0b1010).Read(), 0b1000U);
  EXPECT_EQ((value | 0x1F0).Read(), 0xFCU);
  EXPECT_EQ((value ^ 0b0110).Read(), 0b1010U);
  EXPECT_EQ((value | 1).Type(), byte_);

  value &= 0b0100;
  EXPECT_EQ(value.Read(), 0b0100U);
  value ^= 0xFF;
  EXPECT_EQ(value.Read(), 0xFBU);
}

TEST_F(BitFieldTest, MultiplyAndShiftYieldPlainIntegers) {
  BitField value(byte_, 200);
  uint64_t product = value * 2;
  EXPECT_EQ(product, 400U);
  EXPECT_EQ(value << 4, 3200U);
  EXPECT_EQ(value >> 3, 25U);
  EXPECT_EQ(value >> 64, 0U);
}

// =============================================================================
// Comparison and hashing
// =============================================================================

TEST_F(BitFieldTest, ComparesWithIntegers) {
  BitField value(byte_, 10);
  EXPECT_TRUE(value == 10);
  EXPECT_TRUE(10 == value);
  EXPECT_TRUE(value != 11);
  EXPECT_TRUE(value < 11);
  EXPECT_TRUE(value > -1);
  EXPECT_TRUE(value >= 10U);
}

TEST_F(BitFieldTest, EqualityIncludesGeometry) {
  auto wide = Compile(Schema("Wide").Size(16));
  EXPECT_EQ(BitField(byte_, 5), BitField(byte_, 5));
  EXPECT_NE(BitField(byte_, 5), BitField(wide, 5));
  EXPECT_TRUE(BitField(byte_, 5) <= BitField(wide, 5));
  EXPECT_TRUE(BitField(byte_, 4) < BitField(wide, 5));
}

TEST_F(BitFieldTest, ScalarComparison) {
  BitField value(byte_, 1);
  EXPECT_TRUE(value.Equals(Scalar{int64_t{1}}));
  EXPECT_TRUE(value.Equals(Scalar{true}));
  EXPECT_FALSE(value.Equals(Scalar{std::string("1")}));
  EXPECT_FALSE(value.Equals(Scalar{1.0}));

  EXPECT_EQ(value.Compare(Scalar{int64_t{-5}}), std::strong_ordering::greater);
  EXPECT_EQ(value.Compare(Scalar{uint64_t{2}}), std::strong_ordering::less);
  EXPECT_THROW(static_cast<void>(value.Compare(Scalar{1.0})), TypeError);
  EXPECT_THROW(static_cast<void>(value.Compare(Scalar{})), TypeError);
}

TEST_F(BitFieldTest, HashFollowsEquality) {
  auto same = Compile(Schema("Other").Size(8));
  EXPECT_EQ(BitField(byte_, 7).Hash(), BitField(same, 7).Hash());
  EXPECT_NE(BitField(byte_, 7).Hash(), BitField(byte_, 8).Hash());

  std::unordered_set<BitField> std_set = {
      BitField(byte_, 1), BitField(same, 1)};
  EXPECT_EQ(std_set.size(), 1U);

  absl::flat_hash_set<BitField> absl_set;
  absl_set.insert(BitField(byte_, 1));
  absl_set.insert(BitField(byte_, 2));
  absl_set.insert(BitField(same, 2));
  EXPECT_EQ(absl_set.size(), 2U);
}

// =============================================================================
// Copy, state, repr
// =============================================================================

TEST_F(BitFieldTest, CopyIsDetached) {
  BitField reg(control_, 0b101);
  BitField view = reg["mode"];
  BitField copy = view.Copy();
  EXPECT_FALSE(copy.IsView());
  copy = 0;
  EXPECT_EQ(view.Read(), 0b10U);
  EXPECT_EQ(reg.Read(), 0b101U);
}

TEST_F(BitFieldTest, CopyConstructionAndAssignmentDetach) {
  BitField reg(control_, 0b101);
  BitField view = reg["mode"];
  BitField copied(view);
  EXPECT_FALSE(copied.IsView());
  copied.Write(3);
  EXPECT_EQ(reg.Read(), 0b101U);

  BitField assigned(byte_);
  assigned = view;
  EXPECT_FALSE(assigned.IsView());
  EXPECT_EQ(assigned.Type(), view.Type());
  assigned.Write(0);
  EXPECT_EQ(reg.Read(), 0b101U);
}

TEST_F(BitFieldTest, MoveKeepsTheViewLink) {
  BitField reg(control_, 0);
  BitField view = reg["mode"];
  BitField moved = std::move(view);
  EXPECT_TRUE(moved.IsView());
  moved.Write(3);
  EXPECT_EQ(reg.Read(), 0b110U);
}

TEST_F(BitFieldTest, StateOfRoot) {
  BitField reg(control_, 0x5A);
  PersistedState state = reg.State();
  EXPECT_EQ(state, (PersistedState{.value = 0x5A, .size = 8, .mask = 0xFF}));
}

TEST_F(BitFieldTest, StateOfViewIsRejected) {
  BitField reg(control_, 0x5A);
  EXPECT_THROW(static_cast<void>(reg["mode"].State()), ValueError);
  EXPECT_NO_THROW(static_cast<void>(reg["mode"].Copy().State()));
}

TEST_F(BitFieldTest, FromStateRoundTrip) {
  BitField reg(control_, 0x5A);
  BitField restored = BitField::FromState(reg.State(), control_);
  EXPECT_EQ(restored, reg);
  EXPECT_EQ(restored.Type(), control_);
  EXPECT_EQ(restored.Get("mode"), reg.Get("mode"));

  BitField untyped = BitField::FromState(reg.State());
  EXPECT_EQ(untyped, reg);
  EXPECT_TRUE(untyped.Fields().empty());
}

TEST_F(BitFieldTest, FromStateRejectsInconsistentState) {
  EXPECT_THROW(
      BitField::FromState(
          PersistedState{.value = 1, .size = 16, .mask = 0xFFFF}, control_),
      ValueError);
  EXPECT_THROW(
      BitField::FromState(
          PersistedState{.value = 0x100, .size = 8, .mask = 0xFF}),
      ValueError);
  EXPECT_THROW(
      BitField::FromState(PersistedState{.value = 0, .size = 4, .mask = 0xFF}),
      ValueError);
  EXPECT_THROW(
      BitField::FromState(PersistedState{.value = 0, .size = 0, .mask = 0}),
      ValueError);
}

TEST_F(BitFieldTest, Repr) {
  BitField reg(control_, 0x2A);
  EXPECT_EQ(reg.Repr(), "Control(x=0x2A, base=16)");
  EXPECT_EQ(reg["mode"].Repr(), "<mode(x=0x01, base=16)>");
  EXPECT_EQ(
      BitField(Compile(Schema("W").Size(12)), 5).Repr(),
      "W(x=0x0005, base=16)");
}

}  // namespace
}  // namespace bitview
