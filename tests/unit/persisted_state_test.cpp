#include <gtest/gtest.h>

#include <string>

#include "bitview/bit_field.hpp"
#include "bitview/common/error.hpp"
#include "bitview/mapping_compiler.hpp"
#include "bitview/persisted_state.hpp"
#include "bitview/schema.hpp"

namespace bitview {
namespace {

class PersistedStateTest : public ::testing::Test {};

TEST_F(PersistedStateTest, JsonCarriesValueSizeAndMask) {
  PersistedState state{.value = 5, .size = 8, .mask = 0xFF};
  EXPECT_EQ(ToJson(state), R"({"mask":255,"size":8,"value":5})");
}

TEST_F(PersistedStateTest, ParseAcceptsAnyMemberOrder) {
  EXPECT_EQ(
      ParseState(R"({"value": 5, "mask": 255, "size": 8})"),
      (PersistedState{.value = 5, .size = 8, .mask = 0xFF}));
}

TEST_F(PersistedStateTest, FullWidthValuesSurvive) {
  PersistedState state{
      .value = 0xFFFF'FFFF'FFFF'FFFF,
      .size = 64,
      .mask = 0xFFFF'FFFF'FFFF'FFFF};
  EXPECT_EQ(ParseState(ToJson(state)), state);
}

TEST_F(PersistedStateTest, RejectsParentLinkAndUnknownMembers) {
  EXPECT_THROW(
      ParseState(R"({"value": 1, "size": 8, "mask": 255, "parent": 0})"),
      ValueError);
  EXPECT_THROW(
      ParseState(R"({"value": 1, "size": 8, "mask": 255, "name": "x"})"),
      ValueError);
}

TEST_F(PersistedStateTest, RejectsMissingAndMistypedMembers) {
  EXPECT_THROW(ParseState(R"({"value": 1, "size": 8})"), ValueError);
  EXPECT_THROW(ParseState(R"({"value": -1, "size": 8, "mask": 255})"),
               ValueError);
  EXPECT_THROW(ParseState(R"({"value": "1", "size": 8, "mask": 255})"),
               ValueError);
  EXPECT_THROW(ParseState(R"({"value": 1.5, "size": 8, "mask": 255})"),
               ValueError);
}

TEST_F(PersistedStateTest, RejectsMalformedJson) {
  EXPECT_THROW(ParseState("{"), ValueError);
  EXPECT_THROW(ParseState("[1, 8, 255]"), ValueError);
  EXPECT_THROW(ParseState(""), ValueError);
}

TEST_F(PersistedStateTest, RoundTripThroughBitField) {
  auto type = Compile(Schema("Reg").Size(12).Mask(0xF0F).Field("low", 0, 4));
  BitField reg(type, 0x90A);
  BitField restored =
      BitField::FromState(ParseState(ToJson(reg.State())), type);
  EXPECT_EQ(restored, reg);
  EXPECT_EQ(restored.Get("low"), 0xAU);
}

TEST_F(PersistedStateTest, ViewsHaveNoState) {
  auto type = Compile(Schema("Reg").Field("low", 0, 4).Field("high", 4, 8));
  BitField reg(type, 0x5A);
  EXPECT_THROW(static_cast<void>(reg["high"].State()), ValueError);
}

}  // namespace
}  // namespace bitview
