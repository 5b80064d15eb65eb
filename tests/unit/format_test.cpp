#include <gtest/gtest.h>

#include <string>

#include <fmt/format.h>

#include "bitview/bit_field.hpp"
#include "bitview/format.hpp"
#include "bitview/mapping_compiler.hpp"
#include "bitview/schema.hpp"

namespace bitview {
namespace {

class FormatTest : public ::testing::Test {
 protected:
  TypeRef nested_ = Compile(
      Schema("Nested").Field("first", 0).Nested(
          "nested", Schema().Index(RangePair{3, 8}).Field("inner", 0)));
};

TEST_F(FormatTest, LineShowsDecimalHexBinaryAndMask) {
  BitField value(Compile(Schema("Byte").Size(8)), 205);
  EXPECT_EQ(FormatLine(value), "<205 == 0xCD == (0b11001101 & 0b11111111)>");
}

TEST_F(FormatTest, LinePadsToTheDeclaredWidth) {
  BitField value(Compile(Schema("Reg").Size(12).Mask(0x0F0)), 0x30);
  EXPECT_EQ(
      FormatLine(value), "<48 == 0x0030 == (0b000000110000 & 0b11110000)>");
}

TEST_F(FormatTest, UnboundedLineOmitsMask) {
  EXPECT_EQ(FormatLine(BitField(5)), "<5 == 0x05 == (0b101)>");
}

TEST_F(FormatTest, ValueWithoutFieldsIsOneLine) {
  BitField value(Compile(Schema("Byte").Size(8)), 1);
  EXPECT_EQ(FormatValue(value), FormatLine(value));
}

TEST_F(FormatTest, FieldTree) {
  BitField value(nested_, 0xFF);
  std::string expected =
      "<255 == 0xFF == (0b11111111 & 0b11111111)\n"
      "    first  = <1 == 0x01 == (0b1 & 0b1)>\n"
      "    nested = \n"
      "        <31 == 0x1F == (0b11111 & 0b11111)\n"
      "            inner = <1 == 0x01 == (0b1 & 0b1)>\n"
      "        >\n"
      ">";
  EXPECT_EQ(FormatValue(value), expected);
}

TEST_F(FormatTest, MaxIndentCollapsesDeepLevels) {
  BitField value(nested_, 0xFF);
  std::string expected =
      "<255 == 0xFF == (0b11111111 & 0b11111111)\n"
      "  first  = <1 == 0x01 == (0b1 & 0b1)>\n"
      "  nested = <31 == 0x1F == (0b11111 & 0b11111)>\n"
      ">";
  EXPECT_EQ(
      FormatValue(value, FormatOptions{.max_indent = 4, .indent_step = 2}),
      expected);
}

TEST_F(FormatTest, ViewsFormatTheirOwnWindow) {
  BitField value(nested_, 0xF7);
  EXPECT_EQ(
      FormatValue(value["nested"]),
      "<30 == 0x1E == (0b11110 & 0b11111)\n"
      "    inner = <0 == 0x00 == (0b0 & 0b1)>\n"
      ">");
}

TEST_F(FormatTest, FmtFormatterUsesOneLineForm) {
  BitField value(nested_, 0x09);
  EXPECT_EQ(
      fmt::format("{}", value), "<9 == 0x09 == (0b00001001 & 0b11111111)>");
}

TEST_F(FormatTest, Layout) {
  EXPECT_EQ(
      FormatLayout(*nested_),
      "Nested: 8 bits, mask 0xFF\n"
      "  first  [0, 1)  1 bit\n"
      "  nested [3, 8)  5 bits\n"
      "    inner [0, 1)  1 bit\n");
}

TEST_F(FormatTest, LayoutOfUnboundedType) {
  EXPECT_EQ(
      FormatLayout(*Compile(Schema("Free"))), "Free: unbounded (64 bits)\n");
}

}  // namespace
}  // namespace bitview
