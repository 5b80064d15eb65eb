#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "bitview/common/diagnostic.hpp"
#include "bitview/config/schema_file.hpp"
#include "bitview/descriptor_arena.hpp"

namespace bitview::config {
namespace {

namespace fs = std::filesystem;

class SchemaFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    dir_ = fs::temp_directory_path() /
           ("bitview_schema_test_" + std::to_string(rd()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    fs::remove_all(dir_);
  }

  auto Write(const std::string& content) -> fs::path {
    fs::path path = dir_ / "schema.toml";
    std::ofstream out(path);
    out << content;
    return path;
  }

  fs::path dir_;
  DescriptorArena arena_;
};

TEST_F(SchemaFileTest, LoadsFieldsAndNestedBlocks) {
  auto path = Write(R"(
[schema]
name = "Control"
_size_ = 8

[[schema.fields]]
name = "enable"
bits = 0

[[schema.fields]]
name = "mode"
bits = [1, 3]

[[schema.fields]]
name = "status"
_index_ = [3, 8]
  [[schema.fields.fields]]
  name = "ready"
  bits = 0
)");
  auto file = LoadSchemaFile(path, arena_);
  ASSERT_TRUE(file.has_value()) << file.error().primary.message;

  const auto& type = *file->type;
  EXPECT_EQ(type.Name(), "Control");
  EXPECT_EQ(type.TotalSize(), 8U);
  ASSERT_EQ(type.Fields().size(), 3U);
  EXPECT_EQ(type.Find("mode")->range, (BitRange{.start = 1, .end = 3}));
  const FieldSpec* status = type.Find("status");
  ASSERT_NE(status, nullptr);
  EXPECT_EQ(status->range, (BitRange{.start = 3, .end = 8}));
  ASSERT_EQ(status->Children().size(), 1U);
  EXPECT_EQ(status->Children()[0].name, "ready");
}

TEST_F(SchemaFileTest, SameFileInternsOnce) {
  auto path = Write(R"(
[schema]
name = "Reg"
[[schema.fields]]
name = "x"
bits = [0, 4]
)");
  auto a = LoadSchemaFile(path, arena_);
  auto b = LoadSchemaFile(path, arena_);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->type.get(), b->type.get());
  EXPECT_EQ(arena_.Size(), 1U);
}

TEST_F(SchemaFileTest, MaskAndOverlapOptions) {
  auto path = Write(R"(
[schema]
name = "Reg"
_mask_ = 0xF0
reject_overlaps = true
[[schema.fields]]
name = "high"
bits = [4, 8]
)");
  auto file = LoadSchemaFile(path, arena_);
  ASSERT_TRUE(file.has_value()) << file.error().primary.message;
  EXPECT_EQ(file->type->TotalMask(), 0xF0U);
  EXPECT_TRUE(file->options.reject_overlaps);
}

TEST_F(SchemaFileTest, MissingFileIsHostError) {
  auto file = LoadSchemaFile(dir_ / "absent.toml", arena_);
  ASSERT_FALSE(file.has_value());
  EXPECT_EQ(file.error().primary.kind, DiagKind::kHostError);
}

TEST_F(SchemaFileTest, SyntaxErrorIsHostError) {
  auto file = LoadSchemaFile(Write("[schema\nname = 1"), arena_);
  ASSERT_FALSE(file.has_value());
  EXPECT_EQ(file.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      file.error().primary.message.find("failed to parse"), std::string::npos);
}

TEST_F(SchemaFileTest, ShapeErrorsNameTheKey) {
  struct Case {
    std::string content;
    std::string needle;
  };
  const Case cases[] = {
      {"[other]\n", "missing [schema]"},
      {"[schema]\nname = 3\n", "schema.name"},
      {"[schema]\n_size_ = \"8\"\n", "schema._size_"},
      {"[schema]\nbogus = 1\n", "schema.bogus"},
      {"[schema]\n[[schema.fields]]\nbits = 0\n", "schema.fields[0].name"},
      {"[schema]\n[[schema.fields]]\nname = \"a\"\nbits = \"0\"\n",
       "schema.fields[0].bits"},
      {"[schema]\n[[schema.fields]]\nname = \"a\"\n", "schema.fields[0]"},
      {"[schema]\nreject_overlaps = 1\n", "reject_overlaps"},
  };
  for (const auto& c : cases) {
    auto file = LoadSchemaFile(Write(c.content), arena_);
    ASSERT_FALSE(file.has_value()) << c.content;
    EXPECT_EQ(file.error().primary.kind, DiagKind::kHostError) << c.content;
    EXPECT_NE(file.error().primary.message.find(c.needle), std::string::npos)
        << file.error().primary.message;
  }
}

TEST_F(SchemaFileTest, CompileErrorsCarryTheirCategory) {
  auto file = LoadSchemaFile(
      Write(R"(
[schema]
name = "Bad"
[[schema.fields]]
name = "neg"
bits = [-1, 4]
)"),
      arena_);
  ASSERT_FALSE(file.has_value());
  EXPECT_EQ(file.error().primary.kind, DiagKind::kError);
  EXPECT_EQ(file.error().primary.message.rfind("index error", 0), 0U);
  EXPECT_EQ(arena_.Size(), 0U);
}

TEST_F(SchemaFileTest, NestedBlockWithoutIndexIsValueError) {
  auto file = LoadSchemaFile(
      Write(R"(
[schema]
[[schema.fields]]
name = "block"
  [[schema.fields.fields]]
  name = "a"
  bits = 0
)"),
      arena_);
  ASSERT_FALSE(file.has_value());
  EXPECT_EQ(file.error().primary.kind, DiagKind::kError);
  EXPECT_EQ(file.error().primary.message.rfind("value error", 0), 0U);
}

}  // namespace
}  // namespace bitview::config
