#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace bitview::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string stdout_output;
  std::string stderr_output;
  std::string combined_output;  // stdout followed by stderr

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Test fixture for CLI integration tests
//
// Runs the bitview binary inside a fresh temporary directory, capturing
// stdout and stderr separately. The binary is taken from $BITVIEW_BIN, then
// from the path the build configured, then from PATH.
//
// Usage:
//   TEST_F(DecodeTest, Decodes) {
//     WriteSchema("reg.toml", "Reg", 8, {{"low", "[0, 4]"}});
//     auto result = Run({"decode", "--schema", "reg.toml", "0x5A"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  // Field name and its TOML `bits` value ("3", "[0, 4]")
  struct FieldDecl {
    std::string name;
    std::string bits;
  };

  void SetUp() override;
  void TearDown() override;

  // Run bitview with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Load a capture or fixture file from the test directory
  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create a flat schema file with the given fields
  void WriteSchema(
      const std::filesystem::path& relative_path, const std::string& name,
      int size, const std::vector<FieldDecl>& fields);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path bitview_bin_;
};

}  // namespace bitview::test
