#pragma once

#include <filesystem>

#include "bitview/common/diagnostic.hpp"
#include "bitview/descriptor_arena.hpp"
#include "bitview/mapping_compiler.hpp"
#include "bitview/schema.hpp"
#include "bitview/type_descriptor.hpp"

namespace bitview::config {

struct SchemaFile {
  std::filesystem::path path;
  Schema schema;
  CompileOptions options;
  // Compiled (and interned) descriptor of `schema`.
  TypeRef type;
};

// Parse a TOML schema file and compile it through `arena`.
//
//   [schema]
//   name = "Control"
//   _size_ = 8
//   reject_overlaps = false
//
//   [[schema.fields]]
//   name = "mode"
//   bits = [1, 3]
//
// Returns a host-error Diagnostic for I/O, TOML syntax and shape problems,
// and an error Diagnostic carrying the error category when compilation
// rejects the schema.
auto LoadSchemaFile(const std::filesystem::path& path, DescriptorArena& arena)
    -> Result<SchemaFile>;

}  // namespace bitview::config
