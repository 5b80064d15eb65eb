#include "bitview/config/schema_file.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "bitview/bit_range.hpp"
#include "bitview/common/error.hpp"

namespace bitview::config {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kNameKey = "name";
constexpr std::string_view kBitsKey = "bits";
constexpr std::string_view kIndexKey = "_index_";
constexpr std::string_view kFieldsKey = "fields";

class SchemaReader {
 public:
  explicit SchemaReader(const fs::path& path) : origin_(path.string()) {
  }

  auto Read(const toml::table& tbl) -> Result<Schema> {
    const toml::table* section = tbl["schema"].as_table();
    if (section == nullptr) {
      return Fail("missing [schema] section");
    }

    std::string name;
    if (const toml::node* node = section->get(kNameKey)) {
      auto value = node->value<std::string>();
      if (!value) {
        return Fail("'schema.name' must be a string");
      }
      name = *value;
    }
    Schema schema(name);

    for (auto&& kv : *section) {
      std::string_view k = kv.first.str();
      if (k == kIndexKey) {
        // Rejected by the compiler with its own error category.
        auto range = ReadRange(kv.second, "schema._index_");
        if (!range) {
          return std::unexpected(std::move(range).error());
        }
        schema.Index(*range);
      } else if (
          k != kNameKey && k != kFieldsKey && k != "_size_" &&
          k != "_mask_" && k != "reject_overlaps") {
        return Fail(std::format("unknown key 'schema.{}'", k));
      }
    }

    if (const toml::node* size = section->get("_size_")) {
      auto bits = size->value<int64_t>();
      if (!bits) {
        return Fail("'schema._size_' must be an integer");
      }
      schema.Size(*bits);
    }
    if (const toml::node* mask = section->get("_mask_")) {
      auto bits = mask->value<int64_t>();
      if (!bits || *bits < 0) {
        return Fail("'schema._mask_' must be a non-negative integer");
      }
      schema.Mask(static_cast<uint64_t>(*bits));
    }

    if (const toml::node* fields = section->get(kFieldsKey)) {
      const toml::array* arr = fields->as_array();
      if (arr == nullptr) {
        return Fail("'schema.fields' must be an array of tables");
      }
      if (auto ok = ReadFields(*arr, "schema", schema); !ok) {
        return std::unexpected(std::move(ok).error());
      }
    }
    return schema;
  }

 private:
  auto Fail(std::string message) const -> std::unexpected<Diagnostic> {
    return std::unexpected(Diagnostic::HostError(origin_, std::move(message)));
  }

  // `bits`/`_index_`: an integer bit or a two-element [start, end] array.
  auto ReadRange(const toml::node& node, std::string_view where) const
      -> Result<RangeExpr> {
    if (auto bit = node.value<int64_t>()) {
      return RangeExpr{*bit};
    }
    const toml::array* arr = node.as_array();
    if (arr != nullptr && arr->size() == 2) {
      auto start = (*arr)[0].value<int64_t>();
      auto end = (*arr)[1].value<int64_t>();
      if (start && end) {
        return RangeExpr{RangePair{*start, *end}};
      }
    }
    return Fail(
        std::format(
            "'{}' must be an integer bit or a [start, end] pair", where));
  }

  auto ReadFields(
      const toml::array& arr, std::string_view scope, Schema& into) const
      -> Result<void> {
    for (size_t i = 0; i < arr.size(); ++i) {
      std::string where = std::format("{}.fields[{}]", scope, i);
      const toml::table* entry = arr[i].as_table();
      if (entry == nullptr) {
        return Fail(std::format("'{}' must be a table", where));
      }

      auto name = (*entry)[kNameKey].value<std::string>();
      if (!name) {
        return Fail(std::format("missing required field '{}.name'", where));
      }
      for (auto&& kv : *entry) {
        std::string_view k = kv.first.str();
        if (k != kNameKey && k != kBitsKey && k != kIndexKey &&
            k != kFieldsKey) {
          return Fail(std::format("unknown key '{}.{}'", where, k));
        }
      }

      const toml::node* bits = entry->get(kBitsKey);
      const toml::node* index = entry->get(kIndexKey);
      const toml::node* fields = entry->get(kFieldsKey);

      if (bits != nullptr) {
        if (index != nullptr || fields != nullptr) {
          return Fail(
              std::format(
                  "'{}' has 'bits' and a nested block; use one", where));
        }
        auto range = ReadRange(*bits, std::format("{}.bits", where));
        if (!range) {
          return std::unexpected(std::move(range).error());
        }
        into.Field(*name, *range);
        continue;
      }

      if (fields == nullptr && index == nullptr) {
        return Fail(
            std::format("'{}' needs 'bits' or '_index_' and 'fields'", where));
      }

      Schema block;
      if (index != nullptr) {
        auto range = ReadRange(*index, std::format("{}._index_", where));
        if (!range) {
          return std::unexpected(std::move(range).error());
        }
        block.Index(*range);
      }
      if (fields != nullptr) {
        const toml::array* children = fields->as_array();
        if (children == nullptr) {
          return Fail(
              std::format("'{}.fields' must be an array of tables", where));
        }
        if (auto ok = ReadFields(*children, where, block); !ok) {
          return ok;
        }
      }
      into.Nested(*name, std::move(block));
    }
    return {};
  }

  std::string origin_;
};

}  // namespace

auto LoadSchemaFile(const fs::path& path, DescriptorArena& arena)
    -> Result<SchemaFile> {
  if (!fs::exists(path)) {
    return std::unexpected(
        Diagnostic::HostError(
            path.string(), "schema file not found"));
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            path.string(),
            std::format(
                "failed to parse (line {}): {}", e.source().begin.line,
                e.description())));
  }

  SchemaReader reader(path);
  auto schema = reader.Read(tbl);
  if (!schema) {
    return std::unexpected(std::move(schema).error());
  }

  CompileOptions options;
  if (const toml::node* strict = tbl["schema"]["reject_overlaps"].node()) {
    const auto* flag = strict->as_boolean();
    if (flag == nullptr) {
      return std::unexpected(
          Diagnostic::HostError(
              path.string(), "'schema.reject_overlaps' must be a boolean"));
    }
    options.reject_overlaps = flag->get();
  }

  TypeRef type;
  try {
    type = arena.Intern(*schema, options);
  } catch (const Error& e) {
    return std::unexpected(Diagnostic::Error(path.string(), e));
  }

  spdlog::debug(
      "loaded schema '{}' from {} ({} bits)", type->Name(), path.string(),
      type->TotalSize());
  return SchemaFile{
      .path = path,
      .schema = std::move(*schema),
      .options = options,
      .type = std::move(type),
  };
}

}  // namespace bitview::config
