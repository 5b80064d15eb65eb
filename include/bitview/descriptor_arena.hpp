#pragma once

#include <cstddef>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "bitview/mapping_compiler.hpp"
#include "bitview/schema.hpp"
#include "bitview/type_descriptor.hpp"

namespace bitview {

// Key of an interned descriptor: its display name plus its structure.
struct DescriptorKey {
  std::string name;
  TypeRef type;

  auto operator==(const DescriptorKey& other) const -> bool {
    return name == other.name && *type == *other.type;
  }
};

struct DescriptorKeyHash {
  auto operator()(const DescriptorKey& key) const -> size_t {
    return absl::HashOf(key.name, *key.type);
  }
};

// Interns compiled descriptors so every schema with the same name and
// structure maps to one shared TypeDescriptor. Values of interned types can
// then be checked for "same type" by pointer.
//
// Not synchronized; share an arena across threads only behind a lock.
class DescriptorArena final {
 public:
  DescriptorArena() = default;
  ~DescriptorArena() = default;

  DescriptorArena(const DescriptorArena&) = delete;
  auto operator=(const DescriptorArena&) -> DescriptorArena& = delete;

  DescriptorArena(DescriptorArena&&) = default;
  auto operator=(DescriptorArena&&) -> DescriptorArena& = default;

  // Compile `schema` and return the canonical descriptor for it. Idempotent.
  // Propagates the errors of Compile().
  auto Intern(const Schema& schema, CompileOptions options = {}) -> TypeRef;

  [[nodiscard]] auto Size() const -> size_t {
    return map_.size();
  }

 private:
  absl::flat_hash_map<DescriptorKey, TypeRef, DescriptorKeyHash> map_;
};

}  // namespace bitview
