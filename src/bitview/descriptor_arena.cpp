#include "bitview/descriptor_arena.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace bitview {

auto DescriptorArena::Intern(const Schema& schema, CompileOptions options)
    -> TypeRef {
  TypeRef compiled = Compile(schema, options);
  DescriptorKey key{.name = compiled->Name(), .type = compiled};

  auto it = map_.find(key);
  if (it != map_.end()) {
    spdlog::debug("descriptor arena: reusing '{}'", compiled->Name());
    return it->second;
  }

  spdlog::debug(
      "descriptor arena: interned '{}' ({} entries)", compiled->Name(),
      map_.size() + 1);
  map_.emplace(std::move(key), compiled);
  return compiled;
}

}  // namespace bitview
