#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bitview {

// Detached snapshot of a root value. The parent link of a view is never
// part of it.
struct PersistedState {
  uint64_t value = 0;
  uint32_t size = 0;
  uint64_t mask = 0;

  auto operator==(const PersistedState&) const -> bool = default;
};

// {"value": v, "size": s, "mask": m}
auto ToJson(const PersistedState& state) -> std::string;

// Inverse of ToJson(). Throws ValueError on malformed JSON, missing or
// non-integer members, and on any member other than value/size/mask.
auto ParseState(std::string_view json) -> PersistedState;

}  // namespace bitview
