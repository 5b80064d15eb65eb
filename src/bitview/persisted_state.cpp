#include "bitview/persisted_state.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bitview/common/error.hpp"

namespace bitview {

namespace {

constexpr std::string_view kValueKey = "value";
constexpr std::string_view kSizeKey = "size";
constexpr std::string_view kMaskKey = "mask";

auto ReadUnsigned(const nlohmann::json& j, std::string_view key) -> uint64_t {
  auto it = j.find(key);
  if (it == j.end()) {
    ThrowValueError(std::format("persisted state has no '{}'", key));
  }
  if (!it->is_number_unsigned()) {
    ThrowValueError(
        std::format(
            "persisted state member '{}' must be a non-negative integer, got "
            "{}",
            key, it->type_name()));
  }
  return it->get<uint64_t>();
}

}  // namespace

auto ToJson(const PersistedState& state) -> std::string {
  nlohmann::json j;
  j[kValueKey] = state.value;
  j[kSizeKey] = state.size;
  j[kMaskKey] = state.mask;
  return j.dump();
}

auto ParseState(std::string_view json) -> PersistedState {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json);
  } catch (const nlohmann::json::parse_error& e) {
    ThrowValueError(std::format("malformed persisted state: {}", e.what()));
  }
  if (!j.is_object()) {
    ThrowValueError(
        std::format(
            "persisted state must be a JSON object, got {}", j.type_name()));
  }
  for (const auto& item : j.items()) {
    const std::string& key = item.key();
    if (key != kValueKey && key != kSizeKey && key != kMaskKey) {
      ThrowValueError(
          std::format("unexpected member '{}' in persisted state", key));
    }
  }

  uint64_t size = ReadUnsigned(j, kSizeKey);
  if (size > UINT32_MAX) {
    ThrowValueError(std::format("persisted size {} is out of range", size));
  }
  return PersistedState{
      .value = ReadUnsigned(j, kValueKey),
      .size = static_cast<uint32_t>(size),
      .mask = ReadUnsigned(j, kMaskKey),
  };
}

}  // namespace bitview
