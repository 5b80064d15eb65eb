#include "bitview/type_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bitview/common/bit_utils.hpp"

namespace bitview {

namespace {

auto BuildMapping(const std::vector<FieldSpec>& fields)
    -> std::vector<MappingEntry> {
  std::vector<MappingEntry> result;
  result.reserve(fields.size());
  for (const auto& field : fields) {
    result.push_back(
        MappingEntry{
            .name = field.name,
            .range = field.range,
            .nested = BuildMapping(field.Children())});
  }
  return result;
}

}  // namespace

auto FieldSpec::IsNested() const -> bool {
  return type->HasFields();
}

auto FieldSpec::Children() const -> const std::vector<FieldSpec>& {
  return type->Fields();
}

auto FieldSpec::operator==(const FieldSpec& other) const -> bool {
  return name == other.name && range == other.range && *type == *other.type;
}

TypeDescriptor::TypeDescriptor(
    std::string name, uint32_t total_size, uint64_t total_mask,
    std::vector<FieldSpec> fields, bool bounded)
    : name_(std::move(name)),
      total_size_(total_size),
      total_mask_(total_mask),
      bounded_(bounded),
      fields_(std::move(fields)) {
  index_.reserve(fields_.size());
  for (size_t i = 0; i < fields_.size(); ++i) {
    index_.try_emplace(fields_[i].name, i);
  }
}

auto TypeDescriptor::Unmapped(
    std::string name, uint32_t total_size, uint64_t mask) -> TypeRef {
  return std::make_shared<const TypeDescriptor>(
      std::move(name), total_size, mask, std::vector<FieldSpec>{});
}

auto TypeDescriptor::Unbounded() -> TypeRef {
  static const TypeRef kUnbounded = std::make_shared<const TypeDescriptor>(
      "BitField", common::kMaxBitWidth,
      common::MakeBitMask(common::kMaxBitWidth), std::vector<FieldSpec>{},
      false);
  return kUnbounded;
}

auto TypeDescriptor::Find(std::string_view name) const -> const FieldSpec* {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &fields_[it->second];
}

auto TypeDescriptor::FieldNames() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (const auto& field : fields_) {
    names.push_back(field.name);
  }
  return names;
}

auto TypeDescriptor::Mapping() const -> std::vector<MappingEntry> {
  return BuildMapping(fields_);
}

auto TypeDescriptor::Slice(const BitRange& range, std::string name) const
    -> TypeRef {
  return Unmapped(
      std::move(name), range.Width(), SliceMask(total_mask_, range));
}

auto TypeDescriptor::operator==(const TypeDescriptor& other) const -> bool {
  return total_size_ == other.total_size_ &&
         total_mask_ == other.total_mask_ && bounded_ == other.bounded_ &&
         fields_ == other.fields_;
}

auto SliceMask(uint64_t mask, const BitRange& range) -> uint64_t {
  return common::ExtractBits(mask, range.start, range.Width());
}

}  // namespace bitview
