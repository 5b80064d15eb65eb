#include "bitview/schema.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace bitview {

Schema::Schema(std::string name) : name_(std::move(name)) {
}

auto Schema::Field(std::string name, int64_t bit) -> Schema& {
  return Field(std::move(name), RangeExpr{bit});
}

auto Schema::Field(std::string name, int64_t start, int64_t end) -> Schema& {
  return Field(std::move(name), RangeExpr{RangePair{start, end}});
}

auto Schema::Field(std::string name, RangeExpr range) -> Schema& {
  entries_.push_back(
      SchemaEntry{.name = std::move(name), .range = range, .block = nullptr});
  return *this;
}

auto Schema::Nested(std::string name, Schema block) -> Schema& {
  // A missing `_index_` is reported by Compile().
  RangeExpr range = block.index_.value_or(RangeExpr{int64_t{0}});
  entries_.push_back(
      SchemaEntry{
          .name = std::move(name),
          .range = range,
          .block = std::make_shared<const Schema>(std::move(block))});
  return *this;
}

auto Schema::Index(RangeExpr range) -> Schema& {
  index_ = range;
  return *this;
}

auto Schema::Size(int64_t bits) -> Schema& {
  size_ = bits;
  return *this;
}

auto Schema::Mask(uint64_t mask) -> Schema& {
  mask_ = mask;
  return *this;
}

}  // namespace bitview
