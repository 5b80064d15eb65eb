#pragma once

#include "bitview/schema.hpp"
#include "bitview/type_descriptor.hpp"

namespace bitview {

struct CompileOptions {
  // Sibling ranges may overlap unless this is set; an overlap then raises
  // IndexError naming the field and the shared bits.
  bool reject_overlaps = false;
};

// Compile a schema into an immutable TypeDescriptor.
//
// Throws:
//   IndexError - negative/inverted range, field outside the declared size or
//                outside its nested block, overlap with reject_overlaps
//   ValueError - reserved or duplicate names, top-level `_index_`, nested
//                block without `_index_` or with its own size/mask,
//                non-positive or oversized `_size_`, `_mask_` wider than
//                `_size_`, empty `_mask_`
//
// Compilation is pure: structurally identical schemas yield descriptors that
// compare and hash equal.
auto Compile(const Schema& schema, CompileOptions options = {}) -> TypeRef;

}  // namespace bitview
