#include "bitview/common/error.hpp"

namespace bitview {

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kIndex:
      return "index error";
    case ErrorKind::kType:
      return "type error";
    case ErrorKind::kValue:
      return "value error";
    case ErrorKind::kOverflow:
      return "overflow error";
  }
  return "error";
}

}  // namespace bitview
