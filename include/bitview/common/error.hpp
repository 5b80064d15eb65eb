#pragma once

#include <stdexcept>
#include <string>

namespace bitview {

// Category of a failed operation. Mirrors the error classes callers of a
// dynamically typed bitfield API expect, so tooling can map them 1:1.
enum class ErrorKind {
  kIndex,     // Bad range, unmapped name, index outside the value
  kType,      // Operand of the wrong type
  kValue,     // Inconsistent schema, negative result, detached-state misuse
  kOverflow,  // Result does not fit in the available bits
};

// Base class for every error raised by the bitview core.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& detail)
      : std::runtime_error(detail), kind_(kind) {
  }

  [[nodiscard]] auto Kind() const -> ErrorKind {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class IndexError final : public Error {
 public:
  explicit IndexError(const std::string& detail)
      : Error(ErrorKind::kIndex, detail) {
  }
};

class TypeError final : public Error {
 public:
  explicit TypeError(const std::string& detail)
      : Error(ErrorKind::kType, detail) {
  }
};

class ValueError final : public Error {
 public:
  explicit ValueError(const std::string& detail)
      : Error(ErrorKind::kValue, detail) {
  }
};

class OverflowError final : public Error {
 public:
  explicit OverflowError(const std::string& detail)
      : Error(ErrorKind::kOverflow, detail) {
  }
};

[[noreturn]] inline void ThrowIndexError(const std::string& detail) {
  throw IndexError(detail);
}

[[noreturn]] inline void ThrowTypeError(const std::string& detail) {
  throw TypeError(detail);
}

[[noreturn]] inline void ThrowValueError(const std::string& detail) {
  throw ValueError(detail);
}

[[noreturn]] inline void ThrowOverflowError(const std::string& detail) {
  throw OverflowError(detail);
}

// String conversion for diagnostic display
auto ToString(ErrorKind kind) -> const char*;

}  // namespace bitview
