#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include "bitview/common/error.hpp"

namespace bitview {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Schema rejected by the mapping compiler or a bad operation
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Single diagnostic item (primary or note). `origin` names the file or
// command-line argument the message is about; empty when unknown.
struct DiagItem {
  DiagKind kind;
  std::string origin;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: error reported by the core (carries the error category)
  static auto Error(std::string origin, const bitview::Error& error)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .origin = std::move(origin),
             .message = std::string(ToString(error.Kind())) + ": " +
                        error.what()},
        .notes = {},
    };
  }

  // Factory: host error tied to a file or argument
  static auto HostError(std::string origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .origin = std::move(origin),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(std::string origin, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .origin = std::move(origin),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .origin = {},
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace bitview
