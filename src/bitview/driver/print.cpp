#include "print.hpp"

#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/format.h>

#include "bitview/common/diagnostic.hpp"

namespace bitview::driver {

namespace {

struct KindStyle {
  std::string_view label;
  fmt::terminal_color color;
};

auto StyleOf(DiagKind kind) -> KindStyle {
  switch (kind) {
    case DiagKind::kWarning:
      return {
          .label = "warning:",
          .color = fmt::terminal_color::bright_magenta};
    case DiagKind::kNote:
      return {.label = "note:", .color = fmt::terminal_color::bright_cyan};
    case DiagKind::kError:
    case DiagKind::kHostError:
      break;
  }
  return {.label = "error:", .color = fmt::terminal_color::bright_red};
}

// One "<origin>: <kind> <message>" line on stderr. Diagnostics without an
// origin are attributed to the tool itself.
void PrintLine(
    std::string_view origin, DiagKind kind, std::string_view message,
    bool emphasize) {
  KindStyle style = StyleOf(kind);
  fmt::text_style message_style =
      emphasize ? fmt::text_style(fmt::emphasis::bold) : fmt::text_style{};
  fmt::text_style origin_style = fmt::emphasis::bold;
  if (origin.empty()) {
    origin = "bitview";
    origin_style = fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;
  }
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(origin, origin_style),
      fmt::styled(style.label, fmt::fg(style.color) | fmt::emphasis::bold),
      fmt::styled(message, message_style));
}

}  // namespace

void PrintError(const std::string& message) {
  PrintLine({}, DiagKind::kHostError, message, true);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintLine(
      diag.primary.origin, diag.primary.kind, diag.primary.message, true);
  for (const auto& note : diag.notes) {
    PrintLine(note.origin, note.kind, note.message, false);
  }
}

}  // namespace bitview::driver
