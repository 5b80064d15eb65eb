#pragma once

#include <string>

#include "bitview/common/diagnostic.hpp"

namespace bitview::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace bitview::driver
