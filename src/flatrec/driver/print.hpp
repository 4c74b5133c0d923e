#pragma once

#include <string>

#include "flatrec/common/diagnostic/diagnostic.hpp"

namespace flatrec::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace flatrec::driver
