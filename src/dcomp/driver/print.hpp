#pragma once

#include <string>

#include "dcomp/common/diagnostic.hpp"

namespace dcomp::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace dcomp::driver
