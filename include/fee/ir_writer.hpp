// EDN-style text rendering of the IR for the CLI and golden tests.
#pragma once
#include "fee/ir.hpp"
#include <string>

namespace fee {

std::string write_ir(const FontFeatures& ff);
std::string write_routine(const Routine& r);

} // namespace fee
