#pragma once

#include <gatecore/config.h>

#include <cstdio>

namespace gatecore::os {

GATECORE_API int pid();

GATECORE_API int tid();

bool is_color_terminal() noexcept;

bool in_terminal(FILE* file);

}  // namespace gatecore::os
