// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

// Set by the build (CMake project version); fallback for out-of-tree builds
#ifndef MAGPIE_VERSION
#define MAGPIE_VERSION "0.3.0"
#endif

namespace magpie {

inline const char* magpie_version() {
    return MAGPIE_VERSION;
}

} // namespace magpie
