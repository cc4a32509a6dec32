// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

// Overridden by the build system (project VERSION)
#ifndef FORGEPOST_VERSION
#define FORGEPOST_VERSION "1.0.0"
#endif

namespace forgepost {

inline const char* forgepost_version() {
    return FORGEPOST_VERSION;
}

} // namespace forgepost
