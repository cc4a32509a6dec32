// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "conversion_error.h"

namespace forgepost {

const char* conversion_error_code_name(ConversionErrorCode code) {
    switch (code) {
    case ConversionErrorCode::SUCCESS:
        return "success";
    case ConversionErrorCode::UNTERMINATED_BLOCK:
        return "unterminated_block";
    case ConversionErrorCode::CORRUPT_THUMBNAIL:
        return "corrupt_thumbnail";
    case ConversionErrorCode::INVARIANT_VIOLATION:
        return "invariant_violation";
    }
    return "unknown";
}

} // namespace forgepost
