// =====================================================================
//  src/libfreehand/core.cpp — Library version and logging category
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "freehand/core.h"

Q_LOGGING_CATEGORY(lcFreehand, "freehand", QtWarningMsg)

namespace freehand {

const char* version()
{
    return "0.1.0";
}

}  // namespace freehand
