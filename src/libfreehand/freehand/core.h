// =====================================================================
//  src/libfreehand/freehand/core.h — Library version, export macros and logging
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_CORE_H
#define FREEHAND_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libfreehand as a shared library, FREEHAND_SHARED and
// FREEHAND_BUILDING are defined.  Consumers linking against the shared
// library only see FREEHAND_SHARED (set as a PUBLIC compile definition).

#if defined(FREEHAND_SHARED)
  #if defined(FREEHAND_BUILDING)
    #if defined(_WIN32)
      #define FREEHAND_EXPORT __declspec(dllexport)
    #else
      #define FREEHAND_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define FREEHAND_EXPORT __declspec(dllimport)
    #else
      #define FREEHAND_EXPORT
    #endif
  #endif
#else
  #define FREEHAND_EXPORT
#endif

#include <QLoggingCategory>

/// Logging category for the whole library ("freehand").
///
/// Hosts can silence or enable it with, for example:
/// @code
///     QLoggingCategory::setFilterRules(QStringLiteral("freehand.debug=true"));
/// @endcode
FREEHAND_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcFreehand)

namespace freehand {

/// Library version string (e.g., "0.1.0").
FREEHAND_EXPORT const char* version();

}  // namespace freehand

#endif  // FREEHAND_CORE_H
