// =====================================================================
//  src/libnutriring/nutriring/core.h — Library version and export macros
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_CORE_H
#define NUTRIRING_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libnutriring as a shared library, NUTRIRING_SHARED and
// NUTRIRING_BUILDING are defined.  Consumers linking against the shared
// library only see NUTRIRING_SHARED (set as a PUBLIC compile definition).

#if defined(NUTRIRING_SHARED)
  #if defined(NUTRIRING_BUILDING)
    #if defined(_WIN32)
      #define NUTRIRING_EXPORT __declspec(dllexport)
    #else
      #define NUTRIRING_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define NUTRIRING_EXPORT __declspec(dllimport)
    #else
      #define NUTRIRING_EXPORT
    #endif
  #endif
#else
  #define NUTRIRING_EXPORT
#endif

namespace nutriring {

/// Library version string (e.g., "0.1.0").
NUTRIRING_EXPORT const char* version();

}  // namespace nutriring

#endif  // NUTRIRING_CORE_H
