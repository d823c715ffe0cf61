// =====================================================================
//  src/libnutriring/logging.cpp — Logging categories
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <nutriring/logging.h>

namespace nutriring {

Q_LOGGING_CATEGORY(lcColor,  "nutriring.color",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcSync,   "nutriring.sync",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcLayout, "nutriring.layout", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig, "nutriring.config", QtInfoMsg)

}  // namespace nutriring
