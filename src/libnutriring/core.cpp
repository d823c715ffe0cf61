// =====================================================================
//  src/libnutriring/core.cpp -- Library version
// =====================================================================
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "nutriring/core.h"

namespace nutriring {

const char* version()
{
    return "0.1.0";
}

}  // namespace nutriring
