// =====================================================================
//  src/libnutriring/nutriring/logging.h — Logging categories
// =====================================================================
//
//  Qt categorized logging for libnutriring.  Debug output is off by
//  default; enable it with e.g.
//
//      QT_LOGGING_RULES="nutriring.sync.debug=true"
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_LOGGING_H
#define NUTRIRING_LOGGING_H

#include "core.h"

#include <QLoggingCategory>

namespace nutriring {

Q_DECLARE_LOGGING_CATEGORY(lcColor)
Q_DECLARE_LOGGING_CATEGORY(lcSync)
Q_DECLARE_LOGGING_CATEGORY(lcLayout)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

}  // namespace nutriring

#endif  // NUTRIRING_LOGGING_H
