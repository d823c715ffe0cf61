// =====================================================================
//  src/libnutriring/nutriring/ring/state.h — Ring visual state reducer
// =====================================================================
//
//  Combines arc geometry, the highlight ramp and the tip color into a
//  single RingVisualState for one progress ratio.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_STATE_H
#define NUTRIRING_RING_STATE_H

#include "types.h"

namespace nutriring {
namespace ring {

/// Opacity for a ratio: 0 at or below kVisibilityThreshold, otherwise
/// the effect intensity of the resulting sweep.
NUTRIRING_EXPORT double opacityFor(double ratio);

/// Build the visual state for a ratio under the given parameters.
NUTRIRING_EXPORT RingVisualState reduceRingState(double ratio,
                                                 const RingParameters& params);

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_STATE_H
