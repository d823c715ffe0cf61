// =====================================================================
//  src/libnutriring/nutriring/ring/surface.h — Drawing surface interface
// =====================================================================
//
//  The capability a ring needs from whatever paints it: a stroked
//  circular arc with round caps and an angular color ramp, a blurred
//  shadow blob, and an auxiliary tip marker.  libnutriring never
//  rasterizes; the application supplies an implementation.
//
//  Part of libnutriring.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef NUTRIRING_RING_SURFACE_H
#define NUTRIRING_RING_SURFACE_H

#include "types.h"

namespace nutriring {
namespace ring {

/// Receives accepted ring states.  Implementations are expected to
/// schedule a repaint; the call itself must not block.
class NUTRIRING_EXPORT RingSurface {
public:
    virtual ~RingSurface() = default;

    /// Redraw one ring with a new visual state.
    virtual void drawRing(const RingParameters& params,
                          const RingVisualState& state) = 0;
};

}  // namespace ring
}  // namespace nutriring

#endif  // NUTRIRING_RING_SURFACE_H
