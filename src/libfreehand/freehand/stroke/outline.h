// =====================================================================
//  src/libfreehand/freehand/stroke/outline.h — Pressure-shaped stroke outlines
// =====================================================================
//
//  Turns an ordered sequence of pressure-tagged points into the closed
//  polygon that encloses the stroke once thickness is applied.
//
//  The work happens in two passes:
//
//    1. strokePoints()        -- streamline the raw input and annotate
//                                every point with direction and length
//    2. strokeOutlinePoints() -- offset the annotated centerline by the
//                                pressure-driven radius on both sides,
//                                add caps, and stitch the edges together
//
//  strokeOutline() runs both.
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_STROKE_OUTLINE_H
#define FREEHAND_STROKE_OUTLINE_H

#include "../core.h"
#include "../geometry/types.h"

#include <QPointF>
#include <QVector>

#include <functional>

namespace freehand {
namespace stroke {

// =====================================================================
//  Constants
// =====================================================================

/// How quickly simulated pressure follows changes in pen speed
constexpr double RATE_OF_PRESSURE_CHANGE = 0.275;

/// Slightly more than pi, so that cap arcs close without a seam
constexpr double FIXED_PI = M_PI + 0.0001;

// =====================================================================
//  Options
// =====================================================================

/// Easing curve mapping [0,1] to [0,1]
using Easing = std::function<double(double)>;

/// Settings for one end of the stroke
struct EndOptions {
    bool cap = true;          ///< Round cap (true) or flat cap (false)
    double taper = 0.0;       ///< Length over which the stroke narrows to a point (0 = none)
    Easing easing;            ///< Taper easing; empty selects the built-in curve for that end
};

/// Settings for outline generation
struct StrokeOptions {
    double size = 16.0;              ///< Base diameter of the stroke
    double thinning = 0.5;           ///< Effect of pressure on thickness, -1 to 1
    double smoothing = 0.5;          ///< Softening of the outline edges, 0 to 1
    double streamline = 0.5;         ///< Jitter reduction of the input, 0 to 1
    bool simulatePressure = true;    ///< Derive pressure from pen speed
    bool last = false;               ///< Input is complete (keep the final point exact)
    Easing easing;                   ///< Pressure easing; empty is linear
    EndOptions start;
    EndOptions end;
};

// =====================================================================
//  Stroke Points
// =====================================================================

/// A streamlined centerline point annotated with direction and length
struct StrokePointInfo {
    QPointF point;              ///< Streamlined position
    double pressure = 0.5;      ///< Input pressure
    QPointF vector;             ///< Unit vector from this point back to the previous one
    double distance = 0.0;      ///< Distance to the previous point
    double runningLength = 0.0; ///< Length of the stroke up to this point
};

/// Streamline the input points and annotate them.
/// Returns an empty list for empty input.
FREEHAND_EXPORT QVector<StrokePointInfo> strokePoints(
    const QVector<geometry::StrokePoint>& points,
    const StrokeOptions& options = {});

/// Radius of the stroke at a given pressure
FREEHAND_EXPORT double strokeRadius(
    double size, double thinning, double pressure,
    const Easing& easing = {});

/// Build the closed outline polygon around annotated stroke points.
/// Returns an empty list for empty input or a non-positive size.
FREEHAND_EXPORT QVector<QPointF> strokeOutlinePoints(
    const QVector<StrokePointInfo>& points,
    const StrokeOptions& options = {});

/// strokePoints() followed by strokeOutlinePoints()
FREEHAND_EXPORT QVector<QPointF> strokeOutline(
    const QVector<geometry::StrokePoint>& points,
    const StrokeOptions& options = {});

}  // namespace stroke
}  // namespace freehand

#endif  // FREEHAND_STROKE_OUTLINE_H
