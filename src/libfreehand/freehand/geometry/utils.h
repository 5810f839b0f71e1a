// =====================================================================
//  src/libfreehand/freehand/geometry/utils.h — Geometry utility functions
// =====================================================================
//
//  Vector math and bounding box helpers shared by the stroke generator
//  and the shape utilities.  All functions are pure.
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_GEOMETRY_UTILS_H
#define FREEHAND_GEOMETRY_UTILS_H

#include "types.h"

namespace freehand {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================
//
//  Addition, subtraction and negation are QPointF's own operators.

/// Multiply a vector by a scalar
FREEHAND_EXPORT QPointF scale(const QPointF& v, double factor);

/// Compute the dot product of two vectors (as QPointF)
FREEHAND_EXPORT double dot(const QPointF& a, const QPointF& b);

/// Compute the cross product (z-component) of two 2D vectors
FREEHAND_EXPORT double cross(const QPointF& a, const QPointF& b);

/// Compute the length of a vector
FREEHAND_EXPORT double length(const QPointF& v);

/// Distance between two points
FREEHAND_EXPORT double distance(const QPointF& a, const QPointF& b);

/// Squared distance between two points (no sqrt)
FREEHAND_EXPORT double distanceSquared(const QPointF& a, const QPointF& b);

/// Normalize a vector to unit length (zero vector stays zero)
FREEHAND_EXPORT QPointF normalize(const QPointF& v);

/// Perpendicular vector (x, y) -> (y, -x)
FREEHAND_EXPORT QPointF perpendicular(const QPointF& v);

/// Linear interpolation between two points
FREEHAND_EXPORT QPointF lerp(const QPointF& a, const QPointF& b, double t);

/// Move a point along a direction: a + direction * distance
FREEHAND_EXPORT QPointF project(const QPointF& a, const QPointF& direction, double dist);

/// Exact component-wise equality
FREEHAND_EXPORT bool pointsEqual(const QPointF& a, const QPointF& b);

/// Rotate a point around a pivot by an angle in radians (CCW positive)
FREEHAND_EXPORT QPointF rotateAround(
    const QPointF& point, const QPointF& pivot, double radians);

// =====================================================================
//  Bounds Operations
// =====================================================================

/// Compute the bounds of a point set.
///
/// When @p rotation is non-zero, every point is first rotated by
/// @p rotation radians about the center of the set's own bounds and the
/// envelope of the rotated points is returned.
///
/// @throws std::invalid_argument if @p points is empty
FREEHAND_EXPORT Bounds boundsFromPoints(
    const QVector<QPointF>& points, double rotation = 0.0);

/// Overload for pressure-tagged points (pressure is ignored)
FREEHAND_EXPORT Bounds boundsFromPoints(
    const QVector<StrokePoint>& points, double rotation = 0.0);

/// Move a bounds record by an offset
FREEHAND_EXPORT Bounds translateBounds(const Bounds& bounds, const QPointF& delta);

/// Check whether @p a fully contains @p b (edges inclusive)
FREEHAND_EXPORT bool boundsContain(const Bounds& a, const Bounds& b);

/// Check whether two boxes overlap or touch
FREEHAND_EXPORT bool boundsCollide(const Bounds& a, const Bounds& b);

/// Center point of a bounds record
FREEHAND_EXPORT QPointF boundsCenter(const Bounds& bounds);

/// Grow a bounds record by @p margin on every side
FREEHAND_EXPORT Bounds expandBounds(const Bounds& bounds, double margin);

/// Union of two bounds records
FREEHAND_EXPORT Bounds unionBounds(const Bounds& a, const Bounds& b);

}  // namespace geometry
}  // namespace freehand

#endif  // FREEHAND_GEOMETRY_UTILS_H
