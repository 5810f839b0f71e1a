// =====================================================================
//  src/libfreehand/freehand/geometry/intersections.h — Intersection functions
// =====================================================================
//
//  Intersection queries between bounding boxes, segments and polylines.
//  The list-returning queries report every intersection entity found;
//  an empty list means no overlap.  Touching counts as intersecting.
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_GEOMETRY_INTERSECTIONS_H
#define FREEHAND_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace freehand {
namespace geometry {

// =====================================================================
//  Segment Intersections
// =====================================================================

/// Compute intersection of two line segments (endpoints inclusive)
/// @param p1, p2 First segment endpoints
/// @param p3, p4 Second segment endpoints
/// @return Intersection result with point and parameters
FREEHAND_EXPORT SegmentIntersection intersectSegmentSegment(
    const QPointF& p1, const QPointF& p2,
    const QPointF& p3, const QPointF& p4);

/// Intersections of a segment with the four edges of a box
FREEHAND_EXPORT QVector<Intersection> intersectSegmentBounds(
    const QPointF& a, const QPointF& b,
    const Bounds& bounds);

// =====================================================================
//  Box and Polyline Intersections
// =====================================================================

/// Box vs box: interval overlap on both axes.
/// Reports one entry whose points are the corners of the overlap region.
FREEHAND_EXPORT QVector<Intersection> intersectBoundsBounds(
    const Bounds& a, const Bounds& b);

/// Box vs polyline: every polyline segment is tested against the box edges,
/// so a segment crossing the box is found even when all vertices are
/// outside.  A single-vertex polyline hits when the vertex is in the box.
FREEHAND_EXPORT QVector<Intersection> intersectBoundsPolyline(
    const Bounds& bounds, const QVector<QPointF>& polyline);

/// Polyline vs box, for a box already expressed in the polyline's frame
FREEHAND_EXPORT QVector<Intersection> intersectPolylineBounds(
    const QVector<QPointF>& polyline, const Bounds& bounds);

}  // namespace geometry
}  // namespace freehand

#endif  // FREEHAND_GEOMETRY_INTERSECTIONS_H
