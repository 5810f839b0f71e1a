// =====================================================================
//  src/libfreehand/geometry/intersections.cpp — Intersection functions
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/geometry/intersections.h>
#include <freehand/geometry/utils.h>

#include <utility>

namespace freehand {
namespace geometry {

namespace {

/// Slack on segment parameters so that touching endpoints count
constexpr double PARAM_TOLERANCE = 1e-9;

bool withinUnit(double t)
{
    return t >= -PARAM_TOLERANCE && t <= 1.0 + PARAM_TOLERANCE;
}

/// Parameter of the projection of @p point onto segment a-b
double paramOnSegment(const QPointF& point, const QPointF& a, const QPointF& b)
{
    QPointF d = b - a;
    double lenSq = dot(d, d);
    if (lenSq < DEFAULT_TOLERANCE * DEFAULT_TOLERANCE) {
        return 0.0;
    }
    return dot(point - a, d) / lenSq;
}

/// Point vs segment, used when one of the segments has zero length
SegmentIntersection pointOnSegment(const QPointF& point,
                                   const QPointF& a, const QPointF& b)
{
    SegmentIntersection result;

    double t = paramOnSegment(point, a, b);
    if (!withinUnit(t)) {
        return result;
    }

    QPointF closest = lerp(a, b, qBound(0.0, t, 1.0));
    if (distance(closest, point) > 1e-7) {
        return result;
    }

    result.intersects = true;
    result.point = point;
    result.t2 = qBound(0.0, t, 1.0);
    return result;
}

}  // namespace

// =====================================================================
//  Segment-Segment Intersection
// =====================================================================

SegmentIntersection intersectSegmentSegment(
    const QPointF& p1, const QPointF& p2,
    const QPointF& p3, const QPointF& p4)
{
    SegmentIntersection result;

    // Direction vectors
    QPointF d1 = p2 - p1;
    QPointF d2 = p4 - p3;

    bool degenerate1 = dot(d1, d1) < DEFAULT_TOLERANCE * DEFAULT_TOLERANCE;
    bool degenerate2 = dot(d2, d2) < DEFAULT_TOLERANCE * DEFAULT_TOLERANCE;

    if (degenerate1 && degenerate2) {
        if (distance(p1, p3) <= 1e-7) {
            result.intersects = true;
            result.point = p1;
        }
        return result;
    }
    if (degenerate1) {
        return pointOnSegment(p1, p3, p4);
    }
    if (degenerate2) {
        SegmentIntersection r = pointOnSegment(p3, p1, p2);
        std::swap(r.t1, r.t2);
        return r;
    }

    // Cross product of directions (determinant)
    double det = cross(d1, d2);

    // Vector from p1 to p3
    QPointF delta = p3 - p1;

    // Check for parallel segments
    if (qAbs(det) < DEFAULT_TOLERANCE) {
        result.parallel = true;

        // Collinear when p3 lies on the line through p1, p2
        if (qAbs(cross(delta, d1)) > DEFAULT_TOLERANCE) {
            return result;
        }

        // Overlap of the parameter ranges along the first segment
        double s3 = paramOnSegment(p3, p1, p2);
        double s4 = paramOnSegment(p4, p1, p2);
        double lo = qMax(0.0, qMin(s3, s4));
        double hi = qMin(1.0, qMax(s3, s4));

        if (lo <= hi + PARAM_TOLERANCE) {
            result.coincident = true;
            result.intersects = true;
            result.t1 = lo;
            result.point = lerp(p1, p2, lo);
            result.t2 = paramOnSegment(result.point, p3, p4);
        }
        return result;
    }

    // Compute parameters
    result.t1 = cross(delta, d2) / det;
    result.t2 = cross(delta, d1) / det;

    if (!withinUnit(result.t1) || !withinUnit(result.t2)) {
        return result;
    }

    result.intersects = true;
    result.point = lerp(p1, p2, result.t1);
    return result;
}

QVector<Intersection> intersectSegmentBounds(
    const QPointF& a, const QPointF& b,
    const Bounds& bounds)
{
    const QPointF tl(bounds.minX, bounds.minY);
    const QPointF tr(bounds.maxX, bounds.minY);
    const QPointF br(bounds.maxX, bounds.maxY);
    const QPointF bl(bounds.minX, bounds.maxY);

    struct Edge {
        QPointF from;
        QPointF to;
        const char* name;
    };
    const Edge edges[4] = {
        { tl, tr, "top edge" },
        { tr, br, "right edge" },
        { br, bl, "bottom edge" },
        { bl, tl, "left edge" },
    };

    QVector<Intersection> result;
    for (const Edge& edge : edges) {
        SegmentIntersection hit = intersectSegmentSegment(a, b, edge.from, edge.to);
        if (hit.intersects) {
            Intersection entry;
            entry.didIntersect = true;
            entry.message = QString::fromLatin1(edge.name);
            entry.points.append(hit.point);
            result.append(entry);
        }
    }
    return result;
}

// =====================================================================
//  Box and Polyline Intersections
// =====================================================================

QVector<Intersection> intersectBoundsBounds(const Bounds& a, const Bounds& b)
{
    if (!a.intersects(b)) {
        return {};
    }

    Bounds overlap(qMax(a.minX, b.minX), qMax(a.minY, b.minY),
                   qMin(a.maxX, b.maxX), qMin(a.maxY, b.maxY));

    Intersection entry;
    entry.didIntersect = true;
    entry.message = QStringLiteral("overlap");
    entry.points = {
        QPointF(overlap.minX, overlap.minY),
        QPointF(overlap.maxX, overlap.minY),
        QPointF(overlap.maxX, overlap.maxY),
        QPointF(overlap.minX, overlap.maxY),
    };
    return { entry };
}

QVector<Intersection> intersectBoundsPolyline(
    const Bounds& bounds, const QVector<QPointF>& polyline)
{
    QVector<Intersection> result;

    if (polyline.size() == 1) {
        if (bounds.contains(polyline.first())) {
            Intersection entry;
            entry.didIntersect = true;
            entry.message = QStringLiteral("vertex");
            entry.points.append(polyline.first());
            result.append(entry);
        }
        return result;
    }

    for (int i = 1; i < polyline.size(); ++i) {
        result += intersectSegmentBounds(polyline[i - 1], polyline[i], bounds);
    }
    return result;
}

QVector<Intersection> intersectPolylineBounds(
    const QVector<QPointF>& polyline, const Bounds& bounds)
{
    return intersectBoundsPolyline(bounds, polyline);
}

}  // namespace geometry
}  // namespace freehand
