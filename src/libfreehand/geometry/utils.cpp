// =====================================================================
//  src/libfreehand/geometry/utils.cpp — Geometry utility functions
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/geometry/utils.h>

#include <stdexcept>

namespace freehand {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

QPointF scale(const QPointF& v, double factor)
{
    return QPointF(v.x() * factor, v.y() * factor);
}

double dot(const QPointF& a, const QPointF& b)
{
    return a.x() * b.x() + a.y() * b.y();
}

double cross(const QPointF& a, const QPointF& b)
{
    return a.x() * b.y() - a.y() * b.x();
}

double length(const QPointF& v)
{
    return qSqrt(v.x() * v.x() + v.y() * v.y());
}

double distance(const QPointF& a, const QPointF& b)
{
    return length(b - a);
}

double distanceSquared(const QPointF& a, const QPointF& b)
{
    double dx = b.x() - a.x();
    double dy = b.y() - a.y();
    return dx * dx + dy * dy;
}

QPointF normalize(const QPointF& v)
{
    double len = length(v);
    if (len < DEFAULT_TOLERANCE) {
        return QPointF(0, 0);
    }
    return QPointF(v.x() / len, v.y() / len);
}

QPointF perpendicular(const QPointF& v)
{
    return QPointF(v.y(), -v.x());
}

QPointF lerp(const QPointF& a, const QPointF& b, double t)
{
    return QPointF(
        a.x() + t * (b.x() - a.x()),
        a.y() + t * (b.y() - a.y())
    );
}

QPointF project(const QPointF& a, const QPointF& direction, double dist)
{
    return a + scale(direction, dist);
}

bool pointsEqual(const QPointF& a, const QPointF& b)
{
    return a.x() == b.x() && a.y() == b.y();
}

QPointF rotateAround(const QPointF& point, const QPointF& pivot, double radians)
{
    if (radians == 0.0) {
        return point;
    }

    double s = qSin(radians);
    double c = qCos(radians);

    double px = point.x() - pivot.x();
    double py = point.y() - pivot.y();

    return QPointF(
        px * c - py * s + pivot.x(),
        px * s + py * c + pivot.y()
    );
}

// =====================================================================
//  Bounds Operations
// =====================================================================

Bounds boundsFromPoints(const QVector<QPointF>& points, double rotation)
{
    if (points.isEmpty()) {
        throw std::invalid_argument("boundsFromPoints: empty point set");
    }

    Bounds bounds(points.first());
    for (const QPointF& p : points) {
        bounds.include(p);
    }

    if (rotation == 0.0) {
        return bounds;
    }

    // Rotate about the set's own center, then take the envelope again
    QPointF center = bounds.center();
    QVector<QPointF> rotated;
    rotated.reserve(points.size());
    for (const QPointF& p : points) {
        rotated.append(rotateAround(p, center, rotation));
    }

    return boundsFromPoints(rotated);
}

Bounds boundsFromPoints(const QVector<StrokePoint>& points, double rotation)
{
    return boundsFromPoints(positions(points), rotation);
}

Bounds translateBounds(const Bounds& bounds, const QPointF& delta)
{
    return bounds.translated(delta);
}

bool boundsContain(const Bounds& a, const Bounds& b)
{
    return a.contains(b);
}

bool boundsCollide(const Bounds& a, const Bounds& b)
{
    return a.intersects(b);
}

QPointF boundsCenter(const Bounds& bounds)
{
    return bounds.center();
}

Bounds expandBounds(const Bounds& bounds, double margin)
{
    return Bounds(bounds.minX - margin, bounds.minY - margin,
                  bounds.maxX + margin, bounds.maxY + margin);
}

Bounds unionBounds(const Bounds& a, const Bounds& b)
{
    Bounds result = a;
    result.include(b);
    return result;
}

}  // namespace geometry
}  // namespace freehand
