// =====================================================================
//  src/libfreehand/geometry/types.cpp — Basic geometry types implementation
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/geometry/types.h>

#include <utility>

namespace freehand {
namespace geometry {

// =====================================================================
//  Point lists
// =====================================================================

PointList makePointList(QVector<StrokePoint> points)
{
    return std::make_shared<const QVector<StrokePoint>>(std::move(points));
}

QVector<QPointF> positions(const QVector<StrokePoint>& points)
{
    QVector<QPointF> result;
    result.reserve(points.size());
    for (const StrokePoint& p : points) {
        result.append(p.pos);
    }
    return result;
}

// =====================================================================
//  Bounds Implementation
// =====================================================================

Bounds::Bounds(double x1, double y1, double x2, double y2)
    : minX(qMin(x1, x2))
    , minY(qMin(y1, y2))
    , maxX(qMax(x1, x2))
    , maxY(qMax(y1, y2))
{
}

Bounds::Bounds(const QRectF& rect)
    : Bounds(rect.left(), rect.top(), rect.right(), rect.bottom())
{
}

Bounds::Bounds(const QPointF& point)
    : minX(point.x())
    , minY(point.y())
    , maxX(point.x())
    , maxY(point.y())
{
}

void Bounds::include(const QPointF& point)
{
    minX = qMin(minX, point.x());
    minY = qMin(minY, point.y());
    maxX = qMax(maxX, point.x());
    maxY = qMax(maxY, point.y());
}

void Bounds::include(const Bounds& other)
{
    minX = qMin(minX, other.minX);
    minY = qMin(minY, other.minY);
    maxX = qMax(maxX, other.maxX);
    maxY = qMax(maxY, other.maxY);
}

QPointF Bounds::center() const
{
    return QPointF((minX + maxX) / 2.0, (minY + maxY) / 2.0);
}

QRectF Bounds::toRect() const
{
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

bool Bounds::contains(const QPointF& point) const
{
    return point.x() >= minX && point.x() <= maxX &&
           point.y() >= minY && point.y() <= maxY;
}

bool Bounds::contains(const Bounds& other) const
{
    return other.minX >= minX && other.maxX <= maxX &&
           other.minY >= minY && other.maxY <= maxY;
}

bool Bounds::intersects(const Bounds& other) const
{
    // Touching edges count as an overlap
    return !(maxX < other.minX || other.maxX < minX ||
             maxY < other.minY || other.maxY < minY);
}

Bounds Bounds::translated(const QPointF& delta) const
{
    Bounds b = *this;
    b.minX += delta.x();
    b.maxX += delta.x();
    b.minY += delta.y();
    b.maxY += delta.y();
    return b;
}

bool Bounds::operator==(const Bounds& other) const
{
    return minX == other.minX && minY == other.minY &&
           maxX == other.maxX && maxY == other.maxY;
}

QString toString(const Bounds& bounds)
{
    return QStringLiteral("[%1, %2 -> %3, %4]")
        .arg(bounds.minX).arg(bounds.minY)
        .arg(bounds.maxX).arg(bounds.maxY);
}

}  // namespace geometry
}  // namespace freehand
