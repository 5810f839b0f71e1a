// =====================================================================
//  src/libfreehand/freehand/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout libfreehand.
//  These are lightweight value types for stroke points and bounds.
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_GEOMETRY_TYPES_H
#define FREEHAND_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>
#include <QtMath>

#include <memory>

namespace freehand {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons
constexpr double DEFAULT_TOLERANCE = 1e-9;

/// Pressure value used for points whose pressure is simulated
constexpr double NEUTRAL_PRESSURE = 0.5;

// =====================================================================
//  Stroke Point
// =====================================================================

/// A single pen sample: position plus pressure.
struct StrokePoint {
    QPointF pos;                          ///< Position in shape-local space
    double pressure = NEUTRAL_PRESSURE;   ///< Pen pressure, 0.0 to 1.0

    StrokePoint() = default;
    StrokePoint(double x, double y, double p = NEUTRAL_PRESSURE)
        : pos(x, y), pressure(p) {}
    StrokePoint(const QPointF& position, double p = NEUTRAL_PRESSURE)
        : pos(position), pressure(p) {}

    double x() const { return pos.x(); }
    double y() const { return pos.y(); }

    bool operator==(const StrokePoint& other) const
    {
        return pos == other.pos && pressure == other.pressure;
    }
    bool operator!=(const StrokePoint& other) const { return !(*this == other); }
};

/// Immutable, shared point sequence. The pointer identity is what the
/// geometry caches key on, so an edit must always bind a new list.
using PointList = std::shared_ptr<const QVector<StrokePoint>>;

/// Make a new immutable point list
FREEHAND_EXPORT PointList makePointList(QVector<StrokePoint> points);

/// Strip pressure from a point sequence
FREEHAND_EXPORT QVector<QPointF> positions(const QVector<StrokePoint>& points);

// =====================================================================
//  Intersection Results
// =====================================================================

/// Result of a segment-segment intersection
struct SegmentIntersection {
    bool intersects = false;      ///< Whether the segments meet
    bool parallel = false;        ///< Whether the segments are parallel
    bool coincident = false;      ///< Whether the segments are collinear and overlap
    QPointF point;                ///< Intersection point (first overlap point if coincident)
    double t1 = 0.0;              ///< Parameter on first segment [0,1]
    double t2 = 0.0;              ///< Parameter on second segment [0,1]
};

/// One intersection entity reported by the shape-level queries.
/// Callers treat a non-empty list of these as "overlap".
struct Intersection {
    bool didIntersect = false;    ///< Always true for reported entries
    QString message;              ///< What was hit, e.g. "top edge"
    QVector<QPointF> points;      ///< Contact points (may be empty for containment)
};

// =====================================================================
//  Bounds
// =====================================================================

/// Axis-aligned bounding box, always normalized (min <= max).
struct FREEHAND_EXPORT Bounds {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;

    Bounds() = default;
    Bounds(double x1, double y1, double x2, double y2);
    explicit Bounds(const QRectF& rect);
    explicit Bounds(const QPointF& point);

    /// Expand to include a point
    void include(const QPointF& point);

    /// Expand to include another bounding box
    void include(const Bounds& other);

    /// Get center point
    QPointF center() const;

    /// Top-left corner
    QPointF topLeft() const { return QPointF(minX, minY); }

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }

    /// Convert to QRectF
    QRectF toRect() const;

    /// Check if point is inside (inclusive)
    bool contains(const QPointF& point) const;

    /// Check if another box lies entirely inside this one (inclusive)
    bool contains(const Bounds& other) const;

    /// Check if another box overlaps or touches this one
    bool intersects(const Bounds& other) const;

    /// Copy moved by an offset
    Bounds translated(const QPointF& delta) const;

    bool operator==(const Bounds& other) const;
    bool operator!=(const Bounds& other) const { return !(*this == other); }
};

/// Readable form for diagnostics, e.g. "[0, 0 -> 10, 10]"
FREEHAND_EXPORT QString toString(const Bounds& bounds);

}  // namespace geometry
}  // namespace freehand

#endif  // FREEHAND_GEOMETRY_TYPES_H
