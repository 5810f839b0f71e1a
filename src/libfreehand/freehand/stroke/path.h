// =====================================================================
//  src/libfreehand/freehand/stroke/path.h — Drawing command paths
// =====================================================================
//
//  Converts point sequences into drawing commands (move / line /
//  quadratic curve / close) that a rendering surface can replay, either
//  as SVG path data or as a QPainterPath.
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_STROKE_PATH_H
#define FREEHAND_STROKE_PATH_H

#include "../core.h"
#include "../geometry/types.h"

#include <QPainterPath>
#include <QPointF>
#include <QString>
#include <QVector>

namespace freehand {
namespace stroke {

// =====================================================================
//  Path Commands
// =====================================================================

/// Drawing operation
enum class PathOp {
    MoveTo,
    LineTo,
    QuadTo,   ///< Quadratic curve through control to end
    Close
};

/// A single drawing command
struct PathCommand {
    PathOp op = PathOp::MoveTo;
    QPointF control;    ///< QuadTo only
    QPointF to;         ///< End point (unused for Close)

    bool operator==(const PathCommand& other) const
    {
        return op == other.op && control == other.control && to == other.to;
    }
    bool operator!=(const PathCommand& other) const { return !(*this == other); }
};

/// An ordered list of drawing commands
class FREEHAND_EXPORT StrokePath {
public:
    StrokePath() = default;

    void moveTo(const QPointF& to);
    void lineTo(const QPointF& to);
    void quadTo(const QPointF& control, const QPointF& to);
    void close();

    const QVector<PathCommand>& commands() const { return m_commands; }
    bool isEmpty() const { return m_commands.isEmpty(); }
    int size() const { return m_commands.size(); }

    /// SVG path data, numbers written with at most two decimals.
    /// Consecutive commands of the same kind share one letter.
    QString toSvgPathData() const;

    /// Equivalent QPainterPath
    QPainterPath toPainterPath() const;

    bool operator==(const StrokePath& other) const { return m_commands == other.m_commands; }
    bool operator!=(const StrokePath& other) const { return !(*this == other); }

private:
    QVector<PathCommand> m_commands;
};

/// Format a coordinate with at most two decimals ("10", "2.5", "-1.23")
FREEHAND_EXPORT QString formatCoordinate(double value);

// =====================================================================
//  Path Builders
// =====================================================================

/// Closed path through an outline polygon: quadratic curves using each
/// vertex as control and the midpoint to the next vertex as end.
/// An empty outline gives an empty path.
FREEHAND_EXPORT StrokePath pathFromOutline(const QVector<QPointF>& outline);

/// Lightweight centerline path for selection indicators.
///
/// Zero points give "M 0 0 L 0 0"; fewer than three give a single
/// move-to.  Otherwise the points are streamlined and joined with
/// quadratic curves through consecutive midpoints, ending in a line to
/// the last point.  Pressure is ignored.
FREEHAND_EXPORT StrokePath centerlinePath(const QVector<geometry::StrokePoint>& points);

}  // namespace stroke
}  // namespace freehand

#endif  // FREEHAND_STROKE_PATH_H
