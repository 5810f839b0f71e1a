// =====================================================================
//  src/libfreehand/stroke/path.cpp — Drawing command paths
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/stroke/path.h>
#include <freehand/stroke/outline.h>
#include <freehand/geometry/utils.h>

#include <QStringList>

namespace freehand {
namespace stroke {

using namespace geometry;

// =====================================================================
//  StrokePath
// =====================================================================

void StrokePath::moveTo(const QPointF& to)
{
    m_commands.append(PathCommand{ PathOp::MoveTo, QPointF(), to });
}

void StrokePath::lineTo(const QPointF& to)
{
    m_commands.append(PathCommand{ PathOp::LineTo, QPointF(), to });
}

void StrokePath::quadTo(const QPointF& control, const QPointF& to)
{
    m_commands.append(PathCommand{ PathOp::QuadTo, control, to });
}

void StrokePath::close()
{
    m_commands.append(PathCommand{ PathOp::Close, QPointF(), QPointF() });
}

QString StrokePath::toSvgPathData() const
{
    QStringList parts;
    bool first = true;
    PathOp previous = PathOp::MoveTo;

    auto appendPoint = [&parts](const QPointF& p) {
        parts << formatCoordinate(p.x()) << formatCoordinate(p.y());
    };

    for (const PathCommand& cmd : m_commands) {
        // Repeated commands of one kind are written implicitly, except
        // move-to, whose repetition would mean line-to.
        const bool needsLetter = first || cmd.op != previous || cmd.op == PathOp::MoveTo;

        switch (cmd.op) {
        case PathOp::MoveTo:
            parts << QStringLiteral("M");
            appendPoint(cmd.to);
            break;
        case PathOp::LineTo:
            if (needsLetter) parts << QStringLiteral("L");
            appendPoint(cmd.to);
            break;
        case PathOp::QuadTo:
            if (needsLetter) parts << QStringLiteral("Q");
            appendPoint(cmd.control);
            appendPoint(cmd.to);
            break;
        case PathOp::Close:
            parts << QStringLiteral("Z");
            break;
        }

        first = false;
        previous = cmd.op;
    }

    return parts.join(QLatin1Char(' '));
}

QPainterPath StrokePath::toPainterPath() const
{
    QPainterPath path;
    for (const PathCommand& cmd : m_commands) {
        switch (cmd.op) {
        case PathOp::MoveTo:
            path.moveTo(cmd.to);
            break;
        case PathOp::LineTo:
            path.lineTo(cmd.to);
            break;
        case PathOp::QuadTo:
            path.quadTo(cmd.control, cmd.to);
            break;
        case PathOp::Close:
            path.closeSubpath();
            break;
        }
    }
    return path;
}

QString formatCoordinate(double value)
{
    QString text = QString::number(value, 'f', 2);

    if (text.contains(QLatin1Char('.'))) {
        while (text.endsWith(QLatin1Char('0'))) {
            text.chop(1);
        }
        if (text.endsWith(QLatin1Char('.'))) {
            text.chop(1);
        }
    }

    if (text == QLatin1String("-0")) {
        text = QStringLiteral("0");
    }
    return text;
}

// =====================================================================
//  Path Builders
// =====================================================================

StrokePath pathFromOutline(const QVector<QPointF>& outline)
{
    StrokePath path;
    if (outline.isEmpty()) {
        return path;
    }

    const int n = outline.size();
    path.moveTo(outline[0]);
    for (int i = 0; i < n; ++i) {
        const QPointF& p0 = outline[i];
        const QPointF& p1 = outline[(i + 1) % n];
        path.quadTo(p0, lerp(p0, p1, 0.5));
    }
    path.close();

    return path;
}

StrokePath centerlinePath(const QVector<StrokePoint>& points)
{
    StrokePath path;

    if (points.isEmpty()) {
        path.moveTo(QPointF(0, 0));
        path.lineTo(QPointF(0, 0));
        return path;
    }

    if (points.size() < 3) {
        path.moveTo(points[0].pos);
        return path;
    }

    const QVector<StrokePointInfo> streamlined = strokePoints(points);

    const int len = streamlined.size();
    path.moveTo(streamlined[0].point);
    for (int i = 0; i < len - 1; ++i) {
        const QPointF& p0 = streamlined[i].point;
        const QPointF& p1 = streamlined[i + 1].point;
        path.quadTo(p0, lerp(p0, p1, 0.5));
    }
    path.lineTo(streamlined[len - 1].point);

    return path;
}

}  // namespace stroke
}  // namespace freehand
