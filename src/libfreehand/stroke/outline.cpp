// =====================================================================
//  src/libfreehand/stroke/outline.cpp — Pressure-shaped stroke outlines
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/stroke/outline.h>
#include <freehand/geometry/utils.h>

#include <algorithm>

namespace freehand {
namespace stroke {

using namespace geometry;

namespace {

double linearEase(double t)
{
    return t;
}

double taperStartEase(double t)
{
    return t * (2.0 - t);
}

double taperEndEase(double t)
{
    double u = t - 1.0;
    return u * u * u + 1.0;
}

double applyEasing(const Easing& easing, double (*fallback)(double), double t)
{
    return easing ? easing(t) : fallback(t);
}

/// Pressure derived from pen speed: fast segments press lighter
double simulatedPressure(double previous, double distance, double size)
{
    double sp = qMin(1.0, distance / size);
    double rp = qMin(1.0, 1.0 - sp);
    return qMin(1.0, previous + (rp - previous) * (sp * RATE_OF_PRESSURE_CHANGE));
}

}  // namespace

// =====================================================================
//  Stroke Points
// =====================================================================

QVector<StrokePointInfo> strokePoints(
    const QVector<StrokePoint>& points,
    const StrokeOptions& options)
{
    QVector<StrokePointInfo> result;

    if (points.isEmpty()) {
        return result;
    }

    // Interpolation factor: the stronger the streamline, the slower each
    // point follows the raw input.
    const double t = 0.15 + (1.0 - options.streamline) * 0.85;

    QVector<StrokePoint> pts = points;

    // Subdivide a bare two-point line so it still gets a shape
    if (pts.size() == 2) {
        const StrokePoint last = pts[1];
        pts.removeLast();
        for (int i = 1; i < 5; ++i) {
            double f = i / 4.0;
            pts.append(StrokePoint(lerp(pts[0].pos, last.pos, f),
                                   pts[0].pressure + (last.pressure - pts[0].pressure) * f));
        }
    }

    // A single point gets a partner so there is a direction to work with
    if (pts.size() == 1) {
        pts.append(StrokePoint(pts[0].pos + QPointF(1, 1), pts[0].pressure));
    }

    StrokePointInfo first;
    first.point = pts[0].pos;
    first.pressure = pts[0].pressure;
    first.vector = QPointF(1, 1);
    result.append(first);

    bool hasReachedMinimumLength = false;
    double runningLength = 0.0;
    StrokePointInfo prev = first;
    const int max = pts.size() - 1;

    for (int i = 1; i < pts.size(); ++i) {
        const QPointF point = (options.last && i == max)
            ? pts[i].pos
            : lerp(prev.point, pts[i].pos, t);

        if (pointsEqual(prev.point, point)) {
            continue;
        }

        const double dist = distance(point, prev.point);
        runningLength += dist;

        // Skip the first few points until the stroke is long enough
        // to have a stable direction.
        if (i < max && !hasReachedMinimumLength) {
            if (runningLength < options.size) {
                continue;
            }
            hasReachedMinimumLength = true;
        }

        StrokePointInfo info;
        info.point = point;
        info.pressure = pts[i].pressure;
        info.vector = normalize(prev.point - point);
        info.distance = dist;
        info.runningLength = runningLength;

        result.append(info);
        prev = info;
    }

    result[0].vector = result.size() > 1 ? result[1].vector : QPointF(0, 0);

    return result;
}

double strokeRadius(double size, double thinning, double pressure, const Easing& easing)
{
    return size * applyEasing(easing, linearEase, 0.5 - thinning * (0.5 - pressure));
}

// =====================================================================
//  Outline
// =====================================================================

QVector<QPointF> strokeOutlinePoints(
    const QVector<StrokePointInfo>& points,
    const StrokeOptions& options)
{
    const double size = options.size;

    if (points.isEmpty() || size <= 0.0) {
        return {};
    }

    const double thinning = options.thinning;
    const bool simulate = options.simulatePressure;
    const int count = points.size();

    const double totalLength = points.last().runningLength;
    const double taperStart = options.start.taper;
    const double taperEnd = options.end.taper;

    // Offsets closer than this to the previous one are dropped
    const double minDistance = qPow(size * options.smoothing, 2);

    QVector<QPointF> leftPts;
    QVector<QPointF> rightPts;

    // Seed the pressure from the first few points so the start of the
    // stroke does not begin with a blob.
    double prevPressure = points[0].pressure;
    for (int i = 0; i < qMin(10, count); ++i) {
        double pressure = points[i].pressure;
        if (simulate) {
            pressure = simulatedPressure(prevPressure, points[i].distance, size);
        }
        prevPressure = (prevPressure + pressure) / 2.0;
    }

    double radius = strokeRadius(size, thinning, points.last().pressure, options.easing);
    double firstRadius = 0.0;
    bool hasFirstRadius = false;

    QPointF prevVector = points[0].vector;
    QPointF pl = points[0].point;
    QPointF pr = pl;
    QPointF tl = pl;
    QPointF tr = pr;
    bool isPrevPointSharpCorner = false;

    for (int i = 0; i < count; ++i) {
        double pressure = points[i].pressure;
        const QPointF point = points[i].point;
        const QPointF vector = points[i].vector;
        const double runningLength = points[i].runningLength;

        // The last few pixels are drawn by the end cap
        if (i < count - 1 && totalLength - runningLength < 3.0) {
            continue;
        }

        if (thinning != 0.0) {
            if (simulate) {
                pressure = simulatedPressure(prevPressure, points[i].distance, size);
            }
            radius = strokeRadius(size, thinning, pressure, options.easing);
        } else {
            radius = size / 2.0;
        }

        if (!hasFirstRadius) {
            firstRadius = radius;
            hasFirstRadius = true;
        }

        const double ts = runningLength < taperStart
            ? applyEasing(options.start.easing, taperStartEase, runningLength / taperStart)
            : 1.0;
        const double te = totalLength - runningLength < taperEnd
            ? applyEasing(options.end.easing, taperEndEase, (totalLength - runningLength) / taperEnd)
            : 1.0;

        radius = qMax(0.01, radius * qMin(ts, te));

        const QPointF nextVector = (i < count - 1 ? points[i + 1] : points[i]).vector;
        const double nextDpr = i < count - 1 ? dot(vector, nextVector) : 1.0;
        const double prevDpr = dot(vector, prevVector);

        const bool isPointSharpCorner = prevDpr < 0 && !isPrevPointSharpCorner;
        const bool isNextPointSharpCorner = nextDpr < 0;

        // Sharp corners get a half-circle cap on both edges
        if (isPointSharpCorner || isNextPointSharpCorner) {
            const QPointF offset = scale(perpendicular(prevVector), radius);

            for (int k = 0; k <= 13; ++k) {
                const double t = k / 13.0;
                tl = rotateAround(point - offset, point, FIXED_PI * t);
                leftPts.append(tl);

                tr = rotateAround(point + offset, point, FIXED_PI * -t);
                rightPts.append(tr);
            }

            pl = tl;
            pr = tr;

            if (isNextPointSharpCorner) {
                isPrevPointSharpCorner = true;
            }
            continue;
        }

        isPrevPointSharpCorner = false;

        if (i == count - 1) {
            const QPointF offset = scale(perpendicular(vector), radius);
            leftPts.append(point - offset);
            rightPts.append(point + offset);
            continue;
        }

        // Offset along the bisector of this and the next direction
        const QPointF offset = scale(perpendicular(lerp(nextVector, vector, nextDpr)), radius);

        tl = point - offset;
        if (i <= 1 || distanceSquared(pl, tl) > minDistance) {
            leftPts.append(tl);
            pl = tl;
        }

        tr = point + offset;
        if (i <= 1 || distanceSquared(pr, tr) > minDistance) {
            rightPts.append(tr);
            pr = tr;
        }

        prevPressure = pressure;
        prevVector = vector;
    }

    // ---- Caps --------------------------------------------------------

    const QPointF firstPoint = points[0].point;
    const QPointF lastPoint = count > 1
        ? points[count - 1].point
        : points[0].point + QPointF(1, 1);

    QVector<QPointF> startCap;
    QVector<QPointF> endCap;

    if (count == 1) {
        // A tap: draw a dot
        if (!(taperStart > 0.0 || taperEnd > 0.0) || options.last) {
            const double dotRadius = (hasFirstRadius && firstRadius != 0.0) ? firstRadius : radius;
            const QPointF start = project(
                firstPoint, normalize(perpendicular(firstPoint - lastPoint)), -dotRadius);

            QVector<QPointF> dotPts;
            for (int k = 1; k <= 13; ++k) {
                const double t = k / 13.0;
                dotPts.append(rotateAround(start, firstPoint, FIXED_PI * 2.0 * t));
            }
            return dotPts;
        }
    } else {
        if (taperStart > 0.0) {
            // Tapered start needs no cap
        } else if (options.start.cap) {
            for (int k = 1; k <= 13; ++k) {
                const double t = k / 13.0;
                startCap.append(rotateAround(rightPts.first(), firstPoint, FIXED_PI * t));
            }
        } else {
            const QPointF cornersVector = leftPts.first() - rightPts.first();
            const QPointF offsetA = scale(cornersVector, 0.5);
            const QPointF offsetB = scale(cornersVector, 0.51);
            startCap.append(firstPoint - offsetA);
            startCap.append(firstPoint - offsetB);
            startCap.append(firstPoint + offsetB);
            startCap.append(firstPoint + offsetA);
        }

        const QPointF direction = perpendicular(-points[count - 1].vector);

        if (taperEnd > 0.0) {
            endCap.append(lastPoint);
        } else if (options.end.cap) {
            const QPointF start = project(lastPoint, direction, radius);
            for (int k = 1; k < 29; ++k) {
                const double t = k / 29.0;
                endCap.append(rotateAround(start, lastPoint, FIXED_PI * 3.0 * t));
            }
        } else {
            endCap.append(lastPoint + scale(direction, radius));
            endCap.append(lastPoint + scale(direction, radius * 0.99));
            endCap.append(lastPoint - scale(direction, radius * 0.99));
            endCap.append(lastPoint - scale(direction, radius));
        }
    }

    // Left edge, end cap, right edge backwards, start cap
    QVector<QPointF> outline;
    outline.reserve(leftPts.size() + endCap.size() + rightPts.size() + startCap.size());
    outline += leftPts;
    outline += endCap;
    std::reverse(rightPts.begin(), rightPts.end());
    outline += rightPts;
    outline += startCap;

    return outline;
}

QVector<QPointF> strokeOutline(
    const QVector<StrokePoint>& points,
    const StrokeOptions& options)
{
    return strokeOutlinePoints(strokePoints(points, options), options);
}

}  // namespace stroke
}  // namespace freehand
