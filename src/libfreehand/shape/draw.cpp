// =====================================================================
//  src/libfreehand/shape/draw.cpp — Freehand draw shape
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/shape/draw.h>
#include <freehand/geometry/intersections.h>
#include <freehand/geometry/utils.h>

#include <stdexcept>
#include <utility>

namespace freehand {
namespace shape {

using namespace geometry;

// =====================================================================
//  Style and Patch
// =====================================================================

bool DrawStyle::operator==(const DrawStyle& other) const
{
    return size == other.size &&
           strokeWidth == other.strokeWidth &&
           thinning == other.thinning &&
           streamline == other.streamline &&
           smoothing == other.smoothing &&
           taperStart == other.taperStart &&
           taperEnd == other.taperEnd &&
           capStart == other.capStart &&
           capEnd == other.capEnd &&
           isFilled == other.isFilled &&
           color == other.color;
}

StylePtr makeStyle(DrawStyle style)
{
    return std::make_shared<const DrawStyle>(std::move(style));
}

DrawShape applyPatch(DrawShape shape, const DrawShapePatch& patch)
{
    if (patch.point) {
        shape.point = *patch.point;
    }
    if (patch.points) {
        shape.points = *patch.points;
    }
    if (patch.isDone) {
        shape.isDone = *patch.isDone;
    }
    return shape;
}

// =====================================================================
//  DrawUtil identity and defaults
// =====================================================================

QString DrawUtil::type() const
{
    return QStringLiteral("draw");
}

DrawShape DrawUtil::defaultProps() const
{
    DrawShape shape;
    shape.id = QStringLiteral("id");
    shape.type = type();
    shape.name = QStringLiteral("Draw");
    shape.parentId = QStringLiteral("page");
    shape.childIndex = 1;
    shape.point = QPointF(0, 0);
    shape.points = makePointList({ StrokePoint(0, 0, NEUTRAL_PRESSURE) });
    shape.rotation = 0.0;
    shape.isDone = false;
    shape.style = makeStyle();
    return shape;
}

bool DrawUtil::shouldRender(const DrawShape& prev, const DrawShape& next) const
{
    return next.points != prev.points || next.style != prev.style;
}

const DrawStyle& DrawUtil::styleOf(const DrawShape& shape) const
{
    return shape.style ? *shape.style : m_defaultStyle;
}

stroke::StrokeOptions DrawUtil::strokeOptions(const DrawShape& shape)
{
    const DrawStyle style = shape.style ? *shape.style : DrawStyle();

    stroke::StrokeOptions options;
    options.size = style.size;
    options.thinning = style.thinning;
    options.streamline = style.streamline;
    options.smoothing = style.smoothing;
    options.start.taper = style.taperStart;
    options.start.cap = style.capStart;
    options.end.taper = style.taperEnd;
    options.end.cap = style.capEnd;
    options.last = shape.isDone;

    // Input devices without pressure report the neutral value
    options.simulatePressure = shape.points && shape.points->size() > 1 &&
                               (*shape.points)[1].pressure == NEUTRAL_PRESSURE;

    return options;
}

// =====================================================================
//  Cached geometry
// =====================================================================

Bounds DrawUtil::localBounds(const DrawShape& shape) const
{
    if (!shape.points) {
        throw std::invalid_argument("DrawUtil: shape has no point list");
    }

    const PointList& points = shape.points;
    return m_boundsCache.get(points, [&points]() {
        return boundsFromPoints(*points);
    });
}

const DrawUtil::RotatedGeometry& DrawUtil::rotatedGeometry(const DrawShape& shape) const
{
    if (!shape.points) {
        throw std::invalid_argument("DrawUtil: shape has no point list");
    }

    const PointList& points = shape.points;
    const double rotation = shape.rotation;
    const Bounds local = localBounds(shape);

    return m_rotatedCache.getIf(
        points,
        [rotation](const RotatedGeometry& cached) { return cached.rotation == rotation; },
        [&points, rotation, &local]() {
            RotatedGeometry result;
            result.rotation = rotation;

            const QPointF center = local.center();
            result.points.reserve(points->size());
            for (const StrokePoint& p : *points) {
                result.points.append(rotateAround(p.pos, center, rotation));
            }
            result.bounds = boundsFromPoints(result.points);
            return result;
        });
}

const DrawUtil::OutlineGeometry& DrawUtil::outlineGeometry(const DrawShape& shape) const
{
    const StylePtr style = shape.style;
    const bool isDone = shape.isDone;

    return m_outlineCache.getIf(
        shape.points,
        [&style, isDone](const OutlineGeometry& cached) {
            return cached.style == style && cached.isDone == isDone;
        },
        [&shape, &style, isDone]() {
            OutlineGeometry result;
            result.style = style;
            result.isDone = isDone;
            if (shape.points && shape.points->size() > 2) {
                result.outline = stroke::strokeOutline(*shape.points, strokeOptions(shape));
                result.path = stroke::pathFromOutline(result.outline);
            }
            return result;
        });
}

QVector<QPointF> DrawUtil::outline(const DrawShape& shape) const
{
    return outlineGeometry(shape).outline;
}

void DrawUtil::release(const DrawShape& shape)
{
    m_boundsCache.evict(shape.points);
    m_rotatedCache.evict(shape.points);
    m_outlineCache.evict(shape.points);
    m_indicatorCache.evict(shape.points);
}

int DrawUtil::purgeCaches()
{
    return m_boundsCache.purgeExpired() +
           m_rotatedCache.purgeExpired() +
           m_outlineCache.purgeExpired() +
           m_indicatorCache.purgeExpired();
}

// =====================================================================
//  Rendering
// =====================================================================

Drawable DrawUtil::render(const DrawShape& shape, const RenderInfo& info) const
{
    Q_UNUSED(info);

    const DrawStyle& style = styleOf(shape);

    Drawable drawable;
    drawable.fill = style.isFilled ? style.color : QStringLiteral("none");
    drawable.stroke = style.color;
    // A zero width still draws a hairline
    drawable.strokeWidth = style.strokeWidth != 0.0 ? style.strokeWidth : 1.0;
    drawable.pointerEvents = true;

    // Nothing drawn yet
    if (!shape.points || shape.points->isEmpty()) {
        drawable.kind = Drawable::Kind::Path;
        return drawable;
    }

    const int count = shape.points->size();
    const Bounds bounds = localBounds(shape);

    // Taps and very short strokes are drawn as a dot
    const bool isShort = bounds.width() < style.size / 2.0 &&
                         bounds.height() < style.size / 2.0;
    if (shape.isDone && (count <= 2 || isShort)) {
        drawable.kind = Drawable::Kind::Circle;
        drawable.center = bounds.center();
        drawable.radius = style.size * 0.32;
        return drawable;
    }

    drawable.kind = Drawable::Kind::Path;
    drawable.roundJoin = true;
    drawable.roundCap = true;
    if (count > 2) {
        drawable.path = outlineGeometry(shape).path;
    }
    return drawable;
}

Drawable DrawUtil::renderIndicator(const DrawShape& shape) const
{
    Drawable drawable;
    drawable.kind = Drawable::Kind::Path;

    if (!shape.points) {
        drawable.path = stroke::centerlinePath({});
        return drawable;
    }

    const PointList& points = shape.points;
    drawable.path = m_indicatorCache.get(points, [&points]() {
        return stroke::centerlinePath(*points);
    });
    return drawable;
}

// =====================================================================
//  Bounds
// =====================================================================

Bounds DrawUtil::getBounds(const DrawShape& shape) const
{
    return translateBounds(localBounds(shape), shape.point);
}

Bounds DrawUtil::getRotatedBounds(const DrawShape& shape) const
{
    if (shape.rotation == 0.0) {
        return getBounds(shape);
    }
    return translateBounds(rotatedGeometry(shape).bounds, shape.point);
}

QPointF DrawUtil::getCenter(const DrawShape& shape) const
{
    return boundsCenter(getBounds(shape));
}

// =====================================================================
//  Hit testing
// =====================================================================

bool DrawUtil::hitTest(const DrawShape& shape, const QPointF& point) const
{
    Q_UNUSED(shape);
    Q_UNUSED(point);
    return true;
}

bool DrawUtil::hitTestBounds(const DrawShape& shape, const Bounds& brushBounds) const
{
    // Brush in the shape's local frame
    const Bounds localBrush = translateBounds(brushBounds, -shape.point);

    // Axis-aligned shape
    if (shape.rotation == 0.0) {
        const Bounds bounds = getBounds(shape);

        if (boundsContain(brushBounds, bounds)) {
            return true;
        }

        const bool overlaps = boundsContain(bounds, brushBounds) ||
                              !intersectBoundsBounds(bounds, brushBounds).isEmpty();
        if (!overlaps) {
            return false;
        }

        return !intersectPolylineBounds(positions(*shape.points), localBrush).isEmpty();
    }

    // Rotated shape: test against the points rotated into place
    const RotatedGeometry& rotated = rotatedGeometry(shape);

    if (boundsContain(brushBounds, translateBounds(rotated.bounds, shape.point))) {
        return true;
    }

    return !intersectBoundsPolyline(localBrush, rotated.points).isEmpty();
}

// =====================================================================
//  Transforms and lifecycle
// =====================================================================

DrawShapePatch DrawUtil::transform(const DrawShape& shape, const Bounds& bounds,
                                   const TransformInfo<DrawShape>& info) const
{
    Q_UNUSED(shape);

    const DrawShape& initial = info.initialShape;
    const Bounds initialBounds = localBounds(initial);

    const double iw = initialBounds.width();
    const double ih = initialBounds.height();
    if (iw == 0.0 || ih == 0.0) {
        qCWarning(lcFreehand) << "DrawUtil::transform: initial stroke" << initial.id
                              << "has zero-sized bounds" << toString(initialBounds);
    }

    QVector<StrokePoint> points;
    points.reserve(initial.points->size());
    for (const StrokePoint& p : *initial.points) {
        const double fx = iw > 0.0 ? (p.x() - initialBounds.minX) / iw : 0.0;
        const double fy = ih > 0.0 ? (p.y() - initialBounds.minY) / ih : 0.0;

        points.append(StrokePoint(
            bounds.width() * (info.scaleX < 0 ? 1.0 - fx : fx),
            bounds.height() * (info.scaleY < 0 ? 1.0 - fy : fy),
            p.pressure));
    }

    const Bounds newBounds = boundsFromPoints(points);

    DrawShapePatch patch;
    patch.point = bounds.topLeft() - newBounds.topLeft();
    patch.points = makePointList(std::move(points));
    return patch;
}

DrawShapePatch DrawUtil::transformSingle(const DrawShape& shape, const Bounds& bounds,
                                         const TransformInfo<DrawShape>& info) const
{
    return transform(shape, bounds, info);
}

DrawShapePatch DrawUtil::onSessionComplete(const DrawShape& shape) const
{
    // Offset of the local bounds from the local origin
    const QPointF offset = localBounds(shape).topLeft();

    DrawShapePatch patch;
    patch.isDone = true;

    // Already re-origined: keep the same list so caches stay warm
    if (offset.isNull()) {
        patch.point = shape.point;
        patch.points = shape.points;
        return patch;
    }

    QVector<StrokePoint> points;
    points.reserve(shape.points->size());
    for (const StrokePoint& p : *shape.points) {
        points.append(StrokePoint(p.pos - offset, p.pressure));
    }

    patch.point = shape.point + offset;
    patch.points = makePointList(std::move(points));
    return patch;
}

DrawShapePatch DrawUtil::appendPoint(const DrawShape& shape, const StrokePoint& point) const
{
    if (shape.isDone) {
        qCWarning(lcFreehand) << "DrawUtil::appendPoint: stroke" << shape.id << "is already done";
        throw std::logic_error("DrawUtil::appendPoint: stroke is already done");
    }

    QVector<StrokePoint> points;
    if (shape.points) {
        points = *shape.points;
    }
    points.append(point);

    DrawShapePatch patch;
    patch.points = makePointList(std::move(points));
    return patch;
}

}  // namespace shape
}  // namespace freehand
