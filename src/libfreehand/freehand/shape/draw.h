// =====================================================================
//  src/libfreehand/freehand/shape/draw.h — Freehand draw shape
// =====================================================================
//
//  The freehand stroke shape: an ordered list of pressure-tagged points
//  in shape-local space, drawn as a pressure-shaped outline.
//
//  Lifecycle:
//
//    Drafting   isDone == false, points only ever appended (each append
//               binds a new list, see DrawUtil::appendPoint)
//    Finalizing DrawUtil::onSessionComplete re-origins the points
//    Settled    isDone == true; transform() may run any number of times
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_SHAPE_DRAW_H
#define FREEHAND_SHAPE_DRAW_H

#include "../core.h"
#include "../geometry/types.h"
#include "../stroke/outline.h"
#include "../stroke/path.h"
#include "cache.h"
#include "shapeutil.h"

#include <QString>
#include <QVector>

#include <memory>
#include <optional>

namespace freehand {
namespace shape {

// =====================================================================
//  Style
// =====================================================================

/// Paint and outline settings for a freehand stroke
struct DrawStyle {
    double size = 8.0;              ///< Base stroke diameter
    double strokeWidth = 0.0;       ///< Width of the outline's own stroke (0 = default)
    double thinning = 0.75;         ///< Pressure effect on thickness, -1 to 1
    double streamline = 0.5;        ///< Input smoothing, 0 to 1
    double smoothing = 0.5;         ///< Outline edge softening, 0 to 1
    double taperStart = 0.0;        ///< Taper length at the start (0 = none)
    double taperEnd = 0.0;          ///< Taper length at the end (0 = none)
    bool capStart = true;           ///< Round start cap
    bool capEnd = true;             ///< Round end cap
    bool isFilled = true;           ///< Fill the outline with color
    QString color = QStringLiteral("#000");

    bool operator==(const DrawStyle& other) const;
    bool operator!=(const DrawStyle& other) const { return !(*this == other); }
};

/// Shared, immutable style.  Like point lists, identity matters:
/// shouldRender() compares style pointers.
using StylePtr = std::shared_ptr<const DrawStyle>;

FREEHAND_EXPORT StylePtr makeStyle(DrawStyle style = {});

// =====================================================================
//  Shape
// =====================================================================

/// Partial update of a draw shape.  Unset fields are left unchanged.
struct DrawShapePatch {
    std::optional<QPointF> point;
    std::optional<geometry::PointList> points;
    std::optional<bool> isDone;

    bool isEmpty() const { return !point && !points && !isDone; }
};

/// A freehand stroke
struct DrawShape : ShapeBase {
    using Patch = DrawShapePatch;

    geometry::PointList points;     ///< Shape-local, unrotated, unscaled
    bool isDone = false;            ///< False while the stroke is being drawn
    StylePtr style;
};

/// Apply a partial update, returning the updated shape
FREEHAND_EXPORT DrawShape applyPatch(DrawShape shape, const DrawShapePatch& patch);

// =====================================================================
//  DrawUtil
// =====================================================================

/// Shape contract for freehand strokes.
///
/// Derived geometry (local bounds, rotated points, outlines, indicator
/// paths) is cached per point list identity.  Callers must therefore
/// never modify a point list in place.
class FREEHAND_EXPORT DrawUtil : public ShapeUtil<DrawShape> {
public:
    DrawUtil() = default;

    QString type() const override;
    DrawShape defaultProps() const override;

    /// True iff the points or the style object changed
    bool shouldRender(const DrawShape& prev, const DrawShape& next) const override;

    /// A dot for finished taps and very short strokes, otherwise the
    /// pressure outline as a path.
    Drawable render(const DrawShape& shape, const RenderInfo& info) const override;
    Drawable renderIndicator(const DrawShape& shape) const override;

    geometry::Bounds getBounds(const DrawShape& shape) const override;
    geometry::Bounds getRotatedBounds(const DrawShape& shape) const override;
    QPointF getCenter(const DrawShape& shape) const override;

    /// Always true: any point that reached this test is close enough
    bool hitTest(const DrawShape& shape, const QPointF& point) const override;
    bool hitTestBounds(const DrawShape& shape, const geometry::Bounds& bounds) const override;

    DrawShapePatch transform(const DrawShape& shape, const geometry::Bounds& bounds,
                             const TransformInfo<DrawShape>& info) const override;
    DrawShapePatch transformSingle(const DrawShape& shape, const geometry::Bounds& bounds,
                                   const TransformInfo<DrawShape>& info) const override;

    /// Move the local origin to the top-left of the points' bounds and
    /// mark the stroke done.  Applying it again changes nothing.
    DrawShapePatch onSessionComplete(const DrawShape& shape) const override;

    /// Append a point to a stroke that is still being drawn.
    /// @throws std::logic_error if the stroke is already done
    DrawShapePatch appendPoint(const DrawShape& shape, const geometry::StrokePoint& point) const;

    /// Closed outline polygon of the stroke, in shape-local space
    QVector<QPointF> outline(const DrawShape& shape) const;

    /// Outline generator settings derived from the shape's style
    static stroke::StrokeOptions strokeOptions(const DrawShape& shape);

    /// Forget everything cached for this shape's current point list
    void release(const DrawShape& shape);

    /// Drop cache entries whose point lists no longer exist
    int purgeCaches();

    /// Local-bounds cache, exposed for diagnostics
    const IdentityCache<QVector<geometry::StrokePoint>, geometry::Bounds>& boundsCache() const
    {
        return m_boundsCache;
    }

private:
    struct RotatedGeometry {
        double rotation = 0.0;
        QVector<QPointF> points;    ///< Points rotated about their bounds center
        geometry::Bounds bounds;    ///< Envelope of the rotated points
    };

    struct OutlineGeometry {
        StylePtr style;             ///< Style the outline was built with
        bool isDone = false;
        QVector<QPointF> outline;
        stroke::StrokePath path;
    };

    const DrawStyle& styleOf(const DrawShape& shape) const;
    geometry::Bounds localBounds(const DrawShape& shape) const;
    const RotatedGeometry& rotatedGeometry(const DrawShape& shape) const;
    const OutlineGeometry& outlineGeometry(const DrawShape& shape) const;

    DrawStyle m_defaultStyle;

    mutable IdentityCache<QVector<geometry::StrokePoint>, geometry::Bounds> m_boundsCache;
    mutable IdentityCache<QVector<geometry::StrokePoint>, RotatedGeometry> m_rotatedCache;
    mutable IdentityCache<QVector<geometry::StrokePoint>, OutlineGeometry> m_outlineCache;
    mutable IdentityCache<QVector<geometry::StrokePoint>, stroke::StrokePath> m_indicatorCache;
};

}  // namespace shape
}  // namespace freehand

#endif  // FREEHAND_SHAPE_DRAW_H
