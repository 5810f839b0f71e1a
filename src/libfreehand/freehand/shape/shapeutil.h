// =====================================================================
//  src/libfreehand/freehand/shape/shapeutil.h — Shape contract
// =====================================================================
//
//  The contract every shape type implements to take part in the canvas:
//  bounds, drawing output, hit testing, resize/rotate transforms and the
//  end-of-session normalization.  The host calls these; the shape data
//  itself is owned by the host's document store.
//
//  A shape type T provides a nested T::Patch describing a partial update
//  (what transform() and onSessionComplete() return).
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef FREEHAND_SHAPE_SHAPEUTIL_H
#define FREEHAND_SHAPE_SHAPEUTIL_H

#include "../core.h"
#include "../geometry/types.h"
#include "../geometry/utils.h"
#include "../stroke/path.h"

#include <QPointF>
#include <QString>
#include <QVector>

namespace freehand {
namespace shape {

// =====================================================================
//  Shape identity and placement
// =====================================================================

/// Fields shared by every shape type
struct ShapeBase {
    QString id;                 ///< Unique id within the document
    QString type;               ///< Type tag, e.g. "draw"
    QString name;               ///< Display name
    QString parentId;           ///< Owning page or group
    int childIndex = 1;         ///< Order among siblings
    QPointF point;              ///< Local origin in parent space
    double rotation = 0.0;      ///< Rotation in radians
};

// =====================================================================
//  Host-supplied context
// =====================================================================

/// Context passed with render()
struct RenderInfo {
    bool isDarkMode = false;
    bool isEditing = false;
    bool isHovered = false;
    bool isSelected = false;
};

/// Context passed with transform()
template <typename T>
struct TransformInfo {
    T initialShape;                 ///< Snapshot taken when the gesture began
    double scaleX = 1.0;            ///< Negative when flipped horizontally
    double scaleY = 1.0;            ///< Negative when flipped vertically
    QPointF transformOrigin;        ///< Normalized handle origin (informational)
};

// =====================================================================
//  Drawing output
// =====================================================================

/// What a shape asks the rendering surface to draw, in shape-local space
struct FREEHAND_EXPORT Drawable {
    enum class Kind {
        Circle,     ///< Filled/stroked circle (dot)
        Path        ///< Filled/stroked path
    };

    Kind kind = Kind::Path;
    QPointF center;                 ///< Circle only
    double radius = 0.0;            ///< Circle only
    ::freehand::stroke::StrokePath path;    ///< Path only
    QString fill = QStringLiteral("none");
    QString stroke;
    double strokeWidth = 0.0;
    bool roundJoin = false;
    bool roundCap = false;
    bool pointerEvents = true;      ///< Whether the element takes pointer input

    bool isCircle() const { return kind == Kind::Circle; }
    bool isPath() const { return kind == Kind::Path; }

    /// SVG path data for Path drawables (empty for circles)
    QString svgPathData() const;

    bool operator==(const Drawable& other) const;
    bool operator!=(const Drawable& other) const { return !(*this == other); }
};

// =====================================================================
//  ShapeUtil
// =====================================================================

/// Per-type implementation of the shape contract.
///
/// Utils may memoize derived geometry, so one util instance is meant to
/// be used from one thread at a time.
template <typename T>
class ShapeUtil {
public:
    using Shape = T;
    using Patch = typename T::Patch;

    virtual ~ShapeUtil() = default;

    /// Type tag of the shapes this util handles
    virtual QString type() const = 0;

    /// A shape of this type with every field at its default
    virtual T defaultProps() const = 0;

    /// A default shape with the given id
    T create(const QString& id) const
    {
        T shape = defaultProps();
        shape.id = id;
        return shape;
    }

    /// Whether @p next needs repainting after @p prev
    virtual bool shouldRender(const T& prev, const T& next) const
    {
        Q_UNUSED(prev);
        Q_UNUSED(next);
        return true;
    }

    virtual Drawable render(const T& shape, const RenderInfo& info) const = 0;

    /// Lightweight outline used for selection and hover indicators
    virtual Drawable renderIndicator(const T& shape) const = 0;

    /// Axis-aligned bounds in parent space, ignoring rotation
    virtual geometry::Bounds getBounds(const T& shape) const = 0;

    /// Bounds in parent space after applying the shape's rotation.
    /// The default rotates the corners of getBounds() about its center.
    virtual geometry::Bounds getRotatedBounds(const T& shape) const
    {
        const geometry::Bounds b = getBounds(shape);
        const QPointF c = b.center();
        QVector<QPointF> corners = {
            geometry::rotateAround(QPointF(b.minX, b.minY), c, shape.rotation),
            geometry::rotateAround(QPointF(b.maxX, b.minY), c, shape.rotation),
            geometry::rotateAround(QPointF(b.maxX, b.maxY), c, shape.rotation),
            geometry::rotateAround(QPointF(b.minX, b.maxY), c, shape.rotation),
        };
        return geometry::boundsFromPoints(corners);
    }

    virtual QPointF getCenter(const T& shape) const
    {
        return getBounds(shape).center();
    }

    /// Whether @p point (parent space) hits the shape
    virtual bool hitTest(const T& shape, const QPointF& point) const = 0;

    /// Whether the shape should be selected by a brush with @p bounds
    virtual bool hitTestBounds(const T& shape, const geometry::Bounds& bounds) const = 0;

    /// Fit the shape into @p bounds during a multi-shape resize
    virtual Patch transform(const T& shape, const geometry::Bounds& bounds,
                            const TransformInfo<T>& info) const = 0;

    /// Fit the shape into @p bounds when it is resized on its own
    virtual Patch transformSingle(const T& shape, const geometry::Bounds& bounds,
                                  const TransformInfo<T>& info) const
    {
        return transform(shape, bounds, info);
    }

    /// Normalize the shape when its creation session ends
    virtual Patch onSessionComplete(const T& shape) const
    {
        Q_UNUSED(shape);
        return Patch{};
    }
};

}  // namespace shape
}  // namespace freehand

#endif  // FREEHAND_SHAPE_SHAPEUTIL_H
