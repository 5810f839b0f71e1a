// =====================================================================
//  src/libfreehand/shape/shapeutil.cpp — Shape contract support types
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/shape/shapeutil.h>

namespace freehand {
namespace shape {

QString Drawable::svgPathData() const
{
    if (kind != Kind::Path) {
        return QString();
    }
    return path.toSvgPathData();
}

bool Drawable::operator==(const Drawable& other) const
{
    return kind == other.kind &&
           center == other.center &&
           radius == other.radius &&
           path == other.path &&
           fill == other.fill &&
           stroke == other.stroke &&
           strokeWidth == other.strokeWidth &&
           roundJoin == other.roundJoin &&
           roundCap == other.roundCap &&
           pointerEvents == other.pointerEvents;
}

}  // namespace shape
}  // namespace freehand
