// =====================================================================
//  tests/test_geometry.cpp — Geometry primitive tests
// =====================================================================
//
//  Part of libfreehand.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <freehand/core.h>
#include <freehand/geometry/types.h>
#include <freehand/geometry/utils.h>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace freehand::geometry;

namespace {

void expectPointNear(const QPointF& actual, const QPointF& expected, double tol = 1e-9)
{
    EXPECT_NEAR(actual.x(), expected.x(), tol);
    EXPECT_NEAR(actual.y(), expected.y(), tol);
}

}  // namespace

TEST(Core, ReportsVersion) {
    EXPECT_STREQ(freehand::version(), "0.1.0");
}

// ---- Vectors ---------------------------------------------------------

TEST(Vectors, ArithmeticUsesPointOperators) {
    QPointF a(1, 2);
    QPointF b(3, 5);
    expectPointNear(a + b, QPointF(4, 7));
    expectPointNear(b - a, QPointF(2, 3));
    expectPointNear(-a, QPointF(-1, -2));
    expectPointNear(scale(b, 2.0), QPointF(6, 10));
}

TEST(Vectors, DotCrossAndLength) {
    EXPECT_DOUBLE_EQ(dot(QPointF(1, 2), QPointF(3, 4)), 11.0);
    EXPECT_DOUBLE_EQ(cross(QPointF(1, 0), QPointF(0, 1)), 1.0);
    EXPECT_DOUBLE_EQ(length(QPointF(3, 4)), 5.0);
    EXPECT_DOUBLE_EQ(distance(QPointF(1, 1), QPointF(4, 5)), 5.0);
    EXPECT_DOUBLE_EQ(distanceSquared(QPointF(1, 1), QPointF(4, 5)), 25.0);
}

TEST(Vectors, NormalizeKeepsZeroVector) {
    expectPointNear(normalize(QPointF(0, 5)), QPointF(0, 1));
    expectPointNear(normalize(QPointF(0, 0)), QPointF(0, 0));
}

TEST(Vectors, PerpendicularLerpProject) {
    expectPointNear(perpendicular(QPointF(1, 0)), QPointF(0, -1));
    expectPointNear(lerp(QPointF(0, 0), QPointF(10, 20), 0.25), QPointF(2.5, 5));
    expectPointNear(project(QPointF(1, 1), QPointF(1, 0), 3), QPointF(4, 1));
    EXPECT_TRUE(pointsEqual(QPointF(1, 2), QPointF(1, 2)));
    EXPECT_FALSE(pointsEqual(QPointF(1, 2), QPointF(1, 2.0001)));
}

TEST(Vectors, RotateAroundIsCounterClockwise) {
    expectPointNear(rotateAround(QPointF(1, 0), QPointF(0, 0), M_PI / 2), QPointF(0, 1));
    expectPointNear(rotateAround(QPointF(2, 1), QPointF(1, 1), M_PI), QPointF(0, 1));

    const QPointF p(3.25, -7.5);
    EXPECT_EQ(rotateAround(p, QPointF(10, 10), 0.0), p);
}

// ---- Stroke points ---------------------------------------------------

TEST(StrokePoints, DefaultPressureIsNeutral) {
    StrokePoint p(1, 2);
    EXPECT_DOUBLE_EQ(p.pressure, NEUTRAL_PRESSURE);
    EXPECT_DOUBLE_EQ(p.x(), 1.0);
    EXPECT_DOUBLE_EQ(p.y(), 2.0);
    EXPECT_NE(p, StrokePoint(1, 2, 0.7));
}

TEST(StrokePoints, PointListsAreDistinctObjects) {
    QVector<StrokePoint> raw = { StrokePoint(0, 0), StrokePoint(1, 1, 0.8) };
    PointList a = makePointList(raw);
    PointList b = makePointList(raw);

    ASSERT_TRUE(a);
    EXPECT_NE(a, b);
    EXPECT_EQ(*a, *b);

    QVector<QPointF> pos = positions(*a);
    ASSERT_EQ(pos.size(), 2);
    EXPECT_EQ(pos[1], QPointF(1, 1));
}

// ---- Bounds ----------------------------------------------------------

TEST(Bounds, NormalizesCorners) {
    Bounds b(10, 20, 0, 5);
    EXPECT_DOUBLE_EQ(b.minX, 0.0);
    EXPECT_DOUBLE_EQ(b.minY, 5.0);
    EXPECT_DOUBLE_EQ(b.maxX, 10.0);
    EXPECT_DOUBLE_EQ(b.maxY, 20.0);
    EXPECT_DOUBLE_EQ(b.width(), 10.0);
    EXPECT_DOUBLE_EQ(b.height(), 15.0);
}

TEST(Bounds, FromPoints) {
    QVector<QPointF> pts = { QPointF(3, 4), QPointF(-1, 2), QPointF(5, -6) };
    EXPECT_EQ(boundsFromPoints(pts), Bounds(-1, -6, 5, 4));
}

TEST(Bounds, FromEmptyPointsThrows) {
    EXPECT_THROW(boundsFromPoints(QVector<QPointF>()), std::invalid_argument);
    EXPECT_THROW(boundsFromPoints(QVector<StrokePoint>()), std::invalid_argument);
}

TEST(Bounds, FromPointsWithRotationTurnsAboutOwnCenter) {
    // 20 x 10 box centered on (10, 5), turned a quarter
    QVector<QPointF> pts = { QPointF(0, 0), QPointF(20, 0), QPointF(20, 10) };
    Bounds b = boundsFromPoints(pts, M_PI / 2);

    EXPECT_NEAR(b.minX, 5.0, 1e-9);
    EXPECT_NEAR(b.maxX, 15.0, 1e-9);
    EXPECT_NEAR(b.minY, -5.0, 1e-9);
    EXPECT_NEAR(b.maxY, 15.0, 1e-9);
    expectPointNear(b.center(), QPointF(10, 5));
}

TEST(Bounds, StrokePointOverloadIgnoresPressure) {
    QVector<StrokePoint> pts = { StrokePoint(0, 0, 0.1), StrokePoint(4, 2, 0.9) };
    EXPECT_EQ(boundsFromPoints(pts), Bounds(0, 0, 4, 2));
}

TEST(Bounds, TranslateAndCenter) {
    Bounds b(0, 0, 10, 10);
    EXPECT_EQ(translateBounds(b, QPointF(5, -2)), Bounds(5, -2, 15, 8));
    expectPointNear(boundsCenter(b), QPointF(5, 5));
    EXPECT_EQ(b.topLeft(), QPointF(0, 0));
}

TEST(Bounds, ContainmentIsInclusive) {
    Bounds outer(0, 0, 10, 10);
    EXPECT_TRUE(boundsContain(outer, Bounds(2, 2, 8, 8)));
    EXPECT_TRUE(boundsContain(outer, outer));
    EXPECT_FALSE(boundsContain(outer, Bounds(2, 2, 11, 8)));
    EXPECT_FALSE(boundsContain(Bounds(2, 2, 8, 8), outer));

    EXPECT_TRUE(outer.contains(QPointF(10, 0)));
    EXPECT_FALSE(outer.contains(QPointF(10.001, 0)));
}

TEST(Bounds, TouchingBoxesCollide) {
    Bounds a(0, 0, 10, 10);
    EXPECT_TRUE(boundsCollide(a, Bounds(10, 10, 20, 20)));
    EXPECT_TRUE(boundsCollide(a, Bounds(5, -5, 6, 0)));
    EXPECT_FALSE(boundsCollide(a, Bounds(10.5, 0, 20, 10)));
}

TEST(Bounds, ExpandAndUnion) {
    EXPECT_EQ(expandBounds(Bounds(0, 0, 10, 10), 2), Bounds(-2, -2, 12, 12));
    EXPECT_EQ(unionBounds(Bounds(0, 0, 1, 1), Bounds(5, -3, 6, 0)), Bounds(0, -3, 6, 1));
}

TEST(Bounds, ReadableForm) {
    EXPECT_EQ(toString(Bounds(0, 0, 10, 10)), QStringLiteral("[0, 0 -> 10, 10]"));
    EXPECT_EQ(Bounds(QRectF(1, 2, 3, 4)), Bounds(1, 2, 4, 6));
}
