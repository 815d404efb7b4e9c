/*
 * Unit tests for Base classes (Point, Rect, ScreenSize)
 */
#include <gtest/gtest.h>
#include "../Base.h"
#include <unordered_set>

using namespace tapsight;

// ==================== Point Tests ====================

class PointTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(PointTest, DefaultConstructor) {
    Point p;
    EXPECT_EQ(p.x, 0);
    EXPECT_EQ(p.y, 0);
}

TEST_F(PointTest, ParameterizedConstructor) {
    Point p(10, 20);
    EXPECT_EQ(p.x, 10);
    EXPECT_EQ(p.y, 20);
}

TEST_F(PointTest, EqualityOperator) {
    Point p1(10, 20);
    Point p2(10, 20);
    Point p3(20, 10);
    EXPECT_TRUE(p1 == p2);
    EXPECT_FALSE(p1 == p3);
    EXPECT_TRUE(p1 != p3);
}

TEST_F(PointTest, ToString) {
    EXPECT_EQ(Point(540, 1200).toString(), "(540, 1200)");
}

// ==================== Rect Tests ====================

class RectTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RectTest, DefaultConstructor) {
    Rect r;
    EXPECT_EQ(r.left, 0);
    EXPECT_EQ(r.top, 0);
    EXPECT_EQ(r.right, 0);
    EXPECT_EQ(r.bottom, 0);
    EXPECT_TRUE(r.isEmpty());
}

TEST_F(RectTest, ParameterizedConstructor) {
    Rect r(10, 20, 110, 220);
    EXPECT_EQ(r.left, 10);
    EXPECT_EQ(r.top, 20);
    EXPECT_EQ(r.right, 110);
    EXPECT_EQ(r.bottom, 220);
    EXPECT_EQ(r.width(), 100);
    EXPECT_EQ(r.height(), 200);
}

TEST_F(RectTest, IsEmpty) {
    EXPECT_FALSE(Rect(0, 0, 10, 10).isEmpty());
    EXPECT_TRUE(Rect(10, 0, 10, 10).isEmpty());
    EXPECT_TRUE(Rect(0, 10, 10, 10).isEmpty());
    EXPECT_TRUE(Rect(20, 20, 10, 10).isEmpty());
}

TEST_F(RectTest, Center) {
    EXPECT_EQ(Rect(0, 0, 100, 200).center(), Point(50, 100));
    EXPECT_EQ(Rect(10, 10, 21, 21).center(), Point(15, 15));
}

TEST_F(RectTest, EqualityOperator) {
    EXPECT_TRUE(Rect(1, 2, 3, 4) == Rect(1, 2, 3, 4));
    EXPECT_FALSE(Rect(1, 2, 3, 4) == Rect(1, 2, 3, 5));
}

TEST_F(RectTest, ToString) {
    EXPECT_EQ(Rect(0, 84, 1080, 210).toString(), "[0,84][1080,210]");
}

// ==================== ScreenSize Tests ====================

TEST(ScreenSizeTest, KnownOnlyWithBothSides) {
    ScreenSize unknown;
    EXPECT_FALSE(unknown.isKnown());
    ScreenSize halfKnown{1080, 0};
    EXPECT_FALSE(halfKnown.isKnown());
    ScreenSize known{1080, 2400};
    EXPECT_TRUE(known.isKnown());
}
