#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "BoundingBox.hpp"

TEST(BoundingBoxTest, ComputesExtentAndSpans)
{
    std::vector<Vector2> points = {
        Vector2(-10.0, 5.0),
        Vector2(30.0, -20.0),
        Vector2(4.0, 40.0),
    };
    BoundingBox box = BoundingBox::compute(points);

    EXPECT_DOUBLE_EQ(box.left, -10.0);
    EXPECT_DOUBLE_EQ(box.right, 30.0);
    EXPECT_DOUBLE_EQ(box.top, -20.0);
    EXPECT_DOUBLE_EQ(box.bottom, 40.0);
    EXPECT_DOUBLE_EQ(box.width, 40.0);
    EXPECT_DOUBLE_EQ(box.height, 60.0);
    EXPECT_EQ(box.center(), Vector2(10.0, 10.0));
}

TEST(BoundingBoxTest, SinglePointHasZeroSize)
{
    BoundingBox box = BoundingBox::compute({Vector2(3.0, -7.0)});
    EXPECT_DOUBLE_EQ(box.width, 0.0);
    EXPECT_DOUBLE_EQ(box.height, 0.0);
    EXPECT_EQ(box.center(), Vector2(3.0, -7.0));
}

TEST(BoundingBoxTest, EmptyInputIsRejected)
{
    EXPECT_THROW(BoundingBox::compute({}), std::invalid_argument);
}
