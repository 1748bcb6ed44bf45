#include <gtest/gtest.h>

#include <string>

#include "core/Region.hpp"

namespace snarp {
namespace {

TEST(RegionTest, CreateKeepsGeometry) {
    auto region = Region::create(10, 20, 300, 200);
    ASSERT_TRUE(region);
    EXPECT_EQ(region->x(), 10);
    EXPECT_EQ(region->y(), 20);
    EXPECT_EQ(region->width(), 300);
    EXPECT_EQ(region->height(), 200);
    EXPECT_EQ(region->right(), 310);
    EXPECT_EQ(region->bottom(), 220);
    EXPECT_EQ(region->toString(), "10,20 300x200");
}

TEST(RegionTest, RejectsEmptyOrNegative) {
    std::string err;
    EXPECT_FALSE(Region::create(0, 0, 0, 10, &err));
    EXPECT_EQ(err, "width and height must be positive");
    EXPECT_FALSE(Region::create(0, 0, 10, -1, &err));
    EXPECT_FALSE(Region::create(-1, 0, 10, 10, &err));
    EXPECT_EQ(err, "coordinates must be non-negative");
    EXPECT_FALSE(Region::create(0, -5, 10, 10));
}

TEST(RegionTest, EvenDimensionsRoundDown) {
    auto region = Region::create(10, 10, 101, 51);
    ASSERT_TRUE(region);
    Region even = region->withEvenDimensions();
    EXPECT_EQ(even, *Region::create(10, 10, 100, 50));

    auto alreadyEven = Region::create(3, 7, 64, 48);
    ASSERT_TRUE(alreadyEven);
    EXPECT_EQ(alreadyEven->withEvenDimensions(), *alreadyEven);
}

TEST(RegionTest, EvenDimensionsForAllSmallSizes) {
    for (int w = 1; w <= 64; ++w) {
        for (int h = 1; h <= 64; ++h) {
            Region even = Region::create(5, 9, w, h)->withEvenDimensions();
            SCOPED_TRACE(std::to_string(w) + "x" + std::to_string(h));
            EXPECT_EQ(even.width() % 2, 0);
            EXPECT_EQ(even.height() % 2, 0);
            EXPECT_LE(w - even.width(), 1);
            EXPECT_GE(w - even.width(), 0);
            EXPECT_LE(h - even.height(), 1);
            EXPECT_GE(h - even.height(), 0);
            EXPECT_EQ(even.x(), 5);
            EXPECT_EQ(even.y(), 9);
        }
    }
}

TEST(RegionTest, OnePixelRegionBecomesEmpty) {
    Region even = Region::create(0, 0, 1, 1)->withEvenDimensions();
    EXPECT_EQ(even.width(), 0);
    EXPECT_EQ(even.height(), 0);
}

TEST(RegionTest, RejectsRegionsPastIntRange) {
    std::string err;
    EXPECT_FALSE(Region::create(2147483000, 0, 1000, 10, &err));
    EXPECT_EQ(err, "region extends past the largest coordinate");
    EXPECT_FALSE(Region::create(0, 2147483000, 10, 1000, &err));
    EXPECT_FALSE(parseRegion("2147483000,0,1000,10", &err));
    EXPECT_EQ(err, "region extends past the largest coordinate");

    auto edge = Region::create(2147483000, 0, 647, 10, &err);
    ASSERT_TRUE(edge) << err;
    EXPECT_EQ(edge->right(), 2147483647);
}

TEST(RegionTest, Equality) {
    auto a = Region::create(1, 2, 3, 4);
    auto b = Region::create(1, 2, 3, 4);
    auto c = Region::create(1, 2, 3, 5);
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
}

TEST(RegionTest, ParseRegion) {
    std::string err;
    auto region = parseRegion("100,200,640,480", &err);
    ASSERT_TRUE(region) << err;
    EXPECT_EQ(*region, *Region::create(100, 200, 640, 480));

    EXPECT_FALSE(parseRegion("1,2,3", &err));
    EXPECT_FALSE(parseRegion("1,2,3,4,5", &err));
    EXPECT_FALSE(parseRegion("1,,3,4", &err));
    EXPECT_FALSE(parseRegion("a,b,c,d", &err));
    EXPECT_EQ(err, "invalid number in region: a");
    EXPECT_FALSE(parseRegion("0,0,0,10", &err));
    EXPECT_EQ(err, "width and height must be positive");
    EXPECT_FALSE(parseRegion("", &err));
}

}  // namespace
}  // namespace snarp
