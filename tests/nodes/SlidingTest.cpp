#include "statexpr/nodes/Sliding.hpp"
#include "statexpr/nodes/Leaf.hpp"
#include "statexpr/Errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using namespace statexpr;

namespace {

std::vector<double> feed(ValueNode& n, const std::vector<double>& xs) {
    std::vector<double> out;
    for (double x : xs) {
        MapDump d{{"x", x}};
        out.push_back(n.evaluate(d));
    }
    return out;
}

} // namespace

TEST(SlidingTest, SumOverTwo) {
    SlidingSum s(box("x"), 2);
    EXPECT_EQ(feed(s, {1.0, 2.0, 3.0, 4.0}), (std::vector<double>{1.0, 3.0, 5.0, 7.0}));
    EXPECT_EQ(s.describe(), "SlidingSum(FieldValue(\"x\"), length=2)");
}

TEST(SlidingTest, WindowIsNotPadded) {
    SlidingArithmeticMean m(box("x"), 4);
    auto out = feed(m, {2.0, 4.0});
    EXPECT_DOUBLE_EQ(out[0], 2.0);
    EXPECT_DOUBLE_EQ(out[1], 3.0);
    EXPECT_EQ(m.window().size(), 2u);
}

TEST(SlidingTest, WindowKeepsMostRecent) {
    SlidingSum s(box("x"), 3);
    feed(s, {1.0, 2.0, 3.0, 4.0, 5.0});
    ASSERT_EQ(s.window().size(), 3u);
    EXPECT_DOUBLE_EQ(s.window().front(), 3.0);
    EXPECT_DOUBLE_EQ(s.window().back(), 5.0);
}

TEST(SlidingTest, ArithmeticMean) {
    SlidingArithmeticMean m(box("x"), 2);
    EXPECT_EQ(feed(m, {2.0, 4.0, 8.0}), (std::vector<double>{2.0, 3.0, 6.0}));
}

TEST(SlidingTest, GeometricMean) {
    SlidingGeometricMean g(box("x"), 2);
    auto out = feed(g, {4.0, 1.0, 9.0});
    EXPECT_DOUBLE_EQ(out[0], 4.0);
    EXPECT_DOUBLE_EQ(out[1], 2.0);
    EXPECT_DOUBLE_EQ(out[2], 3.0);
}

TEST(SlidingTest, HarmonicMean) {
    SlidingHarmonicMean h(box("x"), 2);
    auto out = feed(h, {1.0, 3.0, 6.0});
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 1.5);
    EXPECT_DOUBLE_EQ(out[2], 4.0);
}

TEST(SlidingTest, HarmonicZeroInWindowThrows) {
    SlidingHarmonicMean h(box("x"), 3);
    feed(h, {1.0});
    MapDump zero{{"x", 0.0}};
    EXPECT_THROW(h.evaluate(zero), ArithmeticError);
}

TEST(SlidingTest, ResetClearsWindow) {
    SlidingSum s(box("x"), 2);
    feed(s, {10.0, 20.0});
    s.reset();
    EXPECT_TRUE(s.window().empty());
    EXPECT_EQ(feed(s, {1.0, 2.0, 3.0, 4.0}), (std::vector<double>{1.0, 3.0, 5.0, 7.0}));
}

TEST(SlidingTest, ZeroLengthRejected) {
    EXPECT_THROW(SlidingSum(box("x"), 0), BuildError);
}
