#include "zcurve/curve_config.hpp"
#include "zcurve/errors.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace
{

using zcurve::coordinates;
using zcurve::curve_config;
using zcurve::value_type;

TEST(CurveConfig, TotalBits)
{
    static_assert(curve_config{ 3, 5 }.total_bits() == 15);
    EXPECT_EQ((curve_config{ 2, 4 }.total_bits()), 8u);
}

TEST(CurveConfig, PointDerivesDimsAndWidth)
{
    EXPECT_EQ(curve_config::for_point({ 5, 3 }), (curve_config{ 2, 3 }));
    EXPECT_EQ(curve_config::for_point({ 0, 0, 0 }), (curve_config{ 3, 1 }));
    EXPECT_EQ(curve_config::for_point({ 1, 1024 }), (curve_config{ 2, 11 }));
}

TEST(CurveConfig, PointKeepsPinnedValues)
{
    EXPECT_EQ(curve_config::for_point({ 5, 3 }, 2, 4), (curve_config{ 2, 4 }));
    EXPECT_EQ(curve_config::for_point({ 5, 3 }, {}, 16), (curve_config{ 2, 16 }));
}

TEST(CurveConfig, PointRejectsBadInput)
{
    EXPECT_THROW((void)curve_config::for_point({ 5, 3 }, 3), zcurve::dimension_mismatch);
    EXPECT_THROW((void)curve_config::for_point(coordinates{}), zcurve::dimension_mismatch);
    EXPECT_THROW((void)curve_config::for_point({ 5, 3 }, 2, 0), zcurve::width_error);
    EXPECT_THROW((void)curve_config::for_point({ 17, 3 }, 2, 4), zcurve::width_error);
    EXPECT_THROW((void)curve_config::for_point({ -1, 3 }), zcurve::negative_value);
}

TEST(CurveConfig, CodeDerivesSmallestCoveringMultiple)
{
    EXPECT_EQ(curve_config::for_code(0, 2), (curve_config{ 2, 1 }));
    EXPECT_EQ(curve_config::for_code(27, 2), (curve_config{ 2, 3 }));
    EXPECT_EQ(curve_config::for_code(255, 2), (curve_config{ 2, 4 }));
    EXPECT_EQ(curve_config::for_code(255, 3), (curve_config{ 3, 3 }));
    EXPECT_EQ(curve_config::for_code(value_type(1) << 99, 10), (curve_config{ 10, 10 }));
}

TEST(CurveConfig, CodeKeepsPinnedWidth)
{
    EXPECT_EQ(curve_config::for_code(27, 2, 8), (curve_config{ 2, 4 }));
    // narrower than the code is allowed and truncates on decode
    EXPECT_EQ(curve_config::for_code(27, 2, 2), (curve_config{ 2, 1 }));
}

TEST(CurveConfig, CodeRejectsBadInput)
{
    EXPECT_THROW((void)curve_config::for_code(27, 2, 7), zcurve::width_error);
    EXPECT_THROW((void)curve_config::for_code(27, 2, 0), zcurve::width_error);
    EXPECT_THROW((void)curve_config::for_code(27, 0), zcurve::dimension_mismatch);
    EXPECT_THROW((void)curve_config::for_code(-5, 2), zcurve::negative_value);
}

TEST(CurveConfig, RangeUsesWidestOperand)
{
    EXPECT_EQ(curve_config::for_range(20, 12, 60, 2), (curve_config{ 2, 3 }));
    EXPECT_EQ(curve_config::for_range(1, 0, 300, 3), (curve_config{ 3, 3 }));
    EXPECT_EQ(curve_config::for_range(1000, 0, 3, 2), (curve_config{ 2, 5 }));
    EXPECT_EQ(curve_config::for_range(0, 0, 0, 4), (curve_config{ 4, 1 }));
    EXPECT_EQ(curve_config::for_range(20, 12, 60, 2, 12), (curve_config{ 2, 6 }));
}

TEST(CurveConfig, RangeRejectsBadInput)
{
    EXPECT_THROW((void)curve_config::for_range(20, 12, 60, 0), zcurve::dimension_mismatch);
    EXPECT_THROW((void)curve_config::for_range(20, -12, 60, 2), zcurve::negative_value);
    EXPECT_THROW((void)curve_config::for_range(20, 12, 60, 2, 9), zcurve::width_error);
}

TEST(CurveConfig, Streams)
{
    std::ostringstream oss;
    oss << curve_config{ 2, 4 };
    EXPECT_EQ(oss.str(), "{dims=2, bits_per_dim=4, total_bits=8}");
}

} // namespace
