#include "utility/random.hpp"
#include "zcurve/codec.hpp"
#include "zcurve/errors.hpp"
#include <cstdint>
#include <gtest/gtest.h>

namespace
{

using zcurve::coordinates;
using zcurve::curve_config;
using zcurve::value_type;

template <std::size_t D, std::size_t B>
struct CurveWrapper
{
    static constexpr std::size_t dims         = D;
    static constexpr std::size_t bits_per_dim = B;
    static constexpr std::size_t total_bits   = D * B;
};

using types = ::testing::Types<
    CurveWrapper<1, 12>,
    CurveWrapper<2, 4>,
    CurveWrapper<2, 31>,
    CurveWrapper<3, 21>,
    CurveWrapper<4, 40>,
    CurveWrapper<7, 64>>;

auto to_coordinates(std::vector<std::uint64_t> const& p) -> coordinates
{
    return coordinates(p.begin(), p.end());
}

template <typename T>
class CodecTest : public ::testing::Test
{
protected:
    utility::random::random<std::uint64_t> rng_{ 1234u };

    auto random_point() -> coordinates
    {
        return to_coordinates(rng_.randpoint(T::dims, T::bits_per_dim));
    }
};

TYPED_TEST_SUITE(CodecTest, types);

TYPED_TEST(CodecTest, DecodeInvertsEncode)
{
    for (int n = 0; n != 200; ++n)
    {
        const auto point = this->random_point();
        const auto code  = zcurve::encode(point, TypeParam::dims, TypeParam::bits_per_dim);
        EXPECT_EQ(zcurve::decode(code, TypeParam::dims, TypeParam::total_bits), point)
            << "code " << code;
    }
}

TYPED_TEST(CodecTest, CodeFitsTotalWidth)
{
    const value_type limit = value_type(1) << TypeParam::total_bits;
    for (int n = 0; n != 100; ++n)
    {
        const auto code =
            zcurve::encode(this->random_point(), TypeParam::dims, TypeParam::bits_per_dim);
        EXPECT_LT(code, limit);
    }
}

TYPED_TEST(CodecTest, DimensionsOccupyDisjointBits)
{
    const value_type all_ones = (value_type(1) << TypeParam::bits_per_dim) - 1;
    value_type       combined{};
    for (std::size_t i = 0; i != TypeParam::dims; ++i)
    {
        coordinates axis(TypeParam::dims);
        axis[i]         = all_ones;
        const auto code = zcurve::encode(axis, TypeParam::dims, TypeParam::bits_per_dim);
        EXPECT_EQ(value_type(combined & code), 0) << "Overlap at dimension " << i;
        combined |= code;
    }
    EXPECT_EQ(combined, value_type((value_type(1) << TypeParam::total_bits) - 1));
}

TYPED_TEST(CodecTest, DominatedPointsEncodeLower)
{
    for (int n = 0; n != 100; ++n)
    {
        const auto upper = this->random_point();
        auto       lower = upper;
        for (auto& v : lower)
        {
            v = v / 2;
        }
        EXPECT_LE(
            zcurve::encode(lower, TypeParam::dims, TypeParam::bits_per_dim),
            zcurve::encode(upper, TypeParam::dims, TypeParam::bits_per_dim)
        );
    }
}

TEST(Codec, EncodesKnownValues)
{
    EXPECT_EQ(zcurve::encode({ 5, 3 }), 27);
    EXPECT_EQ(zcurve::encode({ 5, 3 }, 2, 16), 27);
    EXPECT_EQ(zcurve::encode({ 1, 2, 4 }), 273);
    EXPECT_EQ(zcurve::encode({ 13 }), 13);
    EXPECT_EQ(zcurve::encode({ 0, 0 }), 0);
    EXPECT_EQ(zcurve::encode({ 5, 3 }, curve_config{ 2, 3 }), 27);
}

TEST(Codec, DecodesKnownValues)
{
    EXPECT_EQ(zcurve::decode(27, 2), (coordinates{ 5, 3 }));
    EXPECT_EQ(zcurve::decode(273, 3), (coordinates{ 1, 2, 4 }));
    EXPECT_EQ(zcurve::decode(13, 1), (coordinates{ 13 }));
    EXPECT_EQ(zcurve::decode(0, 3), (coordinates{ 0, 0, 0 }));
    EXPECT_EQ(zcurve::decode(27, curve_config{ 2, 4 }), (coordinates{ 5, 3 }));
}

TEST(Codec, PinnedWidthDropsHighBits)
{
    EXPECT_EQ(zcurve::decode(27, 2, 4), (coordinates{ 1, 3 }));
}

TEST(Codec, HandlesCoordinatesBeyondMachineWords)
{
    const value_type big = value_type(1) << 100;
    EXPECT_EQ(zcurve::encode({ big, 0 }), value_type(value_type(1) << 200));
    EXPECT_EQ(zcurve::encode({ 0, big }), value_type(value_type(1) << 201));
    EXPECT_EQ(zcurve::decode(value_type(1) << 200, 2), (coordinates{ big, 0 }));

    const coordinates point{ big - 1, big + 12345, 7 };
    EXPECT_EQ(zcurve::decode(zcurve::encode(point), 3), point);
}

TEST(Codec, RejectsInvalidInput)
{
    EXPECT_THROW((void)zcurve::encode({ 5, 3 }, 3), zcurve::dimension_mismatch);
    EXPECT_THROW((void)zcurve::encode(coordinates{}), zcurve::dimension_mismatch);
    EXPECT_THROW(
        (void)zcurve::encode({ 5, 3 }, curve_config{ 3, 4 }), zcurve::dimension_mismatch
    );
    EXPECT_THROW((void)zcurve::encode({ -1, 2 }), zcurve::negative_value);
    EXPECT_THROW((void)zcurve::encode({ 17, 3 }, 2, 4), zcurve::width_error);
    EXPECT_THROW((void)zcurve::decode(-1, 2), zcurve::negative_value);
    EXPECT_THROW((void)zcurve::decode(27, 0), zcurve::dimension_mismatch);
    EXPECT_THROW((void)zcurve::decode(27, 2, 5), zcurve::width_error);
}

TEST(Codec, ExplicitConfigurationRejectsInvalidInput)
{
    const curve_config config{ 2, 4 };
    EXPECT_THROW((void)zcurve::encode({ -5, 1 }, config), zcurve::negative_value);
    EXPECT_THROW((void)zcurve::encode({ 300, 1 }, config), zcurve::width_error);
    EXPECT_THROW((void)zcurve::encode({ 16, 1 }, config), zcurve::width_error);
    EXPECT_THROW((void)zcurve::encode({ 1 }, config), zcurve::dimension_mismatch);
    EXPECT_THROW(
        (void)zcurve::encode(coordinates{}, curve_config{ 0, 4 }), zcurve::dimension_mismatch
    );
    EXPECT_THROW((void)zcurve::encode({ 0, 0 }, curve_config{ 2, 0 }), zcurve::width_error);

    EXPECT_THROW((void)zcurve::decode(-27, config), zcurve::negative_value);
    EXPECT_THROW((void)zcurve::decode(27, curve_config{ 0, 4 }), zcurve::dimension_mismatch);
    EXPECT_THROW((void)zcurve::decode(27, curve_config{ 2, 0 }), zcurve::width_error);

    // the widest coordinate that fits is accepted
    EXPECT_EQ(zcurve::encode({ 15, 15 }, config), 255);
}

} // namespace
