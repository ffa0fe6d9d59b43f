#include "utility/random.hpp"
#include "zcurve/batch.hpp"
#include "zcurve/codec.hpp"
#include "zcurve/errors.hpp"
#include "zcurve/range.hpp"
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <gtest/gtest.h>
#include <sys/resource.h>
#include <type_traits>

namespace
{

using zcurve::coordinates;
using zcurve::value_type;
namespace batch = zcurve::batch;

// Worker counts: all cores, one, several, more than items
using worker_counts = ::testing::Types<
    std::integral_constant<std::size_t, 0>,
    std::integral_constant<std::size_t, 1>,
    std::integral_constant<std::size_t, 3>,
    std::integral_constant<std::size_t, 1000>>;

template <typename T>
class BatchTest : public ::testing::Test
{
protected:
    static constexpr std::size_t s_workers = T::value;
    static constexpr std::size_t s_dims    = 3;
    static constexpr std::size_t s_bits    = 10;

    BatchTest()
    {
        utility::random::random<std::uint64_t> rng{ 99u };
        for (int n = 0; n != 257; ++n)
        {
            const auto p = rng.randpoint(s_dims, s_bits);
            points_.emplace_back(p.begin(), p.end());
            codes_.push_back(zcurve::encode(points_.back(), s_dims, s_bits));
        }
        rmin_ = zcurve::encode({ 100, 200, 50 }, s_dims, s_bits);
        rmax_ = zcurve::encode({ 800, 700, 900 }, s_dims, s_bits);
    }

    std::vector<coordinates> points_;
    std::vector<value_type>  codes_;
    value_type               rmin_;
    value_type               rmax_;
};

TYPED_TEST_SUITE(BatchTest, worker_counts);

TYPED_TEST(BatchTest, EncodeMatchesSingleCalls)
{
    EXPECT_EQ(
        batch::encode_all(this->points_, this->s_workers, this->s_dims, this->s_bits),
        this->codes_
    );
}

TYPED_TEST(BatchTest, DecodeMatchesSingleCalls)
{
    const auto total = this->s_dims * this->s_bits;
    EXPECT_EQ(
        batch::decode_all(this->codes_, this->s_dims, this->s_workers, total),
        this->points_
    );
}

TYPED_TEST(BatchTest, RangeQueriesMatchSingleCalls)
{
    const auto next = batch::next_all(
        this->codes_, this->rmin_, this->rmax_, this->s_dims, this->s_workers
    );
    const auto prev = batch::prev_all(
        this->codes_, this->rmin_, this->rmax_, this->s_dims, this->s_workers
    );
    const auto inside = batch::in_range_all(
        this->codes_, this->rmin_, this->rmax_, this->s_dims, this->s_workers
    );
    ASSERT_EQ(next.size(), this->codes_.size());
    ASSERT_EQ(prev.size(), this->codes_.size());
    ASSERT_EQ(inside.size(), this->codes_.size());

    for (std::size_t i = 0; i != this->codes_.size(); ++i)
    {
        const auto& code = this->codes_[i];
        EXPECT_EQ(next[i], zcurve::next_in_range(code, this->rmin_, this->rmax_, this->s_dims));
        EXPECT_EQ(prev[i], zcurve::prev_in_range(code, this->rmin_, this->rmax_, this->s_dims));
        EXPECT_EQ(
            static_cast<bool>(inside[i]),
            zcurve::in_range(code, this->rmin_, this->rmax_, this->s_dims)
        ) << "code " << code;
    }
}

TYPED_TEST(BatchTest, WorkerExceptionReachesCaller)
{
    auto points = this->points_;
    points[points.size() / 2] = coordinates{ 1, 2 };
    EXPECT_THROW(
        (void)batch::encode_all(points, this->s_workers, this->s_dims, this->s_bits),
        zcurve::dimension_mismatch
    );

    auto codes = this->codes_;
    codes.back() = -1;
    EXPECT_THROW(
        (void)batch::in_range_all(
            codes, this->rmin_, this->rmax_, this->s_dims, this->s_workers
        ),
        zcurve::negative_value
    );
}

TEST(Batch, EmptyInput)
{
    EXPECT_TRUE(batch::encode_all({}, 4).empty());
    EXPECT_TRUE(batch::decode_all({}, 2, 4).empty());
    EXPECT_TRUE(batch::in_range_all({}, 12, 60, 2, 4).empty());
}

TEST(Batch, BoundsAreCheckedUpFront)
{
    const std::vector<value_type> codes{ 20 };
    EXPECT_THROW((void)batch::next_all(codes, 60, 12, 2, 2), zcurve::invariant_violation);
    EXPECT_THROW((void)batch::prev_all(codes, -1, 12, 2, 2), zcurve::negative_value);
    EXPECT_THROW((void)batch::decode_all(codes, 0, 2), zcurve::dimension_mismatch);
    EXPECT_THROW(
        (void)batch::encode_all({ { 1, 2 } }, 2, 0), zcurve::dimension_mismatch
    );
}

// 2000 thread stacks do not fit a 400 MB address space
[[noreturn]]
auto encode_with_limited_address_space(std::vector<coordinates> const& points) -> void
{
    const rlimit limit{ 400ul << 20, 400ul << 20 };
    if (setrlimit(RLIMIT_AS, &limit) != 0) std::exit(2);
    try
    {
        (void)batch::encode_all(points, 2000);
    }
    catch (std::exception const&)
    {
        std::exit(0);
    }
    std::exit(0);
}

TEST(BatchDeathTest, FailedThreadLaunchIsReportedNotFatal)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    const std::vector<coordinates> points(2000, coordinates{ 1, 2 });
    EXPECT_EXIT(
        encode_with_limited_address_space(points), ::testing::ExitedWithCode(0), ""
    );
}

TEST(Batch, ResolveWorkers)
{
    EXPECT_EQ(batch::resolve_workers(4, 100), 4u);
    EXPECT_EQ(batch::resolve_workers(8, 3), 3u);
    EXPECT_EQ(batch::resolve_workers(8, 0), 1u);
    EXPECT_GE(batch::resolve_workers(0, 100), 1u);
}

TEST(Batch, KnownRangeResults)
{
    const std::vector<value_type> codes{ 20, 27, 61, 5 };
    const auto next = batch::next_all(codes, 12, 60, 2, 2);
    EXPECT_EQ(next[0], 24);
    EXPECT_EQ(next[1], 27);
    EXPECT_FALSE(next[2].has_value());
    EXPECT_EQ(next[3], 12);

    const auto inside = batch::in_range_all(codes, 12, 60, 2, 2);
    EXPECT_EQ(inside, (std::vector<bool>{ false, true, false, false }));
}

} // namespace
