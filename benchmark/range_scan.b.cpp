#include "utility/random.hpp"
#include "utility/stopwatch.hpp"
#include "zcurve/zcurve.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <vector>

namespace
{

auto full_scan(
    std::vector<zcurve::value_type> const& keys, zcurve::value_type const& rmin,
    zcurve::value_type const& rmax, std::size_t dims, std::size_t total_bits
) -> std::size_t
{
    std::size_t matches = 0;
    for (auto const& key : keys)
    {
        if (zcurve::in_range(key, rmin, rmax, dims, total_bits)) ++matches;
    }
    return matches;
}

auto skip_scan(
    std::vector<zcurve::value_type> const& keys, zcurve::value_type const& rmin,
    zcurve::value_type const& rmax, std::size_t dims, std::size_t total_bits
) -> std::size_t
{
    std::size_t matches = 0;
    auto        it      = std::lower_bound(keys.begin(), keys.end(), rmin);
    while (it != keys.end() && *it <= rmax)
    {
        if (zcurve::in_range(*it, rmin, rmax, dims, total_bits))
        {
            ++matches;
            ++it;
            continue;
        }
        const auto next = zcurve::next_in_range(*it, rmin, rmax, dims, total_bits);
        if (!next) break;
        it = std::lower_bound(it, keys.end(), *next);
    }
    return matches;
}

} // namespace

int main()
{
    constexpr std::size_t dims         = 3;
    constexpr std::size_t bits_per_dim = 20;
    constexpr std::size_t n_keys       = 200'000;
    constexpr std::size_t n_queries    = 10;

    utility::random::random<std::uint64_t> rng(42u);
    std::vector<zcurve::coordinates>       points;
    points.reserve(n_keys);
    for (std::size_t n = 0; n != n_keys; ++n)
    {
        const auto p = rng.randpoint(dims, bits_per_dim);
        points.emplace_back(p.begin(), p.end());
    }

    std::vector<zcurve::value_type> keys;
    {
        utility::timing::stopwatch s("encode_all");
        keys = zcurve::batch::encode_all(points, 0, dims, bits_per_dim);
    }
    std::sort(keys.begin(), keys.end());

    const auto   side = rng.randbits(bits_per_dim) / 8 + 1;
    std::size_t  full_total = 0, skip_total = 0;
    std::int64_t full_us = 0, skip_us = 0;
    for (std::size_t q = 0; q != n_queries; ++q)
    {
        zcurve::coordinates lower(dims), upper(dims);
        for (std::size_t i = 0; i != dims; ++i)
        {
            const auto lo = rng.randrange(0, (std::uint64_t{ 1 } << bits_per_dim) - side);
            lower[i]      = lo;
            upper[i]      = lo + side - 1;
        }
        const auto rmin = zcurve::encode(lower, dims, bits_per_dim);
        const auto rmax = zcurve::encode(upper, dims, bits_per_dim);
        {
            utility::timing::stopwatch s("full scan");
            full_total += full_scan(keys, rmin, rmax, dims, dims * bits_per_dim);
            full_us += s.elapsed().count();
        }
        {
            utility::timing::stopwatch s("skip scan");
            skip_total += skip_scan(keys, rmin, rmax, dims, dims * bits_per_dim);
            skip_us += s.elapsed().count();
        }
    }

    std::cout << "matches: full " << full_total << ", skip " << skip_total << '\n'
              << "time:    full " << full_us << "us, skip " << skip_us << "us\n";
    return full_total == skip_total ? 0 : 1;
}
