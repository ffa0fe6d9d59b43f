#include "config.hpp"
#include "utility/logging.hpp"
#include "utility/random.hpp"
#include "zcurve/zcurve.hpp"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <vector>

// Range query over a Z-order sorted key space: matching runs are consumed one
// key at a time, non-matching runs are skipped with a single BIGMIN jump.
int main(int argc, char** argv)
{
    using utility::logging::concat;

    try
    {
        const auto config =
            scan_config::parse_config(argc > 1 ? argv[1] : "range_scan.cfg");
        const auto rmin = config.rmin_code();
        const auto rmax = config.rmax_code();
        DEFAULT_SOURCE_LOG_INFO(concat("query box [", rmin, ", ", rmax, "]"));

        utility::random::random<std::uint64_t> rng(config.seed);
        std::vector<zcurve::coordinates>       points;
        points.reserve(config.points);
        for (std::size_t n = 0; n != config.points; ++n)
        {
            const auto p = rng.randpoint(config.dims, config.bits_per_dim);
            points.emplace_back(p.begin(), p.end());
        }

        auto keys = zcurve::batch::encode_all(
            points, config.workers, config.dims, config.bits_per_dim
        );
        std::sort(keys.begin(), keys.end());
        const auto total_bits = config.dims * config.bits_per_dim;

        std::size_t matches = 0;
        std::size_t jumps   = 0;
        auto        it      = std::lower_bound(keys.begin(), keys.end(), rmin);
        while (it != keys.end() && *it <= rmax)
        {
            if (zcurve::in_range(*it, rmin, rmax, config.dims, total_bits))
            {
                ++matches;
                ++it;
                continue;
            }
            const auto next =
                zcurve::next_in_range(*it, rmin, rmax, config.dims, total_bits);
            if (!next) break;
            ++jumps;
            it = std::lower_bound(it, keys.end(), *next);
        }

        const auto flags = zcurve::batch::in_range_all(
            keys, rmin, rmax, config.dims, config.workers, total_bits
        );
        const auto expected =
            static_cast<std::size_t>(std::count(flags.begin(), flags.end(), true));

        std::cout << "keys:     " << keys.size() << '\n'
                  << "matches:  " << matches << " (full scan: " << expected << ")\n"
                  << "jumps:    " << jumps << '\n';
        return matches == expected ? 0 : 1;
    }
    catch (std::exception const& e)
    {
        std::cerr << "range_scan: " << e.what() << '\n';
        return 1;
    }
}
