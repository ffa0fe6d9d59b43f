#include "zcurve/batch.hpp"
#include "utility/error_handling.hpp"
#include "utility/logging.hpp"
#include "zcurve/codec.hpp"
#include "zcurve/curve_config.hpp"
#include "zcurve/errors.hpp"
#include "zcurve/range.hpp"
#include <algorithm>
#include <exception>
#include <thread>

namespace zcurve::batch
{

namespace
{

// Worker w handles indices w, w + workers, w + 2 * workers, ...
template <typename Result, typename Fn>
auto fan_out(size_type count, size_type workers, Fn const& fn) -> std::vector<Result>
{
    std::vector<Result> results(count);
    const auto n_threads = resolve_workers(workers, count);
    DEFAULT_SOURCE_LOG_DEBUG(utility::logging::concat(
        "dispatching ", count, " items over ", n_threads, " workers"
    ));

    std::vector<std::exception_ptr> failures(n_threads);
    {
        // Joined on scope exit, also when launching a later worker throws
        std::vector<std::jthread> threads;
        threads.reserve(n_threads);
        for (size_type w = 0; w != n_threads; ++w)
        {
            threads.emplace_back(
                [&, w]
                {
                    LOGGING_UTILITY_SCOPED_ADD_TAG("batch")
                    try
                    {
                        for (auto i = w; i < count; i += n_threads)
                        {
                            results[i] = fn(i);
                        }
                    }
                    catch (...)
                    {
                        failures[w] = std::current_exception();
                    }
                }
            );
        }
    }

    for (auto const& failure : failures)
    {
        if (failure) std::rethrow_exception(failure);
    }
    return results;
}

auto require_bounds(
    value_type const& rmin, value_type const& rmax, size_type dims,
    optional_size total_bits
) -> void
{
    [[maybe_unused]] const auto config =
        curve_config::for_range(rmin, rmin, rmax, dims, total_bits);
    if (rmin > rmax)
    {
        utility::error_handling::raise<invariant_violation>(
            "range minimum ", rmin, " exceeds range maximum ", rmax
        );
    }
}

} // namespace

auto resolve_workers(size_type workers, size_type items) noexcept -> size_type
{
    if (workers == 0)
    {
        workers = std::max<size_type>(1, std::thread::hardware_concurrency());
    }
    return std::clamp<size_type>(workers, 1, std::max<size_type>(1, items));
}

auto encode_all(
    std::vector<coordinates> const& points, size_type workers, optional_size dims,
    optional_size bits_per_dim
) -> std::vector<value_type>
{
    if (dims && *dims == 0)
    {
        utility::error_handling::raise<dimension_mismatch>("dims must be at least 1");
    }
    return fan_out<value_type>(
        points.size(), workers,
        [&](size_type i) { return encode(points[i], dims, bits_per_dim); }
    );
}

auto decode_all(
    std::vector<value_type> const& codes, size_type dims, size_type workers,
    optional_size total_bits
) -> std::vector<coordinates>
{
    if (dims == 0)
    {
        utility::error_handling::raise<dimension_mismatch>("dims must be at least 1");
    }
    return fan_out<coordinates>(
        codes.size(), workers,
        [&](size_type i) { return decode(codes[i], dims, total_bits); }
    );
}

auto next_all(
    std::vector<value_type> const& codes, value_type const& rmin,
    value_type const& rmax, size_type dims, size_type workers, optional_size total_bits
) -> std::vector<std::optional<value_type>>
{
    require_bounds(rmin, rmax, dims, total_bits);
    return fan_out<std::optional<value_type>>(
        codes.size(), workers,
        [&](size_type i) { return next_in_range(codes[i], rmin, rmax, dims, total_bits); }
    );
}

auto prev_all(
    std::vector<value_type> const& codes, value_type const& rmin,
    value_type const& rmax, size_type dims, size_type workers, optional_size total_bits
) -> std::vector<std::optional<value_type>>
{
    require_bounds(rmin, rmax, dims, total_bits);
    return fan_out<std::optional<value_type>>(
        codes.size(), workers,
        [&](size_type i) { return prev_in_range(codes[i], rmin, rmax, dims, total_bits); }
    );
}

auto in_range_all(
    std::vector<value_type> const& codes, value_type const& rmin,
    value_type const& rmax, size_type dims, size_type workers, optional_size total_bits
) -> std::vector<bool>
{
    require_bounds(rmin, rmax, dims, total_bits);
    // std::vector<bool> elements share words, so workers write to chars
    const auto flags = fan_out<char>(
        codes.size(), workers,
        [&](size_type i) -> char
        { return in_range(codes[i], rmin, rmax, dims, total_bits) ? 1 : 0; }
    );
    return std::vector<bool>(flags.begin(), flags.end());
}

} // namespace zcurve::batch
