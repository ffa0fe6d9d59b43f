#include "zcurve/range.hpp"
#include "utility/error_handling.hpp"
#include "utility/logging.hpp"
#include "zcurve/bitplane.hpp"
#include "zcurve/errors.hpp"

namespace zcurve
{

namespace
{

using utility::error_handling::raise;
using utility::logging::concat;

auto require_ordered(value_type const& rmin, value_type const& rmax) -> void
{
    if (rmin > rmax)
    {
        raise<invariant_violation>("range minimum ", rmin, " exceeds range maximum ", rmax);
    }
}

constexpr auto direction_name(scan_direction direction) noexcept -> char const*
{
    return direction == scan_direction::next ? "next" : "prev";
}

} // namespace

auto range_bound(
    scan_direction direction, value_type const& code, value_type const& rmin,
    value_type const& rmax, curve_config const& config
) -> std::optional<value_type>
{
    config.validate_code(code);
    config.validate_code(rmin);
    config.validate_code(rmax);
    require_ordered(rmin, rmax);

    value_type min = rmin;
    value_type max = rmax;

    // NEXT approaches the box from MIN and prefers the half whose bit is 1, PREV
    // approaches from MAX and prefers the half whose bit is 0.
    const bool  ahead = direction == scan_direction::next;
    value_type& near  = ahead ? min : max;
    value_type& far   = ahead ? max : min;

    std::optional<value_type> candidate;

    for (auto i = config.total_bits(); i-- > 0;)
    {
        const bool c      = bitplane::get_bit(code, i);
        const bool min_at = bitplane::get_bit(min, i);
        const bool max_at = bitplane::get_bit(max, i);

        if (min_at && !max_at)
        {
            raise<invariant_violation>(
                "bit triple (", c, ", 1, 0) at position ", i, ": bounds ", rmin,
                " and ", rmax, " do not describe a box"
            );
        }

        if (min_at == max_at)
        {
            if (c == min_at) continue;

            // The remaining box lies entirely on one side of code
            if (min_at == ahead)
            {
                DEFAULT_SOURCE_LOG_TRACE(concat(
                    direction_name(direction), ": box ahead at bit ", i, ", result ", near
                ));
                return near;
            }
            DEFAULT_SOURCE_LOG_TRACE(concat(
                direction_name(direction), ": box behind at bit ", i, ", result ",
                candidate ? candidate->str() : std::string("none")
            ));
            return candidate;
        }

        // The box straddles bit i of this plane
        if (c == ahead)
        {
            bitplane::load_plane(near, i, config.dims, ahead);
        }
        else
        {
            candidate = bitplane::with_plane_loaded(near, i, config.dims, ahead);
            bitplane::load_plane(far, i, config.dims, !ahead);
        }
        DEFAULT_SOURCE_LOG_TRACE(concat(
            direction_name(direction), ": split at bit ", i, ", min ", min, ", max ", max
        ));
    }

    // Every plane of the box collapsed onto code, so code lies inside it
    return near;
}

auto next_in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits
) -> std::optional<value_type>
{
    const auto config = curve_config::for_range(code, rmin, rmax, dims, total_bits);
    return range_bound(scan_direction::next, code, rmin, rmax, config);
}

auto prev_in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits
) -> std::optional<value_type>
{
    const auto config = curve_config::for_range(code, rmin, rmax, dims, total_bits);
    return range_bound(scan_direction::prev, code, rmin, rmax, config);
}

auto in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits
) -> bool
{
    return in_range(
        code, rmin, rmax, curve_config::for_range(code, rmin, rmax, dims, total_bits)
    );
}

auto in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    curve_config const& config
) -> bool
{
    config.validate_code(code);
    config.validate_code(rmin);
    config.validate_code(rmax);
    require_ordered(rmin, rmax);

    if (code < rmin || rmax < code) return false;
    if (code == rmin || code == rmax) return true;

    const auto next = range_bound(scan_direction::next, code, rmin, rmax, config);
    if (!next) return false;
    const auto back = range_bound(scan_direction::prev, *next, rmin, rmax, config);
    return back == code;
}

} // namespace zcurve
