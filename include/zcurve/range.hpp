#ifndef ZCURVE_INCLUDED_RANGE
#define ZCURVE_INCLUDED_RANGE

#include "curve_config.hpp"
#include "types.hpp"
#include <optional>

namespace zcurve
{

enum class scan_direction
{
    next, // BIGMIN: smallest code in the box that is >= the reference code
    prev, // LITMAX: largest code in the box that is <= the reference code
};

/// @brief Scans code, rmin and rmax from the most significant bit down and
/// returns the nearest code inside the box [rmin, rmax] in the given direction,
/// without decoding any of them.
/// @param config Width shared by all three operands, see curve_config::for_range
/// @return The code itself when it lies inside the box; std::nullopt when no
/// code of the box lies in the scan direction
/// @throws invariant_violation if rmin > rmax or the bounds do not describe a box
/// @throws negative_value, dimension_mismatch, width_error for operands or a
/// configuration that curve_config::validate_code rejects
[[nodiscard]]
auto range_bound(
    scan_direction direction, value_type const& code, value_type const& rmin,
    value_type const& rmax, curve_config const& config
) -> std::optional<value_type>;

// BIGMIN
[[nodiscard]]
auto next_in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits = {}
) -> std::optional<value_type>;

// LITMAX
[[nodiscard]]
auto prev_in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits = {}
) -> std::optional<value_type>;

/// @brief Whether code lies inside the box bounded by rmin and rmax, i.e. it is a
/// fixed point of prev_in_range(next_in_range(code)) under one shared width.
[[nodiscard]]
auto in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits = {}
) -> bool;

[[nodiscard]]
auto in_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    curve_config const& config
) -> bool;

} // namespace zcurve

#endif // ZCURVE_INCLUDED_RANGE
