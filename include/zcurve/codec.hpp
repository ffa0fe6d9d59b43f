#ifndef ZCURVE_INCLUDED_CODEC
#define ZCURVE_INCLUDED_CODEC

#include "curve_config.hpp"
#include "types.hpp"

namespace zcurve
{

/// @brief Interleaves coords into one Morton code: bit k of coordinate i lands on
/// bit i + k * D of the result.
/// @param coords Non-negative coordinates, one per dimension
/// @param dims Defaults to coords.size()
/// @param bits_per_dim Defaults to the bit length of the largest coordinate. A
/// pinned value narrower than some coordinate is rejected with width_error.
[[nodiscard]]
auto encode(
    coordinates const& coords, optional_size dims = {}, optional_size bits_per_dim = {}
) -> value_type;

// Rejects coords the same way as the overload above, see
// curve_config::validate_point
[[nodiscard]]
auto encode(coordinates const& coords, curve_config const& config) -> value_type;

/// @brief Gathers bits {i, i + D, i + 2D, ...} below the total width into
/// coordinate i. Inverse of encode under the same dims and width.
/// @param total_bits Defaults to the smallest multiple of dims covering code. A
/// pinned width below the code's bit length drops the high bits.
[[nodiscard]]
auto decode(value_type const& code, size_type dims, optional_size total_bits = {})
    -> coordinates;

[[nodiscard]]
auto decode(value_type const& code, curve_config const& config) -> coordinates;

} // namespace zcurve

#endif // ZCURVE_INCLUDED_CODEC
