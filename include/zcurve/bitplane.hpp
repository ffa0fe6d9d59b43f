#ifndef ZCURVE_INCLUDED_BITPLANE
#define ZCURVE_INCLUDED_BITPLANE

#include "types.hpp"

namespace zcurve::bitplane
{

// Bit i of a code with D dimensions belongs to plane i % D. Within a plane,
// bit i is less significant than bit i + D.

[[nodiscard]]
auto get_bit(value_type const& n, size_type i) -> bool;

// Number of significant bits; zero for zero.
[[nodiscard]]
auto bit_length(value_type const& n) -> size_type;

[[nodiscard]]
constexpr auto plane_of(size_type i, size_type dims) noexcept -> size_type
{
    return i % dims;
}

/// @brief Writes bit k of value to position dim + k * dims of n, for every such
/// position below total_bits. Bits of value beyond the plane are dropped.
auto scatter_plane(
    value_type& n, size_type dim, size_type dims, size_type total_bits,
    value_type const& value
) -> void;

/// @brief Collects positions dim, dim + dims, ... below total_bits of n into
/// consecutive bits of the result.
[[nodiscard]]
auto gather_plane(
    value_type const& n, size_type dim, size_type dims, size_type total_bits
) -> value_type;

/// @brief Sets bit i of n to lead and the lower bits of the same plane
/// (i - dims, i - 2 * dims, ...) to !lead. lead == true loads "1000...",
/// lead == false loads "0111...". Other planes are left untouched.
auto load_plane(value_type& n, size_type i, size_type dims, bool lead) -> void;

[[nodiscard]]
auto with_plane_loaded(value_type n, size_type i, size_type dims, bool lead)
    -> value_type;

} // namespace zcurve::bitplane

#endif // ZCURVE_INCLUDED_BITPLANE
