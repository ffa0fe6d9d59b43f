#include "zcurve/curve_config.hpp"
#include "utility/error_handling.hpp"
#include "zcurve/bitplane.hpp"
#include "zcurve/errors.hpp"
#include <algorithm>
#include <ostream>

namespace zcurve
{

namespace
{

using utility::error_handling::raise;

auto require_dims(size_type dims) -> void
{
    if (dims == 0) raise<dimension_mismatch>("dims must be at least 1");
}

auto require_bits(size_type bits_per_dim) -> void
{
    if (bits_per_dim == 0) raise<width_error>("bits_per_dim must be at least 1");
}

auto require_non_negative(value_type const& v, char const* what) -> void
{
    if (v.sign() < 0) raise<negative_value>(what, " must be non-negative, got ", v);
}

// Smallest number of planes covering bits, never less than one
constexpr auto planes_for(size_type bits, size_type dims) noexcept -> size_type
{
    return std::max<size_type>(1, (bits + dims - 1) / dims);
}

auto pinned_or_derived(size_type dims, size_type largest_bits, optional_size total_bits)
    -> curve_config
{
    if (!total_bits)
    {
        return curve_config{ dims, planes_for(largest_bits, dims) };
    }
    if (*total_bits == 0 || *total_bits % dims != 0)
    {
        raise<width_error>(
            "total_bits must be a positive multiple of dims (", dims, "), got ",
            *total_bits
        );
    }
    return curve_config{ dims, *total_bits / dims };
}

} // namespace

auto curve_config::for_point(
    coordinates const& coords, optional_size dims, optional_size bits_per_dim
) -> curve_config
{
    const auto d = dims.value_or(coords.size());
    require_dims(d);

    size_type widest = 0;
    for (auto const& c : coords)
    {
        require_non_negative(c, "coordinate");
        widest = std::max(widest, bitplane::bit_length(c));
    }

    const curve_config config{ d, bits_per_dim.value_or(std::max<size_type>(1, widest)) };
    config.validate_point(coords);
    return config;
}

auto curve_config::for_code(
    value_type const& code, size_type dims, optional_size total_bits
) -> curve_config
{
    require_dims(dims);
    require_non_negative(code, "code");
    return pinned_or_derived(dims, bitplane::bit_length(code), total_bits);
}

auto curve_config::for_range(
    value_type const& code, value_type const& rmin, value_type const& rmax,
    size_type dims, optional_size total_bits
) -> curve_config
{
    require_dims(dims);
    require_non_negative(code, "code");
    require_non_negative(rmin, "rmin");
    require_non_negative(rmax, "rmax");
    const auto largest = std::max(
        { bitplane::bit_length(code), bitplane::bit_length(rmin),
          bitplane::bit_length(rmax) }
    );
    return pinned_or_derived(dims, largest, total_bits);
}

auto curve_config::validate_point(coordinates const& coords) const -> void
{
    require_dims(dims);
    require_bits(bits_per_dim);
    if (coords.size() != dims)
    {
        raise<dimension_mismatch>("expected ", dims, " coordinates, got ", coords.size());
    }
    for (auto const& c : coords)
    {
        require_non_negative(c, "coordinate");
        if (const auto bits = bitplane::bit_length(c); bits > bits_per_dim)
        {
            raise<width_error>(
                "coordinate needs ", bits, " bits but bits_per_dim is ", bits_per_dim
            );
        }
    }
}

auto curve_config::validate_code(value_type const& code) const -> void
{
    require_dims(dims);
    require_bits(bits_per_dim);
    require_non_negative(code, "code");
}

auto operator<<(std::ostream& os, curve_config const& config) -> std::ostream&
{
    return os << "{dims=" << config.dims << ", bits_per_dim=" << config.bits_per_dim
              << ", total_bits=" << config.total_bits() << '}';
}

} // namespace zcurve
