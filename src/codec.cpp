#include "zcurve/codec.hpp"
#include "utility/logging.hpp"
#include "zcurve/bitplane.hpp"

namespace zcurve
{

auto encode(coordinates const& coords, optional_size dims, optional_size bits_per_dim)
    -> value_type
{
    const auto config = curve_config::for_point(coords, dims, bits_per_dim);
    DEFAULT_SOURCE_LOG_DEBUG(utility::logging::concat(
        "encode ", coords.size(), " coordinates with ", config
    ));
    return encode(coords, config);
}

auto encode(coordinates const& coords, curve_config const& config) -> value_type
{
    config.validate_point(coords);

    value_type code{};
    for (size_type i = 0; i != coords.size(); ++i)
    {
        bitplane::scatter_plane(code, i, config.dims, config.total_bits(), coords[i]);
    }
    return code;
}

auto decode(value_type const& code, size_type dims, optional_size total_bits)
    -> coordinates
{
    const auto config = curve_config::for_code(code, dims, total_bits);
    DEFAULT_SOURCE_LOG_DEBUG(
        utility::logging::concat("decode ", code, " with ", config)
    );
    return decode(code, config);
}

auto decode(value_type const& code, curve_config const& config) -> coordinates
{
    config.validate_code(code);

    coordinates coords;
    coords.reserve(config.dims);
    for (size_type i = 0; i != config.dims; ++i)
    {
        coords.push_back(bitplane::gather_plane(code, i, config.dims, config.total_bits()));
    }
    return coords;
}

} // namespace zcurve
