#ifndef ZCURVE_INCLUDED_FIXED_MORTON
#define ZCURVE_INCLUDED_FIXED_MORTON

#include "curve_config.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "utility/error_handling.hpp"
#include "zcurve/bitplane.hpp"
#include <array>
#include <concepts>
#include <cstdint>
#include <libmorton/morton.h>

namespace zcurve
{

// 2-D and 3-D codes that fit a uint64_t, encoded through libmorton. Bit layout
// matches zcurve::encode: coordinate 0 on bit 0, coordinate 1 on bit 1, ...

// Base template - not implemented to force specialization
template <std::unsigned_integral auto Dimension>
class fixed_morton;

// 2D Specialization
template <>
class fixed_morton<2u>
{
public:
    using mask_t      = uint64_t;
    using coord_t     = uint32_t;
    using coord_array = std::array<coord_t, 2>;

    static constexpr size_type s_dim          = 2u;
    static constexpr size_type s_bits_per_dim = 32u;

    [[nodiscard]]
    static constexpr auto max_coordinate() noexcept -> coord_t
    {
        return static_cast<coord_t>((uint64_t{ 1 } << s_bits_per_dim) - 1);
    }

    [[nodiscard]]
    static constexpr auto config() noexcept -> curve_config
    {
        return curve_config{ s_dim, s_bits_per_dim };
    }

    [[nodiscard]]
    static auto encode(coord_array const& coords) -> mask_t
    {
        return libmorton::morton2D_64_encode(coords[0], coords[1]);
    }

    [[nodiscard]]
    static auto decode(mask_t code) -> coord_array
    {
        uint_fast32_t x, y;
        libmorton::morton2D_64_decode(code, x, y);
        return { static_cast<coord_t>(x), static_cast<coord_t>(y) };
    }

    [[nodiscard]]
    static auto to_code(mask_t code) -> value_type
    {
        return value_type(code);
    }

    [[nodiscard]]
    static auto from_code(value_type const& code) -> mask_t
    {
        if (code.sign() < 0 || bitplane::bit_length(code) > config().total_bits())
        {
            utility::error_handling::raise<width_error>(
                "code ", code, " does not fit ", config().total_bits(), " bits"
            );
        }
        return code.convert_to<mask_t>();
    }
};

// 3D Specialization
template <>
class fixed_morton<3u>
{
public:
    using mask_t      = uint64_t;
    using coord_t     = uint32_t;
    using coord_array = std::array<coord_t, 3>;

    static constexpr size_type s_dim          = 3u;
    static constexpr size_type s_bits_per_dim = 21u;

    [[nodiscard]]
    static constexpr auto max_coordinate() noexcept -> coord_t
    {
        return (coord_t{ 1 } << s_bits_per_dim) - 1;
    }

    [[nodiscard]]
    static constexpr auto config() noexcept -> curve_config
    {
        return curve_config{ s_dim, s_bits_per_dim };
    }

    [[nodiscard]]
    static auto encode(coord_array const& coords) -> mask_t
    {
        for (auto c : coords)
        {
            if (c > max_coordinate())
            {
                utility::error_handling::raise<width_error>(
                    "coordinate ", c, " exceeds the 21-bit limit of 3-D 64-bit codes"
                );
            }
        }
        return libmorton::morton3D_64_encode(coords[0], coords[1], coords[2]);
    }

    [[nodiscard]]
    static auto decode(mask_t code) -> coord_array
    {
        uint_fast32_t x, y, z;
        libmorton::morton3D_64_decode(code, x, y, z);
        return { static_cast<coord_t>(x), static_cast<coord_t>(y), static_cast<coord_t>(z) };
    }

    [[nodiscard]]
    static auto to_code(mask_t code) -> value_type
    {
        return value_type(code);
    }

    [[nodiscard]]
    static auto from_code(value_type const& code) -> mask_t
    {
        if (code.sign() < 0 || bitplane::bit_length(code) > config().total_bits())
        {
            utility::error_handling::raise<width_error>(
                "code ", code, " does not fit ", config().total_bits(), " bits"
            );
        }
        return code.convert_to<mask_t>();
    }
};

using morton2d = fixed_morton<2u>;
using morton3d = fixed_morton<3u>;

} // namespace zcurve

#endif // ZCURVE_INCLUDED_FIXED_MORTON
