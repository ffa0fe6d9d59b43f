#ifndef ZCURVE_INCLUDED_CURVE_CONFIG
#define ZCURVE_INCLUDED_CURVE_CONFIG

#include "types.hpp"
#include <iosfwd>

namespace zcurve
{

/// @brief Derived parameters of a Z-order code space: dimensionality, bits per
/// dimension and the total bit width D * bits_per_dim shared by every operand of
/// one call.
struct curve_config
{
    size_type dims{};
    size_type bits_per_dim{};

    [[nodiscard]]
    constexpr auto total_bits() const noexcept -> size_type
    {
        return dims * bits_per_dim;
    }

    /// @brief Resolves the parameters for encoding coords
    /// @param dims Defaults to coords.size(); must equal it when given
    /// @param bits_per_dim Defaults to the bit length of the largest coordinate
    /// (at least 1). A pinned value must hold every coordinate.
    /// @throws dimension_mismatch, width_error, negative_value
    [[nodiscard]]
    static auto for_point(
        coordinates const& coords, optional_size dims = {},
        optional_size bits_per_dim = {}
    ) -> curve_config;

    /// @brief Resolves the parameters for decoding code
    /// @param total_bits Defaults to the smallest multiple of dims covering the
    /// bit length of code. A pinned value must be a positive multiple of dims;
    /// a value smaller than the code drops its high bits.
    /// @throws dimension_mismatch, width_error, negative_value
    [[nodiscard]]
    static auto for_code(
        value_type const& code, size_type dims, optional_size total_bits = {}
    ) -> curve_config;

    /// @brief Resolves the single width shared by the three operands of a range
    /// query, from the largest of them unless pinned.
    /// @throws dimension_mismatch, width_error, negative_value
    [[nodiscard]]
    static auto for_range(
        value_type const& code, value_type const& rmin, value_type const& rmax,
        size_type dims, optional_size total_bits = {}
    ) -> curve_config;

    /// @brief Checks that coords can be encoded under this configuration: one
    /// non-negative coordinate per dimension, none wider than bits_per_dim.
    /// @throws dimension_mismatch, width_error, negative_value
    auto validate_point(coordinates const& coords) const -> void;

    /// @brief Checks that code is a non-negative operand of this configuration.
    /// Bits above total_bits are allowed and ignored.
    /// @throws dimension_mismatch, width_error, negative_value
    auto validate_code(value_type const& code) const -> void;

    friend auto operator==(curve_config const&, curve_config const&) -> bool = default;
};

auto operator<<(std::ostream& os, curve_config const& config) -> std::ostream&;

} // namespace zcurve

#endif // ZCURVE_INCLUDED_CURVE_CONFIG
