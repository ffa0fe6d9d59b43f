#include "zcurve/bitplane.hpp"
#include "utility/contracts.hpp"

namespace zcurve::bitplane
{

namespace
{

namespace mp = boost::multiprecision;

inline auto write_bit(value_type& n, size_type i, bool bit) -> void
{
    if (bit)
    {
        mp::bit_set(n, static_cast<unsigned>(i));
    }
    else
    {
        mp::bit_unset(n, static_cast<unsigned>(i));
    }
}

} // namespace

auto get_bit(value_type const& n, size_type i) -> bool
{
    return mp::bit_test(n, static_cast<unsigned>(i));
}

auto bit_length(value_type const& n) -> size_type
{
    if (n.is_zero()) return 0;
    return static_cast<size_type>(mp::msb(n)) + 1;
}

auto scatter_plane(
    value_type& n, size_type dim, size_type dims, size_type total_bits,
    value_type const& value
) -> void
{
    utility::contracts::assert_plane(dim, dims);
    for (size_type pos = dim, k = 0; pos < total_bits; pos += dims, ++k)
    {
        write_bit(n, pos, get_bit(value, k));
    }
}

auto gather_plane(
    value_type const& n, size_type dim, size_type dims, size_type total_bits
) -> value_type
{
    utility::contracts::assert_plane(dim, dims);
    value_type result{};
    for (size_type pos = dim, k = 0; pos < total_bits; pos += dims, ++k)
    {
        if (get_bit(n, pos)) mp::bit_set(result, static_cast<unsigned>(k));
    }
    return result;
}

auto load_plane(value_type& n, size_type i, size_type dims, bool lead) -> void
{
    utility::contracts::assert_plane(plane_of(i, dims), dims);
    write_bit(n, i, lead);
    for (auto pos = i; pos >= dims;)
    {
        pos -= dims;
        write_bit(n, pos, !lead);
    }
}

auto with_plane_loaded(value_type n, size_type i, size_type dims, bool lead)
    -> value_type
{
    load_plane(n, i, dims, lead);
    return n;
}

} // namespace zcurve::bitplane
