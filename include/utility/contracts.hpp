#ifndef INCLUDED_UTILITY_CONTRACTS
#define INCLUDED_UTILITY_CONTRACTS

#include "utility_concepts.hpp"
#include <cassert>
#include <concepts>
#include <type_traits>
#include <utility>

namespace utility::contracts
{

template <concepts::Arithmetic T>
[[gnu::always_inline]]
constexpr auto assert_range(T const& i, T const& low, T const& high)
{
    if (std::is_constant_evaluated())
    {
        if constexpr (std::is_signed_v<T>)
        {
            if (i < low) std::unreachable();
        }
        if (i >= high) std::unreachable();
    }
#ifndef NDEBUG
    else
    {
        if constexpr (std::is_signed_v<T>)
        {
            assert(i >= low);
        }
        assert(i < high);
    }
#endif
}

template <concepts::Arithmetic T>
[[gnu::always_inline]]
constexpr auto assert_index(T const& i, T const& size)
{
    assert_range(i, T{}, size);
}

// A plane of a code with `dims` dimensions is addressed by its dimension index
template <std::unsigned_integral T>
[[gnu::always_inline]]
constexpr auto assert_plane(T const& dim, T const& dims)
{
    assert(dims > T{} && "a code needs at least one dimension");
    assert_index(dim, dims);
}

} // namespace utility::contracts

#endif // INCLUDED_UTILITY_CONTRACTS
