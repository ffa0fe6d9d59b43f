#ifndef INCLUDED_RANDOM_NUMBER_GENERATOR
#define INCLUDED_RANDOM_NUMBER_GENERATOR

#include <cassert>
#include <concepts>
#include <cstddef>
#include <limits>
#include <random>
#include <vector>

namespace utility::random
{

template <std::unsigned_integral T>
class random
{
public:
    using value_type = T;

    random(unsigned int seed = std::random_device{}()) noexcept
    {
        seed_engine(seed);
    }

    /// @brief Generates a number in the range [min, max]
    /// @param min Inclusive lower bound
    /// @param max Inclusive upper bound
    /// @return Number of type T uniformly distributed in the range [min, max]
    [[nodiscard]]
    inline auto randrange(value_type min, value_type max) noexcept -> value_type
    {
        using distribution_t = std::uniform_int_distribution<value_type>;
        assert(min <= max);
        distribution_t uniform_dist(min, max);
        return uniform_dist(random_engine_);
    }

    /// @brief Generates a number below 2^bits
    [[nodiscard]]
    inline auto randbits(std::size_t bits) noexcept -> value_type
    {
        constexpr auto digits =
            static_cast<std::size_t>(std::numeric_limits<value_type>::digits);
        assert(bits >= 1 && bits <= digits);
        const auto max = bits == digits
                           ? std::numeric_limits<value_type>::max()
                           : static_cast<value_type>((value_type{ 1 } << bits) - 1);
        return randrange(value_type{}, max);
    }

    /// @brief Generates dims numbers, each below 2^bits
    [[nodiscard]]
    inline auto randpoint(std::size_t dims, std::size_t bits) -> std::vector<value_type>
    {
        std::vector<value_type> point(dims);
        for (auto& v : point)
        {
            v = randbits(bits);
        }
        return point;
    }

    inline auto seed_engine(unsigned int seed) noexcept -> void
    {
        random_engine_.seed(seed);
    }

private:
    std::mt19937_64 random_engine_;
};

} // namespace utility::random

#endif // INCLUDED_RANDOM_NUMBER_GENERATOR
