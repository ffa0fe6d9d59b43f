#include "zcurve/codec.hpp"
#include "zcurve/fixed_morton.hpp"
#include <exception>
#include <iostream>

int main()
{
    // Read dimensionality, bits per dimension and one point
    std::size_t dims{}, bits_per_dim{};
    std::cout << "Enter dimensions and bits per dimension: ";
    std::cin >> dims >> bits_per_dim;

    zcurve::coordinates point(dims);
    std::cout << "Enter " << dims << " coordinates: ";
    for (auto& v : point)
    {
        std::cin >> v;
    }
    if (!std::cin)
    {
        std::cerr << "Error: malformed input\n";
        return 1;
    }

    try
    {
        const auto code = zcurve::encode(point, dims, bits_per_dim);
        std::cout << "Morton code: " << code << '\n';

        std::cout << "Decoded:";
        for (auto const& v : zcurve::decode(code, dims, dims * bits_per_dim))
        {
            std::cout << ' ' << v;
        }
        std::cout << '\n';

        // Same code through the 64-bit fast path where it applies
        if (dims == 2 && bits_per_dim <= zcurve::morton2d::s_bits_per_dim)
        {
            const auto fast = zcurve::morton2d::encode(
                { point[0].convert_to<zcurve::morton2d::coord_t>(),
                  point[1].convert_to<zcurve::morton2d::coord_t>() }
            );
            std::cout << "libmorton 2D: " << fast << '\n';
        }
        else if (dims == 3 && bits_per_dim <= zcurve::morton3d::s_bits_per_dim)
        {
            const auto fast = zcurve::morton3d::encode(
                { point[0].convert_to<zcurve::morton3d::coord_t>(),
                  point[1].convert_to<zcurve::morton3d::coord_t>(),
                  point[2].convert_to<zcurve::morton3d::coord_t>() }
            );
            std::cout << "libmorton 3D: " << fast << '\n';
        }
    }
    catch (std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
