#pragma once

#include "utility/error_handling.hpp"
#include "zcurve/codec.hpp"
#include "zcurve/types.hpp"
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

// Query box and scan parameters of the range scan programs, read from a
// whitespace separated key/value file:
//
//   # 2-D box (2,2)-(6,6) in a 4 bit space
//   dims          2
//   bits_per_dim  4
//   lower         2 2
//   upper         6 6
//   points        1000
//   seed          42
//   workers       4
struct scan_config
{
    static auto parse_config(std::string const& file_name) -> scan_config
    {
        std::ifstream file(file_name);
        if (!file.is_open())
        {
            utility::error_handling::raise<std::runtime_error>(
                "Could not open config file: ", file_name
            );
        }
        return parse_stream(file);
    }

    static auto parse_stream(std::istream& file) -> scan_config
    {
        const int   MAX_LINE_LENGTH = 1024;
        scan_config c;
        std::string var;
        while (!file.eof() && file.good())
        {
            var = "";
            file >> var;
            if (var == "")
            {
                continue;
            }
            else if (var[0] == '#')
            { /* ignore comment line*/
                file.ignore(MAX_LINE_LENGTH, '\n');
            }
            else if (var == "dims")
            {
                file >> c.dims;
            }
            else if (var == "bits_per_dim")
            {
                file >> c.bits_per_dim;
            }
            else if (var == "lower")
            {
                c.lower = read_point(file, c.dims, var);
            }
            else if (var == "upper")
            {
                c.upper = read_point(file, c.dims, var);
            }
            else if (var == "points")
            {
                file >> c.points;
            }
            else if (var == "seed")
            {
                file >> c.seed;
            }
            else if (var == "workers")
            {
                file >> c.workers;
            }
            else
            {
                utility::error_handling::raise<std::runtime_error>(
                    "Unknown config key: ", var
                );
            }

            if (file.fail())
            {
                utility::error_handling::raise<std::runtime_error>(
                    "Malformed value for config key: ", var
                );
            }
        }
        c.validate();
        return c;
    }

    [[nodiscard]]
    auto rmin_code() const -> zcurve::value_type
    {
        return zcurve::encode(lower, dims, bits_per_dim);
    }

    [[nodiscard]]
    auto rmax_code() const -> zcurve::value_type
    {
        return zcurve::encode(upper, dims, bits_per_dim);
    }

    std::size_t         dims{};          /* dimensionality of the code space */
    std::size_t         bits_per_dim{};  /* bits per dimension */
    zcurve::coordinates lower{};         /* inclusive lower corner of the box */
    zcurve::coordinates upper{};         /* inclusive upper corner of the box */
    std::size_t         points{ 1000 };  /* number of random points to scan */
    unsigned int        seed{ 42 };      /* seed of the point generator */
    std::size_t         workers{ 1 };    /* worker threads, 0 -> all cores */

    // Random points are drawn from 64-bit words
    static constexpr std::size_t s_max_bits_per_dim = 64;

private:
    static auto read_point(std::istream& file, std::size_t dims, std::string const& key)
        -> zcurve::coordinates
    {
        if (dims == 0)
        {
            utility::error_handling::raise<std::runtime_error>(
                "Config key '", key, "' needs 'dims' to be set first"
            );
        }
        zcurve::coordinates point(dims);
        for (auto& v : point)
        {
            file >> v;
        }
        return point;
    }

    auto validate() const -> void
    {
        if (dims == 0 || bits_per_dim == 0)
        {
            utility::error_handling::raise<std::runtime_error>(
                "Config needs positive 'dims' and 'bits_per_dim'"
            );
        }
        if (bits_per_dim > s_max_bits_per_dim)
        {
            utility::error_handling::raise<std::runtime_error>(
                "Config 'bits_per_dim' is limited to ", s_max_bits_per_dim, ", got ",
                bits_per_dim
            );
        }
        if (lower.size() != dims || upper.size() != dims)
        {
            utility::error_handling::raise<std::runtime_error>(
                "Config needs 'lower' and 'upper' with ", dims, " coordinates each"
            );
        }
        for (std::size_t i = 0; i != dims; ++i)
        {
            if (lower[i] > upper[i])
            {
                utility::error_handling::raise<std::runtime_error>(
                    "Config box is empty in dimension ", i, ": ", lower[i], " > ",
                    upper[i]
                );
            }
        }
    }
};
