#ifndef ZCURVE_INCLUDED_TYPES
#define ZCURVE_INCLUDED_TYPES

#include <boost/multiprecision/cpp_int.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace zcurve
{

// Codes and coordinates are unbounded; dims * bits_per_dim has no upper limit
using value_type  = boost::multiprecision::cpp_int;
using size_type   = std::size_t;
using coordinates = std::vector<value_type>;

using optional_size = std::optional<size_type>;

} // namespace zcurve

#endif // ZCURVE_INCLUDED_TYPES
