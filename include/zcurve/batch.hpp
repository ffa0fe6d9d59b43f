#ifndef ZCURVE_INCLUDED_BATCH
#define ZCURVE_INCLUDED_BATCH

#include "types.hpp"
#include <optional>
#include <vector>

// Maps the per-point functions over sequences on a caller-chosen number of worker
// threads. Results keep the input order. Bound and dimension errors are raised
// before any worker starts; an exception thrown by a worker is rethrown on the
// calling thread once every worker has joined.
namespace zcurve::batch
{

// workers == 0 uses std::thread::hardware_concurrency()
[[nodiscard]]
auto resolve_workers(size_type workers, size_type items) noexcept -> size_type;

[[nodiscard]]
auto encode_all(
    std::vector<coordinates> const& points, size_type workers,
    optional_size dims = {}, optional_size bits_per_dim = {}
) -> std::vector<value_type>;

[[nodiscard]]
auto decode_all(
    std::vector<value_type> const& codes, size_type dims, size_type workers,
    optional_size total_bits = {}
) -> std::vector<coordinates>;

[[nodiscard]]
auto next_all(
    std::vector<value_type> const& codes, value_type const& rmin,
    value_type const& rmax, size_type dims, size_type workers,
    optional_size total_bits = {}
) -> std::vector<std::optional<value_type>>;

[[nodiscard]]
auto prev_all(
    std::vector<value_type> const& codes, value_type const& rmin,
    value_type const& rmax, size_type dims, size_type workers,
    optional_size total_bits = {}
) -> std::vector<std::optional<value_type>>;

[[nodiscard]]
auto in_range_all(
    std::vector<value_type> const& codes, value_type const& rmin,
    value_type const& rmax, size_type dims, size_type workers,
    optional_size total_bits = {}
) -> std::vector<bool>;

} // namespace zcurve::batch

#endif // ZCURVE_INCLUDED_BATCH
