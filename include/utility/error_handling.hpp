#ifndef INCLUDED_ERROR_HANDLING_UTILITY
#define INCLUDED_ERROR_HANDLING_UTILITY

#include "logging.hpp"
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace utility::error_handling
{

/// @brief Logs the concatenated message parts at error severity and throws them
/// as an exception of type E
/// @tparam E Exception type constructible from std::string
template <typename E>
    requires std::is_base_of_v<std::exception, E> &&
             std::is_constructible_v<E, std::string const&>
[[noreturn]]
inline auto raise(auto&&... parts) -> void
{
    const auto message =
        utility::logging::concat(std::forward<decltype(parts)>(parts)...);
    DEFAULT_SOURCE_LOG_ERROR(message);
    throw E(message);
}

} // namespace utility::error_handling

#endif // INCLUDED_ERROR_HANDLING_UTILITY
