#pragma once

#include <type_traits>

namespace utility::concepts
{

template <typename T>
concept Arithmetic = std::is_arithmetic_v<T>;

} // namespace utility::concepts
