#ifndef INCLUDED_UTILITY_MACRO_DEFINITIONS
#define INCLUDED_UTILITY_MACRO_DEFINITIONS

#define UTILITY_CONCATENATE_MACRO_IMPL(a, b) a##b
#define UTILITY_CONCATENATE_MACRO(a, b)      UTILITY_CONCATENATE_MACRO_IMPL(a, b)

#endif // INCLUDED_UTILITY_MACRO_DEFINITIONS
