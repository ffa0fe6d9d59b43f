#ifndef ZCURVE_INCLUDED_ERRORS
#define ZCURVE_INCLUDED_ERRORS

#include <stdexcept>

namespace zcurve
{

// Range bounds that cannot describe a box: rmin > rmax, or a bit triple with
// MIN = 1 and MAX = 0 reached during a scan.
class invariant_violation : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// dims == 0, or a coordinate count that differs from dims.
class dimension_mismatch : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// A pinned width that is zero or not a multiple of dims, or a coordinate that
// does not fit the width it is encoded with.
class width_error : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class negative_value : public std::domain_error
{
public:
    using std::domain_error::domain_error;
};

} // namespace zcurve

#endif // ZCURVE_INCLUDED_ERRORS
