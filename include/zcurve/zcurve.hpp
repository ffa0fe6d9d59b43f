#ifndef ZCURVE_INCLUDED_ZCURVE
#define ZCURVE_INCLUDED_ZCURVE

#include "batch.hpp"
#include "bitplane.hpp"
#include "codec.hpp"
#include "curve_config.hpp"
#include "errors.hpp"
#include "range.hpp"
#include "types.hpp"

#endif // ZCURVE_INCLUDED_ZCURVE
