// -*- C++ -*-
#ifndef _GEOHIL_MARGIN_HPP_
#define _GEOHIL_MARGIN_HPP_

#include "exception.hpp"
#include "geohil.hpp"

GEOHIL_NAMESPACE_BEGIN

///
/// @brief return the coordinate error of a curve with the given level
/// @param level level of the Hilbert curve
/// @return (lng_error, lat_error), the half width of a grid cell
///
/// The whole globe is a single cell at level 0, which gives (180, 90). The error is halved with
/// every additional level.
///
inline std::pair<float64, float64> error_for_level(int level)
{
  if (level < 0) {
    throw_error<RangeError>(tfm::format("Curve level must not be negative: %d", level));
  }

  float64 unit = std::ldexp(1.0, -level);

  return {180.0 * unit, 90.0 * unit};
}

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
