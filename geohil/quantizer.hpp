// -*- C++ -*-
#ifndef _GEOHIL_QUANTIZER_HPP_
#define _GEOHIL_QUANTIZER_HPP_

#include "exception.hpp"
#include "geohil.hpp"

GEOHIL_NAMESPACE_BEGIN

///
/// Treatment of the closed upper ends of the coordinate intervals
///
/// `lng = 180` and `lat = 90` are one past the last cell of the grid. With BoundaryClamp they are
/// folded into the last cell. With BoundaryStrict the out-of-range cell is returned as is and
/// rejected later by the curve transform.
///
enum BoundaryPolicy {
  BoundaryClamp  = 0,
  BoundaryStrict = 1,
};

///
/// @brief convert boundary policy name ("clamp" or "strict") to enum
///
BoundaryPolicy to_boundary_policy(const std::string& name);

///
/// @brief convert boundary policy enum to its name
///
std::string to_string(BoundaryPolicy policy);

///
/// @brief check that lng/lat is within the valid intervals
/// @param lng longitude in [-180, 180]
/// @param lat latitude in [-90, 90]
///
/// RangeError is thrown otherwise (NaN included).
///
void check_coordinate(float64 lng, float64 lat);

///
/// @brief convert lng/lat to the lower-left cell of a dim x dim grid
/// @param lng longitude in [-180, 180]; corresponds to x
/// @param lat latitude in [-90, 90]; corresponds to y
/// @param dim number of cells per axis (power of two)
/// @param policy boundary policy
/// @return (x, y)
///
std::pair<uint64, uint64> coordinate_to_cell(float64 lng, float64 lat, uint64 dim,
                                             BoundaryPolicy policy = BoundaryClamp);

///
/// @brief convert a cell of a dim x dim grid to lng/lat of its lower-left corner
/// @param x cell index in [0, dim); corresponds to longitude
/// @param y cell index in [0, dim); corresponds to latitude
/// @param dim number of cells per axis (power of two)
/// @return (lng, lat)
///
std::pair<float64, float64> cell_to_coordinate(uint64 x, uint64 y, uint64 dim);

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
