// -*- C++ -*-
#include "quantizer.hpp"

GEOHIL_NAMESPACE_BEGIN

BoundaryPolicy to_boundary_policy(const std::string& name)
{
  if (name == "clamp") {
    return BoundaryClamp;
  } else if (name == "strict") {
    return BoundaryStrict;
  }

  throw_error<InvalidArgument>(tfm::format("Invalid boundary policy: `%s`", name));
}

std::string to_string(BoundaryPolicy policy)
{
  return policy == BoundaryStrict ? "strict" : "clamp";
}

void check_coordinate(float64 lng, float64 lat)
{
  if (!(lng >= lng_min && lng <= lng_max)) {
    throw_error<RangeError>(
        tfm::format("Longitude %g out of range [%g, %g]", lng, lng_min, lng_max));
  }

  if (!(lat >= lat_min && lat <= lat_max)) {
    throw_error<RangeError>(
        tfm::format("Latitude %g out of range [%g, %g]", lat, lat_min, lat_max));
  }
}

std::pair<uint64, uint64> coordinate_to_cell(float64 lng, float64 lat, uint64 dim,
                                             BoundaryPolicy policy)
{
  check_coordinate(lng, lat);

  if (is_valid_dim(dim) == false) {
    throw_error<InvalidArgument>(tfm::format("Invalid grid dimension: %d", dim));
  }

  float64 fdim = static_cast<float64>(dim);
  float64 x    = std::floor((lng + lng_max) / (lng_max - lng_min) * fdim); // [0 ... dim]
  float64 y    = std::floor((lat + lat_max) / (lat_max - lat_min) * fdim); // [0 ... dim]

  uint64 ix = static_cast<uint64>(x);
  uint64 iy = static_cast<uint64>(y);

  if (policy == BoundaryClamp) {
    ix = std::min(ix, dim - 1);
    iy = std::min(iy, dim - 1);
  }

  return {ix, iy};
}

std::pair<float64, float64> cell_to_coordinate(uint64 x, uint64 y, uint64 dim)
{
  if (is_valid_dim(dim) == false) {
    throw_error<InvalidArgument>(tfm::format("Invalid grid dimension: %d", dim));
  }

  if (x >= dim || y >= dim) {
    throw_error<PreconditionViolation>(
        tfm::format("Cell (%d, %d) outside of %d x %d grid", x, y, dim, dim));
  }

  float64 fdim = static_cast<float64>(dim);
  float64 lng  = static_cast<float64>(x) / fdim * (lng_max - lng_min) + lng_min;
  float64 lat  = static_cast<float64>(y) / fdim * (lat_max - lat_min) + lat_min;

  return {lng, lat};
}

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
