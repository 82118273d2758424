// -*- C++ -*-

///
/// Implementation of the Hilbert curve transform
///
#include "hilbert.hpp"

GEOHIL_NAMESPACE_BEGIN

namespace sfc
{
inline void check_dim(uint64 dim)
{
  if (is_valid_dim(dim) == false) {
    throw_error<InvalidArgument>(tfm::format("Invalid grid dimension: %d", dim));
  }
}

uint64 cell_to_index(uint64 x, uint64 y, uint64 dim)
{
  check_dim(dim);

  if (x >= dim || y >= dim) {
    throw_error<PreconditionViolation>(
        tfm::format("Cell (%d, %d) outside of %d x %d grid", x, y, dim, dim));
  }

  uint64 index = 0;

  for (uint64 lvl = dim >> 1; lvl > 0; lvl >>= 1) {
    uint64 rx = (x & lvl) != 0 ? 1 : 0;
    uint64 ry = (y & lvl) != 0 ? 1 : 0;

    index += lvl * lvl * ((3 * rx) ^ ry);
    std::tie(x, y) = rotate(lvl, x, y, rx, ry);
  }

  return index;
}

std::pair<uint64, uint64> index_to_cell(uint64 index, uint64 dim)
{
  check_dim(dim);

  if (is_valid_index(index, dim) == false) {
    throw_error<PreconditionViolation>(
        tfm::format("Curve index %d outside of %d x %d grid", index, dim, dim));
  }

  uint64 x = 0;
  uint64 y = 0;

  for (uint64 lvl = 1; lvl < dim; lvl <<= 1) {
    uint64 rx = 1 & (index >> 1);
    uint64 ry = 1 & (index ^ rx);

    std::tie(x, y) = rotate(lvl, x, y, rx, ry);
    x += lvl * rx;
    y += lvl * ry;
    index >>= 2;
  }

  return {x, y};
}

void get_map2d(int level, array2d& index, array2d& coord)
{
  if (level < 0 || level > max_map_level) {
    throw_error<RangeError>(
        tfm::format("Curve map level %d out of range [0, %d]", level, max_map_level));
  }

  const uint64 dim  = level_to_dim(level);
  const uint64 size = dim * dim;

  // memory allocation
  {
    std::vector<size_t> dims1 = {static_cast<size_t>(dim), static_cast<size_t>(dim)};
    std::vector<size_t> dims2 = {static_cast<size_t>(size), 2};

    index.resize(dims1);
    coord.resize(dims2);
  }

  // calculate ID to coordinate and coordinate to ID maps at once
  for (uint64 id = 0; id < size; id++) {
    auto [ix, iy] = index_to_cell(id, dim);

    index(iy, ix) = id;
    coord(id, 0)  = ix;
    coord(id, 1)  = iy;
  }

  DEBUG1 << tfm::format("Hilbert curve map of level %d with %d cells constructed", level, size);
}

template <typename T>
bool check_index(T& index)
{
  bool status = true;

  auto flatindex = xt::sort(xt::flatten(index));
  for (size_t id = 0; id < flatindex.size(); id++) {
    status = status & (id == flatindex(id));
  }

  return status;
}

bool check_locality2d(array2d& coord, const uint64 distmax2)
{
  bool status = true;

  int64 dx, dy;
  dx = coord(0, 0);
  dy = coord(0, 1);
  for (size_t id = 1; id < coord.shape(0); id++) {
    int64 ix = coord(id, 0);
    int64 iy = coord(id, 1);
    dx       = dx - ix;
    dy       = dy - iy;
    status   = status & (static_cast<uint64>(dx * dx + dy * dy) <= distmax2);
    dx       = ix;
    dy       = iy;
  }

  return status;
}

template bool check_index(array1d& index);
template bool check_index(array2d& index);

} // namespace sfc

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
