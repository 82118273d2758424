// -*- C++ -*-
#ifndef _GEOHIL_HILBERT_HPP_
#define _GEOHIL_HILBERT_HPP_

#include "exception.hpp"
#include "geohil.hpp"
#include "xtensorall.hpp"

///
/// Hilbert curve on a dim x dim grid (dim = 2^level)
///
/// The transform between a cell (x, y) and the distance along the curve follows the classic
/// iterative algorithm described at:
///   https://en.wikipedia.org/w/index.php?title=Hilbert_curve&oldid=797332503
/// The forward transform walks the bit planes from the most significant one, while the inverse
/// transform walks them from the least significant one. Both must apply exactly the same quadrant
/// rotation, otherwise they are not inverse to each other.
///

GEOHIL_NAMESPACE_BEGIN

namespace sfc
{
using array1d = xt::xtensor<uint64, 1>;
using array2d = xt::xtensor<uint64, 2>;

/// maximum level for which whole-curve maps may be constructed (4^12 cells)
constexpr int max_map_level = 12;

///
/// @brief rotate and flip a quadrant
/// @param n size of the quadrant
/// @param x x coordinate
/// @param y y coordinate
/// @param rx 1 if in the right half and 0 otherwise
/// @param ry 1 if in the upper half and 0 otherwise
/// @return rotated (x, y)
///
/// The reflection may wrap around for x, y >= n, which is harmless as only the bits below n are
/// used afterwards.
///
inline std::pair<uint64, uint64> rotate(uint64 n, uint64 x, uint64 y, uint64 rx, uint64 ry)
{
  if (ry == 0) {
    if (rx == 1) {
      x = n - 1 - x;
      y = n - 1 - y;
    }
    return {y, x};
  }
  return {x, y};
}

///
/// @brief return if index is a valid curve index of a dim x dim grid
///
inline bool is_valid_index(uint64 index, uint64 dim)
{
  // dim^2 overflows for dim = 2^32, for which every 64-bit value is valid
  return dim > std::numeric_limits<uint32>::max() || index < dim * dim;
}

///
/// @brief convert a cell to the curve index
/// @param x x coordinate in [0, dim)
/// @param y y coordinate in [0, dim)
/// @param dim number of cells per axis (power of two)
/// @return curve index in [0, dim^2)
///
uint64 cell_to_index(uint64 x, uint64 y, uint64 dim);

///
/// @brief convert a curve index to the cell
/// @param index curve index in [0, dim^2)
/// @param dim number of cells per axis (power of two)
/// @return (x, y) in [0, dim)
///
std::pair<uint64, uint64> index_to_cell(uint64 index, uint64 dim);

///
/// @brief construct the whole curve map of the given level
/// @param level level of the curve (up to max_map_level)
/// @param index curve index of cells as index(y, x); resized to (dim, dim)
/// @param coord x and y coordinates of cells in curve order; resized to (dim * dim, 2)
///
void get_map2d(int level, array2d& index, array2d& coord);

///
/// @brief check index array
/// @tparam T typename of arrays
/// @param index curve index of cells
/// @return true if it is a permutation of [0, size) and false otherwise
///
template <typename T>
bool check_index(T& index);

///
/// @brief check locality of 2D map
/// @param coord coordinate array to be checked
/// @param distmax2 maximum allowable distance square between consecutive cells
/// @return true if it is local and false otherwise
///
bool check_locality2d(array2d& coord, const uint64 distmax2 = 1);

} // namespace sfc

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
