// -*- C++ -*-
#ifndef _GEOHIL_HPP_
#define _GEOHIL_HPP_

#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#define GEOHIL_NAMESPACE_BEGIN                                                                     \
  namespace geohil                                                                                 \
  {
#define GEOHIL_NAMESPACE_END }

//
// geohil namespace
//
GEOHIL_NAMESPACE_BEGIN

// json
using json = nlohmann::ordered_json;

//
// typedefs namespace
//
namespace typedefs
{
// integer types
using int32  = int32_t;
using int64  = int64_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

// floating point number types
using float32 = float;
using float64 = double;
} // namespace typedefs

using namespace typedefs;

// valid coordinate intervals (both ends inclusive)
constexpr float64 lng_min = -180.0;
constexpr float64 lng_max = +180.0;
constexpr float64 lat_min = -90.0;
constexpr float64 lat_max = +90.0;

// maximum curve level for a 64-bit curve index (dim = 2^32, dim^2 = 2^64)
constexpr int max_level = 32;

// default code length and bits per character
constexpr int default_precision     = 10;
constexpr int default_bits_per_char = 6;

///
/// @brief return if the given number of bits per character is supported
/// @param bits_per_char number of bits encoded by a single character
/// @return true for 2, 4, or 6 and false otherwise
///
inline bool is_valid_bits_per_char(int bits_per_char)
{
  return bits_per_char == 2 || bits_per_char == 4 || bits_per_char == 6;
}

///
/// @brief return if the given grid dimension is a power of two within [1, 2^max_level]
///
inline bool is_valid_dim(uint64 dim)
{
  return dim != 0 && (dim & (dim - 1)) == 0 && dim <= (uint64(1) << max_level);
}

/// grid dimension per axis for the given curve level
inline uint64 level_to_dim(int level)
{
  return uint64(1) << level;
}

///
/// @brief return the curve level encoded by a code
/// @param precision number of characters
/// @param bits_per_char number of bits per character
/// @return level; an odd total number of bits drops the lowest bit
///
inline int get_level(int precision, int bits_per_char)
{
  int64 bits = static_cast<int64>(precision) * bits_per_char;
  return static_cast<int>(std::min<int64>(bits >> 1, std::numeric_limits<int>::max()));
}

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
