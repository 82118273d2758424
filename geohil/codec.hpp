// -*- C++ -*-
#ifndef _GEOHIL_CODEC_HPP_
#define _GEOHIL_CODEC_HPP_

#include "exception.hpp"
#include "geohil.hpp"
#include "hilbert.hpp"
#include "intcodec.hpp"
#include "margin.hpp"
#include "quantizer.hpp"
#include "xtensorall.hpp"

GEOHIL_NAMESPACE_BEGIN

///
/// @brief encode lng/lat as a geohash on a Hilbert curve
/// @param lng longitude in [-180, 180]
/// @param lat latitude in [-90, 90]
/// @param precision number of characters of the geohash
/// @param bits_per_char number of bits per character (2, 4, or 6)
/// @return geohash of length `precision`
///
/// The geohash carries `precision * bits_per_char` bits, half of which give the level of the
/// curve. The defaults (10 characters of 6 bits) use a level 30 curve.
///
std::string encode(float64 lng, float64 lat, int precision = default_precision,
                   int bits_per_char = default_bits_per_char);

///
/// @brief decode a geohash as lng/lat
/// @param code geohash; its length is taken as the precision
/// @param bits_per_char number of bits per character (2, 4, or 6)
/// @return (lng, lat) of the cell center
///
std::pair<float64, float64> decode(const std::string& code,
                                   int                bits_per_char = default_bits_per_char);

///
/// @brief decode a geohash as lng/lat with error margins
/// @param code geohash; its length is taken as the precision
/// @param bits_per_char number of bits per character (2, 4, or 6)
/// @return (lng, lat, lng_error, lat_error) where (lng, lat) is the cell center
///
std::tuple<float64, float64, float64, float64>
decode_exactly(const std::string& code, int bits_per_char = default_bits_per_char);

///
/// @brief return the Hilbert curve of the given precision as a GeoJSON feature
/// @param precision number of characters of the geohash
/// @param bits_per_char number of bits per character (2, 4, or 6)
/// @return Feature with a LineString through the center of every cell in curve order
///
json hilbert_curve(int precision, int bits_per_char = default_bits_per_char);

///
/// @brief Geohash codec with a fixed configuration
///
/// The configuration is a json object, any key of which may be omitted:
///
///   {"precision": 10, "bits_per_char": 6, "boundary": "clamp"}
///
/// A Codec does not change after construction and may be shared between threads.
///
class Codec
{
protected:
  using CoordArray = xt::xtensor<float64, 2>;

  json           config;        ///< configuration
  int            precision;     ///< number of characters
  int            bits_per_char; ///< number of bits per character
  int            level;         ///< level of Hilbert curve
  BoundaryPolicy boundary;      ///< treatment of lng = 180 and lat = 90

public:
  ///
  /// @brief default configuration
  ///
  static const json& get_default_config();

  ///
  /// @brief constructor
  /// @param object configuration (default values are used for missing keys)
  ///
  Codec(const json& object = json());

  ///
  /// @brief validate configuration
  /// @param object configuration to be checked
  ///
  /// InvalidArgument or RangeError is thrown for an invalid configuration.
  ///
  static void validate(const json& object);

  json get_config() const
  {
    return config;
  }

  int get_precision() const
  {
    return precision;
  }

  int get_bits_per_char() const
  {
    return bits_per_char;
  }

  int get_level() const
  {
    return level;
  }

  BoundaryPolicy get_boundary() const
  {
    return boundary;
  }

  ///
  /// @brief encode lng/lat
  /// @param lng longitude in [-180, 180]
  /// @param lat latitude in [-90, 90]
  /// @return geohash of length `precision`
  ///
  std::string encode(float64 lng, float64 lat) const;

  ///
  /// @brief encode an array of coordinates
  /// @param coord coordinates of shape (N, 2); each row is (lng, lat)
  /// @return N geohashes
  ///
  std::vector<std::string> encode(const CoordArray& coord) const;

  ///
  /// @brief decode a geohash (of any length) as lng/lat
  ///
  std::pair<float64, float64> decode(const std::string& code) const;

  ///
  /// @brief decode geohashes
  /// @param code N geohashes
  /// @return coordinates of shape (N, 2); each row is (lng, lat)
  ///
  CoordArray decode(const std::vector<std::string>& code) const;

  ///
  /// @brief decode a geohash (of any length) as lng/lat with error margins
  ///
  std::tuple<float64, float64, float64, float64> decode_exactly(const std::string& code) const;
};

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
