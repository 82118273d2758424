// -*- C++ -*-
#include "codec.hpp"

GEOHIL_NAMESPACE_BEGIN

namespace
{
// check the encoding parameters and return the curve level
int check_encoding(int precision, int bits_per_char)
{
  check_bits_per_char(bits_per_char);

  if (precision < 0) {
    throw_error<RangeError>(tfm::format("Precision must not be negative: %d", precision));
  }

  int level = get_level(precision, bits_per_char);

  if (level > max_level) {
    throw_error<RangeError>(tfm::format("Precision %d with %d bits per character requires "
                                        "level %d exceeding the maximum %d",
                                        precision, bits_per_char, level, max_level));
  }

  return level;
}

std::string encode_with(float64 lng, float64 lat, int precision, int bits_per_char,
                        BoundaryPolicy policy)
{
  const int level = check_encoding(precision, bits_per_char);

  const uint64 dim   = level_to_dim(level);
  auto [x, y]        = coordinate_to_cell(lng, lat, dim, policy);
  const uint64 index = sfc::cell_to_index(x, y, dim);
  std::string  code  = encode_int(index, bits_per_char);

  DEBUG2 << tfm::format("(%.9f, %.9f) => level = %d, cell = (%d, %d), index = %d", lng, lat,
                        level, x, y, index);

  // pad to the precision
  return std::string(precision - code.size(), code_zero) + code;
}

std::tuple<float64, float64, float64, float64> decode_with(const std::string& code,
                                                           int                bits_per_char)
{
  check_bits_per_char(bits_per_char);

  // level of the curve is half of the number of bits
  const size_t bits = code.size() * static_cast<size_t>(bits_per_char);

  if (bits / 2 > static_cast<size_t>(max_level)) {
    throw_error<RangeError>(tfm::format("Code `%s` requires level %d exceeding the maximum %d",
                                        code, bits / 2, max_level));
  }

  const int    level = static_cast<int>(bits / 2);
  const uint64 dim   = level_to_dim(level);
  const uint64 index = decode_int(code, bits_per_char);

  auto [x, y]             = sfc::index_to_cell(index, dim);
  auto [lng, lat]         = cell_to_coordinate(x, y, dim);
  auto [lng_err, lat_err] = error_for_level(level);

  DEBUG2 << tfm::format("`%s` => level = %d, index = %d, cell = (%d, %d)", code, level, index, x,
                        y);

  return {lng + lng_err, lat + lat_err, lng_err, lat_err};
}
} // namespace

std::string encode(float64 lng, float64 lat, int precision, int bits_per_char)
{
  return encode_with(lng, lat, precision, bits_per_char, BoundaryClamp);
}

std::pair<float64, float64> decode(const std::string& code, int bits_per_char)
{
  auto [lng, lat, lng_err, lat_err] = decode_with(code, bits_per_char);

  return {lng, lat};
}

std::tuple<float64, float64, float64, float64> decode_exactly(const std::string& code,
                                                              int                bits_per_char)
{
  return decode_with(code, bits_per_char);
}

json hilbert_curve(int precision, int bits_per_char)
{
  const int level = check_encoding(precision, bits_per_char);

  if (level > sfc::max_map_level) {
    throw_error<RangeError>(tfm::format("Curve level %d too large for curve geometry (max = %d)",
                                        level, sfc::max_map_level));
  }

  const uint64 dim = level_to_dim(level);

  sfc::array2d index;
  sfc::array2d coord;
  sfc::get_map2d(level, index, coord);

  auto [lng_err, lat_err] = error_for_level(level);

  json coordinates = json::array();
  for (size_t id = 0; id < coord.shape(0); id++) {
    auto [lng, lat] = cell_to_coordinate(coord(id, 0), coord(id, 1), dim);
    coordinates.push_back({lng + lng_err, lat + lat_err});
  }

  json feature;
  feature["type"]       = "Feature";
  feature["properties"] = {
      {"precision", precision},
      {"bits_per_char", bits_per_char},
      {"level", level},
  };
  feature["geometry"] = {
      {"type", "LineString"},
      {"coordinates", coordinates},
  };

  return feature;
}

//
// Codec
//
const json& Codec::get_default_config()
{
  static const json default_config = json::parse(R"(
  {
    "precision": 10,
    "bits_per_char": 6,
    "boundary": "clamp"
  }
  )");

  return default_config;
}

Codec::Codec(const json& object)
{
  // set configuration (use default if not specified)
  const json& default_config = get_default_config();

  if (object.is_null() == true) {
    config = default_config;
  } else if (object.is_object() == true) {
    for (auto& element : default_config.items()) {
      config[element.key()] = object.value(element.key(), element.value());
    }
  } else {
    throw_error<InvalidArgument>(
        tfm::format("Codec configuration must be an object: %s", object.dump()));
  }

  validate(config);

  precision     = config["precision"].get<int>();
  bits_per_char = config["bits_per_char"].get<int>();
  level         = get_level(precision, bits_per_char);
  boundary      = to_boundary_policy(config["boundary"].get<std::string>());

  DEBUG1 << tfm::format("Codec with %s", config.dump());
}

void Codec::validate(const json& object)
{
  if (object.is_object() == false) {
    throw_error<InvalidArgument>(
        tfm::format("Codec configuration must be an object: %s", object.dump()));
  }

  const json& default_config = get_default_config();

  json precision     = object.value("precision", default_config["precision"]);
  json bits_per_char = object.value("bits_per_char", default_config["bits_per_char"]);
  json boundary      = object.value("boundary", default_config["boundary"]);

  if (precision.is_number_integer() == false) {
    throw_error<InvalidArgument>(tfm::format("Precision must be an integer: %s", precision.dump()));
  }

  if (bits_per_char.is_number_integer() == false) {
    throw_error<InvalidArgument>(
        tfm::format("Number of bits per character must be an integer: %s", bits_per_char.dump()));
  }

  if (boundary.is_string() == false) {
    throw_error<InvalidArgument>(
        tfm::format("Boundary policy must be a string: %s", boundary.dump()));
  }

  // out-of-range values are mapped to values that are rejected as well
  const int64 p = std::clamp<int64>(precision.get<int64>(), -1, std::numeric_limits<int>::max());
  const int64 b = std::clamp<int64>(bits_per_char.get<int64>(), 0, 64);

  check_encoding(static_cast<int>(p), static_cast<int>(b));
  to_boundary_policy(boundary.get<std::string>());
}

std::string Codec::encode(float64 lng, float64 lat) const
{
  return encode_with(lng, lat, precision, bits_per_char, boundary);
}

std::vector<std::string> Codec::encode(const CoordArray& coord) const
{
  if (coord.shape(1) != 2) {
    throw_error<InvalidArgument>(
        tfm::format("Coordinate array must have shape (N, 2): (%d, %d)", coord.shape(0),
                    coord.shape(1)));
  }

  std::vector<std::string> code(coord.shape(0));

  for (size_t i = 0; i < coord.shape(0); i++) {
    code[i] = encode_with(coord(i, 0), coord(i, 1), precision, bits_per_char, boundary);
  }

  return code;
}

std::pair<float64, float64> Codec::decode(const std::string& code) const
{
  auto [lng, lat, lng_err, lat_err] = decode_with(code, bits_per_char);

  return {lng, lat};
}

Codec::CoordArray Codec::decode(const std::vector<std::string>& code) const
{
  CoordArray coord = xt::zeros<float64>({code.size(), static_cast<size_t>(2)});

  for (size_t i = 0; i < code.size(); i++) {
    auto [lng, lat, lng_err, lat_err] = decode_with(code[i], bits_per_char);

    coord(i, 0) = lng;
    coord(i, 1) = lat;
  }

  return coord;
}

std::tuple<float64, float64, float64, float64> Codec::decode_exactly(const std::string& code) const
{
  return decode_with(code, bits_per_char);
}

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
