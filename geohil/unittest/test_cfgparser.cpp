// -*- C++ -*-

#include "cfgparser.hpp"

#include <catch2/catch.hpp>

using namespace geohil;

//
// write a temporary configuration file and remove it when going out of scope
//
class TemporaryFile
{
protected:
  std::string filename;

public:
  TemporaryFile(std::string name, std::string content)
  {
    namespace fs = std::filesystem;

    filename = (fs::temp_directory_path() / fs::path(name)).string();

    std::ofstream ofs(filename);
    ofs << content;
    ofs.close();
  }

  ~TemporaryFile()
  {
    std::filesystem::remove(filename);
  }

  std::string get_filename() const
  {
    return filename;
  }
};

TEST_CASE("Basic")
{
  CfgParser parser;
}

TEST_CASE("check_mandatory_sections")
{
  CfgParser parser;

  SECTION("successful")
  {
    json root = {{"codec", json::object()}};

    REQUIRE(parser.check_mandatory_sections(root) == true);
  }

  SECTION("codec is missing")
  {
    json root = {{"parameter", 0}};

    REQUIRE(parser.check_mandatory_sections(root) == false);
  }

  SECTION("not an object")
  {
    json root = json::array({1, 2, 3});

    REQUIRE(parser.check_mandatory_sections(root) == false);
  }
}

TEST_CASE("check_codec")
{
  CfgParser parser;

  json codec = {{"precision", 12}, {"bits_per_char", 4}, {"boundary", "strict"}};

  SECTION("successful")
  {
    REQUIRE(parser.check_codec(codec) == true);
  }

  SECTION("defaults")
  {
    json empty = json::object();

    REQUIRE(parser.check_codec(empty) == true);
  }

  SECTION("invalid values")
  {
    auto check_codec_with_item([&](const std::string key, json value) {
      auto tmp = codec;
      tmp[key] = value;
      return parser.check_codec(tmp);
    });

    REQUIRE(check_codec_with_item("precision", -1) == false);
    REQUIRE(check_codec_with_item("precision", 17) == false);
    REQUIRE(check_codec_with_item("precision", "12") == false);
    REQUIRE(check_codec_with_item("bits_per_char", 5) == false);
    REQUIRE(check_codec_with_item("boundary", "wrap") == false);
  }
}

TEST_CASE("parse_file")
{
  CfgParser parser;

  SECTION("json")
  {
    TemporaryFile file("geohil_test_config.json", R"(
{
  // comments are allowed
  "codec": {
    "precision": 12,
    "bits_per_char": 4,
    "boundary": "strict"
  }
}
)");

    REQUIRE(parser.parse_file(file.get_filename(), false) == true);
    REQUIRE(parser.get_precision() == 12);
    REQUIRE(parser.get_bits_per_char() == 4);
    REQUIRE(parser.get_boundary() == "strict");

    Codec codec(parser.get_codec());
    REQUIRE(codec.get_level() == 24);
    REQUIRE(codec.get_boundary() == BoundaryStrict);
    REQUIRE(codec.encode(-122.4194, 37.7749) == "4b71b06d338b");
  }

  SECTION("toml")
  {
    TemporaryFile file("geohil_test_config.toml", R"(
[codec]
precision     = 8
bits_per_char = 2
)");

    REQUIRE(parser.parse_file(file.get_filename(), false) == true);
    REQUIRE(parser.get_precision() == 8);
    REQUIRE(parser.get_bits_per_char() == 2);
    REQUIRE(parser.get_boundary() == "clamp");

    Codec codec(parser.get_codec());
    REQUIRE(codec.encode(13.4, 52.52) == "21002031");
  }

  SECTION("invalid codec section")
  {
    TemporaryFile file("geohil_test_invalid.json", R"({"codec": {"bits_per_char": 3}})");

    REQUIRE(parser.parse_file(file.get_filename(), false) == false);
  }

  SECTION("broken file")
  {
    TemporaryFile file("geohil_test_broken.json", R"({"codec": )");

    REQUIRE(parser.parse_file(file.get_filename(), false) == false);
  }

  SECTION("unknown extension or missing file")
  {
    TemporaryFile file("geohil_test_config.yaml", "codec:\n  precision: 10\n");

    REQUIRE(parser.parse_file(file.get_filename(), false) == false);
    REQUIRE(parser.parse_file("geohil_no_such_file.json", false) == false);
  }
}

TEST_CASE("overwrite")
{
  CfgParser parser;

  json valid   = {{"codec", {{"precision", 4}}}};
  json invalid = {{"codec", {{"precision", -4}}}};

  REQUIRE_NOTHROW(parser.overwrite(valid));
  REQUIRE(parser.get_precision() == 4);
  REQUIRE_THROWS_AS(parser.overwrite(invalid), InvalidArgument);
  REQUIRE(parser.get_root() == valid);
}

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
