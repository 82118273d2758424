// -*- C++ -*-

#include "margin.hpp"

#include <catch2/catch.hpp>

using namespace geohil;

TEST_CASE("error_for_level")
{
  SECTION("whole globe at level 0")
  {
    auto [lng_err, lat_err] = error_for_level(0);

    REQUIRE(lng_err == 180.0);
    REQUIRE(lat_err == 90.0);
  }

  SECTION("level 1 and 30")
  {
    REQUIRE(error_for_level(1) == std::pair<float64, float64>(90.0, 45.0));
    REQUIRE(error_for_level(30).first == 180.0 / (1 << 30));
    REQUIRE(error_for_level(30).second == 90.0 / (1 << 30));
  }

  SECTION("halved with every level")
  {
    int level = GENERATE(range(0, 64));

    auto [lng_err0, lat_err0] = error_for_level(level);
    auto [lng_err1, lat_err1] = error_for_level(level + 1);

    REQUIRE(lng_err1 == lng_err0 / 2);
    REQUIRE(lat_err1 == lat_err0 / 2);
    REQUIRE(lng_err0 == 2 * lat_err0);
  }

  SECTION("negative level")
  {
    REQUIRE_THROWS_AS(error_for_level(-1), RangeError);
  }
}

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
