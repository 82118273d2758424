// -*- C++ -*-

#include "intcodec.hpp"
#include <random>

#include <catch2/catch.hpp>

using namespace geohil;

TEST_CASE("Alphabet")
{
  REQUIRE(get_alphabet(2).size() == 4);
  REQUIRE(get_alphabet(4).size() == 16);
  REQUIRE(get_alphabet(6).size() == 64);

  // ascending order and common padding character
  for (int bits_per_char : {2, 4, 6}) {
    const std::string& alphabet = get_alphabet(bits_per_char);

    REQUIRE(std::is_sorted(alphabet.begin(), alphabet.end()));
    REQUIRE(std::adjacent_find(alphabet.begin(), alphabet.end()) == alphabet.end());
    REQUIRE(alphabet[0] == code_zero);
  }

  REQUIRE_THROWS_AS(get_alphabet(3), InvalidArgument);
}

TEST_CASE("check_bits_per_char")
{
  for (int bits_per_char : {2, 4, 6}) {
    REQUIRE_NOTHROW(check_bits_per_char(bits_per_char));
  }

  int invalid = GENERATE(-2, 0, 1, 3, 5, 7, 8, 64);
  REQUIRE_THROWS_AS(check_bits_per_char(invalid), InvalidArgument);
}

TEST_CASE("encode_int")
{
  SECTION("zero is empty")
  {
    REQUIRE(encode_int(0, 2) == "");
    REQUIRE(encode_int(0, 4) == "");
    REQUIRE(encode_int(0, 6) == "");
  }

  SECTION("2 bits")
  {
    REQUIRE(encode_int(3, 2) == "3");
    REQUIRE(encode_int(6, 2) == "12");
    REQUIRE(encode_int(37005, 2) == "21002031");
  }

  SECTION("4 bits")
  {
    REQUIRE(encode_int(255, 4) == "ff");
    REQUIRE(encode_int(4096, 4) == "1000");
    REQUIRE(encode_int(std::numeric_limits<uint64>::max(), 4) == "ffffffffffffffff");
  }

  SECTION("6 bits")
  {
    REQUIRE(encode_int(10, 6) == "@");
    REQUIRE(encode_int(11, 6) == "A");
    REQUIRE(encode_int(37, 6) == "_");
    REQUIRE(encode_int(63, 6) == "z");
    REQUIRE(encode_int(64, 6) == "10");
    REQUIRE(encode_int(uint64(1) << 59, 6) == "V000000000");
    REQUIRE(encode_int(std::numeric_limits<uint64>::max(), 6) == "Ezzzzzzzzzz");
  }

  SECTION("invalid bits per character")
  {
    REQUIRE_THROWS_AS(encode_int(1, 0), InvalidArgument);
    REQUIRE_THROWS_AS(encode_int(1, 5), InvalidArgument);
    REQUIRE_THROWS_AS(encode_int(1, 8), InvalidArgument);
  }
}

TEST_CASE("decode_int")
{
  SECTION("basic")
  {
    REQUIRE(decode_int("", 6) == 0);
    REQUIRE(decode_int("0000", 2) == 0);
    REQUIRE(decode_int("12", 2) == 6);
    REQUIRE(decode_int("00ff", 4) == 255);
    REQUIRE(decode_int("FF", 4) == 255);
    REQUIRE(decode_int("z", 6) == 63);
    REQUIRE(decode_int("V000000000", 6) == uint64(1) << 59);
    REQUIRE(decode_int("Ezzzzzzzzzz", 6) == std::numeric_limits<uint64>::max());
    REQUIRE(decode_int("0ffffffffffffffff", 4) == std::numeric_limits<uint64>::max());
  }

  SECTION("invalid character")
  {
    REQUIRE_THROWS_AS(decode_int("4", 2), InvalidArgument);
    REQUIRE_THROWS_AS(decode_int("g", 4), InvalidArgument);
    REQUIRE_THROWS_AS(decode_int("ab!", 6), InvalidArgument);
    REQUIRE_THROWS_AS(decode_int("a-b", 6), InvalidArgument);
  }

  SECTION("overflow")
  {
    REQUIRE(decode_int("E0000000000", 6) == uint64(15) << 60);
    REQUIRE_THROWS_AS(decode_int("F0000000000", 6), RangeError);
    REQUIRE_THROWS_AS(decode_int("10000000000000000", 4), RangeError);
    REQUIRE_THROWS_AS(decode_int("1" + std::string(32, '0'), 2), RangeError);
  }

  SECTION("invalid bits per character")
  {
    REQUIRE_THROWS_AS(decode_int("0", 5), InvalidArgument);
  }
}

TEST_CASE("Padded codes")
{
  int bits_per_char = GENERATE(2, 4, 6);
  int precision     = 64 / bits_per_char;

  std::mt19937_64 random(bits_per_char);

  for (int i = 0; i < 1000; i++) {
    uint64 a = random();
    uint64 b = random() >> (i % 64);

    std::string code_a = encode_int(a, bits_per_char);
    std::string code_b = encode_int(b, bits_per_char);
    code_a             = std::string(precision + 1 - code_a.size(), code_zero) + code_a;
    code_b             = std::string(precision + 1 - code_b.size(), code_zero) + code_b;

    // padding is transparent and lexical order follows numeric order
    REQUIRE(decode_int(code_a, bits_per_char) == a);
    REQUIRE(decode_int(code_b, bits_per_char) == b);
    REQUIRE((code_a < code_b) == (a < b));
  }
}

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
