// -*- C++ -*-
#include "intcodec.hpp"

GEOHIL_NAMESPACE_BEGIN

namespace
{
int decode_char(char c, int bits_per_char)
{
  // hexadecimal digits are case insensitive
  if (bits_per_char == 4 && c >= 'A' && c <= 'F') {
    c = c - 'A' + 'a';
  }

  const std::string& alphabet = get_alphabet(bits_per_char);

  size_t pos = alphabet.find(c);
  if (pos == std::string::npos) {
    throw_error<InvalidArgument>(
        tfm::format("Invalid character `%c` for %d bits per character", c, bits_per_char));
  }

  return static_cast<int>(pos);
}
} // namespace

void check_bits_per_char(int bits_per_char)
{
  if (is_valid_bits_per_char(bits_per_char) == false) {
    throw_error<InvalidArgument>(
        tfm::format("Number of bits per character must be 2, 4, or 6: %d", bits_per_char));
  }
}

const std::string& get_alphabet(int bits_per_char)
{
  // clang-format off
  static const std::string base4  = "0123";
  static const std::string base16 = "0123456789abcdef";
  static const std::string base64 = "0123456789"                 // 0x30 - 0x39
                                    "@"                          // 0x40
                                    "ABCDEFGHIJKLMNOPQRSTUVWXYZ" // 0x41 - 0x5a
                                    "_"                          // 0x5f
                                    "abcdefghijklmnopqrstuvwxyz";// 0x61 - 0x7a
  // clang-format on

  check_bits_per_char(bits_per_char);

  if (bits_per_char == 2) {
    return base4;
  } else if (bits_per_char == 4) {
    return base16;
  }

  return base64;
}

std::string encode_int(uint64 value, int bits_per_char)
{
  const std::string& alphabet = get_alphabet(bits_per_char);
  const uint64       mask     = (uint64(1) << bits_per_char) - 1;

  std::string code;
  for (; value != 0; value >>= bits_per_char) {
    code.push_back(alphabet[value & mask]);
  }
  std::reverse(code.begin(), code.end());

  return code;
}

uint64 decode_int(const std::string& code, int bits_per_char)
{
  check_bits_per_char(bits_per_char);

  const int overflow = std::numeric_limits<uint64>::digits - bits_per_char;

  uint64 value = 0;
  for (char c : code) {
    int digit = decode_char(c, bits_per_char);

    if ((value >> overflow) != 0) {
      throw_error<RangeError>(tfm::format("Code `%s` does not fit in 64 bits", code));
    }

    value = (value << bits_per_char) | static_cast<uint64>(digit);
  }

  return value;
}

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
