// -*- C++ -*-
#ifndef _GEOHIL_INTCODEC_HPP_
#define _GEOHIL_INTCODEC_HPP_

#include "exception.hpp"
#include "geohil.hpp"

///
/// Conversion between unsigned integers and strings of 2, 4, or 6 bits per character
///
/// Every alphabet is in ascending ASCII order, so that equal-length codes sort in the same order
/// as the integers they represent, and starts with '0' which is used for padding.
///
/// - 2 bits : 0123
/// - 4 bits : 0123456789abcdef
/// - 6 bits : 0123456789@ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz
///

GEOHIL_NAMESPACE_BEGIN

/// padding character common to all alphabets
constexpr char code_zero = '0';

///
/// @brief throw InvalidArgument unless the number of bits per character is 2, 4, or 6
///
void check_bits_per_char(int bits_per_char);

///
/// @brief return the alphabet for the given number of bits per character
///
const std::string& get_alphabet(int bits_per_char);

///
/// @brief encode an integer as the shortest string (most significant character first)
/// @param value integer to encode
/// @param bits_per_char number of bits per character (2, 4, or 6)
/// @return encoded string; empty for value = 0
///
std::string encode_int(uint64 value, int bits_per_char);

///
/// @brief decode a string to an integer
/// @param code string to decode; leading padding characters are allowed
/// @param bits_per_char number of bits per character (2, 4, or 6)
/// @return decoded integer
///
uint64 decode_int(const std::string& code, int bits_per_char);

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
