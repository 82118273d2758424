// -*- C++ -*-
#ifndef _GEOHIL_EXCEPTION_HPP_
#define _GEOHIL_EXCEPTION_HPP_

#include "geohil.hpp"
#include <stdexcept>

GEOHIL_NAMESPACE_BEGIN

///
/// @brief coordinate, precision, or level outside of the supported range
///
class RangeError : public std::out_of_range
{
public:
  explicit RangeError(const std::string& message) : std::out_of_range(message)
  {
  }
};

///
/// @brief unsupported argument such as bits per character or code character
///
class InvalidArgument : public std::invalid_argument
{
public:
  explicit InvalidArgument(const std::string& message) : std::invalid_argument(message)
  {
  }
};

///
/// @brief input to the curve transform outside of the grid or the index range
///
class PreconditionViolation : public std::logic_error
{
public:
  explicit PreconditionViolation(const std::string& message) : std::logic_error(message)
  {
  }
};

///
/// @brief log the message and throw the given exception
/// @tparam T_error exception type
/// @param message error message
///
template <typename T_error>
[[noreturn]] void throw_error(const std::string& message)
{
  ERROR << message;
  throw T_error(message);
}

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
