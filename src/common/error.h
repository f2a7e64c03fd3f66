/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   base classes for exceptions
*/

#pragma once

#include "common/common_pch.h"

#include <ostream>

namespace stk {

// All exceptions thrown by SubTextKit derive from this class.
class exception: public std::exception {
protected:
  std::string m_message;

public:
  exception() = default;
  exception(std::string message)
    : m_message{std::move(message)}
  {
  }

  virtual const char *what() const noexcept override {
    return m_message.empty() ? "unspecified SubTextKit error" : m_message.c_str();
  }
};

// A caller passed an argument outside the documented range.
class invalid_parameter_x: public exception {
public:
  invalid_parameter_x()
    : exception{"invalid parameter in function call"}
  {
  }

  invalid_parameter_x(std::string message)
    : exception{std::move(message)}
  {
  }
};

inline std::ostream &
operator <<(std::ostream &out,
            exception const &ex) {
  out << ex.what();
  return out;
}

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<stk::exception> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
