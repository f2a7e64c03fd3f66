/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   conversion from arbitrary character sets to UTF-8
*/

#pragma once

#include "common/common_pch.h"

#include <iconv.h>

class charset_converter_c;
using charset_converter_cptr = std::shared_ptr<charset_converter_c>;

// Converts to UTF-8 with iconv. Converters for UTF-8 itself and for
// character sets iconv doesn't know pass their input through unchanged.
class charset_converter_c {
protected:
  std::string m_charset;
  iconv_t m_handle;

  static std::map<std::string, charset_converter_cptr> ms_converters;

public:
  charset_converter_c(std::string charset);
  charset_converter_c(charset_converter_c const &) = delete;
  ~charset_converter_c();

  charset_converter_c &operator =(charset_converter_c const &) = delete;

  std::string utf8(std::string const &source);
  std::string const &get_charset() const;
  bool is_pass_through() const;

public:
  // An empty name means the locale's character set. Unknown character
  // sets throw stk::invalid_parameter_x unless 'fall_back' is set.
  static charset_converter_cptr init(std::string const &charset, bool fall_back = false);
  static bool is_utf8_charset_name(std::string const &charset);
  static bool is_available(std::string const &charset);
};

extern charset_converter_cptr g_cc_local_utf8;

std::string get_local_charset();
