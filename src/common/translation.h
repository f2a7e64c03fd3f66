/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   strings marked for translation but translated only when displayed
*/

#pragma once

#include "common/common_pch.h"

#include <ostream>

// Help texts are built before the message catalog is bound, so the
// lookup happens in get_translated().
class translatable_string_c {
protected:
  std::string m_untranslated;

public:
  translatable_string_c() = default;
  translatable_string_c(std::string untranslated);
  translatable_string_c(char const *untranslated);

  std::string get_translated() const;
};

#define YT(s) translatable_string_c(s)

inline std::ostream &
operator <<(std::ostream &out,
            translatable_string_c const &s) {
  out << s.get_translated();
  return out;
}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<translatable_string_c> : ostream_formatter {};
#endif
