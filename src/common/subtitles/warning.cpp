/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   recoverable problems reported by the codecs
*/

#include "common/common_pch.h"

#include "common/subtitles/warning.h"

namespace stk::subtitles {

std::string
warning_t::format()
  const {
  if (line)
    return fmt::format(FY("line {0}: {1}"), *line, message);
  return message;
}

}
