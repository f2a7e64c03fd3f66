/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   recoverable problems reported by the codecs
*/

#pragma once

#include "common/common_pch.h"

namespace stk::subtitles {

enum class warning_type_e {
  skipped_record,
  unterminated_override_block,
  unresolved_style_reference,
  unsupported_feature_dropped,
  unsupported_feature_approximated,
  invalid_utf8,
};

struct warning_t {
  warning_type_e type;
  std::optional<unsigned int> line;
  std::string message;

  std::string format() const;
};

using warnings_t = std::vector<warning_t>;

}
