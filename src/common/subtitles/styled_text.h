/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   event text split into lines of uniformly styled segments
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/document.h"
#include "common/subtitles/override_tags.h"

namespace stk::subtitles {

struct styled_segment_t {
  std::string text;
  style_c style;
};

using styled_line_t = std::vector<styled_segment_t>;

// Override blocks are applied and removed, escapes resolved. Segments
// without text are omitted, but lines are kept even if empty.
std::vector<styled_line_t> split_styled_lines(std::string const &text, style_c const &base, style_lookup_t const &lookup = {});
std::vector<styled_line_t> split_styled_lines(event_c const &event, document_c const &document, warnings_t *warnings = nullptr);

style_lookup_t make_style_lookup(document_c const &document);

}
