/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   HTML-like markup found in SubRip and WebVTT text
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/styled_text.h"

namespace stk::subtitles::html {

std::string decode_entities(std::string const &text);
std::string encode_entities(std::string const &text);

// Removes all tags and decodes entities.
std::string strip_tags(std::string const &text);

// <b> <i> <u> <s> and their closing tags become override blocks. All
// other tags are left in place.
std::string emphasis_tags_to_override_tags(std::string const &text);

std::string remove_unknown_tags(std::string const &text);

struct tag_support_t {
  bool bold{}, italic{}, underline{}, strikeout{};
};

// Emphasis of each segment as nested tags, in the order b, i, u, s.
std::string format_styled_lines(std::vector<styled_line_t> const &lines, tag_support_t const &support, bool encode = false);

}
