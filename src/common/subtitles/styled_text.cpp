/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   event text split into lines of uniformly styled segments
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"
#include "common/subtitles/styled_text.h"

namespace stk::subtitles {

std::vector<styled_line_t>
split_styled_lines(std::string const &text,
                   style_c const &base,
                   style_lookup_t const &lookup) {
  std::vector<styled_line_t> lines(1);

  for (auto const &[fragment, style] : parse_tags(text, base, lookup)) {
    auto parts = stk::string::split(unescape_text(fragment), "\n");

    for (auto idx = 0u; idx < parts.size(); ++idx) {
      if (idx > 0)
        lines.emplace_back();

      if (!parts[idx].empty())
        lines.back().push_back({ parts[idx], style });
    }
  }

  return lines;
}

style_lookup_t
make_style_lookup(document_c const &document) {
  return [&document](std::string const &name) -> std::optional<style_c> {
    if (document.has_style(name))
      return document.get_style(name);
    return {};
  };
}

std::vector<styled_line_t>
split_styled_lines(event_c const &event,
                   document_c const &document,
                   warnings_t *warnings) {
  return split_styled_lines(event.get_text(), document.resolve_style(event.m_style, warnings), make_style_lookup(document));
}

}
