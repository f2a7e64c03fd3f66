/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   parser and serializer for Advanced SubStation override tags
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/style.h"

namespace stk::subtitles {

enum class directive_kind_e {
  emphasis,                     // \b \i \u \s
  color,                        // \c \1c-\4c \alpha \1a-\4a
  font,                         // \fn \fs \fscx \fsp \bord \shad \be \blur \fr* \fa* \q ...
  positioning,                  // \pos \move \org \an \a \clip \fad ...
  karaoke,                      // \k \K \kf \ko
  transform,                    // \t
  drawing,                      // \p \pbo
  reset,                        // \r
  unknown,
  comment,                      // text inside a block that isn't a directive
};

struct override_directive_t {
  std::string raw, name, argument;
  directive_kind_e kind{directive_kind_e::unknown};
};

enum class override_token_type_e {
  text,
  block_start,
  directive,
  comment,
  block_end,
  forced_break,                 // \N
  soft_break,                   // \n
  hard_space,                   // \h
};

struct override_token_t {
  override_token_type_e type{override_token_type_e::text};
  std::size_t offset{};
  std::string raw;
  override_directive_t directive;
};

// Single forward scan over an event's text, producing one token per
// call. A '{' without a matching '}' throws
// unterminated_override_block_x in strict mode; in lenient mode it is
// returned as literal text and remembered.
class override_tag_parser_c {
protected:
  enum class state_e {
    outside,
    inside,
    directive,
  };

  std::string m_text;
  bool m_strict;
  std::size_t m_position{};
  state_e m_state{state_e::outside};
  std::optional<std::size_t> m_unterminated_offset;

  debugging_option_c m_debug{"override_tags"};

public:
  override_tag_parser_c(std::string text, bool strict = true);

  std::optional<override_token_t> next();
  void restart();

  std::optional<std::size_t> get_unterminated_offset() const {
    return m_unterminated_offset;
  }

protected:
  override_token_t read_text();
  override_token_t read_directive();
  override_token_t read_comment();
};

override_directive_t classify_directive(std::string const &raw);
std::optional<style_overrides_t> directive_delta(override_directive_t const &directive, style_c const &base = {});
std::string format_delta(style_overrides_t const &delta);

struct override_run_t {
  std::optional<std::string> reset; // \r; an empty name resets to the event's style
  style_overrides_t delta;
  std::vector<override_directive_t> passthrough;
  std::string text;

  bool has_markup() const;
};

struct parsed_text_t {
  std::vector<override_run_t> runs;
  std::optional<std::size_t> unterminated_block_offset;
};

parsed_text_t parse_runs(std::string const &text, bool strict = true, style_c const &base = {});
std::string serialize_runs(std::vector<override_run_t> const &runs, style_c const &base = {});

using style_lookup_t = std::function<std::optional<style_c>(std::string const &)>;
using style_fragment_t = std::pair<std::string, style_c>;

std::vector<style_fragment_t> parse_tags(std::string const &text, style_c const &base = {}, style_lookup_t const &lookup = {});

std::string strip_override_blocks(std::string const &text);
std::string remove_directives(std::string const &text, std::function<bool(override_directive_t const &)> const &predicate);
std::string unescape_text(std::string const &text);
bool contains_drawing(std::string const &text);

}
