/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   parser and serializer for Advanced SubStation override tags
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/container.h"
#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "common/subtitles/override_tags.h"
#include "common/subtitles/subtitles_x.h"

namespace stk::subtitles {

namespace {

// Longer names must come before their prefixes.
std::vector<std::pair<std::string, directive_kind_e>> const s_known_directives{
  { "iclip", directive_kind_e::positioning },
  { "xbord", directive_kind_e::font        },
  { "ybord", directive_kind_e::font        },
  { "xshad", directive_kind_e::font        },
  { "yshad", directive_kind_e::font        },
  { "alpha", directive_kind_e::color       },
  { "clip",  directive_kind_e::positioning },
  { "fscx",  directive_kind_e::font        },
  { "fscy",  directive_kind_e::font        },
  { "bord",  directive_kind_e::font        },
  { "shad",  directive_kind_e::font        },
  { "blur",  directive_kind_e::font        },
  { "fade",  directive_kind_e::positioning },
  { "move",  directive_kind_e::positioning },
  { "frx",   directive_kind_e::font        },
  { "fry",   directive_kind_e::font        },
  { "frz",   directive_kind_e::font        },
  { "fax",   directive_kind_e::font        },
  { "fay",   directive_kind_e::font        },
  { "fsp",   directive_kind_e::font        },
  { "pbo",   directive_kind_e::drawing     },
  { "pos",   directive_kind_e::positioning },
  { "org",   directive_kind_e::positioning },
  { "fad",   directive_kind_e::positioning },
  { "kf",    directive_kind_e::karaoke     },
  { "ko",    directive_kind_e::karaoke     },
  { "an",    directive_kind_e::positioning },
  { "fn",    directive_kind_e::font        },
  { "fs",    directive_kind_e::font        },
  { "fr",    directive_kind_e::font        },
  { "fe",    directive_kind_e::font        },
  { "be",    directive_kind_e::font        },
  { "1c",    directive_kind_e::color       },
  { "2c",    directive_kind_e::color       },
  { "3c",    directive_kind_e::color       },
  { "4c",    directive_kind_e::color       },
  { "1a",    directive_kind_e::color       },
  { "2a",    directive_kind_e::color       },
  { "3a",    directive_kind_e::color       },
  { "4a",    directive_kind_e::color       },
  { "b",     directive_kind_e::emphasis    },
  { "i",     directive_kind_e::emphasis    },
  { "u",     directive_kind_e::emphasis    },
  { "s",     directive_kind_e::emphasis    },
  { "c",     directive_kind_e::color       },
  { "a",     directive_kind_e::positioning },
  { "k",     directive_kind_e::karaoke     },
  { "K",     directive_kind_e::karaoke     },
  { "q",     directive_kind_e::font        },
  { "p",     directive_kind_e::drawing     },
  { "r",     directive_kind_e::reset       },
  { "t",     directive_kind_e::transform   },
};

std::optional<double>
parse_double(std::string const &argument) {
  stk_rational_t value;
  if (!stk::string::parse_floating_point_number_as_rational(argument, value))
    return {};
  return boost::rational_cast<double>(value);
}

std::optional<int64_t>
parse_int(std::string const &argument) {
  int64_t value{};
  if (argument.empty() || !stk::string::parse_number(argument, value))
    return {};
  return value;
}

std::optional<bool>
parse_toggle(std::string const &argument) {
  auto value = parse_int(argument);
  if (!value || ((*value != 0) && (*value != 1)))
    return {};
  return *value == 1;
}

std::string
format_double(double value) {
  return stk::string::normalize_fmt_double_output(value);
}

} // anonymous namespace

// ------------------------------------------------------------

override_tag_parser_c::override_tag_parser_c(std::string text,
                                             bool strict)
  : m_text{std::move(text)}
  , m_strict{strict}
{
}

void
override_tag_parser_c::restart() {
  m_position = 0;
  m_state    = state_e::outside;
  m_unterminated_offset.reset();
}

std::optional<override_token_t>
override_tag_parser_c::next() {
  if (m_position >= m_text.size()) {
    // A block still open at the end cannot happen: the closing brace
    // is located before a block is entered.
    return {};
  }

  if (m_state == state_e::outside) {
    if (m_text[m_position] != '{')
      return read_text();

    auto offset = m_position;

    if (m_text.find('}', m_position + 1) == std::string::npos) {
      mxdebug_if(m_debug, fmt::format("unterminated override block at offset {0}\n", offset));

      if (m_strict)
        throw unterminated_override_block_x{offset};

      if (!m_unterminated_offset)
        m_unterminated_offset = offset;

      ++m_position;
      return override_token_t{override_token_type_e::text, offset, "{"s, {}};
    }

    ++m_position;
    m_state = state_e::inside;

    return override_token_t{override_token_type_e::block_start, offset, "{"s, {}};
  }

  // Inside a block.
  auto c = m_text[m_position];

  if (c == '}') {
    m_state = state_e::outside;
    return override_token_t{override_token_type_e::block_end, m_position++, "}"s, {}};
  }

  if (c == '\\') {
    m_state = state_e::directive;
    return read_directive();
  }

  return read_comment();
}

override_token_t
override_tag_parser_c::read_text() {
  auto start = m_position;

  if ((m_text[m_position] == '\\') && ((m_position + 1) < m_text.size())) {
    auto escape = m_text[m_position + 1];
    auto type   = escape == 'N' ? override_token_type_e::forced_break
                : escape == 'n' ? override_token_type_e::soft_break
                : escape == 'h' ? override_token_type_e::hard_space
                :                 override_token_type_e::text;

    if (type != override_token_type_e::text) {
      m_position += 2;
      return override_token_t{type, start, m_text.substr(start, 2), {}};
    }
  }

  ++m_position;

  while (m_position < m_text.size()) {
    auto c = m_text[m_position];
    if (c == '{')
      break;

    if ((c == '\\') && ((m_position + 1) < m_text.size()) && stk::included_in(m_text[m_position + 1], 'N', 'n', 'h'))
      break;

    ++m_position;
  }

  return override_token_t{override_token_type_e::text, start, m_text.substr(start, m_position - start), {}};
}

override_token_t
override_tag_parser_c::read_directive() {
  auto start = m_position;
  auto depth = 0;

  ++m_position;

  while (m_position < m_text.size()) {
    auto c = m_text[m_position];

    if (c == '}')
      break;
    if ((c == '\\') && !depth)
      break;
    if (c == '(')
      ++depth;
    else if ((c == ')') && depth)
      --depth;

    ++m_position;
  }

  m_state  = state_e::inside;
  auto raw = m_text.substr(start, m_position - start);

  return override_token_t{override_token_type_e::directive, start, raw, classify_directive(raw)};
}

override_token_t
override_tag_parser_c::read_comment() {
  auto start = m_position;

  while ((m_position < m_text.size()) && !stk::included_in(m_text[m_position], '\\', '}'))
    ++m_position;

  auto raw = m_text.substr(start, m_position - start);

  return override_token_t{override_token_type_e::comment, start, raw, override_directive_t{raw, {}, raw, directive_kind_e::comment}};
}

// ------------------------------------------------------------

override_directive_t
classify_directive(std::string const &raw) {
  override_directive_t directive;
  directive.raw = raw;

  auto body = raw.substr(raw.empty() || (raw[0] != '\\') ? 0 : 1);

  for (auto const &[name, kind] : s_known_directives)
    if (balg::starts_with(body, name)) {
      directive.name     = name;
      directive.argument = body.substr(name.size());
      directive.kind     = kind;
      return directive;
    }

  directive.argument = body;

  return directive;
}

/** \brief Compute the attribute change a single directive causes

   Returns nothing for directives that don't map to a style attribute
   (positioning, karaoke, transforms, resets) and for directives whose
   argument cannot be parsed. An empty argument reverts the attribute
   to its value in \c base.
*/
std::optional<style_overrides_t>
directive_delta(override_directive_t const &directive,
                style_c const &base) {
  auto const &name = directive.name;
  auto arg         = stk::string::strip_copy(directive.argument);
  auto reverting   = arg.empty();
  style_overrides_t delta;

  auto set_toggle = [&](std::optional<bool> &target, bool base_value) -> bool {
    auto value = reverting ? std::optional<bool>{base_value} : parse_toggle(arg);
    if (!value)
      return false;
    target = value;
    return true;
  };

  auto set_number = [&](std::optional<double> &target, double base_value) -> bool {
    auto value = reverting ? std::optional<double>{base_value} : parse_double(arg);
    if (!value)
      return false;
    target = value;
    return true;
  };

  auto set_color = [&](std::optional<color_c> &target, color_c base_value) -> bool {
    base_value.m_a = 0;
    auto value     = reverting ? std::optional<color_c>{base_value} : color_c::from_override(arg);
    if (!value)
      return false;
    target = value;
    return true;
  };

  auto set_alpha = [&](std::optional<uint8_t> &target, uint8_t base_value) -> bool {
    auto value = reverting ? std::optional<uint8_t>{base_value} : color_c::alpha_from_override(arg);
    if (!value)
      return false;
    target = value;
    return true;
  };

  auto ok = false;

  if (name == "b") {
    if (reverting) {
      delta.bold = base.m_bold;
      ok         = true;
    } else if (auto weight = parse_int(arg); weight && (*weight >= 0)) {
      delta.bold = (*weight == 1) || (*weight > 400);
      ok         = true;
    }

  } else if (name == "i")
    ok = set_toggle(delta.italic, base.m_italic);

  else if (name == "u")
    ok = set_toggle(delta.underline, base.m_underline);

  else if (name == "s")
    ok = set_toggle(delta.strikeout, base.m_strikeout);

  else if (name == "fn") {
    delta.font_name = reverting ? base.m_font_name : arg;
    ok              = true;

  } else if (name == "fs") {
    // Relative sizes ("\fs+2") are left alone.
    if (reverting || std::isdigit(static_cast<unsigned char>(arg[0])))
      ok = set_number(delta.font_size, base.m_font_size);

  } else if (name == "fscx")
    ok = set_number(delta.scale_x, base.m_scale_x);

  else if (name == "fscy")
    ok = set_number(delta.scale_y, base.m_scale_y);

  else if (name == "fsp")
    ok = set_number(delta.spacing, base.m_spacing);

  else if ((name == "frz") || (name == "fr"))
    ok = set_number(delta.angle, base.m_angle);

  else if (name == "bord")
    ok = set_number(delta.outline, base.m_outline);

  else if (name == "shad")
    ok = set_number(delta.shadow, base.m_shadow);

  else if ((name == "c") || (name == "1c"))
    ok = set_color(delta.primary_color, base.m_primary_color);

  else if (name == "2c")
    ok = set_color(delta.secondary_color, base.m_secondary_color);

  else if (name == "3c")
    ok = set_color(delta.outline_color, base.m_outline_color);

  else if (name == "4c")
    ok = set_color(delta.back_color, base.m_back_color);

  else if (name == "1a")
    ok = set_alpha(delta.primary_alpha, base.m_primary_color.m_a);

  else if (name == "2a")
    ok = set_alpha(delta.secondary_alpha, base.m_secondary_color.m_a);

  else if (name == "3a")
    ok = set_alpha(delta.outline_alpha, base.m_outline_color.m_a);

  else if (name == "4a")
    ok = set_alpha(delta.back_alpha, base.m_back_color.m_a);

  else if (name == "alpha") {
    ok = set_alpha(delta.primary_alpha, base.m_primary_color.m_a);
    if (ok) {
      delta.secondary_alpha = reverting ? base.m_secondary_color.m_a : *delta.primary_alpha;
      delta.outline_alpha   = reverting ? base.m_outline_color.m_a   : *delta.primary_alpha;
      delta.back_alpha      = reverting ? base.m_back_color.m_a      : *delta.primary_alpha;
    }

  } else if (name == "an") {
    auto value = reverting ? std::optional<int64_t>{alignment_to_ass(base.m_alignment)} : parse_int(arg);
    if (value && (*value >= 1) && (*value <= 9)) {
      delta.alignment = static_cast<alignment_e>(*value);
      ok              = true;
    }

  } else if (name == "a") {
    auto value = reverting ? std::optional<int64_t>{alignment_to_ssa(base.m_alignment)} : parse_int(arg);
    if (value && (*value >= 1) && (*value <= 11) && (*value & 3)) {
      delta.alignment = alignment_from_ssa(*value);
      ok              = true;
    }

  } else if (name == "p") {
    if (auto level = parse_int(arg); level && (*level >= 0)) {
      delta.drawing = *level > 0;
      ok            = true;
    }
  }

  if (!ok)
    return {};

  return delta;
}

/** \brief Render attribute deltas as override directives

   The order of the directives is fixed so that equal deltas always
   result in identical text.
*/
std::string
format_delta(style_overrides_t const &delta) {
  std::string result;

  auto toggle = [&result](char const *name, std::optional<bool> const &value) {
    if (value)
      result += fmt::format("\\{0}{1}", name, *value ? 1 : 0);
  };

  auto number = [&result](char const *name, std::optional<double> const &value) {
    if (value)
      result += fmt::format("\\{0}{1}", name, format_double(*value));
  };

  auto color = [&result](char const *name, std::optional<color_c> const &value) {
    if (value)
      result += fmt::format("\\{0}{1}", name, value->to_override());
  };

  auto alpha = [&result](char const *name, std::optional<uint8_t> const &value) {
    if (value)
      result += fmt::format("\\{0}{1}", name, color_c::alpha_to_override(*value));
  };

  if (delta.font_name)
    result += "\\fn" + *delta.font_name;

  number("fs",   delta.font_size);
  toggle("b",    delta.bold);
  toggle("i",    delta.italic);
  toggle("u",    delta.underline);
  toggle("s",    delta.strikeout);
  number("fscx", delta.scale_x);
  number("fscy", delta.scale_y);
  number("fsp",  delta.spacing);
  number("frz",  delta.angle);
  number("bord", delta.outline);
  number("shad", delta.shadow);
  color("c",     delta.primary_color);
  color("2c",    delta.secondary_color);
  color("3c",    delta.outline_color);
  color("4c",    delta.back_color);

  auto const all_alphas_equal = delta.primary_alpha
                             && (delta.primary_alpha == delta.secondary_alpha)
                             && (delta.primary_alpha == delta.outline_alpha)
                             && (delta.primary_alpha == delta.back_alpha);

  if (all_alphas_equal)
    alpha("alpha", delta.primary_alpha);

  else {
    alpha("1a", delta.primary_alpha);
    alpha("2a", delta.secondary_alpha);
    alpha("3a", delta.outline_alpha);
    alpha("4a", delta.back_alpha);
  }

  if (delta.alignment)
    result += fmt::format("\\an{0}", alignment_to_ass(*delta.alignment));

  if (delta.drawing)
    result += fmt::format("\\p{0}", *delta.drawing ? 1 : 0);

  return result;
}

// ------------------------------------------------------------

bool
override_run_t::has_markup()
  const {
  return reset || !delta.empty() || !passthrough.empty();
}

parsed_text_t
parse_runs(std::string const &text,
           bool strict,
           style_c const &base) {
  parsed_text_t result;
  override_run_t run;
  override_tag_parser_c parser{text, strict};

  while (auto token = parser.next()) {
    switch (token->type) {
      case override_token_type_e::block_start:
        // Blocks separated by nothing but other blocks are coalesced.
        if (!run.text.empty()) {
          result.runs.emplace_back(std::move(run));
          run = override_run_t{};
        }
        break;

      case override_token_type_e::directive:
        if (token->directive.kind == directive_kind_e::reset) {
          run.reset = stk::string::strip_copy(token->directive.argument);
          run.delta = style_overrides_t{};

        } else if (auto delta = directive_delta(token->directive, base); delta)
          run.delta.merge(*delta);

        else
          run.passthrough.emplace_back(token->directive);

        break;

      case override_token_type_e::comment:
        run.passthrough.emplace_back(token->directive);
        break;

      case override_token_type_e::block_end:
        break;

      default:
        run.text += token->raw;
    }
  }

  if (!run.text.empty() || run.has_markup())
    result.runs.emplace_back(std::move(run));

  result.unterminated_block_offset = parser.get_unterminated_offset();

  return result;
}

std::string
serialize_runs(std::vector<override_run_t> const &runs,
               style_c const &base) {
  std::string result, pending_block;

  // Unknown after a reset to a named style.
  std::optional<style_c> current{base};

  for (auto const &run : runs) {
    if (run.reset) {
      pending_block += "\\r" + *run.reset;
      current        = run.reset->empty() ? std::optional<style_c>{base} : std::optional<style_c>{};
    }

    auto delta      = current ? run.delta.without_no_ops(*current) : run.delta;
    pending_block  += format_delta(delta);

    // A comment is not delimited by a backslash. It gets a block of
    // its own so that it cannot extend the directive before it.
    for (auto const &directive : run.passthrough) {
      if (directive.kind != directive_kind_e::comment) {
        pending_block += directive.raw;
        continue;
      }

      if (!pending_block.empty())
        result += "{" + pending_block + "}";

      result += "{" + directive.raw + "}";
      pending_block.clear();
    }

    if (current)
      current = resolve_effective(*current, delta);

    if (run.text.empty())
      continue;

    if (!pending_block.empty())
      result += "{" + pending_block + "}";

    result += run.text;
    pending_block.clear();
  }

  if (!pending_block.empty())
    result += "{" + pending_block + "}";

  return result;
}

/** \brief Split text into fragments with their effective styles

   The text is split at every override block. The first fragment is
   always returned even if it is empty. Each fragment's style is
   \c base with all preceding blocks applied; resets to named styles
   are resolved through \c lookup and fall back to \c base.
*/
std::vector<style_fragment_t>
parse_tags(std::string const &text,
           style_c const &base,
           style_lookup_t const &lookup) {
  std::vector<style_fragment_t> fragments;
  override_tag_parser_c parser{text, false};
  auto style = base;
  std::string fragment;

  while (auto token = parser.next()) {
    if (token->type == override_token_type_e::block_start) {
      fragments.emplace_back(fragment, style);
      fragment.clear();

    } else if (token->type == override_token_type_e::directive) {
      if (token->directive.kind == directive_kind_e::reset) {
        auto name         = stk::string::strip_copy(token->directive.argument);
        auto named_style  = !name.empty() && lookup ? lookup(name) : std::optional<style_c>{};
        style             = named_style ? *named_style : base;

      } else if (auto delta = directive_delta(token->directive, base); delta)
        style = resolve_effective(style, *delta);

    } else if (!stk::included_in(token->type, override_token_type_e::comment, override_token_type_e::block_end))
      fragment += token->raw;
  }

  fragments.emplace_back(fragment, style);

  return fragments;
}

std::string
strip_override_blocks(std::string const &text) {
  static QRegularExpression s_block_re{"\\{[^}]*\\}"};

  return to_utf8(Q(text).replace(s_block_re, QString{}));
}

// Blocks left without content are removed as well.
std::string
remove_directives(std::string const &text,
                  std::function<bool(override_directive_t const &)> const &predicate) {
  std::string result, block;
  override_tag_parser_c parser{text, false};

  while (auto token = parser.next()) {
    switch (token->type) {
      case override_token_type_e::block_start:
        block.clear();
        break;

      case override_token_type_e::directive:
        if (!predicate(token->directive))
          block += token->raw;
        break;

      case override_token_type_e::comment:
        block += token->raw;
        break;

      case override_token_type_e::block_end:
        if (!block.empty())
          result += "{" + block + "}";
        break;

      default:
        result += token->raw;
    }
  }

  return result;
}

std::string
unescape_text(std::string const &text) {
  auto result = text;

  balg::replace_all(result, "\\h", " ");
  balg::replace_all(result, "\\n", "\n");
  balg::replace_all(result, "\\N", "\n");

  return result;
}

bool
contains_drawing(std::string const &text) {
  auto fragments = parse_tags(text);
  return std::any_of(fragments.begin(), fragments.end(), [](auto const &fragment) { return fragment.second.m_drawing; });
}

}
