/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   RGBA colors as used by SubStation styles and override tags
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/parsing.h"
#include "common/subtitles/color.h"

namespace stk::subtitles {

namespace {

uint8_t
validate_channel(int value) {
  if ((value < 0) || (value > 255))
    throw stk::invalid_parameter_x{fmt::format(FY("The color channel value {0} is outside of the range 0..255"), value)};
  return static_cast<uint8_t>(value);
}

} // anonymous namespace

color_c::color_c(int r,
                 int g,
                 int b,
                 int a)
  : m_r{validate_channel(r)}
  , m_g{validate_channel(g)}
  , m_b{validate_channel(b)}
  , m_a{validate_channel(a)}
{
}

bool
color_c::operator ==(color_c const &other)
  const {
  return (m_r == other.m_r) && (m_g == other.m_g) && (m_b == other.m_b) && (m_a == other.m_a);
}

std::string
color_c::to_ass()
  const {
  return fmt::format("&H{0:02X}{1:02X}{2:02X}{3:02X}", m_a, m_b, m_g, m_r);
}

std::string
color_c::to_ssa()
  const {
  return fmt::to_string((static_cast<int64_t>(m_b) << 16) | (static_cast<int64_t>(m_g) << 8) | m_r);
}

std::string
color_c::to_override()
  const {
  return fmt::format("&H{0:02X}{1:02X}{2:02X}&", m_b, m_g, m_r);
}

std::string
color_c::to_html()
  const {
  return fmt::format("#{0:02x}{1:02x}{2:02x}", m_r, m_g, m_b);
}

/** \brief Parse a color from a style line

   Accepted are the ASS notation \c &HAABBGGRR (alpha optional, an
   optional trailing \c &) and SSA's decimal BGR integers. Invalid
   values throw \c stk::invalid_parameter_x.
*/
color_c
color_c::from_substation(std::string const &value) {
  auto stripped = stk::string::strip_copy(value);
  uint64_t bgr{};

  if (balg::istarts_with(stripped, "&h")) {
    stripped.erase(0, 2);
    if (balg::ends_with(stripped, "&"))
      stripped.pop_back();
    bgr = stk::string::from_hex(stripped);

  } else {
    int64_t decimal{};
    if (!stk::string::parse_number(stripped, decimal))
      throw stk::invalid_parameter_x{fmt::format(FY("'{0}' is not a valid color"), value)};
    bgr = static_cast<uint32_t>(decimal);
  }

  return { static_cast<int>(bgr & 0xff), static_cast<int>((bgr >> 8) & 0xff), static_cast<int>((bgr >> 16) & 0xff), static_cast<int>((bgr >> 24) & 0xff) };
}

std::optional<color_c>
color_c::from_override(std::string const &value) {
  static QRegularExpression s_re{"^&?[hH]?([0-9a-fA-F]{1,8})&?$"};

  auto matches = s_re.match(Q(value));
  if (!matches.hasMatch())
    return {};

  auto bgr = stk::string::from_hex(to_utf8(matches.captured(1)));
  return color_c{ static_cast<int>(bgr & 0xff), static_cast<int>((bgr >> 8) & 0xff), static_cast<int>((bgr >> 16) & 0xff) };
}

std::optional<color_c>
color_c::from_html(std::string const &value) {
  static QRegularExpression s_re{"^#([0-9a-fA-F]{6})$"};
  static std::vector<std::pair<std::string, color_c>> const s_named_colors{
    { "white",   {255, 255, 255} },
    { "black",   {  0,   0,   0} },
    { "red",     {255,   0,   0} },
    { "lime",    {  0, 255,   0} },
    { "green",   {  0, 128,   0} },
    { "blue",    {  0,   0, 255} },
    { "yellow",  {255, 255,   0} },
    { "cyan",    {  0, 255, 255} },
    { "magenta", {255,   0, 255} },
    { "gray",    {128, 128, 128} },
  };

  auto stripped = balg::to_lower_copy(stk::string::strip_copy(value));

  for (auto const &[name, color] : s_named_colors)
    if (name == stripped)
      return color;

  auto matches = s_re.match(Q(stripped));
  if (!matches.hasMatch())
    return {};

  auto rgb = stk::string::from_hex(to_utf8(matches.captured(1)));
  return color_c{ static_cast<int>((rgb >> 16) & 0xff), static_cast<int>((rgb >> 8) & 0xff), static_cast<int>(rgb & 0xff) };
}

std::optional<uint8_t>
color_c::alpha_from_override(std::string const &value) {
  static QRegularExpression s_re{"^&?[hH]?([0-9a-fA-F]{1,2})&?$"};

  auto matches = s_re.match(Q(value));
  if (!matches.hasMatch())
    return {};

  return static_cast<uint8_t>(stk::string::from_hex(to_utf8(matches.captured(1))));
}

std::string
color_c::alpha_to_override(uint8_t alpha) {
  return fmt::format("&H{0:02X}&", alpha);
}

color_c
color_c::white() {
  return { 255, 255, 255 };
}

color_c
color_c::red() {
  return { 255, 0, 0 };
}

color_c
color_c::black() {
  return { 0, 0, 0 };
}

std::ostream &
operator <<(std::ostream &out,
            color_c const &color) {
  out << color.to_ass();
  return out;
}

}
