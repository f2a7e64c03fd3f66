/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   RGBA colors as used by SubStation styles and override tags
*/

#pragma once

#include "common/common_pch.h"

#include <boost/operators.hpp>

namespace stk::subtitles {

// The alpha channel follows SubStation semantics: 0 is fully opaque,
// 255 fully transparent.
class color_c: boost::equality_comparable<color_c> {
public:
  uint8_t m_r{}, m_g{}, m_b{}, m_a{};

public:
  color_c() = default;
  color_c(int r, int g, int b, int a = 0);

  bool operator ==(color_c const &other) const;

  std::string to_ass() const;
  std::string to_ssa() const;
  std::string to_override() const;
  std::string to_html() const;

  static color_c from_substation(std::string const &value);
  static std::optional<color_c> from_override(std::string const &value);
  static std::optional<color_c> from_html(std::string const &value);
  static std::optional<uint8_t> alpha_from_override(std::string const &value);
  static std::string alpha_to_override(uint8_t alpha);

  static color_c white();
  static color_c red();
  static color_c black();
};

std::ostream &operator <<(std::ostream &out, color_c const &color);

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<stk::subtitles::color_c> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
