/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   strings marked for translation
*/

#include "common/common_pch.h"

#include "common/translation.h"

translatable_string_c::translatable_string_c(std::string untranslated)
  : m_untranslated{std::move(untranslated)}
{
}

translatable_string_c::translatable_string_c(char const *untranslated)
  : m_untranslated{untranslated ? untranslated : ""}
{
}

std::string
translatable_string_c::get_translated()
  const
{
  if (m_untranslated.empty())
    return {};

  return gettext(m_untranslated.c_str());
}
