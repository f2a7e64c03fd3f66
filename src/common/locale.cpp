/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   conversion from arbitrary character sets to UTF-8
*/

#include "common/common_pch.h"

#include <cerrno>
#include <clocale>
#include <langinfo.h>

#include "common/locale.h"
#include "common/strings/formatting.h"

charset_converter_cptr g_cc_local_utf8;

std::map<std::string, charset_converter_cptr> charset_converter_c::ms_converters;

namespace {

debugging_option_c s_debug{"locale"};

iconv_t const s_invalid_handle = reinterpret_cast<iconv_t>(-1);

}

charset_converter_c::charset_converter_c(std::string charset)
  : m_charset{std::move(charset)}
  , m_handle{s_invalid_handle}
{
  if (!is_utf8_charset_name(m_charset))
    m_handle = iconv_open("UTF-8", m_charset.c_str());

  mxdebug_if(s_debug, fmt::format("converter for '{0}': {1}\n", m_charset, is_pass_through() ? "pass-through" : "iconv"));
}

charset_converter_c::~charset_converter_c() {
  if (s_invalid_handle != m_handle)
    iconv_close(m_handle);
}

std::string const &
charset_converter_c::get_charset()
  const {
  return m_charset;
}

bool
charset_converter_c::is_pass_through()
  const {
  return s_invalid_handle == m_handle;
}

std::string
charset_converter_c::utf8(std::string const &source) {
  if (is_pass_through() || source.empty())
    return source;

  std::string result;
  std::vector<char> buffer(std::max<std::size_t>(source.length() * 4, 64));

  auto in_buffer = const_cast<char *>(source.data());
  auto in_left   = source.length();

  // Reset the shift state left over from the previous call.
  iconv(m_handle, nullptr, nullptr, nullptr, nullptr);

  while (true) {
    auto out_buffer = buffer.data();
    auto out_left   = buffer.size();
    auto converted  = in_left ? iconv(m_handle, &in_buffer, &in_left, &out_buffer, &out_left)
                              : iconv(m_handle, nullptr, nullptr, &out_buffer, &out_left);

    result.append(buffer.data(), buffer.size() - out_left);

    if (static_cast<std::size_t>(-1) != converted) {
      if (!in_left)
        break;
      continue;
    }

    if (E2BIG == errno)
      continue;

    // Invalid or incomplete sequence: drop one byte and go on.
    if (!in_left)
      break;

    ++in_buffer;
    --in_left;
  }

  return result;
}

charset_converter_cptr
charset_converter_c::init(std::string const &charset,
                          bool fall_back) {
  auto actual_charset = charset.empty() ? get_local_charset() : charset;

  auto itr = ms_converters.find(actual_charset);
  if (itr != ms_converters.end())
    return itr->second;

  if (!is_available(actual_charset) && !fall_back)
    throw stk::invalid_parameter_x{fmt::format(FY("The character set '{0}' is not supported."), actual_charset)};

  auto converter                 = std::make_shared<charset_converter_c>(actual_charset);
  ms_converters[actual_charset]  = converter;

  return converter;
}

bool
charset_converter_c::is_utf8_charset_name(std::string const &charset) {
  auto normalized = stk::string::to_lower_ascii(charset);
  balg::erase_all(normalized, "-");
  balg::erase_all(normalized, "_");

  return normalized == "utf8";
}

bool
charset_converter_c::is_available(std::string const &charset) {
  if (is_utf8_charset_name(charset))
    return true;

  auto handle = iconv_open("UTF-8", charset.c_str());
  if (s_invalid_handle == handle)
    return false;

  iconv_close(handle);

  return true;
}

// ------------------------------------------------------------

std::string
get_local_charset() {
  std::setlocale(LC_CTYPE, "");

  std::string charset = nl_langinfo(CODESET);
  if (charset.empty() || (stk::string::to_lower_ascii(charset) == "ansi_x3.4-1968"))
    charset = "UTF-8";

  return charset;
}
