/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   decoding raw subtitle file contents into UTF-8 text
*/

#include "common/common_pch.h"

#include <fstream>

#include "common/locale.h"
#include "common/strings/utf8.h"
#include "common/text_input.h"

namespace stk::text_input {

namespace {
debugging_option_c s_debug{"text_input"};
}

bool
detect_byte_order_marker(uint8_t const *buffer,
                         std::size_t size,
                         byte_order_mark_e &byte_order_mark,
                         unsigned int &bom_length) {
  if ((3 <= size) && (buffer[0] == 0xef) && (buffer[1] == 0xbb) && (buffer[2] == 0xbf)) {
    byte_order_mark = byte_order_mark_e::utf8;
    bom_length = 3;
  } else if ((4 <= size) && (buffer[0] == 0xff) && (buffer[1] == 0xfe) && (buffer[2] == 0x00) && (buffer[3] == 0x00)) {
    byte_order_mark = byte_order_mark_e::utf32_le;
    bom_length = 4;
  } else if ((4 <= size) && (buffer[0] == 0x00) && (buffer[1] == 0x00) && (buffer[2] == 0xfe) && (buffer[3] == 0xff)) {
    byte_order_mark = byte_order_mark_e::utf32_be;
    bom_length = 4;
  } else if ((2 <= size) && (buffer[0] == 0xff) && (buffer[1] == 0xfe)) {
    byte_order_mark = byte_order_mark_e::utf16_le;
    bom_length = 2;
  } else if ((2 <= size) && (buffer[0] == 0xfe) && (buffer[1] == 0xff)) {
    byte_order_mark = byte_order_mark_e::utf16_be;
    bom_length = 2;
  } else {
    byte_order_mark = byte_order_mark_e::none;
    bom_length = 0;
  }

  return byte_order_mark_e::none != byte_order_mark;
}

std::optional<std::string>
get_encoding(byte_order_mark_e byte_order_mark) {
  switch (byte_order_mark) {
    case byte_order_mark_e::utf8:     return "UTF-8";
    case byte_order_mark_e::utf16_le: return "UTF-16LE";
    case byte_order_mark_e::utf16_be: return "UTF-16BE";
    case byte_order_mark_e::utf32_le: return "UTF-32LE";
    case byte_order_mark_e::utf32_be: return "UTF-32BE";
    default:                          return {};
  }
}

/** \brief Decode a file's raw bytes into UTF-8

   A byte order marker always wins. Otherwise \c charset is used if
   given and UTF-8 is assumed if it isn't. Invalid UTF-8 sequences are
   replaced with U+FFFD and reported via \c had_invalid_utf8.
*/
decoded_text_t
decode(std::string const &bytes,
       std::string const &charset) {
  decoded_text_t result;

  auto bom        = byte_order_mark_e::none;
  auto bom_length = 0u;

  result.had_byte_order_mark = detect_byte_order_marker(reinterpret_cast<uint8_t const *>(bytes.data()), bytes.size(), bom, bom_length);
  result.encoding            = result.had_byte_order_mark ? *get_encoding(bom)
                             : !charset.empty()           ? charset
                             :                              "UTF-8"s;

  auto content = bytes.substr(bom_length);

  mxdebug_if(s_debug, fmt::format("decoding {0} bytes as {1} (BOM: {2})\n", content.size(), result.encoding, result.had_byte_order_mark));

  if (!charset_converter_c::is_utf8_charset_name(result.encoding))
    content = charset_converter_c::init(result.encoding)->utf8(content);

  result.had_invalid_utf8 = !stk::utf8::is_valid(content);
  result.text             = result.had_invalid_utf8 ? stk::utf8::fix_invalid(content) : content;

  return result;
}

std::string
read_file(std::string const &file_name) {
  std::ifstream in{file_name, std::ios::in | std::ios::binary};
  if (!in)
    throw stk::invalid_parameter_x{fmt::format(FY("The file '{0}' could not be opened for reading: {1}."), file_name, std::strerror(errno))};

  std::ostringstream content;
  content << in.rdbuf();

  return content.str();
}

void
write_file(std::string const &file_name,
           std::string const &content) {
  std::ofstream out{file_name, std::ios::out | std::ios::binary | std::ios::trunc};
  if (!out)
    throw stk::invalid_parameter_x{fmt::format(FY("The file '{0}' could not be opened for writing: {1}."), file_name, std::strerror(errno))};

  out.write(content.data(), content.size());
  if (!out)
    throw stk::invalid_parameter_x{fmt::format(FY("Writing to the file '{0}' failed: {1}."), file_name, std::strerror(errno))};
}

}
