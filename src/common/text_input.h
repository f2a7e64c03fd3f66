/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   decoding raw subtitle file contents into UTF-8 text
*/

#pragma once

#include "common/common_pch.h"

namespace stk::text_input {

enum class byte_order_mark_e {
  none,
  utf8,
  utf16_le,
  utf16_be,
  utf32_le,
  utf32_be,
};

struct decoded_text_t {
  std::string encoding, text;
  bool had_byte_order_mark{}, had_invalid_utf8{};
};

bool detect_byte_order_marker(uint8_t const *buffer, std::size_t size, byte_order_mark_e &byte_order_mark, unsigned int &bom_length);
std::optional<std::string> get_encoding(byte_order_mark_e byte_order_mark);

decoded_text_t decode(std::string const &bytes, std::string const &charset = {});
std::string read_file(std::string const &file_name);
void write_file(std::string const &file_name, std::string const &content);

}
