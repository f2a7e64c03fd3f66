/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   UTF-8 validation helpers
*/

#pragma once

#include "common/common_pch.h"

namespace stk::utf8 {

std::string fix_invalid(std::string const &str);
bool is_valid(std::string const &str);
std::size_t num_code_points(std::string const &str);

}
