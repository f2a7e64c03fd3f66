/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line handling common to all programs
*/

#pragma once

#include "common/common_pch.h"

namespace stk::cli {

extern std::string g_usage_text;
extern bool g_abort_on_warnings;

void display_usage(int exit_code = 0);
std::vector<std::string> args_in_utf8(int argc, char **argv);
void handle_common_args(std::vector<std::string> &args);

}
