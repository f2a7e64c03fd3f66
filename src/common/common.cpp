/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   helper functions, common variables
*/

#include "common/common_pch.h"

#include <clocale>

#include "common/locale.h"

unsigned int verbose = 1;

namespace {

std::string s_program_name;
std::vector<std::function<void()>> s_exit_functions;

}

void
mxrun_before_exit(std::function<void()> function) {
  s_exit_functions.emplace_back(std::move(function));
}

void
mxexit(int code) {
  while (!s_exit_functions.empty()) {
    auto function = std::move(s_exit_functions.front());
    s_exit_functions.erase(s_exit_functions.begin());
    function();
  }

  std::exit(code);
}

void
stk_common_init(std::string const &program_name) {
  s_program_name = program_name;

  std::setlocale(LC_ALL, "");
#if defined(HAVE_LIBINTL_H)
  textdomain("subtextkit");
#endif

  stk::debugging::init();

  g_cc_local_utf8 = charset_converter_c::init(get_local_charset(), true);

  init_common_output();
}

std::string const &
get_program_name() {
  return s_program_name;
}
