/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions used by the library and all programs
*/

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#if FMT_VERSION >= 110000
# include <fmt/ranges.h>
#endif // FMT_VERSION >= 110000

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/rational.hpp>

namespace balg = boost::algorithm;

using namespace std::string_literals;

// Message translation. Without libintl the untranslated texts are used.
#if defined(HAVE_LIBINTL_H)
# include <libintl.h>
# undef fprintf
# undef snprintf
# undef sprintf
#else
# define gettext(s)                            (s)
# define ngettext(s_singular, s_plural, count) ((count) != 1 ? (s_plural) : (s_singular))
#endif

#define Y(s)                             gettext(s)
#define FY(s)                            fmt::runtime(gettext(s))
#define NY(s_singular, s_plural, count)  ngettext(s_singular, s_plural, count)
#define FNY(s_singular, s_plural, count) fmt::runtime(ngettext(s_singular, s_plural, count))

// Exact arithmetic for frame rates and durations.
using stk_rational_t = boost::rational<int64_t>;

// Functions registered here run in mxexit() in the order of registration.
void mxrun_before_exit(std::function<void()> function);
[[noreturn]]
void mxexit(int code = 0);

extern unsigned int verbose;

// Sets the locale, reads the debug topics from the environment and
// installs the default message handlers.
void stk_common_init(std::string const &program_name);
std::string const &get_program_name();

#include "common/debugging.h"
#include "common/error.h"
#include "common/output.h"
