/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   version information
*/

#include "common/common_pch.h"

#include <QtGlobal>

#include <boost/version.hpp>

#include "common/strings/formatting.h"
#include "common/version.h"

namespace {

std::string
library_versions() {
  auto boost_version = fmt::format("{0}.{1}.{2}", BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000, BOOST_VERSION % 100);
  auto fmt_version   = fmt::format("{0}.{1}.{2}", FMT_VERSION / 10000, FMT_VERSION / 100 % 100, FMT_VERSION % 100);

  return fmt::format("Boost {0}, fmt {1}, Qt {2}", boost_version, fmt_version, qVersion());
}

}

std::string
get_version_info(std::string const &program,
                 version_info_flags_e flags) {
  std::vector<std::string> info;

  if (!program.empty())
    info.push_back(program);
  info.push_back(fmt::format("v{0}", STK_VERSION));

  if (flags & vif_architecture)
    info.push_back(fmt::format("{0}-bit", sizeof(void *) * 8));

  auto result = stk::string::join(info, " ");

  if (flags & vif_libraries)
    result += fmt::format(" ({0})", library_versions());

  return result;
}
