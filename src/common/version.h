/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   version information
*/

#pragma once

#include "common/common_pch.h"

#if !defined(STK_VERSION)
# define STK_VERSION "1.0.0"
#endif

enum version_info_flags_e {
  vif_none         = 0x0000,
  vif_architecture = 0x0001,
  vif_libraries    = 0x0002,

  vif_default      = vif_architecture,
  vif_full         = 0xffff,
};

// "stkconvert v1.0.0 64-bit", optionally followed by the versions of the
// libraries the program was built against.
std::string get_version_info(std::string const &program, version_info_flags_e flags = vif_default);
