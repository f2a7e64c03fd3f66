/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions for helper functions for unit tests
*/

#pragma once

#include "common/common_pch.h"

#include "gtest/gtest.h"

namespace stkut {

// Thrown by the message handler the suite installs for mxerror().
class mxerror_x: public stk::exception {
public:
  mxerror_x(std::string message)
    : stk::exception{std::move(message)}
  {
  }
};

void init_suite();
void init_case();

}
