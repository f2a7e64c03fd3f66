/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   initialization of the unit test suite
*/

#include "common/common_pch.h"

#include "tests/unit/init.h"

namespace stkut {

namespace {

void
handle_message(unsigned int level,
               std::string const &message) {
  if (MXMSG_ERROR == level)
    throw mxerror_x{message};

  g_warning_issued = true;
}

class case_listener_c: public ::testing::EmptyTestEventListener {
public:
  virtual void OnTestStart(::testing::TestInfo const &) override {
    init_case();
  }
};

} // anonymous namespace

void
init_suite() {
  stk_common_init("UNITTESTS");

  set_mxmsg_handler(MXMSG_ERROR,   handle_message);
  set_mxmsg_handler(MXMSG_WARNING, handle_message);
}

void
init_case() {
  g_warning_issued = false;
}

}

int
main(int argc,
     char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  stkut::init_suite();
  ::testing::UnitTest::GetInstance()->listeners().Append(new stkut::case_listener_c);

  return RUN_ALL_TESTS();
}
