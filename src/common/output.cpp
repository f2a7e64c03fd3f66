/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   message output for info, warning and error levels
*/

#include "common/common_pch.h"

#include "common/command_line.h"
#include "common/container.h"

bool g_suppress_info                = false;
bool g_suppress_warnings            = false;
bool g_warning_issued               = false;

namespace {

std::FILE *s_stdio        = stdout;
bool s_stdio_redirected   = false;

std::map<unsigned int, mxmsg_handler_t> s_handlers;

void
close_redirected_stdio() {
  if (!s_stdio_redirected)
    return;

  std::fclose(s_stdio);
  s_stdio            = stdout;
  s_stdio_redirected = false;
}

void
dispatch(unsigned int level,
         std::string const &message) {
  auto itr = s_handlers.find(level);
  if ((itr != s_handlers.end()) && itr->second)
    itr->second(level, message);
}

void
default_handler(unsigned int level,
                std::string const &message) {
  if (MXMSG_WARNING == level) {
    if (g_suppress_warnings)
      return;

    g_warning_issued = true;
  }

  mxmsg(level, message);

  if (MXMSG_ERROR == level)
    mxexit(2);

  if ((MXMSG_WARNING == level) && stk::cli::g_abort_on_warnings)
    mxexit(1);
}

}

void
redirect_stdio(std::string const &file_name) {
  auto file = std::fopen(file_name.c_str(), "wb");
  if (!file)
    throw stk::invalid_parameter_x{fmt::format(FY("Could not open the file '{0}' for directing the output."), file_name)};

  close_redirected_stdio();

  s_stdio            = file;
  s_stdio_redirected = true;

  mxrun_before_exit(close_redirected_stdio);
}

bool
stdio_redirected() {
  return s_stdio_redirected;
}

void
set_mxmsg_handler(unsigned int level,
                  mxmsg_handler_t const &handler) {
  if (!stk::included_in(level, static_cast<unsigned int>(MXMSG_INFO), static_cast<unsigned int>(MXMSG_WARNING), static_cast<unsigned int>(MXMSG_ERROR)))
    throw stk::invalid_parameter_x{fmt::format("set_mxmsg_handler(): unknown message level {0}", level)};

  s_handlers[level] = handler;
}

void
mxmsg(unsigned int level,
      std::string message) {
  if (g_suppress_info && (MXMSG_INFO == level))
    return;

  // A leading newline goes before the level prefix.
  if (!message.empty() && ('\n' == message[0])) {
    message.erase(0, 1);
    std::fputs("\n", s_stdio);
  }

  if (MXMSG_ERROR == level) {
    std::string prefix = Y("Error:");
    if (balg::starts_with(message, prefix))
      message.erase(0, prefix.length());
    fmt::print(s_stdio, "{0} ", prefix);

  } else if (MXMSG_WARNING == level)
    fmt::print(s_stdio, "{0} ", Y("Warning:"));

  std::fputs(message.c_str(), s_stdio);
  std::fflush(s_stdio);
}

void
mxinfo(std::string const &info) {
  dispatch(MXMSG_INFO, info);
}

void
mxwarn(std::string const &warning) {
  dispatch(MXMSG_WARNING, warning);
}

void
mxerror(std::string const &error) {
  dispatch(MXMSG_ERROR, error);
}

void
mxwarn_fn(std::string const &file_name,
          std::string const &warning) {
  mxwarn(fmt::format(FY("'{0}': {1}"), file_name, warning));
}

void
mxerror_fn(std::string const &file_name,
           std::string const &error) {
  mxerror(fmt::format(FY("'{0}': {1}"), file_name, error));
}

void
init_common_output() {
  for (auto level : { MXMSG_INFO, MXMSG_WARNING, MXMSG_ERROR })
    set_mxmsg_handler(level, default_handler);
}
