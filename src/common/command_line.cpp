/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line handling common to all programs
*/

#include "common/common_pch.h"

#include "common/command_line.h"
#include "common/locale.h"
#include "common/version.h"

namespace stk::cli {

bool g_abort_on_warnings = false;
std::string g_usage_text;

namespace {

void
redirect_output_to(std::string const &file_name) {
  if (stdio_redirected())
    return;

  try {
    redirect_stdio(file_name);
  } catch (stk::invalid_parameter_x &) {
    mxerror(fmt::format(FY("Could not open the file '{0}' for directing the output.\n"), file_name));
  }
}

}

/** \brief Convert the command line arguments to UTF-8

   The arguments are assumed to be in the locale's character set.
   \c --command-line-charset changes the character set for all
   following arguments and is removed from the result.
*/
std::vector<std::string>
args_in_utf8(int argc,
             char **argv) {
  std::vector<std::string> args;
  auto converter = g_cc_local_utf8;

  for (int idx = 1; idx < argc; ++idx) {
    auto arg = std::string{argv[idx]};

    if (arg != "--command-line-charset") {
      args.push_back(converter ? converter->utf8(arg) : arg);
      continue;
    }

    if ((idx + 1) == argc)
      mxerror(Y("'--command-line-charset' is missing its argument.\n"));

    try {
      converter = charset_converter_c::init(argv[++idx]);
    } catch (stk::invalid_parameter_x &ex) {
      mxerror(fmt::format("{0}\n", ex.what()));
    }
  }

  return args;
}

/** \brief Handle the options all programs understand

   Removes \c --debug, \c --abort-on-warnings, \c -r, \c -v and \c -q
   from \c args and acts on them. \c -h and \c -V print their output
   and exit. Options taking an argument are processed before the
   others so that e.g. the output is redirected before the version
   is printed.
*/
void
handle_common_args(std::vector<std::string> &args) {
  auto take_argument = [&args](std::size_t idx) -> std::string {
    if ((idx + 1) == args.size())
      mxerror(fmt::format(FY("'{0}' lacks its argument.\n"), args[idx]));

    auto value = args[idx + 1];
    args.erase(args.begin() + idx, args.begin() + idx + 2);

    return value;
  };

  for (std::size_t idx = 0; idx < args.size();) {
    auto const &arg = args[idx];

    if (arg == "--")
      break;

    else if (arg == "--debug")
      stk::debugging::request(take_argument(idx));

    else if ((arg == "-r") || (arg == "--redirect-output"))
      redirect_output_to(take_argument(idx));

    else if (arg == "--abort-on-warnings") {
      g_abort_on_warnings = true;
      args.erase(args.begin() + idx);

    } else
      ++idx;
  }

  for (std::size_t idx = 0; idx < args.size();) {
    auto const &arg = args[idx];

    if (arg == "--")
      break;

    else if ((arg == "-V") || (arg == "--version")) {
      mxinfo(fmt::format("{0}\n", get_version_info(get_program_name(), vif_full)));
      mxexit();

    } else if ((arg == "-h") || (arg == "-?") || (arg == "--help"))
      display_usage();

    else if ((arg == "-v") || (arg == "--verbose")) {
      ++verbose;
      args.erase(args.begin() + idx);

    } else if ((arg == "-q") || (arg == "--quiet")) {
      verbose         = 0;
      g_suppress_info = true;
      args.erase(args.begin() + idx);

    } else
      ++idx;
  }
}

void
display_usage(int exit_code) {
  if (!g_usage_text.empty()) {
    mxinfo(g_usage_text);
    if (g_usage_text.back() != '\n')
      mxinfo("\n");
  }

  mxexit(exit_code);
}

}
