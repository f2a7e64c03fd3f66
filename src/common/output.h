/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   message output for info, warning and error levels
*/

#pragma once

#include <cstdio>
#include <functional>

constexpr auto MXMSG_ERROR   =  5;
constexpr auto MXMSG_WARNING = 10;
constexpr auto MXMSG_INFO    = 15;

// The default handlers print the message. The error handler exits
// with code 2, the warning handler with code 1 if
// --abort-on-warnings was given.
using mxmsg_handler_t = std::function<void(unsigned int level, std::string const &)>;
void set_mxmsg_handler(unsigned int level, mxmsg_handler_t const &handler);
void init_common_output();

extern bool g_suppress_info, g_suppress_warnings, g_warning_issued;

void redirect_stdio(std::string const &file_name);
bool stdio_redirected();

void mxmsg(unsigned int level, std::string message);

void mxinfo(std::string const &info);
void mxwarn(std::string const &warning);
void mxerror(std::string const &error);

void mxwarn_fn(std::string const &file_name, std::string const &warning);
void mxerror_fn(std::string const &file_name, std::string const &error);
