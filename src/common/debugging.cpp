/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   debug topic registry
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"

namespace stk::debugging {

namespace {

std::unordered_map<std::string, std::string> s_topics;
unsigned int s_generation = 0;

}

void
request(std::string const &topics,
        bool enable) {
  for (auto const &topic : stk::string::split(topics, ",")) {
    auto parts = stk::string::split(stk::string::strip_copy(topic), "=", 2);
    if (parts[0].empty())
      continue;

    if (parts[0] == "!")
      s_topics.clear();
    else if (!enable)
      s_topics.erase(parts[0]);
    else
      s_topics[parts[0]] = parts.size() == 2 ? parts[1] : ""s;
  }

  ++s_generation;
}

bool
requested(std::string const &alternatives,
          std::string *value) {
  for (auto const &alternative : stk::string::split(alternatives, "|")) {
    auto itr = s_topics.find(alternative);
    if (itr == s_topics.end())
      continue;

    if (value)
      *value = itr->second;
    return true;
  }

  return false;
}

unsigned int
generation() {
  return s_generation;
}

void
init() {
  for (auto const &name : { "STK_DEBUG"s, balg::to_upper_copy(get_program_name()) + "_DEBUG" }) {
    auto value = getenv(name.c_str());
    if (value)
      request(value);
  }
}

void
output(std::string const &msg) {
  mxmsg(MXMSG_INFO, msg);
}

}
