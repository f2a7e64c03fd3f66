/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   debug topics requested via --debug or the environment
*/

#pragma once

#include "common/common_pch.h"

namespace stk::debugging {

// Topics are comma separated. "topic=value" attaches an argument,
// "!" clears everything requested so far.
void request(std::string const &topics, bool enable = true);
void init();

// Several alternatives can be given separated by '|'.
bool requested(std::string const &alternatives, std::string *value = nullptr);

unsigned int generation();
void output(std::string const &msg);

}

class debugging_option_c {
protected:
  std::string m_alternatives;
  mutable std::optional<bool> m_requested;
  mutable unsigned int m_generation{};

public:
  debugging_option_c(std::string alternatives)
    : m_alternatives{std::move(alternatives)}
  {
  }

  operator bool() const {
    auto current = stk::debugging::generation();
    if (!m_requested || (m_generation != current)) {
      m_requested  = stk::debugging::requested(m_alternatives);
      m_generation = current;
    }

    return *m_requested;
  }
};

#define mxdebug(msg) stk::debugging::output(fmt::format("Debug> {0}:{1:04}: {2}", __FILE__, __LINE__, msg))

#define mxdebug_if(condition, msg) \
  if (condition) {                 \
    mxdebug(msg);                  \
  }
