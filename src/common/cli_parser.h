/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line parsing
*/

#pragma once

#include "common/common_pch.h"

#include "common/translation.h"

namespace stk::cli {

constexpr auto INDENT_DEFAULT = -1;

using parser_cb_t = std::function<void(void)>;

class parser_c {
protected:
  struct entry_t {
    enum class kind_e {
      option,
      section_header,
      information,
    };

    kind_e m_kind{kind_e::information};
    std::string m_spec, m_names;
    translatable_string_c m_description;
    parser_cb_t m_callback;
    bool m_needs_arg{};
    int m_indent{INDENT_DEFAULT};

    std::string format_text() const;
  };

  std::map<std::string, std::size_t> m_entry_by_name;
  std::vector<entry_t> m_entries;
  std::vector<std::string> m_args;

  std::string m_current_arg, m_next_arg;
  bool m_options_ended{};

  // Called for each argument that is not an option.
  parser_cb_t m_positional_cb;

protected:
  parser_c(std::vector<std::string> args);

  // 'spec' is "a|long-name" or "a|long-name=<arg>".
  void add_option(std::string const &spec, parser_cb_t const &callback, translatable_string_c description);
  void add_section_header(translatable_string_c const &title, int indent = INDENT_DEFAULT);
  void add_information(translatable_string_c const &information, int indent = INDENT_DEFAULT);
  void add_common_options();

  void parse_args();
  void set_usage();

  void handle_positional();
};

}
