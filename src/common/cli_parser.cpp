/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line parsing
*/

#include "common/common_pch.h"

#include "common/cli_parser.h"
#include "common/command_line.h"
#include "common/container.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/translation.h"

namespace stk::cli {

constexpr auto INDENT_COLUMN_OPTION_NAME        =  2;
constexpr auto INDENT_COLUMN_OPTION_DESCRIPTION = 30;
constexpr auto INDENT_COLUMN_SECTION_HEADER     =  1;

std::string
parser_c::entry_t::format_text()
  const {
  auto description = m_description.get_translated();
  if (description.empty())
    return {};

  switch (m_kind) {
    case kind_e::option:
      return stk::string::format_paragraph(description, INDENT_DEFAULT == m_indent ? INDENT_COLUMN_OPTION_DESCRIPTION : m_indent, std::string(INDENT_COLUMN_OPTION_NAME, ' ') + m_names);

    case kind_e::section_header:
      return "\n"s + stk::string::format_paragraph(description + ":", INDENT_DEFAULT == m_indent ? INDENT_COLUMN_SECTION_HEADER : m_indent);

    default:
      return stk::string::format_paragraph(description, INDENT_DEFAULT == m_indent ? 0 : m_indent);
  }
}

// ------------------------------------------------------------

parser_c::parser_c(std::vector<std::string> args)
  : m_args{std::move(args)}
{
}

void
parser_c::parse_args() {
  set_usage();
  stk::cli::handle_common_args(m_args);

  for (auto itr = m_args.cbegin(), end = m_args.cend(); itr != end; ++itr) {
    auto has_next = (itr + 1) != end;
    m_current_arg = *itr;
    m_next_arg    = has_next ? *(itr + 1) : ""s;

    if (!m_options_ended && (m_current_arg == "--")) {
      m_options_ended = true;
      continue;
    }

    auto entry_itr = m_options_ended ? m_entry_by_name.end() : m_entry_by_name.find(m_current_arg);
    if (entry_itr == m_entry_by_name.end()) {
      handle_positional();
      continue;
    }

    auto &entry = m_entries[entry_itr->second];
    if (entry.m_needs_arg) {
      if (!has_next)
        mxerror(fmt::format(FY("Missing argument to '{0}'.\n"), m_current_arg));
      ++itr;
    }

    entry.m_callback();
  }
}

void
parser_c::handle_positional() {
  if (!m_positional_cb)
    mxerror(fmt::format(FY("Unknown option '{0}'.\n"), m_current_arg));

  m_positional_cb();
}

void
parser_c::add_option(std::string const &spec,
                     parser_cb_t const &callback,
                     translatable_string_c description) {
  auto parts = stk::string::split(spec, "=", 2);

  entry_t entry;
  entry.m_kind        = entry_t::kind_e::option;
  entry.m_spec        = spec;
  entry.m_description = std::move(description);
  entry.m_callback    = callback;
  entry.m_needs_arg   = parts.size() == 2;

  for (auto const &name : stk::string::split(parts[0], "|")) {
    auto full_name = (1 == name.length() ? "-"s : "--"s) + name;

    if (stk::includes(m_entry_by_name, full_name))
      throw stk::invalid_parameter_x{fmt::format("parser_c::add_option(): option '{0}' of spec '{1}' is already used by spec '{2}'", full_name, spec, m_entries[m_entry_by_name[full_name]].m_spec)};

    m_entry_by_name[full_name] = m_entries.size();

    if (!entry.m_names.empty())
      entry.m_names += ", ";
    entry.m_names += full_name;
  }

  if (entry.m_needs_arg)
    entry.m_names += " " + parts[1];

  m_entries.push_back(std::move(entry));
}

void
parser_c::add_section_header(translatable_string_c const &title,
                             int indent) {
  entry_t entry;
  entry.m_kind        = entry_t::kind_e::section_header;
  entry.m_description = title;
  entry.m_indent      = indent;

  m_entries.push_back(std::move(entry));
}

void
parser_c::add_information(translatable_string_c const &information,
                          int indent) {
  entry_t entry;
  entry.m_description = information;
  entry.m_indent      = indent;

  m_entries.push_back(std::move(entry));
}

void
parser_c::add_common_options() {
  // These are consumed by handle_common_args() before parsing starts.
  auto OPT = [this](char const *spec, translatable_string_c const &description) {
    add_option(spec, []() {}, description);
  };

  OPT("v|verbose",                YT("Increase verbosity."));
  OPT("q|quiet",                  YT("Suppress status output."));
  OPT("r|redirect-output=<file>", YT("Redirects all messages into this file."));
  OPT("debug=<topic>",            YT("Turns on debugging output for 'topic'."));
  OPT("abort-on-warnings",        YT("Aborts the program after the first warning is emitted."));
  OPT("h|help",                   YT("Show this help."));
  OPT("V|version",                YT("Show version information."));
}

void
parser_c::set_usage() {
  g_usage_text.clear();
  for (auto const &entry : m_entries)
    g_usage_text += entry.format_text();
}

}
