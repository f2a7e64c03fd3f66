/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   base class for subtitle format readers and writers
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec_options.h"
#include "common/subtitles/conversion_policy.h"
#include "common/subtitles/document.h"
#include "common/subtitles/formats.h"
#include "common/subtitles/warning.h"

namespace stk::subtitles {

struct read_result_t {
  document_c document;
  warnings_t warnings;
};

struct write_result_t {
  std::string text;
  lossy_mappings_t lossy_mappings;
  warnings_t warnings;

  std::size_t num_lossy_mappings() const {
    return lossy_mappings.size();
  }
};

class codec_c {
protected:
  format_e m_format;
  debugging_option_c m_debug;

public:
  codec_c(format_e format, std::string const &debug_option);
  virtual ~codec_c() = default;

  format_e get_format() const {
    return m_format;
  }

  // Whether the text looks like this format. Only looks at the content,
  // never at file names.
  virtual bool probe(std::string const &text) const = 0;

  read_result_t read(std::string const &text, codec_options_t const &options) const;
  write_result_t write(document_c const &document, codec_options_t const &options) const;

protected:
  virtual void parse(std::vector<std::string> const &lines, codec_options_t const &options, read_result_t &result) const = 0;
  virtual std::string format_document(document_c const &document, codec_options_t const &options, conversion_policy_c &policy, warnings_t &warnings) const = 0;
  virtual std::string format_empty_document(document_c const &document, codec_options_t const &options) const;

  void skip_or_throw(read_result_t &result, codec_options_t const &options, unsigned int line, std::string const &details) const;
  std::string strip_markup(std::string const &text, codec_options_t const &options) const;

  static std::vector<std::string> split_lines(std::string const &text);
};

using codec_cptr = std::shared_ptr<codec_c>;

codec_cptr create_codec(format_e format);
format_e autodetect_format(std::string const &text);

read_result_t read_text(std::string const &text, std::optional<format_e> format, codec_options_t const &options = {});
write_result_t write_text(document_c const &document, format_e format, codec_options_t const &options = {});

}
