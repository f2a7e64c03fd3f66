/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   SubStation Alpha and Advanced SubStation Alpha scripts
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec.h"

namespace stk::subtitles {

class substation_codec_c: public codec_c {
public:
  enum class section_e {
    none,
    info,
    styles,
    events,
    opaque,
  };

public:
  substation_codec_c(format_e format);

  virtual bool probe(std::string const &text) const override;

public:
  static bool is_ass_script(std::string const &text);

protected:
  virtual void parse(std::vector<std::string> const &lines, codec_options_t const &options, read_result_t &result) const override;
  virtual std::string format_document(document_c const &document, codec_options_t const &options, conversion_policy_c &policy, warnings_t &warnings) const override;
  virtual std::string format_empty_document(document_c const &document, codec_options_t const &options) const override;

  bool is_ass() const {
    return m_format == format_e::ass;
  }

  std::string format_style(std::string const &name, style_c const &style) const;
  std::string format_event(event_c const &event, std::string const &style_name) const;
};

}
