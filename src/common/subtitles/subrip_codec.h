/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   SubRip (.srt) subtitles
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec.h"

namespace stk::subtitles {

class subrip_codec_c: public codec_c {
public:
  enum parser_state_e {
    STATE_INITIAL,
    STATE_SUBS,
    STATE_SUBS_OR_NUMBER,
    STATE_TIME,
    STATE_SKIP,
  };

public:
  subrip_codec_c();

  virtual bool probe(std::string const &text) const override;

protected:
  virtual void parse(std::vector<std::string> const &lines, codec_options_t const &options, read_result_t &result) const override;
  virtual std::string format_document(document_c const &document, codec_options_t const &options, conversion_policy_c &policy, warnings_t &warnings) const override;

  std::string convert_markup(std::string const &text, codec_options_t const &options) const;
  std::string format_text(event_c const &event, document_c const &document, codec_options_t const &options, conversion_policy_c const &policy, warnings_t &warnings) const;
};

}
