/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   WebVTT (.vtt) subtitles
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec.h"

namespace stk::subtitles {

class webvtt_codec_c: public codec_c {
public:
  webvtt_codec_c();

  virtual bool probe(std::string const &text) const override;

protected:
  virtual void parse(std::vector<std::string> const &lines, codec_options_t const &options, read_result_t &result) const override;
  virtual std::string format_document(document_c const &document, codec_options_t const &options, conversion_policy_c &policy, warnings_t &warnings) const override;
  virtual std::string format_empty_document(document_c const &document, codec_options_t const &options) const override;

  void parse_block(std::vector<std::string> const &block, unsigned int first_line_number, codec_options_t const &options, read_result_t &result) const;
  void parse_cue_text(event_c &event, std::string const &text, codec_options_t const &options) const;
  std::string format_header(document_c const &document) const;
};

}
