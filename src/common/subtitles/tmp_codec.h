/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   TMPlayer plain text subtitles
*/

#pragma once

#include "common/common_pch.h"

#include "common/subtitles/codec.h"

namespace stk::subtitles {

class tmp_codec_c: public codec_c {
public:
  static constexpr int64_t MIN_DURATION_MS      = 500;
  static constexpr int64_t DURATION_PER_CHAR_MS = 67;

public:
  tmp_codec_c();

  virtual bool probe(std::string const &text) const override;

public:
  static timestamp_c infer_end(timestamp_c const &start, std::string const &text, std::optional<timestamp_c> const &next_start);

protected:
  virtual void parse(std::vector<std::string> const &lines, codec_options_t const &options, read_result_t &result) const override;
  virtual std::string format_document(document_c const &document, codec_options_t const &options, conversion_policy_c &policy, warnings_t &warnings) const override;
};

}
