/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   exceptions thrown by the subtitle model and the format codecs
*/

#pragma once

#include "common/common_pch.h"

namespace stk::subtitles {

class exception: public stk::exception {
public:
  exception(std::string message)
    : stk::exception{std::move(message)}
  {
  }
};

class malformed_timestamp_x: public exception {
protected:
  std::string m_text;

public:
  malformed_timestamp_x(std::string const &text, std::string const &format_name)
    : exception{fmt::format(FY("'{0}' is not a valid {1} timestamp"), text, format_name)}
    , m_text{text}
  {
  }

  std::string const &get_text() const {
    return m_text;
  }
};

class missing_frame_rate_x: public exception {
public:
  missing_frame_rate_x(std::string const &format_name)
    : exception{fmt::format(FY("The {0} format counts frames and requires a frame rate, but none was given"), format_name)}
  {
  }
};

class malformed_input_x: public exception {
protected:
  unsigned int m_line;

public:
  malformed_input_x(unsigned int line, std::string const &details)
    : exception{fmt::format(FY("Malformed input in line {0}: {1}"), line, details)}
    , m_line{line}
  {
  }

  unsigned int get_line() const {
    return m_line;
  }
};

class unterminated_override_block_x: public exception {
protected:
  std::size_t m_offset;

public:
  unterminated_override_block_x(std::size_t offset)
    : exception{fmt::format(FY("The override block starting at offset {0} is not terminated"), offset)}
    , m_offset{offset}
  {
  }

  std::size_t get_offset() const {
    return m_offset;
  }
};

class invalid_timing_x: public exception {
public:
  invalid_timing_x(int64_t start_ms, int64_t end_ms)
    : exception{fmt::format(FY("The end time {1} ms lies before the start time {0} ms"), start_ms, end_ms)}
  {
  }
};

class duplicate_style_x: public exception {
public:
  duplicate_style_x(std::string const &name)
    : exception{fmt::format(FY("A style named '{0}' exists already"), name)}
  {
  }
};

class unknown_style_x: public exception {
public:
  unknown_style_x(std::string const &name)
    : exception{fmt::format(FY("There is no style named '{0}'"), name)}
  {
  }
};

class unknown_format_x: public exception {
public:
  unknown_format_x(std::string const &name)
    : exception{fmt::format(FY("Unknown or unsupported subtitle format '{0}'"), name)}
  {
  }
};

class format_autodetection_x: public exception {
public:
  format_autodetection_x(std::string const &message)
    : exception{message}
  {
  }
};

}
