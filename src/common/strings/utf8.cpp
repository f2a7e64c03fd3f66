/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   UTF-8 validation helpers
*/

#include "common/common_pch.h"

#include <QStringDecoder>

#include "common/qt.h"
#include "common/strings/utf8.h"

namespace stk::utf8 {

bool
is_valid(std::string const &str) {
  QStringDecoder decoder{QStringDecoder::Utf8, QStringDecoder::Flag::Stateless};
  QString decoded = decoder.decode(QByteArrayView{str.data(), static_cast<qsizetype>(str.size())});

  return !decoder.hasError();
}

// Invalid sequences are replaced with U+FFFD.
std::string
fix_invalid(std::string const &str) {
  QStringDecoder decoder{QStringDecoder::Utf8, QStringDecoder::Flag::Stateless};
  QString decoded = decoder.decode(QByteArrayView{str.data(), static_cast<qsizetype>(str.size())});

  return decoder.hasError() ? to_utf8(decoded) : str;
}

std::size_t
num_code_points(std::string const &str) {
  std::size_t count{};

  for (auto c : str)
    if ((static_cast<unsigned char>(c) & 0xc0) != 0x80)
      ++count;

  return count;
}

}
