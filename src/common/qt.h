/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   conversion helpers between Qt and standard strings
*/

#pragma once

#include "common/common_pch.h"

#include <QRegularExpression>
#include <QString>

#define Q(s)  to_qs(s)

inline QChar
to_qs(char const c) {
  return QChar{c};
}

inline QString
to_qs(QString const &s) {
  return s;
}

inline QString
to_qs(char const *s) {
  return QString::fromUtf8(s);
}

inline QString
to_qs(std::string const &s) {
  return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

inline std::string
to_utf8(QString const &s) {
  auto const utf8 = s.toUtf8();
  return { utf8.constData(), static_cast<std::size_t>(utf8.size()) };
}

inline std::string
to_utf8(std::string const &s) {
  return s;
}

inline std::ostream &
operator <<(std::ostream &out,
            QString const &s) {
  return out << to_utf8(s);
}

template<>
struct fmt::formatter<QString> : fmt::formatter<std::string> {
  template<typename FormatContext>
  auto
  format(QString const &s,
         FormatContext &ctx)
    const {
    return fmt::formatter<std::string>::format(to_utf8(s), ctx);
  }
};
