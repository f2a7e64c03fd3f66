/*
   SubTextKit -- subtitle document model and format converter

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   membership tests for containers and value lists
*/

#pragma once

#include <algorithm>
#include <type_traits>

namespace stk {

template<typename T, typename = void>
struct has_find_member: std::false_type {};

template<typename T>
struct has_find_member<T, std::void_t<decltype(std::declval<T const &>().find(std::declval<typename T::key_type const &>()))>>: std::true_type {};

// Maps and sets are searched by key, everything else linearly.
template<typename Tcontainer,
         typename Tkey>
bool
includes(Tcontainer const &container,
         Tkey const &key) {
  if constexpr (has_find_member<Tcontainer>::value)
    return container.find(key) != container.end();
  else
    return std::find(container.begin(), container.end(), key) != container.end();
}

template<typename Tneedle,
         typename... Tvalues>
bool
included_in(Tneedle const &needle,
            Tvalues const &... values) {
  return ((needle == values) || ...);
}

}
