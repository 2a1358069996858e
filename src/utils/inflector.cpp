// Copyright 2026 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "utils/inflector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "utils/string.hpp"

using namespace std::string_view_literals;

namespace {

// singular, plural
inline constexpr std::array kIrregulars{
    std::pair{"person"sv, "people"sv}, std::pair{"man"sv, "men"sv},     std::pair{"woman"sv, "women"sv},
    std::pair{"child"sv, "children"sv}, std::pair{"mouse"sv, "mice"sv}, std::pair{"ox"sv, "oxen"sv},
};

inline constexpr std::array kUncountables{"equipment"sv, "information"sv, "rice"sv,  "money"sv,
                                          "species"sv,   "series"sv,      "fish"sv,  "sheep"sv,
                                          "news"sv,      "data"sv,        "police"sv};

// <cctype> functions take the character as an unsigned char value.
unsigned char Byte(char c) { return static_cast<unsigned char>(c); }

bool IsVowel(char c) {
  switch (tolower(Byte(c))) {
    case 'a':
    case 'e':
    case 'i':
    case 'o':
    case 'u':
      return true;
    default:
      return false;
  }
}

// Replaces `from` with `to` keeping the capitalization of the first letter.
std::string MatchCase(std::string_view from, std::string_view to) {
  std::string res{to};
  if (!from.empty() && !res.empty() && isupper(Byte(from.front()))) {
    res.front() = static_cast<char>(toupper(Byte(res.front())));
  }
  return res;
}

bool IsUncountable(std::string_view word) {
  const auto lower = netrel::utils::ToLowerCase(word);
  return std::find(kUncountables.begin(), kUncountables.end(), lower) != kUncountables.end();
}

std::string PluralizeWord(std::string_view word) {
  if (word.empty() || IsUncountable(word)) return std::string{word};
  const auto lower = netrel::utils::ToLowerCase(word);
  for (const auto &[singular, plural] : kIrregulars) {
    if (lower == singular || lower == plural) return MatchCase(word, plural);
  }

  using netrel::utils::EndsWith;
  std::string res{word};
  if (EndsWith(lower, "s") || EndsWith(lower, "x") || EndsWith(lower, "z") || EndsWith(lower, "ch") ||
      EndsWith(lower, "sh")) {
    return res + "es";
  }
  if (lower.size() > 1 && EndsWith(lower, "y") && !IsVowel(lower[lower.size() - 2])) {
    res.pop_back();
    return res + "ies";
  }
  return res + "s";
}

std::string SingularizeWord(std::string_view word) {
  if (word.empty() || IsUncountable(word)) return std::string{word};
  const auto lower = netrel::utils::ToLowerCase(word);
  for (const auto &[singular, plural] : kIrregulars) {
    if (lower == plural || lower == singular) return MatchCase(word, singular);
  }

  using netrel::utils::EndsWith;
  std::string res{word};
  if (EndsWith(lower, "ies") && lower.size() > 3) {
    res.resize(res.size() - 3);
    return res + "y";
  }
  if (EndsWith(lower, "sses") || EndsWith(lower, "xes") || EndsWith(lower, "zes") || EndsWith(lower, "ches") ||
      EndsWith(lower, "shes") || EndsWith(lower, "uses")) {
    res.resize(res.size() - 2);
    return res;
  }
  if (EndsWith(lower, "ss") || EndsWith(lower, "us")) return res;
  if (EndsWith(lower, "s")) res.pop_back();
  return res;
}

// Applies `inflect` to the last underscore separated word of `word`.
template <class TFunc>
std::string InflectLastWord(std::string_view word, TFunc &&inflect) {
  const auto pos = word.rfind('_');
  if (pos == std::string_view::npos) return inflect(word);
  return std::string{word.substr(0, pos + 1)} + inflect(word.substr(pos + 1));
}

}  // namespace

namespace netrel::utils {

std::string Underscore(std::string_view word) {
  std::string res;
  res.reserve(word.size() + 4);
  for (size_t i = 0; i < word.size(); ++i) {
    const char c = word[i];
    if (c == '-' || c == ' ') {
      res += '_';
      continue;
    }
    if (isupper(Byte(c))) {
      const bool after_lower = i > 0 && (islower(Byte(word[i - 1])) || isdigit(Byte(word[i - 1])));
      const bool acronym_end =
          i > 0 && isupper(Byte(word[i - 1])) && i + 1 < word.size() && islower(Byte(word[i + 1]));
      if ((after_lower || acronym_end) && !res.empty() && res.back() != '_') res += '_';
      res += static_cast<char>(tolower(Byte(c)));
    } else {
      res += c;
    }
  }
  return res;
}

std::string Camelize(std::string_view word) {
  std::string res;
  res.reserve(word.size());
  bool upper_next = true;
  for (const char c : word) {
    if (c == '_') {
      upper_next = true;
      continue;
    }
    res += upper_next ? static_cast<char>(toupper(Byte(c))) : c;
    upper_next = false;
  }
  return res;
}

std::string Pluralize(std::string_view word) { return InflectLastWord(word, PluralizeWord); }

std::string Singularize(std::string_view word) { return InflectLastWord(word, SingularizeWord); }

}  // namespace netrel::utils
