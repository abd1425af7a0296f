/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace hostnet {

inline std::string strip(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return std::string();
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

// split on runs of whitespace
inline std::vector<std::string> split_fields(const std::string &line) {
  std::vector<std::string> fields;
  std::istringstream ss(line);
  std::string f;
  while (ss >> f)
    fields.push_back(f);
  return fields;
}

inline std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line))
    lines.push_back(line);
  return lines;
}

// split a comma separated flag value, dropping empty items
inline std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> items;
  std::istringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = strip(item);
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

inline std::string join(const std::vector<std::string> &items,
                        const std::string &sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      out += sep;
    out += items[i];
  }
  return out;
}

} // namespace hostnet
