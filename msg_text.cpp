#include "msg_text.h"

#include <algorithm>
#include <cctype>

void msg_trim_inplace(std::string& s) {
  auto is_ws = [](char ch) { return std::isspace((unsigned char)ch) != 0; };

  auto it1 = std::find_if_not(s.begin(), s.end(), is_ws);
  auto it2 = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();

  if (it1 >= it2) { s.clear(); return; }
  s.assign(it1, it2);
}
