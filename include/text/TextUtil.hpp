#pragma once
#include <string>
#include <vector>

namespace textutil {

// collapse whitespace runs (ASCII, \x1c-\x1f and UTF-8 Unicode spaces such as
// NBSP) to one space, ';' -> ',', trim.
// idempotent: clean_text(clean_text(s)) == clean_text(s)
std::string clean_text(const std::string& s);

std::string to_lower_ascii(std::string s);

// lowercase, blank out everything except word chars / whitespace / , ; -
// then return whole words made only of a-z with length >= 3, in order
std::vector<std::string> keyword_tokens(const std::string& raw);

}  // namespace textutil
