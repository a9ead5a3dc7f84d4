#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace renderplan::util {

std::string_view Trim(std::string_view value);

// Strips one pair of matching surrounding quotes, if present.
std::string_view Unquote(std::string_view value);

// Splits on any run of the given delimiter characters; empty pieces are dropped.
std::vector<std::string> SplitAny(std::string_view value, std::string_view delimiters);

// Leading whitespace count (spaces and tabs each count as one).
std::size_t LeadingWhitespace(std::string_view line);

std::vector<std::string> SplitLines(std::string_view text);

} // namespace renderplan::util
