#include "internal/util/strings.hpp"

namespace renderplan::util {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

} // namespace

std::string_view Trim(std::string_view value) {
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

std::string_view Unquote(std::string_view value) {
  if (value.size() >= 2) {
    const char front = value.front();
    if ((front == '"' || front == '\'') && value.back() == front) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

std::vector<std::string> SplitAny(std::string_view value, std::string_view delimiters) {
  std::vector<std::string> pieces;
  std::size_t              pos = 0;
  while (pos < value.size()) {
    const auto start = value.find_first_not_of(delimiters, pos);
    if (start == std::string_view::npos) {
      break;
    }
    auto end = value.find_first_of(delimiters, start);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    pieces.emplace_back(value.substr(start, end - start));
    pos = end;
  }
  return pieces;
}

std::size_t LeadingWhitespace(std::string_view line) {
  std::size_t count = 0;
  while (count < line.size() && (line[count] == ' ' || line[count] == '\t')) {
    ++count;
  }
  return count;
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t              pos = 0;
  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    pos = end + 1;
  }
  return lines;
}

} // namespace renderplan::util
