#include "internal/extract/frame_padding.hpp"

#include <cctype>
#include <regex>

namespace renderplan::extract {

namespace {

const std::regex& PaddingToken() {
  // %d, %04d, $F, $F4
  static const std::regex token(R"((%0?\d*d)|(\$F\d*))");
  return token;
}

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool HasFramePadding(std::string_view literal) {
  return std::regex_search(literal.begin(), literal.end(), PaddingToken());
}

std::string NormalizeFramePadding(std::string_view literal) {
  std::string result(literal);
  if (HasFramePadding(literal)) {
    return result;
  }

  const auto separator = literal.find_last_of("/\\");
  const auto name_begin = separator == std::string_view::npos ? 0 : separator + 1;

  auto stem_end = literal.find_last_of('.');
  if (stem_end == std::string_view::npos || stem_end < name_begin) {
    stem_end = literal.size();
  }

  std::size_t digits_end = stem_end;
  while (digits_end > name_begin && !IsDigit(literal[digits_end - 1])) {
    --digits_end;
  }
  if (digits_end == name_begin) {
    return result;
  }

  std::size_t digits_begin = digits_end;
  while (digits_begin > name_begin && IsDigit(literal[digits_begin - 1])) {
    --digits_begin;
  }

  const auto width = digits_end - digits_begin;
  result.replace(digits_begin, width, "%0" + std::to_string(width) + "d");
  return result;
}

} // namespace renderplan::extract
