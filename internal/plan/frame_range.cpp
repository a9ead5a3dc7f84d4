#include "internal/plan/frame_range.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace renderplan::plan {

namespace {

std::optional<long long> ParseFrame(std::string_view text) {
  text = util::Trim(text);
  long long value = 0;
  const auto* begin = text.data();
  const auto* end   = text.data() + text.size();
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || begin == end) {
    return std::nullopt;
  }
  return value;
}

std::optional<long long> ParseTimeCode(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char*        endptr = nullptr;
  const double value  = std::strtod(text.c_str(), &endptr);
  if (!endptr || *endptr != '\0') {
    return std::nullopt;
  }
  // 2^63 is exact as a double; anything at or past it does not fit.
  constexpr auto kLowest = static_cast<double>(std::numeric_limits<long long>::min());
  constexpr auto kLimit  = static_cast<double>(std::numeric_limits<long long>::max());
  if (!std::isfinite(value) || value < kLowest || value >= kLimit) {
    throw util::InvalidFrameRange("time code out of range: '" + text + "'");
  }
  return static_cast<long long>(value);
}

} // namespace

std::string FrameRange::ToString() const {
  return std::to_string(start) + "-" + std::to_string(end);
}

FrameRange ParseFrameRange(const std::string& text) {
  const auto trimmed = util::Trim(text);
  // Skip a leading sign so "-10-5" splits after the first bound.
  const auto dash = trimmed.find('-', 1);

  FrameRange range;
  const auto start = ParseFrame(trimmed.substr(0, dash));
  const auto end   = dash == std::string_view::npos ? start : ParseFrame(trimmed.substr(dash + 1));
  if (!start || !end) {
    throw util::InvalidFrameRange("frame range must look like <start>-<end>: '" + text + "'");
  }

  range.start = *start;
  range.end   = *end;
  if (range.end < range.start) {
    throw util::InvalidFrameRange("end frame must not be lower than start frame: '" + text + "'");
  }
  return range;
}

std::optional<FrameRange> FrameRangeFromMetadata(const model::LayerMetadata& metadata) {
  const auto start = ParseTimeCode(metadata.start_time_code);
  const auto end   = ParseTimeCode(metadata.end_time_code);
  if (!start || !end) {
    return std::nullopt;
  }
  if (*end < *start) {
    throw util::InvalidFrameRange("endTimeCode must not be lower than startTimeCode: " + metadata.start_time_code +
                                  "-" + metadata.end_time_code);
  }
  return FrameRange{*start, *end};
}

std::optional<FrameRange> ResolveFrameRange(const model::LayerMetadata& metadata,
                                            const std::optional<FrameRange>& override_range) {
  if (override_range) {
    return override_range;
  }
  return FrameRangeFromMetadata(metadata);
}

} // namespace renderplan::plan
