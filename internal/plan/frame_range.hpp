#pragma once

#include <optional>
#include <string>

#include "internal/model/render_graph.hpp"

namespace renderplan::plan {

struct FrameRange {
  long long start = 0;
  long long end   = 0;

  // "1001-1250"
  std::string ToString() const;

  bool operator==(const FrameRange&) const = default;
};

// Parses "1001-1250" or "1001". Throws util::InvalidFrameRange when the
// bounds are not integers or end < start.
FrameRange ParseFrameRange(const std::string& text);

// Frame list authored on the layer, or nullopt when the layer does not
// author both time codes. Fractional time codes are truncated. Throws
// util::InvalidFrameRange when a time code does not fit a frame number or
// endTimeCode < startTimeCode.
std::optional<FrameRange> FrameRangeFromMetadata(const model::LayerMetadata& metadata);

// An explicit override wins over the layer's time codes.
std::optional<FrameRange> ResolveFrameRange(const model::LayerMetadata& metadata,
                                            const std::optional<FrameRange>& override_range);

} // namespace renderplan::plan
