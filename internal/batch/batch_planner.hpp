#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "internal/extract/layer_parser.hpp"
#include "internal/plan/frame_range.hpp"
#include "internal/plan/output_planner.hpp"

namespace renderplan::batch {

struct BatchOptions {
  plan::PlanRequest               request;
  std::optional<plan::FrameRange> frames;
};

struct BatchItemResult {
  std::string                 source;
  bool                        ok = false;
  std::string                 error;
  std::string                 frames;
  std::vector<plan::PassPlan> passes;
};

/*
  BatchPlanner

  Plans several layer dumps in one go. Every dump is parsed and planned
  on its own: a dump that cannot be read or parsed fails its own item
  and the remaining dumps are still planned.
*/
class BatchPlanner {
 public:
  explicit BatchPlanner(extract::LayerParser parser);

  BatchItemResult PlanStream(const std::string& source, std::istream& input, const BatchOptions& options) const;

  // "-" reads standard input.
  BatchItemResult PlanFile(const std::string& path, const BatchOptions& options) const;

  std::vector<BatchItemResult> PlanFiles(const std::vector<std::string>& paths, const BatchOptions& options) const;

  // Scene_v005.FG.usd;Scene_v005.BG.usd -> Scene_v005. Empty for a single file.
  static std::string BatchName(const std::vector<std::string>& paths);

  static std::string FormatResultsMessage(const std::vector<BatchItemResult>& results);

 private:
  extract::LayerParser parser_;
};

} // namespace renderplan::batch
