#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/render_graph.hpp"

namespace renderplan::plan {

/*
  User overrides for one submission. An absent or blank value means
  "not provided".
*/
struct PlanRequest {
  std::optional<std::string> pass_selection;
  std::optional<std::string> settings_selection;
  // Comma separated output identifiers, e.g. "beauty.%04d.exr, depth.%04d.exr".
  std::optional<std::string> output_override;
};

struct PassPlan {
  // Empty for the layer-default pass.
  std::string              pass;
  std::vector<std::string> settings;
  std::vector<std::string> outputs;

  bool operator==(const PassPlan&) const = default;
};

/*
  OutputPlanner

  Computes, per selected pass, which render settings to use and which
  output images the renderer will write:

    pass --renderSource--> settings --products--> product --> productName

  Explicit settings replace the pass-derived settings. Explicit outputs
  replace the traversal for every pass. A pass whose outputs resolve to
  nothing is still emitted, with an empty output list.
*/
class OutputPlanner {
 public:
  static std::vector<PassPlan> Plan(const model::RenderGraph& graph, const PlanRequest& request);

  // Product names reachable from `settings`, in traversal order.
  static std::vector<std::string> CollectOutputs(const model::RenderGraph& graph, const std::vector<std::string>& settings);

  static std::vector<std::string> ParseOutputOverride(std::string_view outputs);
};

} // namespace renderplan::plan
