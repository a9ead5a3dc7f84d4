#include "internal/plan/output_planner.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/resolve/pattern_resolver.hpp"
#include "internal/util/strings.hpp"

namespace renderplan::plan {

using model::PrimKind;
using model::RenderGraph;
using resolve::PatternResolver;

namespace {

const std::string* Provided(const std::optional<std::string>& value) {
  if (!value.has_value() || util::Trim(*value).empty()) {
    return nullptr;
  }
  return &*value;
}

std::vector<std::string> CandidatePasses(const RenderGraph& graph, const PlanRequest& request) {
  if (const auto* selection = Provided(request.pass_selection)) {
    auto passes = PatternResolver::Resolve(*selection, graph, PrimKind::kRenderPass);
    if (passes.empty()) {
      RENDERPLAN_LOG_WARN("pass selection resolved no render passes",
                          {observability::StringField("selection", *selection)});
    }
    return passes;
  }
  return {std::string()};
}

std::vector<std::string> PassSettings(const RenderGraph& graph, const std::string& pass) {
  if (pass.empty()) {
    return {graph.metadata().render_settings_prim_path};
  }
  return graph.Targets(pass);
}

} // namespace

std::vector<std::string> OutputPlanner::ParseOutputOverride(std::string_view outputs) {
  std::vector<std::string> parsed;
  for (const auto& entry : util::SplitAny(outputs, ",")) {
    const auto trimmed = util::Trim(entry);
    if (!trimmed.empty()) {
      parsed.emplace_back(trimmed);
    }
  }
  return parsed;
}

std::vector<std::string> OutputPlanner::CollectOutputs(const RenderGraph& graph,
                                                       const std::vector<std::string>& settings) {
  std::vector<std::string> outputs;
  for (const auto& settings_path : settings) {
    for (const auto& product : graph.Targets(settings_path)) {
      for (const auto& target : graph.Targets(product)) {
        // Product relationship lists also carry RenderVar paths.
        if (graph.IsProductName(target)) {
          outputs.push_back(target);
        }
      }
    }
  }
  return outputs;
}

std::vector<PassPlan> OutputPlanner::Plan(const RenderGraph& graph, const PlanRequest& request) {
  std::vector<PassPlan> plans;

  std::optional<std::vector<std::string>> explicit_settings;
  if (const auto* selection = Provided(request.settings_selection)) {
    explicit_settings = PatternResolver::Resolve(*selection, graph, PrimKind::kRenderSettings);
    if (explicit_settings->empty()) {
      RENDERPLAN_LOG_WARN("settings selection resolved no render settings",
                          {observability::StringField("selection", *selection)});
    }
  }

  std::optional<std::vector<std::string>> explicit_outputs;
  if (const auto* outputs = Provided(request.output_override)) {
    explicit_outputs = ParseOutputOverride(*outputs);
  }

  for (auto& pass : CandidatePasses(graph, request)) {
    const bool seen = std::any_of(plans.begin(), plans.end(), [&](const PassPlan& plan) { return plan.pass == pass; });
    if (seen) {
      continue;
    }

    PassPlan plan;
    plan.settings = explicit_settings ? *explicit_settings : PassSettings(graph, pass);
    plan.outputs  = explicit_outputs ? *explicit_outputs : CollectOutputs(graph, plan.settings);
    plan.pass     = std::move(pass);

    if (plan.outputs.empty()) {
      RENDERPLAN_LOG_WARN("no outputs resolved for pass",
                          {observability::StringField("pass", plan.pass.empty() ? "<default>" : plan.pass)});
    }

    plans.push_back(std::move(plan));
  }

  return plans;
}

} // namespace renderplan::plan
