#include "internal/export/plan_export.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace renderplan::exporter {

namespace {

void CopyPaths(const std::vector<std::string>& paths, google::protobuf::RepeatedPtrField<std::string>* out) {
  out->Reserve(static_cast<int>(paths.size()));
  for (const auto& path : paths) {
    *out->Add() = path;
  }
}

} // namespace

renderplan::v1::RenderGraph ToProto(const model::RenderGraph& graph) {
  renderplan::v1::RenderGraph out;

  auto* metadata = out.mutable_metadata();
  metadata->set_start_time_code(graph.metadata().start_time_code);
  metadata->set_end_time_code(graph.metadata().end_time_code);
  metadata->set_render_settings_prim_path(graph.metadata().render_settings_prim_path);

  CopyPaths(graph.Prims(model::PrimKind::kRenderSettings), out.mutable_render_settings());
  CopyPaths(graph.Prims(model::PrimKind::kRenderProduct), out.mutable_render_products());
  CopyPaths(graph.Prims(model::PrimKind::kRenderVar), out.mutable_render_vars());
  CopyPaths(graph.Prims(model::PrimKind::kRenderPass), out.mutable_render_passes());
  CopyPaths(graph.ProductNames(), out.mutable_product_names());

  for (const auto& [source, targets] : graph.relationships()) {
    auto* relationship = out.add_relationships();
    relationship->set_source(source);
    CopyPaths(targets, relationship->mutable_targets());
  }

  return out;
}

renderplan::v1::PassPlan ToProto(const plan::PassPlan& pass_plan) {
  renderplan::v1::PassPlan out;
  out.set_pass(pass_plan.pass);
  CopyPaths(pass_plan.settings, out.mutable_settings());
  CopyPaths(pass_plan.outputs, out.mutable_outputs());
  return out;
}

renderplan::v1::OutputPlan ToOutputPlan(const std::string& source,
                                        const std::string& frames,
                                        const std::vector<plan::PassPlan>& passes) {
  renderplan::v1::OutputPlan out;
  out.set_source(source);
  out.set_frames(frames);
  for (const auto& pass : passes) {
    *out.add_passes() = ToProto(pass);
  }
  return out;
}

renderplan::v1::BatchReport ToBatchReport(const std::string& batch_name,
                                          const std::vector<batch::BatchItemResult>& results) {
  renderplan::v1::BatchReport report;
  report.set_batch_name(batch_name);
  for (const auto& result : results) {
    auto* item = report.add_items();
    item->set_source(result.source);
    item->set_ok(result.ok);
    item->set_error(result.error);
    if (result.ok) {
      *item->mutable_plan() = ToOutputPlan(result.source, result.frames, result.passes);
    }
  }
  return report;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize message to JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace renderplan::exporter
