#include "internal/export/plan_export.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/extract/layer_parser.hpp"
#include "render_layer_fixture.hpp"

namespace {

using renderplan::extract::LayerParser;
using renderplan::plan::OutputPlanner;
using renderplan::plan::PlanRequest;

void TestGraphConversionKeepsBucketsAndRelationships() {
  const auto graph = LayerParser().ParseText(renderplan::testing::kShotLayer);
  const auto proto = renderplan::exporter::ToProto(graph);

  assert(proto.metadata().start_time_code() == "1001");
  assert(proto.render_settings_size() == 2);
  assert(proto.render_products_size() == 2);
  assert(proto.render_vars_size() == 3);
  assert(proto.render_passes_size() == 2);
  assert(proto.product_names_size() == 2);
  assert(proto.relationships_size() == 6);

  bool found_beauty = false;
  for (const auto& relationship : proto.relationships()) {
    if (relationship.source() == "/Render/Products/beauty") {
      found_beauty = true;
      assert(relationship.targets_size() == 3);
      assert(relationship.targets(2) == "/renders/sh010/beauty.%04d.exr");
    }
  }
  assert(found_beauty);
}

void TestPlanJsonUsesFieldNames() {
  const auto graph = LayerParser().ParseText(renderplan::testing::kShotLayer);
  PlanRequest request;
  request.pass_selection = "fg";

  const auto plan = renderplan::exporter::ToOutputPlan("sh010.usda", "1001-1250", OutputPlanner::Plan(graph, request));
  assert(plan.passes_size() == 1);
  assert(plan.passes(0).pass() == "/Render/fg");
  assert(plan.passes(0).outputs_size() == 2);

  const auto json = renderplan::exporter::ToJson(plan);
  assert(json.find("\"frames\"") != std::string::npos);
  assert(json.find("\"/Render/fg\"") != std::string::npos);
  assert(json.find("\"/renders/sh010/depth.%04d.exr\"") != std::string::npos);
}

void TestBatchReportCarriesFailures() {
  std::vector<renderplan::batch::BatchItemResult> results(2);
  results[0].source = "a.usda";
  results[0].ok     = true;
  results[0].frames = "1-2";
  results[1].source = "b.usda";
  results[1].error  = "broken";

  const auto report = renderplan::exporter::ToBatchReport("batch", results);
  assert(report.batch_name() == "batch");
  assert(report.items_size() == 2);
  assert(report.items(0).ok());
  assert(report.items(0).plan().frames() == "1-2");
  assert(!report.items(1).ok());
  assert(report.items(1).error() == "broken");
  assert(!report.items(1).has_plan());
}

} // namespace

int main() {
  TestGraphConversionKeepsBucketsAndRelationships();
  TestPlanJsonUsesFieldNames();
  TestBatchReportCarriesFailures();

  std::cout << "renderplan_unit_plan_export: pass\n";
  return 0;
}
