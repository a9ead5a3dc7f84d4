#include "internal/model/render_graph.hpp"

#include <cassert>
#include <iostream>

namespace {

using renderplan::model::ParsePrimKind;
using renderplan::model::PrimKind;
using renderplan::model::RenderGraph;

void TestPrimIsRecordedOncePerBucket() {
  RenderGraph graph;
  assert(graph.AddPrim(PrimKind::kRenderSettings, "/Render/rs"));
  assert(!graph.AddPrim(PrimKind::kRenderSettings, "/Render/rs"));

  assert(graph.Prims(PrimKind::kRenderSettings).size() == 1);
  assert(graph.HasPrim(PrimKind::kRenderSettings, "/Render/rs"));
  assert(graph.KindOf("/Render/rs") == PrimKind::kRenderSettings);
}

void TestPathStaysInItsFirstBucket() {
  RenderGraph graph;
  graph.AddPrim(PrimKind::kRenderProduct, "/Render/thing");
  assert(!graph.AddPrim(PrimKind::kRenderVar, "/Render/thing"));

  assert(graph.Prims(PrimKind::kRenderVar).empty());
  assert(graph.KindOf("/Render/thing") == PrimKind::kRenderProduct);
}

void TestUnknownSourceHasNoTargets() {
  RenderGraph graph;
  assert(graph.Targets("/Render/missing").empty());
  assert(!graph.KindOf("/Render/missing").has_value());

  graph.OpenRelationship("/Render/forward");
  graph.AppendTarget("/Render/forward", "/Render/later");
  graph.AppendTarget("/Render/forward", "/Render/earlier");
  assert(graph.Targets("/Render/forward").back() == "/Render/earlier");
}

void TestStructuralEquality() {
  RenderGraph a;
  RenderGraph b;
  assert(a == b);

  a.AddProductName("beauty.%04d.exr");
  assert(!(a == b));
  b.AddProductName("beauty.%04d.exr");
  assert(a == b);

  a.metadata().start_time_code = "1001";
  assert(!(a == b));
}

void TestKindNames() {
  assert(ParsePrimKind("RenderPass") == PrimKind::kRenderPass);
  assert(ParsePrimKind("RenderVar") == PrimKind::kRenderVar);
  assert(!ParsePrimKind("Scope").has_value());
}

} // namespace

int main() {
  TestPrimIsRecordedOncePerBucket();
  TestPathStaysInItsFirstBucket();
  TestUnknownSourceHasNoTargets();
  TestStructuralEquality();
  TestKindNames();

  std::cout << "renderplan_unit_render_graph: pass\n";
  return 0;
}
