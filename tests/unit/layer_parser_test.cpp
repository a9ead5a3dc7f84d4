#include "internal/extract/layer_parser.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "render_layer_fixture.hpp"

namespace {

using renderplan::extract::LayerParser;
using renderplan::extract::ParserOptions;
using renderplan::extract::ParserState;
using renderplan::model::PrimKind;
using renderplan::model::RenderGraph;

const std::vector<std::string> kPreamble = {"#usda 1.0", "(", ")"};

std::vector<std::string> WithPreamble(std::vector<std::string> body) {
  std::vector<std::string> lines = kPreamble;
  lines.insert(lines.end(), body.begin(), body.end());
  return lines;
}

void TestShotLayerIsBucketedByKind() {
  const auto graph = LayerParser().ParseText(renderplan::testing::kShotLayer);

  assert((graph.Prims(PrimKind::kRenderSettings) ==
          std::vector<std::string>{"/Render/rendersettings", "/Render/rendersettings_preview"}));
  assert((graph.Prims(PrimKind::kRenderProduct) ==
          std::vector<std::string>{"/Render/Products/beauty", "/Render/Products/depth"}));
  assert((graph.Prims(PrimKind::kRenderVar) ==
          std::vector<std::string>{"/Render/Products/Vars/C", "/Render/Products/Vars/N", "/Render/Products/Vars/Z"}));
  assert((graph.Prims(PrimKind::kRenderPass) == std::vector<std::string>{"/Render/fg", "/Render/bg"}));
}

void TestShotLayerRelationshipsKeepFileOrder() {
  const auto graph = LayerParser().ParseText(renderplan::testing::kShotLayer);

  assert((graph.Targets("/Render/Products/beauty") ==
          std::vector<std::string>{"/Render/Products/Vars/C", "/Render/Products/Vars/N", "/renders/sh010/beauty.%04d.exr"}));
  assert((graph.Targets("/Render/Products/depth") ==
          std::vector<std::string>{"/Render/Products/Vars/Z", "/renders/sh010/depth.%04d.exr"}));
  assert((graph.Targets("/Render/rendersettings") ==
          std::vector<std::string>{"/Render/Products/beauty", "/Render/Products/depth"}));
  assert((graph.Targets("/Render/bg") == std::vector<std::string>{"/Render/rendersettings_preview"}));

  // `rel camera` is not render wiring.
  assert(graph.Targets("/cameras/shotcam").empty());
  assert(graph.relationships().size() == 6);
}

void TestShotLayerMetadata() {
  const auto graph = LayerParser().ParseText(renderplan::testing::kShotLayer);

  assert(graph.metadata().start_time_code == "1001");
  assert(graph.metadata().end_time_code == "1250");
  assert(graph.metadata().render_settings_prim_path == "/Render/rendersettings");
}

void TestMetadataValuesAreUnquotedAndOverrideDefault() {
  const auto graph = LayerParser().Parse(std::vector<std::string>{
      "#usda 1.0",
      "(",
      "    renderSettingsPrimPath = \"/Render/final\"",
      "    startTimeCode = 1",
      ")",
  });

  assert(graph.metadata().render_settings_prim_path == "/Render/final");
  assert(graph.metadata().start_time_code == "1");
  assert(graph.metadata().end_time_code.empty());
}

void TestTypedCustomLayerDataEntryIsRead() {
  ParserOptions options;
  options.default_render_settings_path = "/Render/default";

  const auto graph = LayerParser(options).Parse(std::vector<std::string>{
      "#usda 1.0",
      "(",
      "    customLayerData = {",
      "        string renderSettingsPrimPath = \"/Render/shot_settings\"",
      "    }",
      "    double endTimeCode = 1100",
      ")",
  });

  assert(graph.metadata().render_settings_prim_path == "/Render/shot_settings");
  assert(graph.metadata().end_time_code == "1100");
}

void TestConfiguredDefaultRenderSettingsPath() {
  ParserOptions options;
  options.default_render_settings_path = "/Render/default";

  const auto graph = LayerParser(options).Parse(kPreamble);
  assert(graph.metadata().render_settings_prim_path == "/Render/default");
}

void TestDepthReconstructionPopsAndAppends() {
  const auto lines = WithPreamble({
      "def RenderPass \"A\"",
      "    def RenderPass \"B\"",
      "        def RenderPass \"C\"",
      "    def RenderPass \"D\"",
      "def RenderPass \"E\"",
  });

  const LayerParser parser;
  RenderGraph       graph;
  ParserState       state;
  std::vector<std::string> paths;
  for (const auto& line : lines) {
    parser.ProcessLine(state, line, graph);
    if (line.find("def ") != std::string::npos) {
      paths.push_back(state.path);
    }
  }

  assert((paths == std::vector<std::string>{"/A", "/A/B", "/A/B/C", "/A/D", "/E"}));
  assert(graph.Prims(PrimKind::kRenderPass) == paths);
}

void TestArrayResumeAppendsEntriesUntilTerminator() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def RenderSettings \"rs\"",
      "{",
      "    rel products = [",
      "        </Render/p1>,",
      "        </Render/p2>,",
      "        </Render/p3>,",
      "    ]",
      "    rel products = </Render/p4>",
      "}",
  }));

  assert((graph.Targets("/rs") == std::vector<std::string>{"/Render/p1", "/Render/p2", "/Render/p3", "/Render/p4"}));
}

void TestArrayResumeStopsOnUnexpectedLine() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def RenderSettings \"rs\"",
      "{",
      "    rel products = [",
      "        </Render/p1>,",
      "        garbage",
      "        </Render/p2>,",
      "    ]",
      "}",
  }));

  // The stray line ends the list; later entries are not picked up.
  assert((graph.Targets("/rs") == std::vector<std::string>{"/Render/p1"}));
}

void TestSingleLineArrayValue() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def RenderSettings \"rs\"",
      "{",
      "    rel products = [</Render/p1>, </Render/p2>]",
      "}",
  }));

  assert((graph.Targets("/rs") == std::vector<std::string>{"/Render/p1", "/Render/p2"}));
}

void TestMapResumeRecordsFirstSampleOnly() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def RenderProduct \"beauty\"",
      "{",
      "    token productName.timeSamples = {",
      "        1001: \"/out/beauty.1001.exr\",",
      "        1002: \"/out/beauty.1002.exr\",",
      "    }",
      "    rel orderedVars = </beauty/C>",
      "}",
  }));

  assert((graph.Targets("/beauty") == std::vector<std::string>{"/out/beauty.%04d.exr", "/beauty/C"}));
  assert((graph.ProductNames() == std::vector<std::string>{"/out/beauty.%04d.exr"}));
  assert(graph.IsProductName("/out/beauty.%04d.exr"));
  assert(!graph.IsProductName("/out/beauty.1001.exr"));
}

void TestEmptyArrayOpensRelationship() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def RenderSettings \"rs\"",
      "{",
      "    rel products = [",
      "    ]",
      "}",
  }));

  assert(graph.relationships().count("/rs") == 1);
  assert(graph.Targets("/rs").empty());
}

void TestRepeatedDefinitionsAreRecordedOnce() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def Scope \"Render\"",
      "    def RenderVar \"C\"",
      "def Scope \"Render\"",
      "    def RenderVar \"C\"",
  }));

  assert((graph.Prims(PrimKind::kRenderVar) == std::vector<std::string>{"/Render/C"}));
}

void TestUnknownKindsAndLinesAreIgnored() {
  const auto graph = LayerParser().Parse(WithPreamble({
      "def Xform \"cameras\"",
      "    def Camera \"shotcam\"",
      "    float focalLength = 35",
      "    rel material:binding = </mtl>",
      "def RenderSettings \"rs\"",
  }));

  assert((graph.Prims(PrimKind::kRenderSettings) == std::vector<std::string>{"/rs"}));
  assert(graph.relationships().empty());
}

void TestUnclosedMetadataIsMalformed() {
  bool threw = false;
  try {
    LayerParser().Parse(std::vector<std::string>{"#usda 1.0", "(", "    startTimeCode = 1", "def RenderPass \"p\""});
  } catch (const renderplan::util::MalformedLayerError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    LayerParser().Parse(std::vector<std::string>{});
  } catch (const renderplan::util::MalformedLayerError&) {
    threw = true;
  }
  assert(threw);
}

void TestParsingTwiceYieldsEqualGraphs() {
  const LayerParser parser;
  std::istringstream stream{std::string(renderplan::testing::kShotLayer)};

  const auto from_text   = parser.ParseText(renderplan::testing::kShotLayer);
  const auto from_stream = parser.Parse(stream);
  assert(from_text == from_stream);
  assert(from_text == parser.ParseText(renderplan::testing::kShotLayer));
}

void TestLayerMetadataOnlyDump() {
  const auto metadata = LayerParser().ParseLayerMetadata({
      "#usda 1.0",
      "(",
      "    endTimeCode = 1100",
      "    startTimeCode = 1001",
      ")",
      "",
  });

  assert(metadata.start_time_code == "1001");
  assert(metadata.end_time_code == "1100");

  bool threw = false;
  try {
    LayerParser().ParseLayerMetadata({"#usda 1.0", "(", "    startTimeCode = 1001"});
  } catch (const renderplan::util::MalformedLayerError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestShotLayerIsBucketedByKind();
  TestShotLayerRelationshipsKeepFileOrder();
  TestShotLayerMetadata();
  TestMetadataValuesAreUnquotedAndOverrideDefault();
  TestTypedCustomLayerDataEntryIsRead();
  TestConfiguredDefaultRenderSettingsPath();
  TestDepthReconstructionPopsAndAppends();
  TestArrayResumeAppendsEntriesUntilTerminator();
  TestArrayResumeStopsOnUnexpectedLine();
  TestSingleLineArrayValue();
  TestMapResumeRecordsFirstSampleOnly();
  TestEmptyArrayOpensRelationship();
  TestRepeatedDefinitionsAreRecordedOnce();
  TestUnknownKindsAndLinesAreIgnored();
  TestUnclosedMetadataIsMalformed();
  TestParsingTwiceYieldsEqualGraphs();
  TestLayerMetadataOnlyDump();

  std::cout << "renderplan_unit_layer_parser: pass\n";
  return 0;
}
