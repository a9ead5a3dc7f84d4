#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/render_graph.hpp"

namespace renderplan::extract {

// Resume states for multi-line relationship values.
struct Idle {};

// `= [` ... `]`, one `<path>` per line.
struct ConsumingArray {
  std::string source;
};

// `= {` ... `}`, one `<timecode>: "<literal>",` per line.
struct ConsumingMap {
  std::string source;
};

// Swallows everything up to `terminator`.
struct Skipping {
  char terminator;
};

using ResumeState = std::variant<Idle, ConsumingArray, ConsumingMap, Skipping>;

/*
  State carried from one line to the next. Lives for a single parse, so
  independent layers can be parsed concurrently.
*/
struct ParserState {
  bool        in_metadata = true;
  std::string path;
  int         depth = -1;
  ResumeState resume;
};

struct ParserOptions {
  // Seeded into the graph before the metadata preamble is read.
  std::string default_render_settings_path{model::kDefaultRenderSettingsPrimPath};
};

/*
  LayerParser

  Single forward pass over the text of a flattened layer:

    #usda 1.0
    (
        endTimeCode = 1250
        startTimeCode = 1001
    )

    def Scope "Render"
    {
        def RenderSettings "rendersettings"
        {
            rel products = </Render/Products/beauty>
        }
    }

  Nesting is recovered from indentation (4 spaces per level); closing
  braces are not tracked. Anything that does not match a known line shape
  is ignored. The only fatal condition is a metadata preamble that never
  closes, reported as util::MalformedLayerError.
*/
class LayerParser {
 public:
  LayerParser() = default;
  explicit LayerParser(ParserOptions options);

  model::RenderGraph Parse(const std::vector<std::string>& lines) const;
  model::RenderGraph Parse(std::istream& input) const;
  model::RenderGraph ParseText(std::string_view text) const;

  // Reads only the preamble, e.g. the output of `usdcat --layerMetadata`.
  model::LayerMetadata ParseLayerMetadata(const std::vector<std::string>& lines) const;

  // Advances `state` by one line, recording into `graph`.
  void ProcessLine(ParserState& state, std::string_view line, model::RenderGraph& graph) const;

 private:
  void ProcessMetadataLine(ParserState& state, std::string_view line, model::LayerMetadata& metadata) const;
  bool ProcessResumeLine(ParserState& state, std::string_view line, model::RenderGraph& graph) const;
  bool ProcessPrimDefinition(ParserState& state, std::string_view line, model::RenderGraph& graph) const;
  bool ProcessRelationship(ParserState& state, std::string_view line, model::RenderGraph& graph) const;

  ParserOptions options_;
};

} // namespace renderplan::extract
