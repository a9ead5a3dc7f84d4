#include "internal/extract/layer_parser.hpp"

#include <array>
#include <regex>

#include "internal/extract/frame_padding.hpp"
#include "internal/model/relationship.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace renderplan::extract {

using model::LayerMetadata;
using model::RenderGraph;

namespace {

using LineMatch = std::match_results<std::string_view::const_iterator>;

constexpr int kIndentWidth = 4;

struct MetadataField {
  std::string_view          key;
  std::string LayerMetadata::*field;
};

constexpr std::array<MetadataField, 3> kMetadataFields = {{
    {"startTimeCode", &LayerMetadata::start_time_code},
    {"endTimeCode", &LayerMetadata::end_time_code},
    {"renderSettingsPrimPath", &LayerMetadata::render_settings_prim_path},
}};

const std::regex& PrimDefinition() {
  // Typeless defs still take part in path reconstruction.
  static const std::regex pattern(R"re(def (?:(\w+) )?"([^"]+)")re");
  return pattern;
}

const std::regex& RelationshipLine() {
  static const std::regex pattern(
      R"re((?:rel|token) (products|renderSource|orderedVars|productName\.timeSamples|productName) = (.*)$)re");
  return pattern;
}

const std::regex& BracketedPath() {
  static const std::regex pattern(R"re(<([^>]*)>)re");
  return pattern;
}

const std::regex& ArrayEntry() {
  static const std::regex pattern(R"re(<(.*)>)re");
  return pattern;
}

const std::regex& MapEntry() {
  static const std::regex pattern(R"re([-+0-9.eE]+\s*:\s*"(.+)",?)re");
  return pattern;
}

bool Search(std::string_view text, LineMatch& match, const std::regex& pattern) {
  return std::regex_search(text.begin(), text.end(), match, pattern);
}

// Drops the last "/segment"; the last remaining segment pops to "".
void PopSegment(std::string& path) {
  const auto slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    path.clear();
    return;
  }
  path.erase(slash);
}

void RecordProductName(RenderGraph& graph, const std::string& source, std::string_view literal) {
  auto normalized = NormalizeFramePadding(literal);
  graph.AddProductName(normalized);
  graph.AppendTarget(source, std::move(normalized));
}

} // namespace

LayerParser::LayerParser(ParserOptions options) : options_(std::move(options)) {
}

// ------------------------------------------------------------
// Entry points
// ------------------------------------------------------------

RenderGraph LayerParser::Parse(const std::vector<std::string>& lines) const {
  RenderGraph graph;
  graph.metadata().render_settings_prim_path = options_.default_render_settings_path;

  ParserState state;
  for (const auto& line : lines) {
    ProcessLine(state, line, graph);
  }

  if (state.in_metadata) {
    throw util::MalformedLayerError("layer metadata is not terminated by a closing ')' line");
  }

  RENDERPLAN_LOG_DEBUG("parsed render layer",
                       {observability::IntField("lines", static_cast<std::int64_t>(lines.size())),
                        observability::IntField("settings", graph.Prims(model::PrimKind::kRenderSettings).size()),
                        observability::IntField("products", graph.Prims(model::PrimKind::kRenderProduct).size()),
                        observability::IntField("passes", graph.Prims(model::PrimKind::kRenderPass).size()),
                        observability::IntField("product_names", graph.ProductNames().size())});
  return graph;
}

RenderGraph LayerParser::Parse(std::istream& input) const {
  std::vector<std::string> lines;
  std::string              line;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return Parse(lines);
}

RenderGraph LayerParser::ParseText(std::string_view text) const {
  return Parse(util::SplitLines(text));
}

LayerMetadata LayerParser::ParseLayerMetadata(const std::vector<std::string>& lines) const {
  LayerMetadata metadata;
  metadata.render_settings_prim_path = options_.default_render_settings_path;

  ParserState state;
  for (const auto& line : lines) {
    ProcessMetadataLine(state, line, metadata);
    if (!state.in_metadata) {
      return metadata;
    }
  }
  throw util::MalformedLayerError("layer metadata is not terminated by a closing ')' line");
}

// ------------------------------------------------------------
// Line dispatch
// ------------------------------------------------------------

void LayerParser::ProcessLine(ParserState& state, std::string_view line, RenderGraph& graph) const {
  if (state.in_metadata) {
    ProcessMetadataLine(state, line, graph.metadata());
    return;
  }

  if (ProcessResumeLine(state, line, graph)) {
    return;
  }

  if (ProcessPrimDefinition(state, line, graph)) {
    return;
  }

  ProcessRelationship(state, line, graph);
}

void LayerParser::ProcessMetadataLine(ParserState& state, std::string_view line, LayerMetadata& metadata) const {
  const auto trimmed = util::Trim(line);
  if (trimmed == ")") {
    state.in_metadata = false;
    return;
  }

  const auto equals = trimmed.find('=');
  if (equals == std::string_view::npos) {
    return;
  }

  // Entries nested in customLayerData carry a type: "string renderSettingsPrimPath".
  auto       key   = util::Trim(trimmed.substr(0, equals));
  const auto space = key.find_last_of(" \t");
  if (space != std::string_view::npos) {
    key.remove_prefix(space + 1);
  }
  const auto value = util::Unquote(util::Trim(trimmed.substr(equals + 1)));
  for (const auto& field : kMetadataFields) {
    if (field.key == key) {
      metadata.*field.field = std::string(value);
      return;
    }
  }
}

// ------------------------------------------------------------
// Multi-line values
// ------------------------------------------------------------

bool LayerParser::ProcessResumeLine(ParserState& state, std::string_view line, RenderGraph& graph) const {
  if (std::holds_alternative<Idle>(state.resume)) {
    return false;
  }

  if (const auto* skipping = std::get_if<Skipping>(&state.resume)) {
    if (line.find(skipping->terminator) != std::string_view::npos) {
      state.resume = Idle{};
    }
    return true;
  }

  LineMatch match;

  if (const auto* array = std::get_if<ConsumingArray>(&state.resume)) {
    if (line.find(']') != std::string_view::npos || !Search(line, match, ArrayEntry())) {
      state.resume = Idle{};
      return true;
    }
    graph.AppendTarget(array->source, match[1].str());
    return true;
  }

  const auto source = std::get<ConsumingMap>(state.resume).source;
  if (line.find('}') != std::string_view::npos || !Search(line, match, MapEntry())) {
    state.resume = Idle{};
    return true;
  }

  // Only the first time sample names the product.
  RecordProductName(graph, source, match[1].str());
  state.resume = Skipping{'}'};
  return true;
}

// ------------------------------------------------------------
// Prim definitions
// ------------------------------------------------------------

bool LayerParser::ProcessPrimDefinition(ParserState& state, std::string_view line, RenderGraph& graph) const {
  LineMatch match;
  if (!Search(line, match, PrimDefinition())) {
    return false;
  }

  const int depth = static_cast<int>(util::LeadingWhitespace(line)) / kIndentWidth;
  if (depth > state.depth) {
    state.depth = depth;
  } else {
    const int diff = state.depth - depth;
    for (int i = 0; i < diff + 1; ++i) {
      PopSegment(state.path);
    }
    state.depth -= diff;
  }
  state.path += '/';
  state.path += match[2].str();

  if (!match[1].matched) {
    return true;
  }

  const auto kind = model::ParsePrimKind(match[1].str());
  if (kind && !graph.AddPrim(*kind, state.path) && !graph.HasPrim(*kind, state.path)) {
    RENDERPLAN_LOG_WARN("prim already classified under another kind",
                        {observability::StringField("path", state.path),
                         observability::StringField("kind", model::ToString(*kind))});
  }
  return true;
}

// ------------------------------------------------------------
// Relationships
// ------------------------------------------------------------

bool LayerParser::ProcessRelationship(ParserState& state, std::string_view line, RenderGraph& graph) const {
  LineMatch match;
  if (!Search(line, match, RelationshipLine())) {
    return false;
  }

  const auto name  = model::ParseRelationshipName(match[1].str());
  const auto raw   = match[2].str();
  const auto value = util::Trim(raw);

  graph.OpenRelationship(state.path);

  if (value == "[") {
    state.resume = ConsumingArray{state.path};
    return true;
  }

  if (value == "{") {
    state.resume = ConsumingMap{state.path};
    return true;
  }

  if (value.empty()) {
    return true;
  }

  if (value.front() == '[') {
    // Single-line array: [</a>, </b>]
    using PathIterator = std::regex_iterator<std::string_view::const_iterator>;
    for (PathIterator it(value.begin(), value.end(), BracketedPath()), end; it != end; ++it) {
      graph.AppendTarget(state.path, (*it)[1].str());
    }
    return true;
  }

  if (value.front() == '<' && Search(value, match, BracketedPath())) {
    graph.AppendTarget(state.path, match[1].str());
    return true;
  }

  const auto literal = util::Unquote(value);
  if (name == model::RelationshipName::kProductName && literal.size() != value.size()) {
    RecordProductName(graph, state.path, literal);
    return true;
  }

  RENDERPLAN_LOG_DEBUG("ignoring relationship value",
                       {observability::StringField("source", state.path), observability::StringField("value", value)});
  return true;
}

} // namespace renderplan::extract
