#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/prim_kind.hpp"
#include "internal/model/render_graph.hpp"

namespace renderplan::resolve {

/*
  Resolves a user selection such as "beauty, /Render/Passes/fg*" against
  one kind bucket of a graph.

  Patterns are split on commas and whitespace. `*` matches any sequence,
  every other character is literal, and a leading "/" is added when
  missing. A path matches when the pattern occurs anywhere inside it, so
  "rs1" also selects "/Render/rs10". Results follow pattern order, then
  bucket order; duplicates across patterns are kept.
*/
class PatternResolver {
 public:
  static std::vector<std::string> Resolve(std::string_view selection, const model::RenderGraph& graph, model::PrimKind kind);

  static std::vector<std::string> SplitSelection(std::string_view selection);

  static std::regex CompilePattern(std::string_view pattern);
};

} // namespace renderplan::resolve
