#include "internal/resolve/pattern_resolver.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace renderplan::resolve {

namespace {

constexpr std::string_view kSelectionDelimiters = ", \t\r\n";
constexpr std::string_view kRegexSpecials       = R"(\^$.|?+()[]{})";

} // namespace

std::vector<std::string> PatternResolver::SplitSelection(std::string_view selection) {
  return util::SplitAny(selection, kSelectionDelimiters);
}

std::regex PatternResolver::CompilePattern(std::string_view pattern) {
  std::string expression;
  expression.reserve(pattern.size() * 2 + 1);

  if (pattern.empty() || pattern.front() != '/') {
    expression += '/';
  }

  for (char c : pattern) {
    if (c == '*') {
      expression += ".*";
      continue;
    }
    if (kRegexSpecials.find(c) != std::string_view::npos) {
      expression += '\\';
    }
    expression += c;
  }

  return std::regex(expression);
}

std::vector<std::string> PatternResolver::Resolve(std::string_view selection,
                                                  const model::RenderGraph& graph,
                                                  model::PrimKind kind) {
  std::vector<std::string> matches;
  const auto&              candidates = graph.Prims(kind);

  for (const auto& pattern : SplitSelection(selection)) {
    const auto regex  = CompilePattern(pattern);
    const auto before = matches.size();

    for (const auto& path : candidates) {
      if (std::regex_search(path, regex)) {
        matches.push_back(path);
      }
    }

    if (matches.size() == before) {
      RENDERPLAN_LOG_DEBUG("selection pattern matched nothing",
                           {observability::StringField("pattern", pattern),
                            observability::StringField("kind", model::ToString(kind))});
    }
  }

  return matches;
}

} // namespace renderplan::resolve
