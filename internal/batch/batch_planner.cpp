#include "internal/batch/batch_planner.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace renderplan::batch {

BatchPlanner::BatchPlanner(extract::LayerParser parser) : parser_(std::move(parser)) {
}

BatchItemResult BatchPlanner::PlanStream(const std::string& source,
                                         std::istream& input,
                                         const BatchOptions& options) const {
  BatchItemResult result;
  result.source = source;

  try {
    const auto graph = parser_.Parse(input);

    if (const auto frames = plan::ResolveFrameRange(graph.metadata(), options.frames)) {
      result.frames = frames->ToString();
    }
    result.passes = plan::OutputPlanner::Plan(graph, options.request);
    result.ok     = true;
  } catch (const util::MalformedLayerError& e) {
    result.error = e.what();
    RENDERPLAN_LOG_ERROR("layer could not be parsed",
                         {observability::StringField("source", source), observability::StringField("error", e.what())});
    return result;
  } catch (const util::InvalidFrameRange& e) {
    result.error = e.what();
    RENDERPLAN_LOG_ERROR("layer frame range is invalid",
                         {observability::StringField("source", source), observability::StringField("error", e.what())});
    return result;
  }

  RENDERPLAN_LOG_INFO("planned layer",
                      {observability::StringField("source", source),
                       observability::StringField("frames", result.frames),
                       observability::IntField("passes", static_cast<std::int64_t>(result.passes.size()))});
  return result;
}

BatchItemResult BatchPlanner::PlanFile(const std::string& path, const BatchOptions& options) const {
  if (path == "-") {
    return PlanStream("<stdin>", std::cin, options);
  }

  std::ifstream input(path);
  if (!input) {
    BatchItemResult result;
    result.source = path;
    result.error  = "cannot open layer dump";
    RENDERPLAN_LOG_ERROR("cannot open layer dump", {observability::StringField("path", path)});
    return result;
  }
  return PlanStream(path, input, options);
}

std::vector<BatchItemResult> BatchPlanner::PlanFiles(const std::vector<std::string>& paths,
                                                     const BatchOptions& options) const {
  std::vector<BatchItemResult> results;
  results.reserve(paths.size());
  for (const auto& path : paths) {
    results.push_back(PlanFile(path, options));
  }
  return results;
}

std::string BatchPlanner::BatchName(const std::vector<std::string>& paths) {
  if (paths.size() < 2) {
    return {};
  }

  std::string_view prefix = paths.front();
  for (const auto& path : paths) {
    const auto mismatch = std::mismatch(prefix.begin(), prefix.end(), path.begin(), path.end());
    prefix              = prefix.substr(0, static_cast<std::size_t>(mismatch.first - prefix.begin()));
  }

  return std::filesystem::path(std::string(prefix)).stem().string();
}

std::string BatchPlanner::FormatResultsMessage(const std::vector<BatchItemResult>& results) {
  std::ostringstream out;

  const auto section = [&](bool ok, std::string_view title) {
    const bool any = std::any_of(results.begin(), results.end(), [&](const BatchItemResult& r) { return r.ok == ok; });
    if (!any) {
      return;
    }

    out << title << '\n';
    for (const auto& result : results) {
      if (result.ok != ok) {
        continue;
      }
      out << result.source << '\n';
      if (!ok) {
        for (const auto& line : util::SplitLines(result.error)) {
          if (!util::Trim(line).empty()) {
            out << '\t' << line << '\n';
          }
        }
      }
    }
    out << '\n';
  };

  section(true, "---|   Planned Layers   |---");
  section(false, "-!!|   Failed Layers    |!!-");

  auto message = out.str();
  while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
    message.pop_back();
  }
  return message;
}

} // namespace renderplan::batch
