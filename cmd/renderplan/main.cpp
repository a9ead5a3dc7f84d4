#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/batch/batch_planner.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/export/plan_export.hpp"
#include "internal/extract/layer_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/plan/frame_range.hpp"
#include "internal/tools/executable_locator.hpp"
#include "internal/util/errors.hpp"

using renderplan::runtime::config::RuntimeConfig;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  renderplan [--config <config.yaml>] graph <dump.usda|->\n"
            << "  renderplan [--config <config.yaml>] plan [--pass <patterns>] [--settings <patterns>]\n"
            << "             [--outputs <out1,out2>] [--frames <start-end>] <dump.usda|->...\n"
            << "  renderplan [--config <config.yaml>] locate [version]\n";
}

static renderplan::extract::LayerParser MakeParser(const RuntimeConfig& config) {
  renderplan::extract::ParserOptions options;
  options.default_render_settings_path = config.planner().default_render_settings_path();
  return renderplan::extract::LayerParser(options);
}

static int RunGraph(const RuntimeConfig& config, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    Usage();
    return 1;
  }

  const auto parser = MakeParser(config);

  renderplan::model::RenderGraph graph;
  if (args[0] == "-") {
    graph = parser.Parse(std::cin);
  } else {
    std::ifstream input(args[0]);
    if (!input) {
      std::cerr << "cannot open layer dump: " << args[0] << "\n";
      return 2;
    }
    graph = parser.Parse(input);
  }

  std::cout << renderplan::exporter::ToJson(renderplan::exporter::ToProto(graph));
  return 0;
}

static int RunPlan(const RuntimeConfig& config, const std::vector<std::string>& args) {
  renderplan::batch::BatchOptions options;
  std::vector<std::string>        dumps;

  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg       = args[i];
    const bool  has_value = i + 1 < args.size();

    if (arg == "--pass" && has_value) {
      options.request.pass_selection = args[++i];
    } else if (arg == "--settings" && has_value) {
      options.request.settings_selection = args[++i];
    } else if (arg == "--outputs" && has_value) {
      options.request.output_override = args[++i];
    } else if (arg == "--frames" && has_value) {
      options.frames = renderplan::plan::ParseFrameRange(args[++i]);
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown or incomplete option: " << arg << "\n";
      Usage();
      return 1;
    } else {
      dumps.push_back(arg);
    }
  }

  if (dumps.empty()) {
    Usage();
    return 1;
  }

  renderplan::batch::BatchPlanner planner(MakeParser(config));
  const auto                      results    = planner.PlanFiles(dumps, options);
  const auto                      batch_name = renderplan::batch::BatchPlanner::BatchName(dumps);

  std::cout << renderplan::exporter::ToJson(renderplan::exporter::ToBatchReport(batch_name, results));
  std::cerr << renderplan::batch::BatchPlanner::FormatResultsMessage(results) << "\n";

  for (const auto& result : results) {
    if (!result.ok) {
      return 3;
    }
  }
  return 0;
}

static int RunLocate(const RuntimeConfig& config, const std::vector<std::string>& args) {
  if (args.size() > 1) {
    Usage();
    return 1;
  }

  const auto version = args.empty() ? config.tools().version() : args[0];
  renderplan::tools::ExecutableLocator locator(config.tools().render_executable(), version);

  const auto render_executable = locator.FindRenderExecutable();
  if (!render_executable) {
    std::cerr << "render executable not found\nconfig: " << config.tools().render_executable()
              << "\nversion: " << version << "\n";
    return 2;
  }

  const auto dump_tool = renderplan::tools::ExecutableLocator::FindDumpTool(*render_executable);
  if (!dump_tool) {
    std::cerr << "layer dump tool not found next to " << render_executable->string() << "\n";
    return 2;
  }

  std::cout << "render_executable=" << render_executable->string() << "\n"
            << "dump_tool=" << dump_tool->string() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const auto command = args.front();
  args.erase(args.begin());

  // Config load failures are logged to stderr too.
  renderplan::observability::InitializeLogging(renderplan::config::ConfigLoader::Defaults());

  try {
    const auto config = config_path ? renderplan::config::ConfigLoader::LoadFromYaml(*config_path)
                                    : renderplan::config::ConfigLoader::Defaults();
    renderplan::observability::InitializeLogging(config);

    int status = 1;
    if (command == "graph") {
      status = RunGraph(config, args);
    } else if (command == "plan") {
      status = RunPlan(config, args);
    } else if (command == "locate") {
      status = RunLocate(config, args);
    } else {
      std::cerr << "unknown command: " << command << "\n";
      Usage();
    }

    renderplan::observability::ShutdownLogging();
    return status;
  } catch (const renderplan::util::InvalidFrameRange& e) {
    std::cerr << e.what() << "\n";
    renderplan::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    RENDERPLAN_LOG_ERROR("Fatal error", {renderplan::observability::StringField("error", e.what())});
    renderplan::observability::ShutdownLogging();
    return 2;
  }
}
