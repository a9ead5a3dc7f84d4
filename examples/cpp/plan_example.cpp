#include <fstream>
#include <iostream>

#include "internal/extract/layer_parser.hpp"
#include "internal/plan/output_planner.hpp"

// Usage: plan_example <dump.usda> [pass patterns]
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: plan_example <dump.usda> [pass patterns]\n";
    return 1;
  }

  std::ifstream input(argv[1]);
  if (!input) {
    std::cerr << "cannot open " << argv[1] << "\n";
    return 1;
  }

  try {
    const auto graph = renderplan::extract::LayerParser().Parse(input);

    renderplan::plan::PlanRequest request;
    if (argc >= 3) {
      request.pass_selection = argv[2];
    }

    for (const auto& pass : renderplan::plan::OutputPlanner::Plan(graph, request)) {
      std::cout << (pass.pass.empty() ? "<default>" : pass.pass) << "\n";
      for (const auto& settings : pass.settings) {
        std::cout << "  settings " << settings << "\n";
      }
      for (const auto& output : pass.outputs) {
        std::cout << "  output   " << output << "\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  return 0;
}
