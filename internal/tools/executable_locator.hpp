#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace renderplan::tools {

inline constexpr std::string_view kVersionPlaceholder = "XX.X.XXX";

/*
  Finds the renderer and the layer dump tool on disk.

  A search list is a ';' separated list of candidate files, e.g.
  "/opt/hfsXX.X.XXX/bin/husk;C:/Houdini XX.X.XXX/bin/husk.exe". Nothing
  found is reported as nullopt; callers decide how to surface it.
*/
class ExecutableLocator {
 public:
  explicit ExecutableLocator(std::string search_list, std::string version = {});

  // Candidates with the version placeholder substituted, in search order.
  std::vector<std::filesystem::path> Candidates() const;

  std::optional<std::filesystem::path> FindRenderExecutable() const;

  // The dump tool ships next to the renderer: .../bin/husk -> .../bin/usdcat
  static std::optional<std::filesystem::path> FindDumpTool(const std::filesystem::path& render_executable);

  // Arguments for a flattened dump restricted to the render subtree.
  static std::vector<std::string> FlattenArguments(const std::filesystem::path& scene_file);

  static std::vector<std::string> LayerMetadataArguments(const std::filesystem::path& scene_file);

 private:
  std::string search_list_;
  std::string version_;
};

} // namespace renderplan::tools
