#include "internal/tools/executable_locator.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace renderplan::tools {

namespace {

#ifdef _WIN32
constexpr std::string_view kDumpToolName = "usdcat.exe";
#else
constexpr std::string_view kDumpToolName = "usdcat";
#endif

constexpr std::string_view kRenderMask = "/Render";

bool IsRegularFile(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to) {
  if (from.empty()) {
    return text;
  }
  for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
    text.replace(pos, from.size(), to);
  }
  return text;
}

} // namespace

ExecutableLocator::ExecutableLocator(std::string search_list, std::string version)
    : search_list_(std::move(search_list)), version_(std::move(version)) {
}

std::vector<std::filesystem::path> ExecutableLocator::Candidates() const {
  std::vector<std::filesystem::path> candidates;
  for (const auto& entry : util::SplitAny(search_list_, ";")) {
    const auto trimmed = util::Trim(entry);
    if (trimmed.empty()) {
      continue;
    }
    candidates.emplace_back(ReplaceAll(std::string(trimmed), kVersionPlaceholder, version_));
  }
  return candidates;
}

std::optional<std::filesystem::path> ExecutableLocator::FindRenderExecutable() const {
  for (const auto& candidate : Candidates()) {
    if (IsRegularFile(candidate)) {
      return candidate;
    }
  }

  RENDERPLAN_LOG_WARN("render executable not found",
                      {observability::StringField("search_list", search_list_),
                       observability::StringField("version", version_)});
  return std::nullopt;
}

std::optional<std::filesystem::path> ExecutableLocator::FindDumpTool(const std::filesystem::path& render_executable) {
  auto dump_tool = render_executable.parent_path() / std::string(kDumpToolName);
  if (!IsRegularFile(dump_tool)) {
    RENDERPLAN_LOG_WARN("layer dump tool not found", {observability::StringField("path", dump_tool.string())});
    return std::nullopt;
  }
  return dump_tool;
}

std::vector<std::string> ExecutableLocator::FlattenArguments(const std::filesystem::path& scene_file) {
  return {"--flatten", "--mask", std::string(kRenderMask), scene_file.string()};
}

std::vector<std::string> ExecutableLocator::LayerMetadataArguments(const std::filesystem::path& scene_file) {
  return {"--layerMetadata", scene_file.string()};
}

} // namespace renderplan::tools
