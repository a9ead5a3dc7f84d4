#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/prim_kind.hpp"

namespace renderplan::model {

inline constexpr std::string_view kDefaultRenderSettingsPrimPath = "/Render/rendersettings";

struct LayerMetadata {
  std::string start_time_code;
  std::string end_time_code;
  std::string render_settings_prim_path{kDefaultRenderSettingsPrimPath};

  bool operator==(const LayerMetadata&) const = default;
};

/*
  Insertion ordered set of paths or literals.
*/
class PathSet {
 public:
  // Returns false when the value was already present.
  bool Insert(const std::string& value);
  bool Contains(std::string_view value) const;

  const std::vector<std::string>& values() const {
    return ordered_;
  }

  std::size_t size() const {
    return ordered_.size();
  }

  bool empty() const {
    return ordered_.empty();
  }

  bool operator==(const PathSet& other) const {
    return ordered_ == other.ordered_;
  }

 private:
  std::vector<std::string>        ordered_;
  std::unordered_set<std::string> index_;
};

/*
  RenderGraph

  Render prims of one flattened layer, bucketed by kind, plus one
  relationship list per source path. Targets keep file order; the
  planner relies on it.

  Sources do not have to be classified: a lookup on an unknown source
  yields an empty list.
*/
class RenderGraph {
 public:
  using Relationships = std::map<std::string, std::vector<std::string>, std::less<>>;

  LayerMetadata& metadata() {
    return metadata_;
  }

  const LayerMetadata& metadata() const {
    return metadata_;
  }

  // Records `path` under `kind`. A path already classified under another
  // kind is left where it is and false is returned.
  bool AddPrim(PrimKind kind, const std::string& path);

  const std::vector<std::string>& Prims(PrimKind kind) const;
  bool                            HasPrim(PrimKind kind, std::string_view path) const;
  std::optional<PrimKind>         KindOf(const std::string& path) const;

  bool                            AddProductName(const std::string& literal);
  bool                            IsProductName(std::string_view literal) const;
  const std::vector<std::string>& ProductNames() const {
    return product_names_.values();
  }

  // Creates an empty relationship list for `source` if none exists yet.
  std::vector<std::string>& OpenRelationship(const std::string& source);
  void                      AppendTarget(const std::string& source, std::string target);

  const std::vector<std::string>& Targets(std::string_view source) const;
  const Relationships&            relationships() const {
    return relationships_;
  }

  bool operator==(const RenderGraph& other) const;

 private:
  LayerMetadata                         metadata_;
  std::array<PathSet, kPrimKindCount>   buckets_;
  std::unordered_map<std::string, PrimKind> kinds_;
  PathSet                               product_names_;
  Relationships                         relationships_;
};

} // namespace renderplan::model
