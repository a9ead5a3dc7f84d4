#include "internal/model/render_graph.hpp"

namespace renderplan::model {

namespace {

const std::vector<std::string>& EmptyTargets() {
  static const std::vector<std::string> empty;
  return empty;
}

} // namespace

// ------------------------------------------------------------
// PathSet
// ------------------------------------------------------------

bool PathSet::Insert(const std::string& value) {
  if (!index_.insert(value).second) {
    return false;
  }
  ordered_.push_back(value);
  return true;
}

bool PathSet::Contains(std::string_view value) const {
  return index_.find(std::string(value)) != index_.end();
}

// ------------------------------------------------------------
// Prims
// ------------------------------------------------------------

bool RenderGraph::AddPrim(PrimKind kind, const std::string& path) {
  auto [it, inserted] = kinds_.emplace(path, kind);
  if (!inserted && it->second != kind) {
    return false;
  }
  return buckets_[BucketIndex(kind)].Insert(path);
}

const std::vector<std::string>& RenderGraph::Prims(PrimKind kind) const {
  return buckets_[BucketIndex(kind)].values();
}

bool RenderGraph::HasPrim(PrimKind kind, std::string_view path) const {
  return buckets_[BucketIndex(kind)].Contains(path);
}

std::optional<PrimKind> RenderGraph::KindOf(const std::string& path) const {
  auto it = kinds_.find(path);
  if (it == kinds_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ------------------------------------------------------------
// Product names
// ------------------------------------------------------------

bool RenderGraph::AddProductName(const std::string& literal) {
  return product_names_.Insert(literal);
}

bool RenderGraph::IsProductName(std::string_view literal) const {
  return product_names_.Contains(literal);
}

// ------------------------------------------------------------
// Relationships
// ------------------------------------------------------------

std::vector<std::string>& RenderGraph::OpenRelationship(const std::string& source) {
  return relationships_[source];
}

void RenderGraph::AppendTarget(const std::string& source, std::string target) {
  relationships_[source].push_back(std::move(target));
}

const std::vector<std::string>& RenderGraph::Targets(std::string_view source) const {
  auto it = relationships_.find(source);
  if (it == relationships_.end()) {
    return EmptyTargets();
  }
  return it->second;
}

bool RenderGraph::operator==(const RenderGraph& other) const {
  return metadata_ == other.metadata_ && buckets_ == other.buckets_ && product_names_ == other.product_names_ &&
         relationships_ == other.relationships_;
}

} // namespace renderplan::model
