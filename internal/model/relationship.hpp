#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace renderplan::model {

/*
  Relationship and token properties that carry render wiring.

  kProductName covers both the plain `productName = "..."` form and the
  `productName.timeSamples = { ... }` form.
*/
enum class RelationshipName : std::uint8_t {
  kProducts,
  kRenderSource,
  kOrderedVars,
  kProductName,
};

constexpr std::string_view ToString(RelationshipName name) {
  switch (name) {
    case RelationshipName::kProducts:
      return "products";
    case RelationshipName::kRenderSource:
      return "renderSource";
    case RelationshipName::kOrderedVars:
      return "orderedVars";
    case RelationshipName::kProductName:
    default:
      return "productName";
  }
}

constexpr std::optional<RelationshipName> ParseRelationshipName(std::string_view property) {
  if (property == "products") return RelationshipName::kProducts;
  if (property == "renderSource") return RelationshipName::kRenderSource;
  if (property == "orderedVars") return RelationshipName::kOrderedVars;
  if (property == "productName" || property == "productName.timeSamples") return RelationshipName::kProductName;
  return std::nullopt;
}

} // namespace renderplan::model
