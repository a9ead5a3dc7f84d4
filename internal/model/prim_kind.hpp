#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace renderplan::model {

enum class PrimKind : std::uint8_t {
  kRenderSettings = 0,
  kRenderProduct  = 1,
  kRenderVar      = 2,
  kRenderPass     = 3,
};

inline constexpr std::size_t kPrimKindCount = 4;

inline constexpr std::array<PrimKind, kPrimKindCount> kAllPrimKinds = {
    PrimKind::kRenderSettings,
    PrimKind::kRenderProduct,
    PrimKind::kRenderVar,
    PrimKind::kRenderPass,
};

constexpr std::string_view ToString(PrimKind kind) {
  switch (kind) {
    case PrimKind::kRenderSettings:
      return "RenderSettings";
    case PrimKind::kRenderProduct:
      return "RenderProduct";
    case PrimKind::kRenderVar:
      return "RenderVar";
    case PrimKind::kRenderPass:
    default:
      return "RenderPass";
  }
}

// Maps the type name of a `def <Type> "<name>"` line onto a kind.
constexpr std::optional<PrimKind> ParsePrimKind(std::string_view type_name) {
  for (auto kind : kAllPrimKinds) {
    if (ToString(kind) == type_name) {
      return kind;
    }
  }
  return std::nullopt;
}

constexpr std::size_t BucketIndex(PrimKind kind) {
  return static_cast<std::size_t>(kind);
}

} // namespace renderplan::model
