#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

enum class AssetClass {
  Equities,
  Bonds,
  Commodities,
  Golds,
};

inline constexpr std::array<AssetClass, 4> asset_classes = {
    AssetClass::Equities,
    AssetClass::Bonds,
    AssetClass::Commodities,
    AssetClass::Golds,
};

constexpr std::string_view asset_class_name(AssetClass cls) {
  switch (cls) {
    case AssetClass::Equities:
      return "equities";
    case AssetClass::Bonds:
      return "bonds";
    case AssetClass::Commodities:
      return "commodities";
    case AssetClass::Golds:
      return "golds";
  }
  return "";
}

inline std::optional<AssetClass> asset_class_from(std::string_view str) {
  for (auto cls : asset_classes)
    if (asset_class_name(cls) == str)
      return cls;
  return std::nullopt;
}
