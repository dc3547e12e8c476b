#pragma once
#include "classify/Defect.hpp"
#include <optional>
#include <string>

namespace lfx {
namespace tw {

constexpr const char* PointerNone = "pointer-events-none";
constexpr const char* PointerAuto = "pointer-events-auto";
constexpr const char* Relative = "relative";
constexpr const char* Preserve3d = "[transform-style:preserve-3d]";
constexpr const char* Perspective = "[perspective:1000px]";
constexpr const char* BackfaceVisible = "[backface-visibility:visible]";

// Stacking scale used by generated layouts
constexpr int LayerContent = 10;
constexpr int LayerDropdown = 20;
constexpr int LayerBackdrop = 40;
constexpr int LayerModal = 50;

// z-N for values on the default scale, z-[N] otherwise
std::string layerClass(int z);

// Next level above `z`: none or below 10 -> 20, below 50 -> 50, else z+10
int layerAbove(std::optional<int> z);

int roleLayer(LayerRole role);

} // namespace tw
} // namespace lfx
