#include "rules/Tailwind.hpp"

namespace lfx {
namespace tw {

std::string layerClass(int z) {
  switch (z) {
  case 0: case 10: case 20: case 30: case 40: case 50:
    return "z-" + std::to_string(z);
  default:
    return z < 0 ? "-z-[" + std::to_string(-z) + "]" : "z-[" + std::to_string(z) + "]";
  }
}

int layerAbove(std::optional<int> z) {
  if (!z || *z < LayerContent) return LayerDropdown;
  if (*z < LayerModal) return LayerModal;
  return *z + 10;
}

int roleLayer(LayerRole role) {
  switch (role) {
  case LayerRole::Content: return LayerContent;
  case LayerRole::Overlay: return LayerBackdrop;
  case LayerRole::Dialog: return LayerModal;
  }
  return LayerContent;
}

} // namespace tw
} // namespace lfx
