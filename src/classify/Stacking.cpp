#include "classify/Stacking.hpp"
#include "classify/StyleAnalyzer.hpp"
#include "llvm/ADT/StringRef.h"

namespace lfx {

bool isAncestorOf(const Node& ancestor, const Node& el) {
  for (const Node* p = el.parent; p; p = p->parent)
    if (p == &ancestor) return true;
  return false;
}

const Node* containingBlock(const Node& el) {
  for (const Node* p = el.parent; p && p->isElement(); p = p->parent)
    if (analyzeStyle(*p).isPositioned()) return p;
  return nullptr;
}

// A z-index only orders an element once it is positioned; otherwise the
// nearest positioned ancestor with a layer decides.
static int effectiveLayer(const Node& el) {
  for (const Node* p = &el; p && p->isElement(); p = p->parent) {
    StyleSnapshot s = analyzeStyle(*p);
    if (s.isPositioned() && s.layer) return *s.layer;
  }
  return 0;
}

const Node* passThroughAncestor(const Node& el) {
  for (const Node* p = &el; p && p->isElement(); p = p->parent) {
    PointerMode m = analyzeStyle(*p).pointer;
    if (m == PointerMode::Auto) return nullptr;
    if (m == PointerMode::None) return p;
  }
  return nullptr;
}

static bool hasInteractiveDescendant(const Node& el) {
  for (const Node* c : el.children)
    if (isInteractive(*c) || hasInteractiveDescendant(*c)) return true;
  return false;
}

bool isDecorativeOverlay(const Node& el) {
  if (hasInlineHandler(el) || hasInteractiveDescendant(el)) return false;
  StyleSnapshot s = analyzeStyle(el);
  if (s.opacity < 1.0) return true;
  for (const auto& raw : s.classes) {
    llvm::StringRef c(raw);
    if (c.startswith("bg-gradient-") || c.startswith("bg-[linear-gradient") ||
        c.startswith("bg-[radial-gradient") || c.startswith("backdrop-") ||
        c.startswith("bg-opacity-"))
      return true;
    if (c.startswith("bg-") && c.contains('/')) return true;
  }
  return el.children.empty() && !el.hasText;
}

static bool coversAsOverlay(const Node& o, const StyleSnapshot& s) {
  return s.isOutOfFlow() && s.insetZero && s.pointer != PointerMode::None && !s.isHidden() &&
         !passThroughAncestor(o);
}

std::optional<Blockage> findBlockage(const Dom& dom, const Node& el) {
  const int elLayer = effectiveLayer(el);
  const bool elPositioned = analyzeStyle(el).isPositioned();
  std::optional<Blockage> best;
  const Node* bestNode = nullptr;

  for (const Node* o : dom.elements()) {
    if (o == &el || isAncestorOf(*o, el) || isAncestorOf(el, *o)) continue;
    StyleSnapshot s = analyzeStyle(*o);
    if (!coversAsOverlay(*o, s)) continue;

    // absolute overlays only cover their own containing block
    if (s.position != Position::Fixed) {
      const Node* cb = containingBlock(*o);
      if (cb && !isAncestorOf(*cb, el)) continue;
    }

    int layer = s.layer.value_or(0);
    if (layer < elLayer) continue;
    if (layer == elLayer && elPositioned && o->begin < el.begin) continue;

    if (!best || layer > best->blockerLayer ||
        (layer == best->blockerLayer && o->begin > bestNode->begin)) {
      best = Blockage{o, layer, false};
      bestNode = o;
    }
  }
  if (best) best->decorative = isDecorativeOverlay(*best->blocker);
  return best;
}

static bool mayOverlap(const Node& a, const StyleSnapshot& sa, const Node& b,
                       const StyleSnapshot& sb) {
  if (sa.insetZero || sb.insetZero) return true;
  if (sa.position == Position::Fixed && sb.position == Position::Fixed) return true;
  if (a.parent == b.parent && sa.position == Position::Absolute &&
      sb.position == Position::Absolute)
    return true;
  if (sa.boundingBox && sb.boundingBox) return sa.boundingBox->intersects(*sb.boundingBox);
  return false;
}

std::optional<Blockage> findLayerConflict(const Dom& dom, const Node& el) {
  const int elLayer = effectiveLayer(el);
  const StyleSnapshot elStyle = analyzeStyle(el);
  for (const Node* o : dom.elements()) {
    if (o == &el || isAncestorOf(*o, el) || isAncestorOf(el, *o)) continue;
    StyleSnapshot s = analyzeStyle(*o);
    if (!s.isPositioned() || !s.layer || *s.layer < 40) continue;
    if (s.pointer == PointerMode::None || s.isHidden() || passThroughAncestor(*o)) continue;
    if (*s.layer <= elLayer) continue;
    if (mayOverlap(el, elStyle, *o, s)) return Blockage{o, *s.layer, isDecorativeOverlay(*o)};
  }
  return std::nullopt;
}

} // namespace lfx
