#pragma once
#include "classify/Defect.hpp"
#include "document/HtmlParser.hpp"
#include <optional>

namespace lfx {

struct Blockage {
  const Node* blocker = nullptr;
  int         blockerLayer = 0;
  bool        decorative = false;
};

// Positioned inset-0 overlay that is not pass-through and covers `el`
// from the same or a higher layer. Highest layer wins, later document
// order breaks ties.
std::optional<Blockage> findBlockage(const Dom& dom, const Node& el);

// Higher-layer positioned element that may overlap `el`
std::optional<Blockage> findLayerConflict(const Dom& dom, const Node& el);

// Ancestor (or the element itself) whose pointer-events-none is not
// re-enabled further down the chain.
const Node* passThroughAncestor(const Node& el);

// Gradient or translucent backdrop, or an empty cover, with no handler and
// no interactive content.
bool isDecorativeOverlay(const Node& el);

// Nearest positioned ancestor; nullptr means the initial containing block
const Node* containingBlock(const Node& el);

bool isAncestorOf(const Node& ancestor, const Node& el);

} // namespace lfx
