#pragma once
#include "classify/Defect.hpp"
#include "document/HtmlParser.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfx {

// Reads the utility classes and inline style of one element.
StyleSnapshot analyzeStyle(const Node& el);

// z-10, z-[15], -z-10; nullopt for z-auto and non-layer classes
std::optional<int> parseLayerClass(std::string_view cls);
bool isLayerClass(std::string_view cls);

// Strips a leading '!' (important modifier)
std::string_view baseClass(std::string_view cls, bool* important = nullptr);

// Translates large enough to push the element out of its box
std::vector<std::string> offscreenClasses(const StyleSnapshot& s);
// Half-turn rotation about x or y, so the back face is what shows
bool isFlipped(const StyleSnapshot& s);

bool isInteractive(const Node& el);
bool hasInlineHandler(const Node& el);
bool isClickType(const Node& el);
LayerRole roleOf(const Node& el);

} // namespace lfx
