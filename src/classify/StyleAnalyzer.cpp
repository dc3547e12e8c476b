#include "classify/StyleAnalyzer.hpp"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/StringSwitch.h"
#include <algorithm>

namespace lfx {

static const llvm::StringSet<> kHandlerAttrs = {
  "onclick", "onmousedown", "onmouseup", "ontouchstart", "ontouchend", "onkeydown",
  "onkeypress", "onfocus", "onblur", "onpointerdown", "onpointerup", "onchange", "oninput"};

static const llvm::StringSet<> kInteractiveRoles = {
  "button", "link", "checkbox", "radio", "tab", "menuitem", "menuitemcheckbox",
  "menuitemradio", "option", "switch", "slider", "spinbutton", "textbox", "combobox",
  "listbox", "searchbox", "gridcell", "treeitem"};

static const llvm::StringSet<> kClickRoles = {
  "button", "link", "checkbox", "radio", "tab", "menuitem", "switch", "option"};

static const llvm::StringSet<> kClickInputTypes = {"button", "submit", "reset", "checkbox", "radio"};

std::string_view baseClass(std::string_view cls, bool* important) {
  bool imp = !cls.empty() && cls.front() == '!';
  if (important) *important = imp;
  return imp ? cls.substr(1) : cls;
}

// "hover:bg-blue-500" -> variant "hover", utility "bg-blue-500". Colons
// inside arbitrary values ("[transform-style:preserve-3d]") do not count.
static void splitVariant(llvm::StringRef cls, llvm::StringRef& variant, llvm::StringRef& utility) {
  int depth = 0;
  size_t lastColon = llvm::StringRef::npos;
  for (size_t i = 0; i < cls.size(); ++i) {
    if (cls[i] == '[') ++depth;
    else if (cls[i] == ']') --depth;
    else if (cls[i] == ':' && depth == 0) lastColon = i;
  }
  if (lastColon == llvm::StringRef::npos) {
    variant = "";
    utility = cls;
  } else {
    variant = cls.take_front(lastColon);
    utility = cls.drop_front(lastColon + 1);
  }
}

std::optional<int> parseLayerClass(std::string_view cls) {
  llvm::StringRef s(baseClass(cls).data(), baseClass(cls).size());
  bool negative = s.consume_front("-");
  if (!s.consume_front("z-")) return std::nullopt;
  if (s.consume_front("[")) {
    if (!s.consume_back("]")) return std::nullopt;
  }
  int v = 0;
  if (s.empty() || s.getAsInteger(10, v)) return std::nullopt;
  return negative ? -v : v;
}

bool isLayerClass(std::string_view cls) {
  if (parseLayerClass(cls)) return true;
  return baseClass(cls) == "z-auto";
}

static bool isOffsetTranslate(llvm::StringRef u) {
  return u.startswith("translate-") || u.startswith("-translate-");
}

static bool isRotation(llvm::StringRef u) {
  return u.startswith("rotate-") || u.startswith("-rotate-") ||
         (u.startswith("[transform:") && u.contains("rotate"));
}

std::vector<std::string> offscreenClasses(const StyleSnapshot& s) {
  std::vector<std::string> out;
  for (const auto& raw : s.transforms) {
    llvm::StringRef u(raw);
    u.consume_front("!");
    u.consume_front("-");
    if (!u.consume_front("translate-x-") && !u.consume_front("translate-y-")) continue;
    if (u == "full") {
      out.push_back(raw);
      continue;
    }
    if (!u.consume_front("[") || !u.consume_back("]")) continue;
    int limit = 0;
    if (u.consume_back("px")) limit = 1000;
    else if (u.consume_back("%") || u.consume_back("vw") || u.consume_back("vh")) limit = 100;
    else continue;
    u.consume_front("-");
    int v = 0;
    if (!u.getAsInteger(10, v) && v >= limit) out.push_back(raw);
  }
  return out;
}

bool isFlipped(const StyleSnapshot& s) {
  for (const auto& raw : s.transforms) {
    llvm::StringRef u(raw);
    u.consume_front("!");
    u.consume_front("-");
    if (u == "rotate-y-180" || u == "rotate-x-180") return true;
    if (u.startswith("[transform:") && (u.contains("rotateY(180deg)") || u.contains("rotateX(180deg)")))
      return true;
  }
  return false;
}

namespace {

struct InlineStyle {
  std::optional<double> opacity;
  std::optional<std::string> display;
  std::optional<bool> visibilityHidden;
  std::optional<PointerMode> pointer;
  std::optional<int> layer;
  std::optional<Position> position;
};

InlineStyle parseInlineStyle(llvm::StringRef text) {
  InlineStyle out;
  llvm::SmallVector<llvm::StringRef, 8> decls;
  text.split(decls, ';', -1, false);
  for (llvm::StringRef d : decls) {
    auto kv = d.split(':');
    std::string prop = kv.first.trim().lower();
    std::string value = kv.second.trim().lower();
    llvm::StringRef v(value);
    v.consume_back("!important");
    v = v.trim();
    if (prop == "opacity") {
      double o = 1.0;
      if (!v.getAsDouble(o)) out.opacity = o;
    } else if (prop == "display") {
      out.display = v.str();
    } else if (prop == "visibility") {
      out.visibilityHidden = v == "hidden" || v == "collapse";
    } else if (prop == "pointer-events") {
      out.pointer = v == "none" ? PointerMode::None : PointerMode::Auto;
    } else if (prop == "z-index") {
      int z = 0;
      if (!v.getAsInteger(10, z)) out.layer = z;
    } else if (prop == "position") {
      out.position = llvm::StringSwitch<Position>(v)
                       .Case("relative", Position::Relative)
                       .Case("absolute", Position::Absolute)
                       .Case("fixed", Position::Fixed)
                       .Case("sticky", Position::Sticky)
                       .Default(Position::Static);
    }
  }
  return out;
}

} // namespace

StyleSnapshot analyzeStyle(const Node& el) {
  StyleSnapshot s;
  s.classes = el.classes();

  bool opacityImportant = false, displayImportant = false, visibilityImportant = false;
  bool pointerImportant = false;
  bool activeScale = false, activeTone = false, anyFeedback = false;
  bool insetX = false, insetY = false, top = false, bottom = false, left = false, right = false;

  for (const auto& raw : s.classes) {
    llvm::StringRef variant, u;
    splitVariant(raw, variant, u);
    bool important = u.consume_front("!");

    if (!variant.empty()) {
      if (variant == "active" || variant == "hover" || variant == "focus" ||
          variant == "focus-visible" || variant == "group-hover") {
        anyFeedback = true;
        if (variant == "active" && (u.startswith("scale-") || u.startswith("-scale-")))
          activeScale = true;
        if (variant == "active" && (u.startswith("brightness-") || u.startswith("bg-")))
          activeTone = true;
      }
      continue;
    }

    if (u.startswith("opacity-")) {
      int pct = 100;
      if (!u.drop_front(8).getAsInteger(10, pct)) {
        s.opacity = pct / 100.0;
        s.opacityClass = raw;
        opacityImportant = important;
      }
      continue;
    }

    std::optional<std::string> display = llvm::StringSwitch<std::optional<std::string>>(u)
      .Case("hidden", std::string("none"))
      .Case("block", std::string("block"))
      .Case("inline-block", std::string("inline-block"))
      .Case("inline", std::string("inline"))
      .Case("flex", std::string("flex"))
      .Case("inline-flex", std::string("inline-flex"))
      .Case("grid", std::string("grid"))
      .Case("inline-grid", std::string("inline-grid"))
      .Case("contents", std::string("contents"))
      .Case("table", std::string("table"))
      .Default(std::nullopt);
    if (display) {
      s.display = *display;
      s.displayClass = raw;
      displayImportant = important;
      continue;
    }

    if (u == "invisible" || u == "visible") {
      s.visibilityHidden = u == "invisible";
      s.visibilityClass = raw;
      visibilityImportant = important;
    } else if (auto z = parseLayerClass(u)) {
      // the stylesheet emits layers in ascending order, so the highest applies
      s.layer = s.layer ? std::max(*s.layer, *z) : *z;
    } else if (u == "z-auto") {
      s.layer.reset();
    } else if (u == "static" || u == "relative" || u == "absolute" || u == "fixed" || u == "sticky") {
      s.position = llvm::StringSwitch<Position>(u)
                     .Case("relative", Position::Relative)
                     .Case("absolute", Position::Absolute)
                     .Case("fixed", Position::Fixed)
                     .Case("sticky", Position::Sticky)
                     .Default(Position::Static);
    } else if (u == "pointer-events-none" || u == "pointer-events-auto") {
      s.pointer = u == "pointer-events-none" ? PointerMode::None : PointerMode::Auto;
      pointerImportant = important;
    } else if (isOffsetTranslate(u) || isRotation(u)) {
      s.transforms.push_back(raw);
    } else if (u == "backface-hidden" || u == "[backface-visibility:hidden]") {
      s.backfaceHidden = true;
    } else if (u == "backface-visible" || u == "[backface-visibility:visible]") {
      s.backfaceHidden = false;
    } else if (u == "preserve-3d" || u == "transform-style-3d" ||
               u == "[transform-style:preserve-3d]") {
      s.preserve3d = true;
    } else if (u == "inset-0") {
      s.insetZero = true;
    } else if (u == "inset-x-0") {
      insetX = true;
    } else if (u == "inset-y-0") {
      insetY = true;
    } else if (u == "top-0") {
      top = true;
    } else if (u == "bottom-0") {
      bottom = true;
    } else if (u == "left-0") {
      left = true;
    } else if (u == "right-0") {
      right = true;
    }
  }
  if ((insetX || (left && right)) && (insetY || (top && bottom))) s.insetZero = true;

  if (activeScale && activeTone) s.feedback = FeedbackLevel::Strong;
  else if (anyFeedback) s.feedback = FeedbackLevel::Weak;

  // Inline declarations beat classes unless the class is !important
  if (auto style = el.attrValue("style")) {
    InlineStyle in = parseInlineStyle(*style);
    if (in.opacity && !opacityImportant) {
      s.opacity = *in.opacity;
      if (s.opacity <= 0.0) s.inlineHidden = true;
    }
    if (in.display && !displayImportant) {
      s.display = *in.display;
      if (s.display == "none") s.inlineHidden = true;
    }
    if (in.visibilityHidden && !visibilityImportant) {
      s.visibilityHidden = *in.visibilityHidden;
      if (s.visibilityHidden) s.inlineHidden = true;
    }
    if (in.pointer && !pointerImportant) s.pointer = *in.pointer;
    if (in.layer) s.layer = in.layer;
    if (in.position) s.position = *in.position;
  }
  return s;
}

bool hasInlineHandler(const Node& el) {
  for (const auto& a : el.attributes)
    if (kHandlerAttrs.count(a.name)) return true;
  return false;
}

bool isInteractive(const Node& el) {
  if (!el.isElement() || el.hasAttr("disabled")) return false;
  const std::string& t = el.tag;
  if (t == "button" || t == "select" || t == "textarea" || t == "summary") return true;
  if (t == "a" && el.hasAttr("href")) return true;
  if (t == "input") {
    auto type = el.attrValue("type");
    return !type || llvm::StringRef(*type).lower() != "hidden";
  }
  if (hasInlineHandler(el)) return true;
  if (auto role = el.attrValue("role"))
    if (kInteractiveRoles.count(llvm::StringRef(*role).lower())) return true;
  if (auto tabindex = el.attrValue("tabindex")) {
    int v = -1;
    if (!llvm::StringRef(*tabindex).trim().getAsInteger(10, v) && v >= 0) return true;
  }
  if (auto ce = el.attrValue("contenteditable"))
    if (ce->empty() || llvm::StringRef(*ce).lower() == "true") return true;
  for (const auto& c : el.classes())
    if (c == "cursor-pointer") return true;
  return false;
}

bool isClickType(const Node& el) {
  if (el.tag == "button" || el.tag == "a" || el.tag == "summary") return true;
  if (el.tag == "input") {
    auto type = el.attrValue("type");
    return type && kClickInputTypes.count(llvm::StringRef(*type).lower());
  }
  if (auto role = el.attrValue("role"))
    if (kClickRoles.count(llvm::StringRef(*role).lower())) return true;
  if (el.hasAttr("onclick")) return true;
  for (const auto& c : el.classes())
    if (c == "cursor-pointer") return true;
  return false;
}

LayerRole roleOf(const Node& el) {
  auto role = el.attrValue("role");
  if (el.tag == "dialog" || (role && (*role == "dialog" || *role == "alertdialog")) ||
      el.hasAttr("aria-modal"))
    return LayerRole::Dialog;
  StyleSnapshot s = analyzeStyle(el);
  if (s.position == Position::Fixed || (s.isOutOfFlow() && s.insetZero)) return LayerRole::Overlay;
  return LayerRole::Content;
}

} // namespace lfx
