#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lfx {

enum class Family { Visibility, Stacking, Pointer, Transform, Feedback, Script, Unknown };

// Flat identifier for every kind; the payload variant below carries the
// family-specific details.
enum class KindId {
  HiddenOpacity,
  HiddenDisplay,
  HiddenVisibility,
  LayerConflict,
  LayerMissing,
  PointerBlocked,
  PointerIntercepted,
  OverlayIntercept,
  BackfaceHidden,
  Offscreen,
  FeedbackTooSubtle,
  FeedbackMissing,
  UndefinedHandler,
  MissingReference,
  Unknown
};

enum class LayerRole { Content, Overlay, Dialog };

struct VisibilityDefect {
  enum class Cause { Opacity, Display, Visibility };
  Cause       cause = Cause::Opacity;
  std::string suppressingClass;   // empty when the inline style hides it
  bool        fromInlineStyle = false;
};

struct StackingDefect {
  enum class Cause { Conflict, Missing };
  Cause              cause = Cause::Conflict;
  std::optional<int> blockerLayer;
  LayerRole          role = LayerRole::Content;
};

struct PointerDefect {
  // Blocked: a positioned element covers it. Intercepted: pass-through
  // inherited from an ancestor (or set on itself). Overlay: the cover is
  // purely decorative.
  enum class Cause { Blocked, Intercepted, Overlay };
  Cause              cause = Cause::Blocked;
  std::optional<int> blockerLayer;
};

struct TransformDefect {
  enum class Cause { Backface, Offscreen };
  Cause       cause = Cause::Backface;
  std::string containerSelector;
  std::vector<std::string> offendingClasses;
};

struct FeedbackDefect {
  enum class Cause { TooSubtle, Missing };
  Cause  cause = Cause::TooSubtle;
  double localDelta = 0.0;
  double globalDelta = 0.0;
  bool   hasHandler = false;
};

struct ScriptDefect {
  enum class Cause { UndefinedHandler, MissingReference };
  Cause       cause = Cause::UndefinedHandler;
  std::string symbol;             // function name or element id
};

struct UnknownDefect {
  std::string evidence;
};

using ErrorKind = std::variant<VisibilityDefect, StackingDefect, PointerDefect, TransformDefect,
                               FeedbackDefect, ScriptDefect, UnknownDefect>;

KindId kindId(const ErrorKind& kind);
Family familyOf(KindId id);
// Static per kind; kinds outside this set always go to the generative fixer.
bool isDeterministicFixable(KindId id);
const char* kindName(KindId id);
const char* familyName(Family f);

enum class Position { Static, Relative, Absolute, Fixed, Sticky };
enum class PointerMode { Default, Auto, None };
enum class FeedbackLevel { None, Weak, Strong };

struct BoundingBox {
  double x = 0, y = 0, width = 0, height = 0;
  bool intersects(const BoundingBox& o) const {
    return x < o.x + o.width && o.x < x + width && y < o.y + o.height && o.y < y + height;
  }
};

// What the utility classes and inline style say about one element.
struct StyleSnapshot {
  double             opacity = 1.0;
  std::string        display;          // "none", "block", "flex", ... empty when unset
  bool               visibilityHidden = false;
  std::optional<int> layer;
  Position           position = Position::Static;
  PointerMode        pointer = PointerMode::Default;
  std::vector<std::string> transforms;
  bool               backfaceHidden = false;
  bool               preserve3d = false;
  bool               insetZero = false;
  std::optional<BoundingBox> boundingBox;
  FeedbackLevel      feedback = FeedbackLevel::None;
  std::vector<std::string> classes;

  // Which source produced each suppression, for the visibility rule
  std::string opacityClass, displayClass, visibilityClass;
  bool        inlineHidden = false;

  bool isPositioned() const { return position != Position::Static; }
  bool isOutOfFlow() const { return position == Position::Absolute || position == Position::Fixed; }
  bool isHidden() const { return opacity <= 0.0 || display == "none" || visibilityHidden; }
};

struct ClassifiedError {
  ErrorKind   kind;
  std::string selector;
  std::string tag;
  StyleSnapshot style;
  std::optional<std::string> blocker;   // selector of the blocking element
  double      confidence = 0.0;         // always within [0,1]
  bool        requiresGenerative = false;
  std::string rationale;

  KindId id() const { return kindId(kind); }
  Family family() const { return familyOf(id()); }
  void setConfidence(double c);
};

// Builds an error with the deterministic/generative routing filled in
// from the kind.
ClassifiedError makeError(ErrorKind kind, std::string selector, std::string tag,
                          double confidence, std::string rationale);

std::string describe(const ClassifiedError& e);

} // namespace lfx
