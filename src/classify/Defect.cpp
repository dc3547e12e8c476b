#include "classify/Defect.hpp"
#include <algorithm>
#include <cstdio>

namespace lfx {

namespace {

struct KindOf {
  KindId operator()(const VisibilityDefect& d) const {
    switch (d.cause) {
    case VisibilityDefect::Cause::Opacity: return KindId::HiddenOpacity;
    case VisibilityDefect::Cause::Display: return KindId::HiddenDisplay;
    case VisibilityDefect::Cause::Visibility: return KindId::HiddenVisibility;
    }
    return KindId::Unknown;
  }
  KindId operator()(const StackingDefect& d) const {
    return d.cause == StackingDefect::Cause::Conflict ? KindId::LayerConflict : KindId::LayerMissing;
  }
  KindId operator()(const PointerDefect& d) const {
    switch (d.cause) {
    case PointerDefect::Cause::Blocked: return KindId::PointerBlocked;
    case PointerDefect::Cause::Intercepted: return KindId::PointerIntercepted;
    case PointerDefect::Cause::Overlay: return KindId::OverlayIntercept;
    }
    return KindId::Unknown;
  }
  KindId operator()(const TransformDefect& d) const {
    return d.cause == TransformDefect::Cause::Backface ? KindId::BackfaceHidden : KindId::Offscreen;
  }
  KindId operator()(const FeedbackDefect& d) const {
    return d.cause == FeedbackDefect::Cause::TooSubtle ? KindId::FeedbackTooSubtle
                                                       : KindId::FeedbackMissing;
  }
  KindId operator()(const ScriptDefect& d) const {
    return d.cause == ScriptDefect::Cause::UndefinedHandler ? KindId::UndefinedHandler
                                                            : KindId::MissingReference;
  }
  KindId operator()(const UnknownDefect&) const { return KindId::Unknown; }
};

} // namespace

KindId kindId(const ErrorKind& kind) { return std::visit(KindOf{}, kind); }

Family familyOf(KindId id) {
  switch (id) {
  case KindId::HiddenOpacity:
  case KindId::HiddenDisplay:
  case KindId::HiddenVisibility: return Family::Visibility;
  case KindId::LayerConflict:
  case KindId::LayerMissing: return Family::Stacking;
  case KindId::PointerBlocked:
  case KindId::PointerIntercepted:
  case KindId::OverlayIntercept: return Family::Pointer;
  case KindId::BackfaceHidden:
  case KindId::Offscreen: return Family::Transform;
  case KindId::FeedbackTooSubtle:
  case KindId::FeedbackMissing: return Family::Feedback;
  case KindId::UndefinedHandler:
  case KindId::MissingReference: return Family::Script;
  case KindId::Unknown: return Family::Unknown;
  }
  return Family::Unknown;
}

bool isDeterministicFixable(KindId id) {
  switch (id) {
  case KindId::FeedbackMissing:
  case KindId::UndefinedHandler:
  case KindId::MissingReference:
  case KindId::Unknown: return false;
  default: return true;
  }
}

const char* kindName(KindId id) {
  switch (id) {
  case KindId::HiddenOpacity: return "hidden-opacity";
  case KindId::HiddenDisplay: return "hidden-display";
  case KindId::HiddenVisibility: return "hidden-visibility";
  case KindId::LayerConflict: return "layer-conflict";
  case KindId::LayerMissing: return "layer-missing";
  case KindId::PointerBlocked: return "pointer-blocked";
  case KindId::PointerIntercepted: return "pointer-intercepted";
  case KindId::OverlayIntercept: return "overlay-intercept";
  case KindId::BackfaceHidden: return "backface-hidden";
  case KindId::Offscreen: return "offscreen";
  case KindId::FeedbackTooSubtle: return "feedback-too-subtle";
  case KindId::FeedbackMissing: return "feedback-missing";
  case KindId::UndefinedHandler: return "undefined-handler";
  case KindId::MissingReference: return "missing-reference";
  case KindId::Unknown: return "unknown";
  }
  return "unknown";
}

const char* familyName(Family f) {
  switch (f) {
  case Family::Visibility: return "visibility";
  case Family::Stacking: return "stacking";
  case Family::Pointer: return "pointer-routing";
  case Family::Transform: return "spatial-transform";
  case Family::Feedback: return "feedback-intensity";
  case Family::Script: return "script-fault";
  case Family::Unknown: return "unknown";
  }
  return "unknown";
}

void ClassifiedError::setConfidence(double c) {
  // NaN compares false both ways; treat it as no evidence
  if (!(c >= 0.0)) c = 0.0;
  confidence = std::min(c, 1.0);
}

ClassifiedError makeError(ErrorKind kind, std::string selector, std::string tag,
                          double confidence, std::string rationale) {
  ClassifiedError e;
  e.kind = std::move(kind);
  e.selector = std::move(selector);
  e.tag = std::move(tag);
  e.setConfidence(confidence);
  e.requiresGenerative = !isDeterministicFixable(e.id());
  e.rationale = std::move(rationale);
  return e;
}

std::string describe(const ClassifiedError& e) {
  char conf[16];
  std::snprintf(conf, sizeof(conf), "%.2f", e.confidence);
  std::string out = std::string("[") + kindName(e.id()) + "] " + e.selector + " <" + e.tag +
                    "> confidence " + conf;
  if (e.blocker) out += " blocked by " + *e.blocker;
  if (e.requiresGenerative) out += " (generative)";
  if (!e.rationale.empty()) out += ": " + e.rationale;
  return out;
}

} // namespace lfx
