#include "ai/GenerativeFixer.hpp"
#ifdef ENABLE_ONNXRUNTIME
#include "classify/StyleAnalyzer.hpp"
#include "rules/Tailwind.hpp"
#include "support/Log.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <memory>

namespace lfx {

namespace {

constexpr size_t kKinds = static_cast<size_t>(KindId::Unknown) + 1;
constexpr size_t kStyleFeatures = 8;
constexpr size_t kFeatures = kKinds + kStyleFeatures;
constexpr float kScoreFloor = 0.5f;

// Candidate edits the model scores; row 0 means "leave it alone"
enum Template { Keep = 0, Feedback, RaiseAndRoute, Reveal, ResetTransform, kTemplates };

void fillTemplate(Template t, const ClassifiedError& e, Patch& p) {
  switch (t) {
  case Feedback:
    for (const char* c : {"active:scale-95", "active:brightness-90", "transition", "duration-150"})
      p.addClass(c);
    break;
  case RaiseAndRoute:
    p.addClass(tw::PointerAuto);
    p.removeClass(tw::PointerNone);
    if (!e.style.isPositioned()) p.addClass(tw::Relative);
    for (const auto& c : e.style.classes)
      if (isLayerClass(c)) p.removeClass(c);
    p.addClass(tw::layerClass(tw::layerAbove(e.style.layer)));
    break;
  case Reveal:
    p.addClass("opacity-100");
    p.addClass("visible");
    p.removeClass("hidden");
    p.removeClass("invisible");
    break;
  case ResetTransform:
    p.addClass("translate-x-0");
    p.addClass("translate-y-0");
    p.addClass(tw::BackfaceVisible);
    break;
  default:
    break;
  }
}

void features(const ClassifiedError& e, float* row) {
  std::fill(row, row + kFeatures, 0.0f);
  row[static_cast<size_t>(e.id())] = 1.0f;
  float* s = row + kKinds;
  const StyleSnapshot& st = e.style;
  s[0] = (float)st.opacity;
  s[1] = st.layer ? (float)*st.layer / 100.0f : 0.0f;
  s[2] = st.isPositioned() ? 1.0f : 0.0f;
  s[3] = st.isOutOfFlow() ? 1.0f : 0.0f;
  s[4] = st.pointer == PointerMode::None ? 1.0f : 0.0f;
  s[5] = st.insetZero ? 1.0f : 0.0f;
  s[6] = (float)static_cast<int>(st.feedback) / 2.0f;
  s[7] = (float)e.confidence;
}

class OnnxFixer final : public GenerativeFixer {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "layoutfix"};
  Ort::Session session{nullptr};
  Ort::SessionOptions opts;

public:
  explicit OnnxFixer(const std::string& modelPath) {
    opts.SetIntraOpNumThreads(1);
    session = Ort::Session(env, modelPath.c_str(), opts);
  }

  bool proposeFix(const Document& doc,
                  const std::vector<ClassifiedError>& unresolved,
                  int attemptsRemaining,
                  FixProposal& out,
                  std::string* error) override {
    (void)doc;
    auto start = std::chrono::steady_clock::now();
    FixProposal proposal;
    proposal.patches.source = "onnx-fixer";

    std::vector<const ClassifiedError*> rows;
    for (const auto& e : unresolved)
      if (e.requiresGenerative && e.tag != "script") rows.push_back(&e);
    if (attemptsRemaining <= 0 || rows.empty()) {
      out = std::move(proposal);
      return true;
    }

    std::vector<float> input(rows.size() * kFeatures);
    for (size_t i = 0; i < rows.size(); ++i) features(*rows[i], &input[i * kFeatures]);
    std::array<int64_t, 2> shape{(int64_t)rows.size(), (int64_t)kFeatures};

    try {
      Ort::AllocatorWithDefaultOptions allocator;
      auto inName = session.GetInputNameAllocated(0, allocator);
      auto outName = session.GetOutputNameAllocated(0, allocator);
      const char* inNames[] = {inName.get()};
      const char* outNames[] = {outName.get()};

      auto memInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
      Ort::Value tensor = Ort::Value::CreateTensor<float>(memInfo, input.data(), input.size(),
                                                          shape.data(), shape.size());
      auto results = session.Run(Ort::RunOptions{nullptr}, inNames, &tensor, 1, outNames, 1);

      auto info = results.front().GetTensorTypeAndShapeInfo();
      auto outShape = info.GetShape();
      if (outShape.size() != 2 || outShape[0] != (int64_t)rows.size() ||
          outShape[1] < (int64_t)kTemplates) {
        if (error) *error = "model output has unexpected shape";
        return false;
      }
      const float* scores = results.front().GetTensorData<float>();
      const size_t width = (size_t)outShape[1];

      for (size_t i = 0; i < rows.size(); ++i) {
        const float* row = scores + i * width;
        size_t best = Keep;
        for (size_t t = 1; t < kTemplates; ++t)
          if (row[t] > row[best]) best = t;
        if (best == Keep || row[best] < kScoreFloor) continue;
        Patch p;
        p.selector = rows[i]->selector;
        fillTemplate(static_cast<Template>(best), *rows[i], p);
        p.rationale = "onnx: template " + std::to_string(best);
        if (!p.empty()) proposal.patches.add(std::move(p));
      }
    } catch (const Ort::Exception& ex) {
      if (error) *error = std::string("onnxruntime: ") + ex.what();
      return false;
    }

    proposal.usage.calls = 1;
    proposal.usage.costUnits = (double)rows.size();
    proposal.usage.latencyMs = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - start).count();
    log::debug() << "onnx fixer proposed " << proposal.patches.size() << " patch(es)\n";
    out = std::move(proposal);
    return true;
  }
};

} // namespace

GenerativeFixer* makeOnnxFixer(const std::string& modelPath) { return new OnnxFixer(modelPath); }

} // namespace lfx
#endif
