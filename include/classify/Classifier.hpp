#pragma once
#include "classify/Defect.hpp"
#include "document/Document.hpp"
#include "validate/Validator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lfx {

class Classifier {
public:
  virtual ~Classifier() = default;

  // Total over the interactive elements of `doc`. `report` is the last
  // validation of this same document, or null on the first pass. Fails
  // only when the document cannot be parsed.
  virtual bool classify(const Document& doc,
                        const ValidationReport* report,
                        const Thresholds& thresholds,
                        std::vector<ClassifiedError>& out,
                        std::string* error) const = 0;
};

std::unique_ptr<Classifier> makeLayoutClassifier();

// Family order, then confidence descending, then selector.
void prioritize(std::vector<ClassifiedError>& errors);

} // namespace lfx
