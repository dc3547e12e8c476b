#pragma once
#include "document/Document.hpp"
#include "patch/PatchApplier.hpp"
#include "rules/Patch.hpp"
#include <string>
#include <vector>

namespace lfx {

// Classes that take an interactive element out of reach
bool isDisablingClass(const std::string& cls);

// Screens a generative proposal before it touches the document. A patch is
// dropped when a class is not a valid token, when its selector is invalid
// or matches nothing, or when it adds a disabling class to an interactive
// element. Accepted patches keep their order; dropped ones land in
// `rejected` with the reason.
PatchSet validateProposal(const Document& doc, const PatchSet& proposal,
                          std::vector<SkippedPatch>* rejected);

} // namespace lfx
