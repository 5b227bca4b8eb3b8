#pragma once
#include "core/types.hpp"
#include "validators/validator.hpp"
#include <string>

namespace gup {

struct RoutingDecision {
  ValidatorKind kind = ValidatorKind::Generic;
  std::string handler; // "pdf", "image", "archive", "generic"
  std::string reason;  // "media-type" / "truncated" / "fallback"
};

// Chooses the validator from the sniffed media type only; the file name is
// never consulted. Inputs that were not fully retained go to the generic
// validator, which only checks size.
RoutingDecision routeToValidator(const SniffResult& sniff, bool fullyRetained = true);

} // namespace gup
