// src/routing/router.cpp
#include "routing/router.hpp"
#include "core/sniffer.hpp"

namespace gup {

RoutingDecision routeToValidator(const SniffResult& sniff, bool fullyRetained) {
  RoutingDecision rd{};
  const std::string& mt = sniff.mediaType;

  if (!fullyRetained) {
    rd.kind = ValidatorKind::Generic;
    rd.handler = toString(rd.kind);
    rd.reason = "truncated";
    return rd;
  }

  if (mt == "application/pdf") {
    rd.kind = ValidatorKind::Pdf;
  } else if (mt.rfind("image/", 0) == 0) {
    rd.kind = ValidatorKind::Image;
  } else if (isArchiveMediaType(mt)) {
    rd.kind = ValidatorKind::Archive;
  } else {
    rd.kind = ValidatorKind::Generic;
    rd.handler = toString(rd.kind);
    rd.reason = "fallback";
    return rd;
  }
  rd.handler = toString(rd.kind);
  rd.reason = "media-type";
  return rd;
}

} // namespace gup
