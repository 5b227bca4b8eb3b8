#include "validators/validator.hpp"
#include "core/sniffer.hpp"
#include <algorithm>

namespace gup {

const char* toString(ValidatorKind k){
  switch (k) { case ValidatorKind::Pdf: return "pdf";
               case ValidatorKind::Image: return "image";
               case ValidatorKind::Archive: return "archive";
               case ValidatorKind::Generic: return "generic"; }
  return "generic";
}

std::unique_ptr<IValidator> makeValidator(ValidatorKind k){
  switch (k) {
    case ValidatorKind::Pdf:     return makePdfValidator();
    case ValidatorKind::Image:   return makeImageValidator();
    case ValidatorKind::Archive: return makeArchiveValidator();
    case ValidatorKind::Generic: return makeGenericValidator();
  }
  return makeGenericValidator();
}

static bool isTextual(const std::string& mt){
  return mt.rfind("text/", 0) == 0 || mt == "application/xml";
}

void checkExtension(const std::string& claimedExt, const SniffResult& sniff, FindingList& out){
  if (claimedExt.empty()) return;
  const auto& exts = sniff.extensions;
  const bool listed = std::find(exts.begin(), exts.end(), claimedExt) != exts.end();

  if (sniff.mediaType == kExecutableMediaType) {
    if (!listed && !isExecutableExtension(claimedExt))
      out.add(finding::kExtensionMismatch, Severity::High,
              "." + claimedExt + " claimed but content is " + sniff.label);
    return;
  }
  if (listed || !isKnownExtension(claimedExt)) return;
  if (sniff.mediaType == kUnknownMediaType) {
    out.add(finding::kExtensionMismatch, Severity::Medium,
            "." + claimedExt + " claimed but content matches no known signature");
    return;
  }
  // .json sniffed as text/plain or .svg sniffed as text is not a contradiction.
  if (isTextual(sniff.mediaType)) {
    static const char* textual[] = {"txt","text","log","csv","tsv","md","ini","conf","cfg","json","yaml","yml",
                                    "xml","svg","xsd","xsl","plist","html","htm","xhtml",
                                    "sh","bash","zsh","ksh","csh","py","pl","rb"};
    for (const char* t : textual) if (claimedExt == t) return;
  }
  out.add(finding::kExtensionMismatch, Severity::Medium,
          "." + claimedExt + " claimed but content is " + sniff.mediaType);
}

} // namespace gup
