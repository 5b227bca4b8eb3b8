#include "validators/validator.hpp"

namespace gup {

namespace {

class GenericValidator : public IValidator {
public:
  ValidatorKind kind() const override { return ValidatorKind::Generic; }
  const char* name() const override { return "generic"; }

  void validate(const ValidationInput& in, const Limits& limits,
                Budget& budget, FindingList& out) const override {
    if (!budget.checkpoint()) return;
    if (in.totalSize > limits.maxFileBytes) {
      out.add(finding::kOversized, Severity::High,
              std::to_string(in.totalSize) + " bytes exceeds max size of " +
              std::to_string(limits.maxFileBytes) + " bytes; content not inspected");
    }
  }
};

} // namespace

std::unique_ptr<IValidator> makeGenericValidator() {
  return std::make_unique<GenericValidator>();
}

} // namespace gup
