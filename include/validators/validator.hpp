#pragma once
#include "core/resource_guard.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace gup {

enum class ValidatorKind { Pdf, Image, Archive, Generic };
const char* toString(ValidatorKind k);

struct ValidationInput {
  const uint8_t* data = nullptr;
  size_t   len = 0;          // bytes retained in memory
  uint64_t totalSize = 0;    // full length of the input stream
  const SniffResult* sniff = nullptr;
  std::string identifier;
};

// Validators are total: every parse error, unexpected EOF or limit hit is a
// Finding. They charge the bytes they read or inflate to the budget and stop
// as soon as charge() or checkpoint() returns false.
class IValidator {
public:
  virtual ~IValidator() = default;
  virtual ValidatorKind kind() const = 0;
  virtual const char* name() const = 0;
  virtual void validate(const ValidationInput& in, const Limits& limits,
                        Budget& budget, FindingList& out) const = 0;
};

std::unique_ptr<IValidator> makePdfValidator();
std::unique_ptr<IValidator> makeImageValidator();
std::unique_ptr<IValidator> makeArchiveValidator();
std::unique_ptr<IValidator> makeGenericValidator();
std::unique_ptr<IValidator> makeValidator(ValidatorKind k);

// Emits extension-mismatch when the claimed extension contradicts the content.
void checkExtension(const std::string& claimedExt, const SniffResult& sniff, FindingList& out);

} // namespace gup
