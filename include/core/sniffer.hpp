#pragma once
#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gup {

constexpr const char* kUnknownMediaType = "unknown/octet-stream";
constexpr const char* kExecutableMediaType = "application/x-executable";
constexpr size_t kSniffPrefixBytes = 8192;

// Identify the real media type from content only. Never fails; empty or
// unrecognised input yields kUnknownMediaType. Only the first
// kSniffPrefixBytes bytes are inspected.
SniffResult sniffBytes(const uint8_t* data, size_t len);
inline SniffResult sniffBytes(const std::vector<uint8_t>& buf){ return sniffBytes(buf.data(), buf.size()); }

// Canonical extensions of every known type, lower-case without dot.
bool isKnownExtension(const std::string& extLower);
bool isExecutableExtension(const std::string& extLower);

// "photo.JPG" -> "jpg"; "" when the identifier has no extension.
std::string claimedExtension(const std::string& identifier);

bool isArchiveMediaType(const std::string& mediaType);

} // namespace gup
