#include "core/sniffer.hpp"
#include "json_min.h"
#include "validators/validator.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace gup;

namespace {

std::vector<uint8_t> bytes(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

// DOS stub whose e_lfanew points at a PE signature.
std::vector<uint8_t> peImage() {
  std::vector<uint8_t> pe(0x100, 0);
  pe[0] = 'M'; pe[1] = 'Z';
  pe[0x3C] = 0x80;
  std::memcpy(pe.data() + 0x80, "PE\0\0", 4);
  return pe;
}

void TestPdfHeader() {
  auto r = sniffBytes(bytes("%PDF-1.7\n%\xE2\xE3\xCF\xD3\n1 0 obj\n"));
  assert(r.mediaType == "application/pdf");
  assert(hexSpacedUpper(r.magic.data(), r.magic.size()) == "25 50 44 46 2D");

  // junk before the header is tolerated within the first KiB
  std::string prefixed(100, ' ');
  prefixed += "%PDF-1.4\n";
  assert(sniffBytes(bytes(prefixed)).mediaType == "application/pdf");
}

void TestUnknownInputs() {
  assert(sniffBytes(nullptr, 0).mediaType == kUnknownMediaType && "empty input is unknown");
  std::vector<uint8_t> zeros(4096, 0);
  auto r = sniffBytes(zeros);
  assert(r.mediaType == kUnknownMediaType && "all-zero bytes are unknown");
  assert(r.magic.size() == 8);

  std::mt19937 rng(1234);
  for (int i = 0; i < 200; ++i) {
    std::vector<uint8_t> buf(rng() % 600);
    for (auto& b : buf) b = (uint8_t)rng();
    auto x = sniffBytes(buf);
    assert(!x.mediaType.empty() && "sniffing random bytes always yields a type");
  }
}

void TestBinarySignatures() {
  assert(sniffBytes(bytes(std::string("\x89PNG\r\n\x1A\n", 8) + "rest")).mediaType == "image/png");
  assert(sniffBytes(bytes("\xFF\xD8\xFF\xE0....JFIF")).mediaType == "image/jpeg");
  assert(sniffBytes(bytes("GIF89a......")).mediaType == "image/gif");
  assert(sniffBytes(bytes(std::string("PK\x03\x04", 4) + "zipdata")).mediaType == "application/zip");
  assert(sniffBytes(bytes(std::string("\x7F" "ELF\x02\x01\x01", 7))).mediaType == kExecutableMediaType);
  assert(sniffBytes(peImage()).mediaType == kExecutableMediaType);
  assert(sniffBytes(bytes("BZh91AY&SY")).mediaType == "application/x-bzip2");

  std::vector<uint8_t> tar(600, 0);
  std::memcpy(tar.data() + 257, "ustar", 5);
  assert(sniffBytes(tar).mediaType == "application/x-tar");
}

void TestWeakMagicNeedsSecondMarker() {
  assert(sniffBytes(bytes("MZ Corp quarterly notes\n")).mediaType == "text/plain");
  assert(sniffBytes(bytes("BZh is an odd way to start a line\n")).mediaType == "text/plain");

  auto stub = peImage();
  std::memcpy(stub.data() + 0x80, "NE\0\0", 4);
  assert(sniffBytes(stub).mediaType != kExecutableMediaType && "no PE header, no executable");

  // a .txt file starting with those letters is not flagged
  FindingList out;
  checkExtension("txt", sniffBytes(bytes("MZ Corp quarterly notes\n")), out);
  assert(out.empty());
  assert(isKnownExtension("exe") && isKnownExtension("bz2"));
}

void TestTextHeuristic() {
  assert(sniffBytes(bytes("hello, 10b")).mediaType == "text/plain");
  assert(sniffBytes(bytes("#!/bin/sh\necho hi\n")).mediaType == "text/x-shellscript");
  assert(sniffBytes(bytes("<?xml version=\"1.0\"?><a/>")).mediaType == "application/xml");
  std::string bin = "abc";
  bin.push_back('\0');
  bin += "def";
  assert(sniffBytes(bytes(bin)).mediaType == kUnknownMediaType && "NUL rules out text");
}

void TestExtensions() {
  assert(claimedExtension("photo.JPG") == "jpg");
  assert(claimedExtension("dir.v2/README") == "");
  assert(claimedExtension(".bashrc") == "");
  assert(claimedExtension("a\\b\\setup.Exe") == "exe");
  assert(isKnownExtension("pdf"));
  assert(!isKnownExtension("qqq"));
  assert(isExecutableExtension("dll"));
  assert(!isExecutableExtension("png"));
  assert(isArchiveMediaType("application/zip"));
  assert(!isArchiveMediaType("application/pdf"));
}

} // namespace

int main() {
  TestPdfHeader();
  TestUnknownInputs();
  TestBinarySignatures();
  TestWeakMagicNeedsSecondMarker();
  TestTextHeuristic();
  TestExtensions();
  std::cout << "sniffer tests ok\n";
  return 0;
}
