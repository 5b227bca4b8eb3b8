#include "core/byte_source.hpp"
#include "core/hasher.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace gup;

namespace {

const char* kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const char* kAbcDigest   = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

bool DigestOf(const uint8_t* data, size_t len, std::string& hex) {
  Sha256Hasher h;
  std::string err;
  return h.update(data, len) && h.finish(hex, err);
}

bool DigestOf(const std::string& s, std::string& hex) {
  return DigestOf(reinterpret_cast<const uint8_t*>(s.data()), s.size(), hex);
}

void TestKnownVectors() {
  std::string hex;
  assert(DigestOf("", hex) && hex == kEmptyDigest);
  assert(DigestOf("abc", hex) && hex == kAbcDigest);
}

void TestIncrementalMatchesOneShot() {
  Sha256Hasher h;
  assert(h.ok());
  const std::string parts[] = {"a", "", "b", "c"};
  for (auto& p : parts) assert(h.update(reinterpret_cast<const uint8_t*>(p.data()), p.size()));
  std::string hex, err;
  assert(h.finish(hex, err));
  assert(hex == kAbcDigest && "chunking must not change the digest");
  assert(h.bytesHashed() == 3);

  std::string again;
  assert(!h.finish(again, err) && "a digest is produced once");
  assert(!err.empty());
}

void TestDeterministicAndBitSensitive() {
  std::vector<uint8_t> data(100000);
  for (size_t i = 0; i < data.size(); ++i) data[i] = (uint8_t)(i * 31 + 7);
  std::string a, b, c;
  assert(DigestOf(data.data(), data.size(), a));
  assert(DigestOf(data.data(), data.size(), b));
  assert(a == b);
  data[5000] ^= 0x01;
  assert(DigestOf(data.data(), data.size(), c));
  assert(a != c && "one flipped bit changes the digest");
  assert(a.size() == 64);
}

void TestFileDigest() {
  auto path = std::filesystem::temp_directory_path() / "gup_hasher_test.bin";
  {
    std::ofstream f(path, std::ios::binary);
    f << "abc";
  }
  FileByteSource src(path.string());
  Sha256Hasher h;
  uint8_t buf[2];
  size_t got = 0;
  std::string err;
  for (;;) {
    assert(src.read(buf, sizeof buf, got, err));
    if (got == 0) break;
    assert(h.update(buf, got));
  }
  std::string hex;
  assert(h.finish(hex, err) && hex == kAbcDigest);
  std::filesystem::remove(path);

  FileByteSource missing(path.string());
  assert(!missing.read(buf, sizeof buf, got, err) && "missing file is an error, not a digest");
  assert(!err.empty());
}

} // namespace

int main() {
  TestKnownVectors();
  TestIncrementalMatchesOneShot();
  TestDeterministicAndBitSensitive();
  TestFileDigest();
  std::cout << "hasher tests ok\n";
  return 0;
}
