#include "entropy.h"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

namespace {

void TestEntropyBounds() {
  std::vector<uint8_t> zeros(4096, 0);
  assert(entropy_8bit(zeros) == 0.0);
  assert(entropy_8bit(nullptr, 0) == 0.0);

  std::vector<uint8_t> uniform(256 * 4);
  for (size_t i = 0; i < uniform.size(); ++i) uniform[i] = (uint8_t)i;
  assert(std::fabs(entropy_8bit(uniform) - 8.0) < 1e-9);

  std::vector<uint8_t> two(1000);
  for (size_t i = 0; i < two.size(); ++i) two[i] = (i & 1) ? 'a' : 'b';
  assert(std::fabs(entropy_8bit(two) - 1.0) < 1e-9);
}

void TestProfileWindows() {
  std::vector<uint8_t> buf(3000, 'x');
  auto w = entropy_profile(buf.data(), buf.size(), 1024, 512);
  assert(w.size() == 5);
  assert(w[0].offset == 0 && w[3].offset == 1536);
  assert(w.back().offset == 3000 - 1024 && "tail window ends at the last byte");
  for (auto& x : w) assert(x.length == 1024 && x.entropy == 0.0);

  auto small = entropy_profile(buf.data(), 100, 1024, 512);
  assert(small.size() == 1 && small[0].length == 100);

  assert(entropy_profile(buf.data(), 0, 1024, 512).empty());
}

void TestProfileLocatesNoise() {
  std::vector<uint8_t> buf(8192, 0);
  uint32_t s = 2463534242u;
  for (size_t i = 4096; i < 6144; ++i) {
    s ^= s << 13; s ^= s >> 17; s ^= s << 5;
    buf[i] = (uint8_t)s;
  }
  auto w = entropy_profile(buf.data(), buf.size(), 1024, 1024);
  assert(w.size() == 8);
  for (auto& x : w) {
    bool noisy = x.offset >= 4096 && x.offset < 6144;
    assert(noisy ? x.entropy > 7.0 : x.entropy == 0.0);
  }
}

} // namespace

int main() {
  TestEntropyBounds();
  TestProfileWindows();
  TestProfileLocatesNoise();
  std::cout << "entropy tests ok\n";
  return 0;
}
