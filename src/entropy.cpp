// src/entropy.cpp
#include "entropy.h"
#include <cmath>

double entropy_8bit(const uint8_t* data, size_t len) {
  if (len == 0) return 0.0;
  double cnt[256] = {0};
  for (size_t i = 0; i < len; ++i) cnt[data[i]] += 1.0;
  double sum = (double)len;
  double H = 0.0;
  for (int i = 0; i < 256; ++i) if (cnt[i] > 0) {
    double p = cnt[i] / sum; H -= p * std::log2(p);
  }
  return H;
}

double entropy_8bit(const std::vector<uint8_t>& buf) {
  return entropy_8bit(buf.data(), buf.size());
}

std::vector<EntropyWindow> entropy_profile(const uint8_t* data, size_t len,
                                           size_t window, size_t step) {
  std::vector<EntropyWindow> out;
  if (len == 0 || window == 0) return out;
  if (step == 0) step = window;
  if (len <= window) {
    out.push_back(EntropyWindow{0, len, entropy_8bit(data, len)});
    return out;
  }
  size_t off = 0;
  for (; off + window <= len; off += step)
    out.push_back(EntropyWindow{off, window, entropy_8bit(data + off, window)});
  // tail not covered by the last full window
  size_t covered = out.back().offset + window;
  if (covered < len)
    out.push_back(EntropyWindow{len - window, window, entropy_8bit(data + len - window, window)});
  return out;
}
