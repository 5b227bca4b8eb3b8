// include/entropy.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

double entropy_8bit(const std::vector<uint8_t>& buf);
double entropy_8bit(const uint8_t* data, size_t len);

struct EntropyWindow {
  size_t offset = 0;
  size_t length = 0;
  double entropy = 0.0;
};

// Shannon entropy of every window of `window` bytes, advancing by `step`.
// A region shorter than one window yields a single window covering it.
std::vector<EntropyWindow> entropy_profile(const uint8_t* data, size_t len,
                                           size_t window, size_t step);
