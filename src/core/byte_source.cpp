#include "core/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace gup {

bool FileByteSource::read(uint8_t* buffer, size_t maxLen, size_t& got, std::string& err) {
  got = 0;
  if (!opened_) {
    opened_ = true;
    std::error_code ec;
    if (std::filesystem::is_directory(path_, ec)) { err = "is a directory: " + path_.string(); return false; }
    in_.open(path_, std::ios::binary);
    if (!in_) { err = "open failed: " + path_.string() + ": " + std::strerror(errno); return false; }
  }
  if (!in_.is_open()) { err = "source not open: " + path_.string(); return false; }
  if (maxLen == 0 || in_.eof()) return true;
  in_.read(reinterpret_cast<char*>(buffer), (std::streamsize)maxLen);
  got = (size_t)in_.gcount();
  if (in_.bad()) { err = "read failed: " + path_.string(); return false; }
  return true;
}

bool MemoryByteSource::read(uint8_t* buffer, size_t maxLen, size_t& got, std::string&) {
  got = 0;
  if (offset_ >= data_.size() || maxLen == 0) return true;
  got = std::min(maxLen, data_.size() - offset_);
  std::memcpy(buffer, data_.data() + offset_, got);
  offset_ += got;
  return true;
}

} // namespace gup
