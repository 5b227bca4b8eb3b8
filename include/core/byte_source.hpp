#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace gup {

// A finite, non-rewindable byte stream supplied by the discovery collaborator.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to maxLen bytes. got == 0 with a true return means EOF.
  // Returns false on I/O error and fills err.
  virtual bool read(uint8_t* buffer, size_t maxLen, size_t& got, std::string& err) = 0;
};

class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::filesystem::path path) : path_(std::move(path)) {}
  bool read(uint8_t* buffer, size_t maxLen, size_t& got, std::string& err) override;

private:
  std::filesystem::path path_;
  std::ifstream in_;
  bool opened_ = false;
};

class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::vector<uint8_t> data) : data_(std::move(data)) {}
  explicit MemoryByteSource(const std::string& text) : data_(text.begin(), text.end()) {}
  bool read(uint8_t* buffer, size_t maxLen, size_t& got, std::string& err) override;

private:
  std::vector<uint8_t> data_;
  size_t offset_ = 0;
};

// One input of a scan run: logical identifier plus the source to read it from.
struct ScanInput {
  std::string identifier;
  std::unique_ptr<ByteSource> source;
};

} // namespace gup
