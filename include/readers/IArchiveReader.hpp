#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace gup {

// One entry of an archive as reported by its central directory.
struct EntryInfo {
  std::string name;
  uint64_t    size = 0;             // declared uncompressed size
  uint64_t    compressedSize = 0;
  bool        isDir = false;
  bool        isSymlink = false;
  bool        isEncrypted = false;
};

// Receives inflated bytes chunk by chunk; returning false stops the read.
using ChunkSink = std::function<bool(const uint8_t* data, size_t len)>;

class IArchiveReader {
public:
  virtual ~IArchiveReader() = default;

  // Opens an archive held in memory. `data` must outlive the reader.
  virtual bool open(const uint8_t* data, size_t len, std::string& err) = 0;

  virtual uint64_t entryCount() const = 0;
  // Sum of the declared uncompressed sizes; nothing is inflated.
  virtual uint64_t declaredTotal() const = 0;

  // Fills `out` with the current entry without advancing.
  // Returns false once every entry has been visited or on error (check `err`).
  virtual bool nextEntry(EntryInfo& out, std::string& err) = 0;

  // Streams the current entry to `sink` in fixed chunks and advances.
  virtual bool readEntry(const ChunkSink& sink, std::string& err) = 0;

  // Advances past the current entry without inflating it.
  virtual void skipEntry() = 0;

  virtual void close() = 0;
};

std::unique_ptr<IArchiveReader> makeZipReader();

} // namespace gup
