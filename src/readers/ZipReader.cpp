#include "readers/IArchiveReader.hpp"
#include <zip.h>
#include <vector>

namespace gup {

namespace {

constexpr size_t kChunk = 1 << 16;

bool isUnixSymlink(zip_uint8_t opsys, zip_uint32_t attr){
  if (opsys != ZIP_OPSYS_UNIX) return false;
  const zip_uint32_t mode = attr >> 16;
  return (mode & 0170000) == 0120000;
}

class ZipReader : public IArchiveReader {
  zip_t* z_ = nullptr;
  zip_int64_t idx_ = 0;          // entry returned by the last nextEntry
  zip_int64_t total_ = 0;

public:
  ~ZipReader() override { close(); }

  bool open(const uint8_t* data, size_t len, std::string& err) override {
    close();
    zip_error_t ze;
    zip_error_init(&ze);
    zip_source_t* src = zip_source_buffer_create(data, len, 0, &ze);
    if (!src) {
      err = std::string("zip_source_buffer_create failed: ") + zip_error_strerror(&ze);
      zip_error_fini(&ze);
      return false;
    }
    z_ = zip_open_from_source(src, ZIP_RDONLY, &ze);
    if (!z_) {
      err = std::string("zip_open failed: ") + zip_error_strerror(&ze);
      zip_source_free(src);
      zip_error_fini(&ze);
      return false;
    }
    zip_error_fini(&ze);
    total_ = zip_get_num_entries(z_, 0);
    if (total_ < 0) total_ = 0;
    idx_ = 0;
    return true;
  }

  uint64_t entryCount() const override { return (uint64_t)total_; }

  uint64_t declaredTotal() const override {
    if (!z_) return 0;
    uint64_t sum = 0;
    for (zip_int64_t i = 0; i < total_; ++i) {
      zip_stat_t st; zip_stat_init(&st);
      if (zip_stat_index(z_, (zip_uint64_t)i, 0, &st) != 0) continue;
      if (!(st.valid & ZIP_STAT_SIZE)) continue;
      if (st.size > UINT64_MAX - sum) return UINT64_MAX;
      sum += st.size;
    }
    return sum;
  }

  bool nextEntry(EntryInfo& out, std::string& err) override {
    if (!z_) { err = "zip not open"; return false; }
    if (idx_ >= total_) return false;

    zip_stat_t st; zip_stat_init(&st);
    if (zip_stat_index(z_, (zip_uint64_t)idx_, 0, &st) != 0) {
      err = std::string("zip_stat_index failed: ") + zip_strerror(z_);
      return false;
    }

    out.name           = st.name ? st.name : "";
    out.size           = (st.valid & ZIP_STAT_SIZE) ? (uint64_t)st.size : 0;
    out.compressedSize = (st.valid & ZIP_STAT_COMP_SIZE) ? (uint64_t)st.comp_size : 0;
    out.isDir          = !out.name.empty() && out.name.back() == '/';
    out.isEncrypted    = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE;

    zip_uint8_t opsys = 0;
    zip_uint32_t attr = 0;
    out.isSymlink = zip_file_get_external_attributes(z_, (zip_uint64_t)idx_, 0, &opsys, &attr) == 0 &&
                    isUnixSymlink(opsys, attr);
    return true;
  }

  bool readEntry(const ChunkSink& sink, std::string& err) override {
    if (!z_) { err = "zip not open"; return false; }
    const zip_int64_t cur = idx_++;

    zip_file_t* zf = zip_fopen_index(z_, (zip_uint64_t)cur, 0);
    if (!zf) { err = std::string("zip_fopen_index failed: ") + zip_strerror(z_); return false; }

    std::vector<uint8_t> buf(kChunk);
    zip_int64_t n;
    bool ok = true;
    while ((n = zip_fread(zf, buf.data(), buf.size())) > 0) {
      if (!sink(buf.data(), (size_t)n)) break;
    }
    if (n < 0) {
      err = std::string("zip_fread failed: ") + zip_file_strerror(zf);
      ok = false;
    }
    zip_fclose(zf);
    return ok;
  }

  void skipEntry() override { if (idx_ < total_) idx_++; }

  void close() override {
    if (z_) { zip_discard(z_); z_ = nullptr; }
  }
};

} // namespace

std::unique_ptr<IArchiveReader> makeZipReader() {
  return std::make_unique<ZipReader>();
}

} // namespace gup
