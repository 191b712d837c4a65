
#include "payload_io.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace ferry {

BufferSource::BufferSource(std::string name, std::vector<uint8_t> data,
                           std::string mime)
    : name_(std::move(name)), mime_(std::move(mime)), data_(std::move(data)) {}

size_t BufferSource::read(uint64_t offset, uint8_t *dst, size_t n) {
  if (offset >= data_.size())
    return 0;
  size_t avail = (size_t)(data_.size() - offset);
  size_t k = n < avail ? n : avail;
  std::memcpy(dst, data_.data() + offset, k);
  return k;
}

std::shared_ptr<DiskFileSource> DiskFileSource::open(const std::string &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    Logger::instance().log(LogLevel::ERROR, "cannot stat %s: %s", path.c_str(),
                           std::strerror(errno));
    return nullptr;
  }
  std::FILE *f = std::fopen(path.c_str(), "rb");
  if (!f) {
    Logger::instance().log(LogLevel::ERROR, "cannot open %s: %s", path.c_str(),
                           std::strerror(errno));
    return nullptr;
  }
  std::string name = sanitize_file_name(path);
  std::string mime = guess_mime_type(name);
  return std::shared_ptr<DiskFileSource>(
      new DiskFileSource(f, name, mime, (uint64_t)st.st_size));
}

DiskFileSource::DiskFileSource(std::FILE *f, std::string name, std::string mime,
                               uint64_t size)
    : f_(f), name_(std::move(name)), mime_(std::move(mime)), size_(size) {}

DiskFileSource::~DiskFileSource() {
  if (f_)
    std::fclose(f_);
}

size_t DiskFileSource::read(uint64_t offset, uint8_t *dst, size_t n) {
  if (offset >= size_)
    return 0;
  if (fseeko(f_, (off_t)offset, SEEK_SET) != 0) {
    Logger::instance().log(LogLevel::ERROR, "seek %s: %s", name_.c_str(),
                           std::strerror(errno));
    return 0;
  }
  return std::fread(dst, 1, n, f_);
}

MemorySink::MemorySink(uint64_t expected) {
  const uint64_t cap = 64ull * 1024 * 1024;
  data_.reserve((size_t)(expected < cap ? expected : cap));
}

bool MemorySink::write_at(uint64_t offset, const uint8_t *data, size_t len) {
  if (len == 0)
    return true;
  uint64_t end = offset + len;
  if (end > data_.size())
    data_.resize((size_t)end);
  std::memcpy(data_.data() + offset, data, len);
  return true;
}

size_t MemorySink::read_at(uint64_t offset, uint8_t *dst, size_t n) {
  if (offset >= data_.size())
    return 0;
  size_t avail = (size_t)(data_.size() - offset);
  size_t k = n < avail ? n : avail;
  std::memcpy(dst, data_.data() + offset, k);
  return k;
}

std::shared_ptr<const std::vector<uint8_t>> MemorySink::payload() {
  return std::make_shared<const std::vector<uint8_t>>(std::move(data_));
}

DiskSink::DiskSink(const std::string &dir, const std::string &file_name) {
  std::string base = dir.empty() ? std::string(".") : dir;
  if (base.back() != '/')
    base.push_back('/');
  final_path_ = base + sanitize_file_name(file_name);
  part_path_ = final_path_ + ".part";
}

DiskSink::~DiskSink() {
  if (f_)
    abort();
}

bool DiskSink::open_part() {
  if (f_)
    return true;
  f_ = std::fopen(part_path_.c_str(), "w+b");
  if (!f_) {
    Logger::instance().log(LogLevel::ERROR, "cannot create %s: %s",
                           part_path_.c_str(), std::strerror(errno));
    failed_ = true;
    return false;
  }
  return true;
}

bool DiskSink::write_at(uint64_t offset, const uint8_t *data, size_t len) {
  if (failed_ || !open_part())
    return false;
  if (len == 0)
    return true;
  if (fseeko(f_, (off_t)offset, SEEK_SET) != 0 ||
      std::fwrite(data, 1, len, f_) != len) {
    Logger::instance().log(LogLevel::ERROR, "write %s at %llu: %s",
                           part_path_.c_str(), (unsigned long long)offset,
                           std::strerror(errno));
    failed_ = true;
    return false;
  }
  return true;
}

size_t DiskSink::read_at(uint64_t offset, uint8_t *dst, size_t n) {
  if (failed_ || !f_)
    return 0;
  if (fseeko(f_, (off_t)offset, SEEK_SET) != 0) {
    Logger::instance().log(LogLevel::ERROR, "seek %s: %s", part_path_.c_str(),
                           std::strerror(errno));
    return 0;
  }
  return std::fread(dst, 1, n, f_);
}

bool DiskSink::finish() {
  if (failed_)
    return false;
  // An empty payload never wrote anything; create the file now.
  if (!open_part())
    return false;
  bool ok = std::fclose(f_) == 0;
  f_ = nullptr;
  if (!ok || std::rename(part_path_.c_str(), final_path_.c_str()) != 0) {
    Logger::instance().log(LogLevel::ERROR, "cannot finalize %s: %s",
                           final_path_.c_str(), std::strerror(errno));
    std::remove(part_path_.c_str());
    failed_ = true;
    return false;
  }
  return true;
}

void DiskSink::abort() {
  if (f_) {
    std::fclose(f_);
    f_ = nullptr;
  }
  std::remove(part_path_.c_str());
}

} // namespace ferry
