
#pragma once
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace ferry {

class FileSource {
public:
    virtual ~FileSource() = default;
    virtual const std::string& name() const = 0;
    virtual const std::string& mime_type() const = 0;
    virtual uint64_t size() const = 0;
    // Returns the number of bytes copied; less than `n` only at the end or
    // on a read error.
    virtual size_t read(uint64_t offset, uint8_t* dst, size_t n) = 0;
};

class BufferSource : public FileSource {
public:
    BufferSource(std::string name, std::vector<uint8_t> data,
                 std::string mime = "application/octet-stream");
    const std::string& name() const override { return name_; }
    const std::string& mime_type() const override { return mime_; }
    uint64_t size() const override { return data_.size(); }
    size_t read(uint64_t offset, uint8_t* dst, size_t n) override;
private:
    std::string name_;
    std::string mime_;
    std::vector<uint8_t> data_;
};

class DiskFileSource : public FileSource {
public:
    // Returns nullptr when the path cannot be opened.
    static std::shared_ptr<DiskFileSource> open(const std::string& path);
    ~DiskFileSource() override;
    const std::string& name() const override { return name_; }
    const std::string& mime_type() const override { return mime_; }
    uint64_t size() const override { return size_; }
    size_t read(uint64_t offset, uint8_t* dst, size_t n) override;
private:
    DiskFileSource(std::FILE* f, std::string name, std::string mime, uint64_t size);
    std::FILE* f_;
    std::string name_;
    std::string mime_;
    uint64_t size_;
};

// Receives reassembled bytes at their payload offsets. Writes may arrive out
// of order and may overwrite earlier ones.
class PayloadSink {
public:
    virtual ~PayloadSink() = default;
    virtual bool write_at(uint64_t offset, const uint8_t* data, size_t len) = 0;
    // Copies back bytes already written; returns how many were copied.
    virtual size_t read_at(uint64_t offset, uint8_t* dst, size_t n) = 0;
    virtual bool finish() = 0;
    virtual void abort() = 0;
    // Whatever the consumer should be handed after finish().
    virtual std::shared_ptr<const std::vector<uint8_t>> payload() { return nullptr; }
    virtual std::string location() const { return {}; }
};

class MemorySink : public PayloadSink {
public:
    explicit MemorySink(uint64_t expected = 0);
    bool write_at(uint64_t offset, const uint8_t* data, size_t len) override;
    size_t read_at(uint64_t offset, uint8_t* dst, size_t n) override;
    bool finish() override { return true; }
    void abort() override { data_.clear(); }
    std::shared_ptr<const std::vector<uint8_t>> payload() override;
private:
    std::vector<uint8_t> data_;
};

// Writes to "<dir>/<name>.part" and renames on finish.
class DiskSink : public PayloadSink {
public:
    DiskSink(const std::string& dir, const std::string& file_name);
    ~DiskSink() override;
    bool write_at(uint64_t offset, const uint8_t* data, size_t len) override;
    size_t read_at(uint64_t offset, uint8_t* dst, size_t n) override;
    bool finish() override;
    void abort() override;
    std::string location() const override { return final_path_; }
private:
    bool open_part();

    std::string part_path_;
    std::string final_path_;
    std::FILE* f_{nullptr};
    bool failed_{false};
};

} // namespace ferry
