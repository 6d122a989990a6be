#pragma once

#include "norflash/utils/error.hpp"
#include "norflash/utils/types.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace norflash::storage {

/**
 * @brief Persistent random-access byte store underneath an emulated flash
 *
 * Implementations perform blocking I/O and report every failure as a
 * BACKING_STORE_* error. Reads past size() fail; writes past size() are
 * rejected as well, growth only happens through extend_to().
 */
class BackingStore {
public:
    virtual ~BackingStore() = default;

    virtual Result<void> read_at(u64 offset, void* buffer, size_t size) = 0;
    virtual Result<void> write_at(u64 offset, const void* data, size_t size) = 0;

    virtual u64 size() const = 0;

    // Grows the store to length bytes, new bytes take the fill value
    virtual Result<void> extend_to(u64 length, u8 fill) = 0;
    virtual Result<void> truncate_to(u64 length) = 0;

    virtual Result<void> flush() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Backing store kept in a regular file
 */
class FileBackingStore : public BackingStore {
public:
    // Opens path read/write, creating an empty file (and parent directories) if absent
    static Result<std::unique_ptr<FileBackingStore>> open(const std::string& path);

    ~FileBackingStore() override;

    FileBackingStore(const FileBackingStore&) = delete;
    FileBackingStore& operator=(const FileBackingStore&) = delete;

    Result<void> read_at(u64 offset, void* buffer, size_t size) override;
    Result<void> write_at(u64 offset, const void* data, size_t size) override;
    u64 size() const override { return size_; }
    Result<void> extend_to(u64 length, u8 fill) override;
    Result<void> truncate_to(u64 length) override;
    Result<void> flush() override;
    std::string describe() const override;

    const std::filesystem::path& path() const { return path_; }

    static std::string expand_path(const std::string& path);

private:
    FileBackingStore(std::filesystem::path path, u64 size);

    Result<void> open_stream();

    std::filesystem::path path_;
    std::fstream file_;
    u64 size_;
};

/**
 * @brief Volatile backing store, mostly for tests
 */
class MemoryBackingStore : public BackingStore {
public:
    MemoryBackingStore() = default;
    explicit MemoryBackingStore(std::vector<u8> initial) : data_(std::move(initial)) {}

    Result<void> read_at(u64 offset, void* buffer, size_t size) override;
    Result<void> write_at(u64 offset, const void* data, size_t size) override;
    u64 size() const override { return data_.size(); }
    Result<void> extend_to(u64 length, u8 fill) override;
    Result<void> truncate_to(u64 length) override;
    Result<void> flush() override { return {}; }
    std::string describe() const override;

    const std::vector<u8>& data() const { return data_; }

private:
    std::vector<u8> data_;
};

}  // namespace norflash::storage
