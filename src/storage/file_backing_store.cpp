#include "norflash/storage/backing_store.hpp"
#include "norflash/utils/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <system_error>

namespace norflash::storage {

namespace fs = std::filesystem;

namespace {

constexpr size_t FILL_CHUNK_SIZE = 64 * KiB;

}  // namespace

Result<std::unique_ptr<FileBackingStore>> FileBackingStore::open(const std::string& path) {
    if (path.empty()) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_OPEN_FAILED,
                                     "Backing store path is empty"));
    }

    fs::path file_path(expand_path(path));
    std::error_code ec;

    if (file_path.has_parent_path() && !fs::exists(file_path.parent_path(), ec)) {
        fs::create_directories(file_path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Failed to create directory {}: {}", file_path.parent_path().string(), ec.message());
            return unexpected(make_error(ErrorCode::BACKING_STORE_OPEN_FAILED,
                "Cannot create directory " + file_path.parent_path().string() + ": " + ec.message()));
        }
    }

    if (!fs::exists(file_path, ec)) {
        std::ofstream create(file_path, std::ios::binary);
        if (!create.is_open()) {
            LOG_ERROR("Failed to create backing file: {}", file_path.string());
            return unexpected(make_error(ErrorCode::BACKING_STORE_OPEN_FAILED,
                "Cannot create backing file " + file_path.string()));
        }
        LOG_DEBUG("Created empty backing file: {}", file_path.string());
    } else if (!fs::is_regular_file(file_path, ec)) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_OPEN_FAILED,
            "Backing store path is not a regular file: " + file_path.string()));
    }

    auto file_size = fs::file_size(file_path, ec);
    if (ec) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_OPEN_FAILED,
            "Cannot stat backing file " + file_path.string() + ": " + ec.message()));
    }

    std::unique_ptr<FileBackingStore> store(new FileBackingStore(file_path, file_size));
    RETURN_IF_ERROR(store->open_stream());
    return store;
}

FileBackingStore::FileBackingStore(fs::path path, u64 size)
    : path_(std::move(path)), size_(size) {
}

// Hands buffered data to the OS; there is no fsync, a power loss can still drop it
FileBackingStore::~FileBackingStore() {
    if (file_.is_open()) {
        file_.flush();
        if (!file_) {
            LOG_ERROR("Failed to flush backing file on close: {}", path_.string());
        }
        file_.close();
    }
}

Result<void> FileBackingStore::open_stream() {
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_.is_open()) {
        LOG_ERROR("Failed to open backing file for read/write: {}", path_.string());
        return unexpected(make_error(ErrorCode::BACKING_STORE_OPEN_FAILED,
            "Cannot open backing file " + path_.string() + " for read/write"));
    }
    return {};
}

Result<void> FileBackingStore::read_at(u64 offset, void* buffer, size_t size) {
    if (offset > size_ || size > size_ - offset) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_READ_FAILED,
            "Read past end of backing file " + path_.string()));
    }
    if (size == 0) {
        return {};
    }

    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(static_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (!file_) {
        file_.clear();
        LOG_ERROR("Backing file read of {} bytes at {} failed: {}", size, offset, path_.string());
        return unexpected(make_error(ErrorCode::BACKING_STORE_READ_FAILED,
            "Cannot read " + std::to_string(size) + " bytes at offset " +
            std::to_string(offset) + " from " + path_.string()));
    }
    return {};
}

Result<void> FileBackingStore::write_at(u64 offset, const void* data, size_t size) {
    if (offset > size_ || size > size_ - offset) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_WRITE_FAILED,
            "Write past end of backing file " + path_.string()));
    }
    if (size == 0) {
        return {};
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file_) {
        file_.clear();
        LOG_ERROR("Backing file write of {} bytes at {} failed: {}", size, offset, path_.string());
        return unexpected(make_error(ErrorCode::BACKING_STORE_WRITE_FAILED,
            "Cannot write " + std::to_string(size) + " bytes at offset " +
            std::to_string(offset) + " to " + path_.string()));
    }
    return {};
}

Result<void> FileBackingStore::extend_to(u64 length, u8 fill) {
    if (length <= size_) {
        return {};
    }

    std::vector<char> chunk(static_cast<size_t>(std::min<u64>(FILL_CHUNK_SIZE, length - size_)),
                            static_cast<char>(fill));
    file_.seekp(static_cast<std::streamoff>(size_));

    u64 position = size_;
    while (position < length) {
        auto count = static_cast<size_t>(std::min<u64>(chunk.size(), length - position));
        file_.write(chunk.data(), static_cast<std::streamsize>(count));
        if (!file_) {
            file_.clear();
            LOG_ERROR("Failed to extend backing file {} at offset {}", path_.string(), position);
            return unexpected(make_error(ErrorCode::BACKING_STORE_WRITE_FAILED,
                "Cannot extend " + path_.string() + " to " + std::to_string(length) + " bytes"));
        }
        position += count;
        // Track progress so a later failure leaves size_ matching the file
        size_ = position;
    }

    return flush();
}

Result<void> FileBackingStore::truncate_to(u64 length) {
    if (length >= size_) {
        return {};
    }

    file_.close();
    std::error_code ec;
    fs::resize_file(path_, length, ec);
    if (ec) {
        LOG_ERROR("Failed to truncate backing file {}: {}", path_.string(), ec.message());
        RETURN_IF_ERROR(open_stream());
        return unexpected(make_error(ErrorCode::BACKING_STORE_WRITE_FAILED,
            "Cannot truncate " + path_.string() + ": " + ec.message()));
    }
    size_ = length;
    return open_stream();
}

Result<void> FileBackingStore::flush() {
    file_.flush();
    if (!file_) {
        file_.clear();
        return unexpected(make_error(ErrorCode::BACKING_STORE_WRITE_FAILED,
            "Cannot flush backing file " + path_.string()));
    }
    return {};
}

std::string FileBackingStore::describe() const {
    return "file:" + path_.string();
}

std::string FileBackingStore::expand_path(const std::string& path) {
    if (path.size() >= 1 && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

}  // namespace norflash::storage
