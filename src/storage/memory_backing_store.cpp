#include "norflash/storage/backing_store.hpp"

#include <cstring>

namespace norflash::storage {

Result<void> MemoryBackingStore::read_at(u64 offset, void* buffer, size_t size) {
    if (offset > data_.size() || size > data_.size() - offset) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_READ_FAILED,
            "Read past end of memory store"));
    }
    if (size != 0) {
        std::memcpy(buffer, data_.data() + offset, size);
    }
    return {};
}

Result<void> MemoryBackingStore::write_at(u64 offset, const void* data, size_t size) {
    if (offset > data_.size() || size > data_.size() - offset) {
        return unexpected(make_error(ErrorCode::BACKING_STORE_WRITE_FAILED,
            "Write past end of memory store"));
    }
    if (size != 0) {
        std::memcpy(data_.data() + offset, data, size);
    }
    return {};
}

Result<void> MemoryBackingStore::extend_to(u64 length, u8 fill) {
    if (length > data_.size()) {
        data_.resize(static_cast<size_t>(length), fill);
    }
    return {};
}

Result<void> MemoryBackingStore::truncate_to(u64 length) {
    if (length < data_.size()) {
        data_.resize(static_cast<size_t>(length));
    }
    return {};
}

std::string MemoryBackingStore::describe() const {
    return "memory:" + std::to_string(data_.size()) + " bytes";
}

}  // namespace norflash::storage
