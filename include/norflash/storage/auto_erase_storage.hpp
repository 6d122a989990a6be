#pragma once

#include "norflash/storage/nor_flash.hpp"
#include "norflash/utils/error.hpp"
#include "norflash/utils/types.hpp"

#include <memory>
#include <vector>

namespace norflash::storage {

/**
 * @brief Read-modify-write Storage on top of a NorFlash
 *
 * write() erases every block it touches and restores the bytes of those
 * blocks that lie outside the written range, so callers never deal with
 * erase state or alignment. Blocks are rewritten one after another: a write
 * spanning several blocks that fails midway leaves the earlier blocks
 * already rewritten.
 *
 * The flash is borrowed and must outlive the adapter.
 */
class AutoEraseStorage : public Storage {
public:
    // Fails unless the erase granularity is a multiple of the read and write granularities
    static Result<std::unique_ptr<AutoEraseStorage>> create(NorFlash& flash);

    Result<void> read(Address offset, void* buffer, size_t size) override;
    Result<void> write(Address offset, const void* data, size_t size) override;
    size_t capacity() const override { return flash_.capacity(); }

    Result<void> erase(Address offset, size_t size);

    NorFlash& flash() const { return flash_; }

private:
    explicit AutoEraseStorage(NorFlash& flash);

    // Erases the block at block_start and writes it back with [offset, offset + size) replaced by data
    Result<void> rewrite_block(Address block_start, Address offset, const u8* data, size_t size);

    NorFlash& flash_;
    std::vector<u8> merge_buffer_;
};

}  // namespace norflash::storage
