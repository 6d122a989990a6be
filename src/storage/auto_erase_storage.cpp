#include "norflash/storage/auto_erase_storage.hpp"
#include "norflash/utils/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace norflash::storage {

Result<std::unique_ptr<AutoEraseStorage>> AutoEraseStorage::create(NorFlash& flash) {
    const size_t erase_size = flash.erase_granularity();
    if (erase_size == 0 || flash.read_granularity() == 0 || flash.write_granularity() == 0 ||
        erase_size % flash.read_granularity() != 0 ||
        erase_size % flash.write_granularity() != 0) {
        return unexpected(make_error(ErrorCode::FLASH_INVALID_PARAMETERS,
            fmt::format("erase granularity {} must be a multiple of read granularity {} "
                        "and write granularity {} for read-modify-write",
                        erase_size, flash.read_granularity(), flash.write_granularity())));
    }
    return std::unique_ptr<AutoEraseStorage>(new AutoEraseStorage(flash));
}

AutoEraseStorage::AutoEraseStorage(NorFlash& flash)
    : flash_(flash), merge_buffer_(flash.erase_granularity()) {
}

Result<void> AutoEraseStorage::read(Address offset, void* buffer, size_t size) {
    return flash_.read(offset, buffer, size);
}

Result<void> AutoEraseStorage::erase(Address offset, size_t size) {
    return flash_.erase(offset, size);
}

Result<void> AutoEraseStorage::write(Address offset, const void* data, size_t size) {
    RETURN_IF_ERROR(check_bounds("write", offset, size, flash_.capacity()));
    if (size == 0) {
        return {};
    }
    if (data == nullptr) {
        return unexpected(make_error(ErrorCode::INVALID_PARAMETER, "Write data is null"));
    }

    const u64 block_size = flash_.erase_granularity();
    const u64 end = static_cast<u64>(offset) + size;
    const auto* bytes = static_cast<const u8*>(data);

    size_t blocks_done = 0;
    for (u64 block = align_down(offset, block_size); block < end; block += block_size) {
        auto result = rewrite_block(static_cast<Address>(block), offset, bytes, size);
        if (!result) {
            LOG_ERROR("Auto-erase write {} failed in block 0x{:08X} after {} block(s) were rewritten: {}",
                      format_range(offset, size), block, blocks_done, result.error().message());
            return result;
        }
        ++blocks_done;
    }

    LOG_TRACE("Auto-erase write {} rewrote {} block(s)", format_range(offset, size), blocks_done);
    return {};
}

Result<void> AutoEraseStorage::rewrite_block(Address block_start, Address offset, const u8* data, size_t size) {
    const size_t block_size = merge_buffer_.size();
    const size_t unit = flash_.write_granularity();
    u8* merge = merge_buffer_.data();

    RETURN_IF_ERROR(flash_.read(block_start, merge, block_size));
    RETURN_IF_ERROR(flash_.erase(block_start, block_size));

    // Part of the caller's range inside this block, relative to block_start
    const u64 range_start = std::max<u64>(offset, block_start) - block_start;
    const u64 range_end = std::min<u64>(static_cast<u64>(offset) + size,
                                        static_cast<u64>(block_start) + block_size) - block_start;
    std::memcpy(merge + range_start, data + (block_start + range_start - offset), range_end - range_start);

    // Units outside the range that were erased before stay erased; the rest
    // is written back in contiguous runs.
    auto needs_write = [&](size_t at) {
        if (at < range_end && at + unit > range_start) {
            return true;
        }
        return std::any_of(merge + at, merge + at + unit, [](u8 byte) { return byte != ERASED_BYTE; });
    };

    size_t run_start = 0;
    size_t run_length = 0;
    for (size_t at = 0; at <= block_size; at += unit) {
        if (at < block_size && needs_write(at)) {
            if (run_length == 0) {
                run_start = at;
            }
            run_length += unit;
            continue;
        }
        if (run_length != 0) {
            RETURN_IF_ERROR(flash_.write(block_start + static_cast<Address>(run_start), merge + run_start, run_length));
            run_length = 0;
        }
    }

    return {};
}

}  // namespace norflash::storage
