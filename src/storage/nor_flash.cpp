#include "norflash/storage/nor_flash.hpp"

#include <fmt/format.h>

namespace norflash::storage {

namespace {

Result<void> check_alignment(const char* operation, Address offset, size_t size,
                             size_t granularity, const char* granularity_name) {
    if (!is_aligned(offset, granularity)) {
        return unexpected(make_error(ErrorCode::FLASH_NOT_ALIGNED,
            fmt::format("{} offset 0x{:08X} is not a multiple of {} {}",
                        operation, offset, granularity_name, granularity))
            .with_address(offset));
    }
    if (!is_aligned(size, granularity)) {
        return unexpected(make_error(ErrorCode::FLASH_NOT_ALIGNED,
            fmt::format("{} length {} is not a multiple of {} {}",
                        operation, size, granularity_name, granularity))
            .with_address(offset));
    }
    return {};
}

}  // namespace

Result<void> FlashGeometry::validate() const {
    if (!is_power_of_two(read_granularity)) {
        return unexpected(make_error(ErrorCode::FLASH_INVALID_PARAMETERS,
            fmt::format("read granularity must be a power of two (got {})", read_granularity)));
    }
    if (!is_power_of_two(write_granularity)) {
        return unexpected(make_error(ErrorCode::FLASH_INVALID_PARAMETERS,
            fmt::format("write granularity must be a power of two (got {})", write_granularity)));
    }
    if (!is_power_of_two(erase_granularity)) {
        return unexpected(make_error(ErrorCode::FLASH_INVALID_PARAMETERS,
            fmt::format("erase granularity must be a power of two (got {})", erase_granularity)));
    }
    if (capacity % erase_granularity != 0) {
        return unexpected(make_error(ErrorCode::FLASH_INVALID_PARAMETERS,
            fmt::format("capacity must be a multiple of the erase granularity ({} % {} != 0)",
                        capacity, erase_granularity)));
    }
    if (static_cast<u64>(capacity) > MAX_FLASH_CAPACITY) {
        return unexpected(make_error(ErrorCode::FLASH_INVALID_PARAMETERS,
            fmt::format("capacity {} exceeds the 32-bit address space", capacity)));
    }
    return {};
}

Result<void> check_bounds(const char* operation, Address offset, size_t size, size_t capacity) {
    // Written as two comparisons so offset + size cannot overflow
    if (size > capacity || offset > capacity - size) {
        return unexpected(make_error(ErrorCode::FLASH_OUT_OF_BOUNDS,
            fmt::format("{} range {} exceeds capacity 0x{:X}",
                        operation, format_range(offset, size), capacity))
            .with_address(offset));
    }
    return {};
}

Result<void> check_read(const ReadNorFlash& flash, Address offset, size_t size) {
    RETURN_IF_ERROR(check_alignment("read", offset, size, flash.read_granularity(), "read granularity"));
    return check_bounds("read", offset, size, flash.capacity());
}

Result<void> check_write(const NorFlash& flash, Address offset, size_t size) {
    RETURN_IF_ERROR(check_alignment("write", offset, size, flash.write_granularity(), "write granularity"));
    return check_bounds("write", offset, size, flash.capacity());
}

Result<void> check_erase(const NorFlash& flash, Address offset, size_t size) {
    RETURN_IF_ERROR(check_alignment("erase", offset, size, flash.erase_granularity(), "erase granularity"));
    return check_bounds("erase", offset, size, flash.capacity());
}

std::string format_range(Address offset, size_t size) {
    return fmt::format("[0x{:08X}, 0x{:08X})", offset, static_cast<u64>(offset) + size);
}

}  // namespace norflash::storage
