#pragma once

#include "norflash/utils/error.hpp"
#include "norflash/utils/types.hpp"

#include <string>

namespace norflash::storage {

/**
 * @brief Size and alignment parameters of an emulated NOR flash part
 *
 * All three granularities must be non-zero powers of two and the capacity
 * must be a whole number of erase blocks addressable with 32 bits.
 */
struct FlashGeometry {
    size_t capacity = 0;
    size_t read_granularity = 1;
    size_t write_granularity = 1;
    size_t erase_granularity = 4096;

    Result<void> validate() const;
    size_t block_count() const { return erase_granularity ? capacity / erase_granularity : 0; }
};

/**
 * @brief Read side of a NOR flash device
 */
class ReadNorFlash {
public:
    virtual ~ReadNorFlash() = default;

    // Offset and size must be multiples of read_granularity()
    virtual Result<void> read(Address offset, void* buffer, size_t size) = 0;

    virtual size_t capacity() const = 0;
    virtual size_t read_granularity() const = 0;
};

/**
 * @brief NOR flash device with erase-before-write semantics
 *
 * write() only succeeds on erased bytes; erase() resets whole
 * erase_granularity() sized blocks to 0xFF.
 */
class NorFlash : public ReadNorFlash {
public:
    virtual Result<void> write(Address offset, const void* data, size_t size) = 0;
    virtual Result<void> erase(Address offset, size_t size) = 0;

    virtual size_t write_granularity() const = 0;
    virtual size_t erase_granularity() const = 0;
};

/**
 * @brief Byte-addressable readable storage without alignment rules of its own
 */
class ReadStorage {
public:
    virtual ~ReadStorage() = default;

    virtual Result<void> read(Address offset, void* buffer, size_t size) = 0;
    virtual size_t capacity() const = 0;
};

/**
 * @brief Storage whose writes take care of erasing on their own
 */
class Storage : public ReadStorage {
public:
    virtual Result<void> write(Address offset, const void* data, size_t size) = 0;
};

// Argument checks shared by NorFlash implementations. Alignment is checked
// before bounds, neither touches the device.
Result<void> check_read(const ReadNorFlash& flash, Address offset, size_t size);
Result<void> check_write(const NorFlash& flash, Address offset, size_t size);
Result<void> check_erase(const NorFlash& flash, Address offset, size_t size);

// Fails with FLASH_OUT_OF_BOUNDS unless [offset, offset + size) lies within capacity
Result<void> check_bounds(const char* operation, Address offset, size_t size, size_t capacity);

std::string format_range(Address offset, size_t size);

}  // namespace norflash::storage
