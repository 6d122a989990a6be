#pragma once

#include <cstdint>
#include <cstddef>

namespace norflash {

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using size_t = std::size_t;

// Flash offsets are 32-bit, like the address bus of the parts being emulated
using Address = u32;

constexpr u8 ERASED_BYTE = 0xFF;

// Largest capacity a 32-bit address can cover
constexpr u64 MAX_FLASH_CAPACITY = u64{1} << 32;

constexpr size_t KiB = 1024;
constexpr size_t MiB = 1024 * KiB;

constexpr bool is_power_of_two(u64 value) {
    return value != 0 && (value & (value - 1)) == 0;
}

constexpr u64 align_down(u64 value, u64 alignment) {
    return value & ~(alignment - 1);
}

constexpr bool is_aligned(u64 value, u64 alignment) {
    return (value & (alignment - 1)) == 0;
}

}  // namespace norflash
