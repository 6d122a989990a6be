#pragma once

#include "norflash/storage/backing_store.hpp"
#include "norflash/storage/nor_flash.hpp"
#include "norflash/utils/error.hpp"
#include "norflash/utils/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace norflash::storage {

// How the emulator decides whether a byte may be written
enum class EraseTracking {
    ContentEquality,  // erased means "currently reads 0xFF"
    Strict            // per-byte erased/written bitmap, a written 0xFF stays written
};

const char* erase_tracking_to_string(EraseTracking tracking) noexcept;
Result<EraseTracking> erase_tracking_from_string(const std::string& name);

/**
 * @brief NOR Flash emulation engine backed by a persistent byte store
 *
 * Provides NOR flash behavior on top of a file (or any BackingStore):
 * - Read/write/erase with power-of-two alignment granularities
 * - Erase-before-write enforcement, rejected writes change nothing
 * - Erase sets bytes to 0xFF
 * - Byte i of the store is flash address i, there is no header
 *
 * An instance exclusively owns its store and is not thread-safe. Callers
 * sharing one across threads must serialize access themselves.
 */
class FlashEmulator : public NorFlash {
public:
    struct Config {
        std::string image_path = "flash.bin";
        FlashGeometry geometry{32 * KiB, 1, 1, 4 * KiB};
        EraseTracking erase_tracking = EraseTracking::Strict;
        // Oversized images are rejected unless this is set
        bool truncate_oversized_image = false;
    };

    struct FlashStats {
        u64 read_operations = 0;
        u64 write_operations = 0;
        u64 erase_operations = 0;
        u64 bytes_read = 0;
        u64 bytes_written = 0;
        u64 bytes_erased = 0;
        u64 rejected_operations = 0;
    };

    // Opens (or creates) the image file and sizes it to the configured capacity
    static Result<std::unique_ptr<FlashEmulator>> open(const Config& config);

    // Builds an emulator over an already opened store
    static Result<std::unique_ptr<FlashEmulator>> create(std::unique_ptr<BackingStore> store,
                                                         const FlashGeometry& geometry,
                                                         EraseTracking tracking = EraseTracking::Strict,
                                                         bool truncate_oversized = false);

    ~FlashEmulator() override;

    FlashEmulator(const FlashEmulator&) = delete;
    FlashEmulator& operator=(const FlashEmulator&) = delete;

    // NorFlash
    Result<void> read(Address offset, void* buffer, size_t size) override;
    Result<void> write(Address offset, const void* data, size_t size) override;
    Result<void> erase(Address offset, size_t size) override;

    size_t capacity() const override { return geometry_.capacity; }
    size_t read_granularity() const override { return geometry_.read_granularity; }
    size_t write_granularity() const override { return geometry_.write_granularity; }
    size_t erase_granularity() const override { return geometry_.erase_granularity; }

    EraseTracking erase_tracking() const { return tracking_; }

    // True when every byte of the range is erased. Only bounds are checked.
    Result<bool> is_erased(Address offset, size_t size);

    Result<void> flush();

    const FlashStats& get_statistics() const { return stats_; }
    void reset_statistics() { stats_ = FlashStats{}; }
    std::string get_flash_info() const;

private:
    FlashEmulator(std::unique_ptr<BackingStore> store, const FlashGeometry& geometry, EraseTracking tracking);

    Result<void> prepare_backing_store(bool truncate_oversized);
    Result<void> load_erase_map();

    // Offset of the first byte in range that is not erased, if any
    Result<std::optional<Address>> find_non_erased(Address offset, size_t size);

    void mark_range(Address offset, size_t size, bool erased);

    std::unique_ptr<BackingStore> store_;
    FlashGeometry geometry_;
    EraseTracking tracking_;
    std::vector<bool> erased_map_;  // per byte, only used with EraseTracking::Strict
    FlashStats stats_;
};

}  // namespace norflash::storage
