#include "norflash/storage/flash_emulator.hpp"
#include "norflash/utils/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <sstream>

namespace norflash::storage {

namespace {

// Upper bound for scratch buffers used while scanning or filling the store
constexpr size_t SCAN_CHUNK_SIZE = 64 * KiB;

}  // namespace

const char* erase_tracking_to_string(EraseTracking tracking) noexcept {
    switch (tracking) {
        case EraseTracking::ContentEquality: return "content";
        case EraseTracking::Strict: return "strict";
        default: return "unknown";
    }
}

Result<EraseTracking> erase_tracking_from_string(const std::string& name) {
    if (name == "strict") {
        return EraseTracking::Strict;
    }
    if (name == "content") {
        return EraseTracking::ContentEquality;
    }
    return unexpected(make_error(ErrorCode::CONFIG_INVALID_VALUE,
        "Unknown erase tracking mode '" + name + "' (expected 'strict' or 'content')"));
}

Result<std::unique_ptr<FlashEmulator>> FlashEmulator::open(const Config& config) {
    // Reject bad parameters before the image file is created or resized
    RETURN_IF_ERROR(config.geometry.validate());

    ASSIGN_OR_RETURN(auto file_store, FileBackingStore::open(config.image_path));
    return create(std::move(file_store), config.geometry, config.erase_tracking,
                  config.truncate_oversized_image);
}

Result<std::unique_ptr<FlashEmulator>> FlashEmulator::create(std::unique_ptr<BackingStore> store,
                                                             const FlashGeometry& geometry,
                                                             EraseTracking tracking,
                                                             bool truncate_oversized) {
    if (!store) {
        return unexpected(make_error(ErrorCode::INVALID_PARAMETER, "Backing store is null"));
    }
    RETURN_IF_ERROR(geometry.validate());

    std::unique_ptr<FlashEmulator> flash(new FlashEmulator(std::move(store), geometry, tracking));
    RETURN_IF_ERROR(flash->prepare_backing_store(truncate_oversized));
    if (tracking == EraseTracking::Strict) {
        RETURN_IF_ERROR(flash->load_erase_map());
    }

    LOG_INFO("Flash emulator ready on {}: {} bytes, granularity read={} write={} erase={}, {} erase tracking",
             flash->store_->describe(), geometry.capacity, geometry.read_granularity,
             geometry.write_granularity, geometry.erase_granularity, erase_tracking_to_string(tracking));
    return flash;
}

FlashEmulator::FlashEmulator(std::unique_ptr<BackingStore> store,
                             const FlashGeometry& geometry,
                             EraseTracking tracking)
    : store_(std::move(store)), geometry_(geometry), tracking_(tracking) {
}

FlashEmulator::~FlashEmulator() {
    if (store_) {
        auto result = store_->flush();
        if (!result) {
            LOG_ERROR("Failed to flush {} on close: {}", store_->describe(), result.error().to_string());
        }
    }
}

Result<void> FlashEmulator::prepare_backing_store(bool truncate_oversized) {
    const u64 current = store_->size();
    const u64 wanted = geometry_.capacity;

    if (current < wanted) {
        LOG_INFO("Extending {} from {} to {} bytes with erased bytes", store_->describe(), current, wanted);
        return store_->extend_to(wanted, ERASED_BYTE);
    }

    if (current > wanted) {
        if (!truncate_oversized) {
            LOG_ERROR("{} holds {} bytes, larger than flash capacity {}", store_->describe(), current, wanted);
            return unexpected(make_error(ErrorCode::BACKING_STORE_SIZE_MISMATCH,
                fmt::format("{} holds {} bytes but flash capacity is {}", store_->describe(), current, wanted)));
        }
        LOG_WARN("Truncating {} from {} to {} bytes", store_->describe(), current, wanted);
        return store_->truncate_to(wanted);
    }

    return {};
}

Result<void> FlashEmulator::load_erase_map() {
    erased_map_.assign(geometry_.capacity, false);

    std::vector<u8> chunk(std::min(SCAN_CHUNK_SIZE, geometry_.capacity));
    for (u64 position = 0; position < geometry_.capacity; position += chunk.size()) {
        const auto count = static_cast<size_t>(std::min<u64>(chunk.size(), geometry_.capacity - position));
        RETURN_IF_ERROR(store_->read_at(position, chunk.data(), count));
        for (size_t i = 0; i < count; ++i) {
            erased_map_[position + i] = chunk[i] == ERASED_BYTE;
        }
    }
    return {};
}

Result<void> FlashEmulator::read(Address offset, void* buffer, size_t size) {
    if (auto check = check_read(*this, offset, size); !check) {
        ++stats_.rejected_operations;
        LOG_DEBUG("Rejected read: {}", check.error().message());
        return check;
    }
    if (size == 0) {
        return {};
    }
    if (buffer == nullptr) {
        return unexpected(make_error(ErrorCode::INVALID_PARAMETER, "Read buffer is null"));
    }

    RETURN_IF_ERROR(store_->read_at(offset, buffer, size));

    ++stats_.read_operations;
    stats_.bytes_read += size;
    LOG_TRACE("Read {} bytes at 0x{:08X}", size, offset);
    return {};
}

Result<void> FlashEmulator::write(Address offset, const void* data, size_t size) {
    if (auto check = check_write(*this, offset, size); !check) {
        ++stats_.rejected_operations;
        LOG_DEBUG("Rejected write: {}", check.error().message());
        return check;
    }
    if (size == 0) {
        return {};
    }
    if (data == nullptr) {
        return unexpected(make_error(ErrorCode::INVALID_PARAMETER, "Write data is null"));
    }

    ASSIGN_OR_RETURN(auto non_erased, find_non_erased(offset, size));
    if (non_erased) {
        ++stats_.rejected_operations;
        LOG_WARN("Write {} rejected, byte at 0x{:08X} is not erased", format_range(offset, size), *non_erased);
        return unexpected(make_error(ErrorCode::FLASH_NOT_ERASED,
            fmt::format("write {} targets non-erased byte at 0x{:08X}", format_range(offset, size), *non_erased))
            .with_address(*non_erased));
    }

    auto written = store_->write_at(offset, data, size);
    // A failed store write may still have changed part of the range
    mark_range(offset, size, false);
    if (!written) {
        LOG_ERROR("Write {} failed: {}", format_range(offset, size), written.error().message());
        return written;
    }
    RETURN_IF_ERROR(store_->flush());

    ++stats_.write_operations;
    stats_.bytes_written += size;
    LOG_TRACE("Wrote {} bytes at 0x{:08X}", size, offset);
    return {};
}

Result<void> FlashEmulator::erase(Address offset, size_t size) {
    if (auto check = check_erase(*this, offset, size); !check) {
        ++stats_.rejected_operations;
        LOG_DEBUG("Rejected erase: {}", check.error().message());
        return check;
    }
    if (size == 0) {
        return {};
    }

    const std::vector<u8> erased(std::min(SCAN_CHUNK_SIZE, size), ERASED_BYTE);
    u64 position = offset;
    const u64 end = static_cast<u64>(offset) + size;
    while (position < end) {
        const auto count = static_cast<size_t>(std::min<u64>(erased.size(), end - position));
        auto result = store_->write_at(position, erased.data(), count);
        if (!result) {
            LOG_ERROR("Erase {} failed at 0x{:08X}: {}", format_range(offset, size), position,
                      result.error().message());
            return result;
        }
        mark_range(static_cast<Address>(position), count, true);
        position += count;
    }
    RETURN_IF_ERROR(store_->flush());

    ++stats_.erase_operations;
    stats_.bytes_erased += size;
    LOG_TRACE("Erased {} ({} blocks)", format_range(offset, size), size / geometry_.erase_granularity);
    return {};
}

Result<bool> FlashEmulator::is_erased(Address offset, size_t size) {
    RETURN_IF_ERROR(check_bounds("erase query", offset, size, geometry_.capacity));
    ASSIGN_OR_RETURN(auto non_erased, find_non_erased(offset, size));
    return !non_erased.has_value();
}

Result<void> FlashEmulator::flush() {
    return store_->flush();
}

Result<std::optional<Address>> FlashEmulator::find_non_erased(Address offset, size_t size) {
    const u64 end = static_cast<u64>(offset) + size;

    if (tracking_ == EraseTracking::Strict) {
        for (u64 position = offset; position < end; ++position) {
            if (!erased_map_[position]) {
                return std::optional<Address>(static_cast<Address>(position));
            }
        }
        return std::optional<Address>();
    }

    std::vector<u8> chunk(std::min(SCAN_CHUNK_SIZE, size));
    for (u64 position = offset; position < end; position += chunk.size()) {
        const auto count = static_cast<size_t>(std::min<u64>(chunk.size(), end - position));
        RETURN_IF_ERROR(store_->read_at(position, chunk.data(), count));
        auto it = std::find_if(chunk.begin(), chunk.begin() + count,
                               [](u8 byte) { return byte != ERASED_BYTE; });
        if (it != chunk.begin() + count) {
            return std::optional<Address>(static_cast<Address>(position + (it - chunk.begin())));
        }
    }
    return std::optional<Address>();
}

void FlashEmulator::mark_range(Address offset, size_t size, bool erased) {
    if (tracking_ != EraseTracking::Strict) {
        return;
    }
    std::fill_n(erased_map_.begin() + offset, size, erased);
}

std::string FlashEmulator::get_flash_info() const {
    std::ostringstream info;
    info << "Flash Emulator Information:\n";
    info << "  Backing Store: " << store_->describe() << "\n";
    info << "  Capacity: " << geometry_.capacity << " bytes (0x" << std::hex << geometry_.capacity
         << std::dec << ")\n";
    info << "  Read Granularity: " << geometry_.read_granularity << " bytes\n";
    info << "  Write Granularity: " << geometry_.write_granularity << " bytes\n";
    info << "  Erase Granularity: " << geometry_.erase_granularity << " bytes\n";
    info << "  Erase Blocks: " << geometry_.block_count() << "\n";
    info << "  Erase Tracking: " << erase_tracking_to_string(tracking_) << "\n";
    info << "Statistics:\n";
    info << "  Read Operations: " << stats_.read_operations << "\n";
    info << "  Write Operations: " << stats_.write_operations << "\n";
    info << "  Erase Operations: " << stats_.erase_operations << "\n";
    info << "  Bytes Read: " << stats_.bytes_read << "\n";
    info << "  Bytes Written: " << stats_.bytes_written << "\n";
    info << "  Bytes Erased: " << stats_.bytes_erased << "\n";
    info << "  Rejected Operations: " << stats_.rejected_operations << "\n";
    return info.str();
}

}  // namespace norflash::storage
