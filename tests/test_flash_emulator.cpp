#include <gtest/gtest.h>
#include "norflash/storage/flash_emulator.hpp"
#include "faulty_backing_store.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace norflash::storage::test {

class FlashEmulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = std::filesystem::temp_directory_path() /
                   (std::string("norflash_emulator_") + info->name());
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);

        config.image_path = (test_dir / "flash.bin").string();
        config.geometry = FlashGeometry{32 * KiB, 1, 1, 4 * KiB};
        config.erase_tracking = EraseTracking::Strict;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::unique_ptr<FlashEmulator> open_flash() {
        auto result = FlashEmulator::open(config);
        if (!result) {
            ADD_FAILURE() << "Failed to open flash: " << result.error().to_string();
            return nullptr;
        }
        return std::move(result).value();
    }

    std::vector<u8> read_range(FlashEmulator& flash, Address offset, size_t size) {
        std::vector<u8> data(size);
        auto result = flash.read(offset, data.data(), data.size());
        EXPECT_TRUE(result.has_value()) << result.error().to_string();
        return data;
    }

    void write_image(const std::vector<u8>& bytes) {
        std::ofstream file(config.image_path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    std::filesystem::path test_dir;
    FlashEmulator::Config config;
};

TEST_F(FlashEmulatorTest, NewImageIsFullyErased) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    EXPECT_EQ(std::filesystem::file_size(config.image_path), 32 * KiB);
    EXPECT_EQ(flash->capacity(), 32 * KiB);
    EXPECT_EQ(flash->read_granularity(), 1u);
    EXPECT_EQ(flash->write_granularity(), 1u);
    EXPECT_EQ(flash->erase_granularity(), 4 * KiB);

    auto data = read_range(*flash, 0, flash->capacity());
    for (u8 byte : data) {
        ASSERT_EQ(byte, ERASED_BYTE);
    }

    auto erased = flash->is_erased(0, flash->capacity());
    ASSERT_TRUE(erased.has_value());
    EXPECT_TRUE(erased.value());
}

TEST_F(FlashEmulatorTest, ConcreteScenario) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    ASSERT_TRUE(flash->erase(0, 4096).has_value());

    const char message[] = "Hello, embedded-storage!";
    ASSERT_EQ(sizeof(message), 25u);
    auto written = flash->write(0x100, message, sizeof(message));
    ASSERT_TRUE(written.has_value()) << written.error().to_string();

    auto data = read_range(*flash, 0x100, sizeof(message));
    EXPECT_EQ(std::memcmp(data.data(), message, sizeof(message)), 0);

    auto again = flash->write(0x100, "x", 1);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::FLASH_NOT_ERASED);
}

TEST_F(FlashEmulatorTest, RejectedWriteChangesNothing) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const std::vector<u8> first = {0x12, 0x34};
    ASSERT_TRUE(flash->write(0x11, first.data(), first.size()).has_value());

    // Overlaps the written bytes at 0x11, the erased bytes before it must stay erased too
    const std::vector<u8> second = {0xAA, 0xBB, 0xCC, 0xDD};
    auto result = flash->write(0x0F, second.data(), second.size());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::FLASH_NOT_ERASED);
    ASSERT_TRUE(result.error().address().has_value());
    EXPECT_EQ(*result.error().address(), 0x11u);

    EXPECT_EQ(read_range(*flash, 0x0F, 4), (std::vector<u8>{0xFF, 0xFF, 0x12, 0x34}));
    auto erased = flash->is_erased(0x0F, 2);
    ASSERT_TRUE(erased.has_value());
    EXPECT_TRUE(erased.value());
}

TEST_F(FlashEmulatorTest, EraseIsIdempotent) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const std::vector<u8> data(64, 0x5A);
    ASSERT_TRUE(flash->write(4096, data.data(), data.size()).has_value());

    ASSERT_TRUE(flash->erase(4096, 4096).has_value());
    auto once = read_range(*flash, 0, flash->capacity());
    ASSERT_TRUE(flash->erase(4096, 4096).has_value());
    auto twice = read_range(*flash, 0, flash->capacity());

    EXPECT_EQ(once, twice);
    EXPECT_EQ(once, std::vector<u8>(flash->capacity(), ERASED_BYTE));
}

TEST_F(FlashEmulatorTest, EraseOnlyTouchesItsBlocks) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const std::vector<u8> data(8192, 0x00);
    ASSERT_TRUE(flash->write(4096, data.data(), data.size()).has_value());
    ASSERT_TRUE(flash->erase(8192, 4096).has_value());

    EXPECT_EQ(read_range(*flash, 4096, 4096), std::vector<u8>(4096, 0x00));
    EXPECT_EQ(read_range(*flash, 8192, 4096), std::vector<u8>(4096, ERASED_BYTE));

    // Erased block accepts new data again
    ASSERT_TRUE(flash->write(8192, data.data(), 4096).has_value());
}

TEST_F(FlashEmulatorTest, AlignmentIsEnforced) {
    config.geometry = FlashGeometry{32 * KiB, 2, 4, 4 * KiB};
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    u8 buffer[8] = {};
    auto read = flash->read(1, buffer, 2);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    auto read_length = flash->read(0, buffer, 3);
    ASSERT_FALSE(read_length.has_value());
    EXPECT_EQ(read_length.error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    auto write = flash->write(2, buffer, 4);
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    auto write_length = flash->write(4, buffer, 6);
    ASSERT_FALSE(write_length.has_value());
    EXPECT_EQ(write_length.error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    auto erase = flash->erase(2048, 4096);
    ASSERT_FALSE(erase.has_value());
    EXPECT_EQ(erase.error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    auto erase_length = flash->erase(0, 100);
    ASSERT_FALSE(erase_length.has_value());
    EXPECT_EQ(erase_length.error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    EXPECT_TRUE(flash->write(4, buffer, 8).has_value());
    EXPECT_TRUE(flash->read(2, buffer, 6).has_value());
    EXPECT_EQ(flash->get_statistics().rejected_operations, 6u);
}

TEST_F(FlashEmulatorTest, AlignmentCheckedBeforeBounds) {
    config.geometry = FlashGeometry{32 * KiB, 1, 4, 4 * KiB};
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    u8 buffer[4] = {};
    auto result = flash->write(static_cast<Address>(flash->capacity() + 2), buffer, 4);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::FLASH_NOT_ALIGNED);
}

TEST_F(FlashEmulatorTest, BoundsAreEnforced) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    u8 buffer[16] = {};
    auto read = flash->read(static_cast<Address>(flash->capacity() - 8), buffer, 16);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code(), ErrorCode::FLASH_OUT_OF_BOUNDS);

    auto write = flash->write(static_cast<Address>(flash->capacity()), buffer, 1);
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code(), ErrorCode::FLASH_OUT_OF_BOUNDS);

    auto erase = flash->erase(static_cast<Address>(flash->capacity()), 4096);
    ASSERT_FALSE(erase.has_value());
    EXPECT_EQ(erase.error().code(), ErrorCode::FLASH_OUT_OF_BOUNDS);

    // offset + size wraps around 32 bits
    auto wrapped = flash->write(0xFFFFFFF0u, buffer, 16);
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_EQ(wrapped.error().code(), ErrorCode::FLASH_OUT_OF_BOUNDS);

    EXPECT_TRUE(flash->read(static_cast<Address>(flash->capacity() - 16), buffer, 16).has_value());
    EXPECT_EQ(std::filesystem::file_size(config.image_path), 32 * KiB);
}

TEST_F(FlashEmulatorTest, RejectedOperationsLeaveContentUntouched) {
    config.geometry = FlashGeometry{32 * KiB, 2, 4, 4 * KiB};
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const Address last_block = static_cast<Address>(flash->capacity() - 4096);
    const std::vector<u8> block_one(4096, 0x11);
    const std::vector<u8> block_last(4096, 0x22);
    ASSERT_TRUE(flash->write(4096, block_one.data(), block_one.size()).has_value());
    ASSERT_TRUE(flash->write(last_block, block_last.data(), block_last.size()).has_value());
    const auto before = read_range(*flash, 0, flash->capacity());

    const std::vector<u8> data(8, 0x00);
    EXPECT_EQ(flash->erase(2048, 4096).error().code(), ErrorCode::FLASH_NOT_ALIGNED);
    EXPECT_EQ(flash->erase(4096, 4096 + 100).error().code(), ErrorCode::FLASH_NOT_ALIGNED);
    EXPECT_EQ(flash->erase(last_block, 8192).error().code(), ErrorCode::FLASH_OUT_OF_BOUNDS);
    EXPECT_EQ(flash->write(4098, data.data(), 4).error().code(), ErrorCode::FLASH_NOT_ALIGNED);
    EXPECT_EQ(flash->write(0, data.data(), 6).error().code(), ErrorCode::FLASH_NOT_ALIGNED);
    EXPECT_EQ(flash->write(last_block - 4, data.data(), 8).error().code(), ErrorCode::FLASH_NOT_ERASED);
    EXPECT_EQ(flash->write(static_cast<Address>(flash->capacity() - 4), data.data(), 8).error().code(),
              ErrorCode::FLASH_OUT_OF_BOUNDS);

    std::vector<u8> buffer(16, 0xAA);
    EXPECT_EQ(flash->read(static_cast<Address>(flash->capacity() - 8), buffer.data(), 16).error().code(),
              ErrorCode::FLASH_OUT_OF_BOUNDS);
    EXPECT_EQ(flash->read(1, buffer.data(), 2).error().code(), ErrorCode::FLASH_NOT_ALIGNED);

    EXPECT_EQ(read_range(*flash, 0, flash->capacity()), before);
    EXPECT_EQ(std::filesystem::file_size(config.image_path), 32 * KiB);

    // Erase state of untouched bytes is unchanged as well
    auto erased = flash->is_erased(0, 4096);
    ASSERT_TRUE(erased.has_value());
    EXPECT_TRUE(erased.value());
    auto written = flash->is_erased(4096, 4096);
    ASSERT_TRUE(written.has_value());
    EXPECT_FALSE(written.value());
    EXPECT_EQ(flash->get_statistics().erase_operations, 0u);
}

TEST_F(FlashEmulatorTest, RandomizedEraseWriteMatchesModel) {
    config.geometry = FlashGeometry{32 * KiB, 2, 4, 4 * KiB};
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const size_t block = flash->erase_granularity();
    const size_t unit = flash->write_granularity();
    const size_t blocks = flash->capacity() / block;
    std::vector<u8> model(flash->capacity(), ERASED_BYTE);

    std::mt19937 gen(0x5EED);
    std::uniform_int_distribution<size_t> block_dist(0, blocks - 1);
    std::uniform_int_distribution<int> byte_dist(0, 0xFE);

    for (int iteration = 0; iteration < 200; ++iteration) {
        SCOPED_TRACE("iteration " + std::to_string(iteration));

        const size_t first_block = block_dist(gen);
        const size_t block_count = std::uniform_int_distribution<size_t>(1, blocks - first_block)(gen);
        const Address region = static_cast<Address>(first_block * block);
        const size_t region_units = block_count * block / unit;
        ASSERT_TRUE(flash->erase(region, block_count * block).has_value());
        std::fill_n(model.begin() + region, block_count * block, ERASED_BYTE);

        const size_t first_unit = std::uniform_int_distribution<size_t>(0, region_units - 1)(gen);
        const size_t unit_count = std::uniform_int_distribution<size_t>(1, region_units - first_unit)(gen);
        const Address offset = static_cast<Address>(region + first_unit * unit);
        std::vector<u8> data(unit_count * unit);
        for (auto& byte : data) {
            byte = static_cast<u8>(byte_dist(gen));
        }

        ASSERT_TRUE(flash->write(offset, data.data(), data.size()).has_value());
        std::copy(data.begin(), data.end(), model.begin() + offset);
        ASSERT_EQ(read_range(*flash, offset, data.size()), data);

        // Every byte just written is non-erased, so any rewrite is refused
        auto rewrite = flash->write(offset, data.data(), unit);
        ASSERT_FALSE(rewrite.has_value());
        EXPECT_EQ(rewrite.error().code(), ErrorCode::FLASH_NOT_ERASED);
    }

    EXPECT_EQ(read_range(*flash, 0, flash->capacity()), model);
}

TEST_F(FlashEmulatorTest, ZeroLengthOperationsAreNoOps) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    EXPECT_TRUE(flash->read(0, nullptr, 0).has_value());
    EXPECT_TRUE(flash->write(static_cast<Address>(flash->capacity()), nullptr, 0).has_value());
    EXPECT_TRUE(flash->erase(4096, 0).has_value());

    const auto& stats = flash->get_statistics();
    EXPECT_EQ(stats.read_operations, 0u);
    EXPECT_EQ(stats.write_operations, 0u);
    EXPECT_EQ(stats.erase_operations, 0u);
}

TEST_F(FlashEmulatorTest, DataPersistsAcrossReopen) {
    const std::vector<u8> data = {'p', 'e', 'r', 's', 'i', 's', 't'};
    {
        auto flash = open_flash();
        ASSERT_NE(flash, nullptr);
        ASSERT_TRUE(flash->write(0x2000, data.data(), data.size()).has_value());
    }

    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);
    EXPECT_EQ(read_range(*flash, 0x2000, data.size()), data);

    // Written bytes are still protected after reopening
    auto rewrite = flash->write(0x2000, data.data(), 1);
    ASSERT_FALSE(rewrite.has_value());
    EXPECT_EQ(rewrite.error().code(), ErrorCode::FLASH_NOT_ERASED);
}

TEST_F(FlashEmulatorTest, ImageIsRawFlashContents) {
    {
        auto flash = open_flash();
        ASSERT_NE(flash, nullptr);
        const std::vector<u8> data = {0x01, 0x02, 0x03};
        ASSERT_TRUE(flash->write(10, data.data(), data.size()).has_value());
    }

    std::ifstream file(config.image_path, std::ios::binary);
    std::vector<u8> contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    ASSERT_EQ(contents.size(), 32 * KiB);
    EXPECT_EQ(contents[9], ERASED_BYTE);
    EXPECT_EQ(contents[10], 0x01);
    EXPECT_EQ(contents[12], 0x03);
    EXPECT_EQ(contents[13], ERASED_BYTE);
}

TEST_F(FlashEmulatorTest, ShortImageIsExtendedWithErasedBytes) {
    write_image(std::vector<u8>(100, 0x42));

    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);
    EXPECT_EQ(std::filesystem::file_size(config.image_path), 32 * KiB);

    EXPECT_EQ(read_range(*flash, 0, 100), std::vector<u8>(100, 0x42));
    EXPECT_EQ(read_range(*flash, 100, 28), std::vector<u8>(28, ERASED_BYTE));

    // Existing contents count as written, the extension as erased
    u8 byte = 0;
    auto existing = flash->write(50, &byte, 1);
    ASSERT_FALSE(existing.has_value());
    EXPECT_EQ(existing.error().code(), ErrorCode::FLASH_NOT_ERASED);
    EXPECT_TRUE(flash->write(100, &byte, 1).has_value());
}

TEST_F(FlashEmulatorTest, EmptiedImageReopensFullyErased) {
    {
        auto flash = open_flash();
        ASSERT_NE(flash, nullptr);
        const std::vector<u8> data(256, 0x00);
        ASSERT_TRUE(flash->write(0, data.data(), data.size()).has_value());
    }

    std::filesystem::resize_file(config.image_path, 0);

    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);
    EXPECT_EQ(read_range(*flash, 0, flash->capacity()), std::vector<u8>(flash->capacity(), ERASED_BYTE));
    const std::vector<u8> data(256, 0x01);
    EXPECT_TRUE(flash->write(0, data.data(), data.size()).has_value());
}

TEST_F(FlashEmulatorTest, OversizedImageIsRejected) {
    write_image(std::vector<u8>(40 * KiB, 0x00));

    auto result = FlashEmulator::open(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::BACKING_STORE_SIZE_MISMATCH);
    EXPECT_EQ(std::filesystem::file_size(config.image_path), 40 * KiB);
}

TEST_F(FlashEmulatorTest, OversizedImageIsTruncatedWhenAllowed) {
    std::vector<u8> image(40 * KiB, ERASED_BYTE);
    image[0] = 0x77;
    write_image(image);
    config.truncate_oversized_image = true;

    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);
    EXPECT_EQ(std::filesystem::file_size(config.image_path), 32 * KiB);
    EXPECT_EQ(read_range(*flash, 0, 1), std::vector<u8>{0x77});
}

TEST_F(FlashEmulatorTest, InvalidGeometryIsRejectedBeforeTouchingFile) {
    const FlashGeometry invalid[] = {
        {32 * KiB, 3, 1, 4 * KiB},         // read granularity not a power of two
        {32 * KiB, 1, 0, 4 * KiB},         // zero write granularity
        {32 * KiB, 1, 1, 3000},            // erase granularity not a power of two
        {30 * KiB, 1, 1, 4 * KiB},         // capacity not a multiple of erase granularity
        {size_t{1} << 33, 1, 1, 4 * KiB},  // beyond 32-bit addressing
    };

    for (const auto& geometry : invalid) {
        config.geometry = geometry;
        auto result = FlashEmulator::open(config);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code(), ErrorCode::FLASH_INVALID_PARAMETERS);
    }
    EXPECT_FALSE(std::filesystem::exists(config.image_path));
}

TEST_F(FlashEmulatorTest, FullAddressSpaceCapacityIsAccepted) {
    EXPECT_TRUE((FlashGeometry{size_t{1} << 32, 1, 1, 4 * KiB}.validate().has_value()));
}

TEST_F(FlashEmulatorTest, StrictTrackingRejectsRewriteOfWrittenErasedValue) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const u8 erased_value = ERASED_BYTE;
    ASSERT_TRUE(flash->write(0, &erased_value, 1).has_value());

    const u8 data = 0x00;
    auto result = flash->write(0, &data, 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::FLASH_NOT_ERASED);

    auto erased = flash->is_erased(0, 1);
    ASSERT_TRUE(erased.has_value());
    EXPECT_FALSE(erased.value());
}

TEST_F(FlashEmulatorTest, ContentTrackingTreatsErasedValueAsErased) {
    config.erase_tracking = EraseTracking::ContentEquality;
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);
    EXPECT_EQ(flash->erase_tracking(), EraseTracking::ContentEquality);

    const u8 erased_value = ERASED_BYTE;
    ASSERT_TRUE(flash->write(0, &erased_value, 1).has_value());

    const u8 data = 0x00;
    EXPECT_TRUE(flash->write(0, &data, 1).has_value());

    auto rewrite = flash->write(0, &data, 1);
    ASSERT_FALSE(rewrite.has_value());
    EXPECT_EQ(rewrite.error().code(), ErrorCode::FLASH_NOT_ERASED);
}

TEST_F(FlashEmulatorTest, StrictTrackingIsSeededFromContentOnOpen) {
    {
        auto flash = open_flash();
        ASSERT_NE(flash, nullptr);
        const u8 erased_value = ERASED_BYTE;
        ASSERT_TRUE(flash->write(0, &erased_value, 1).has_value());
    }

    // A written 0xFF cannot be told apart from an erased byte in the image
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);
    const u8 data = 0x00;
    EXPECT_TRUE(flash->write(0, &data, 1).has_value());
}

TEST_F(FlashEmulatorTest, StatisticsAreCounted) {
    auto flash = open_flash();
    ASSERT_NE(flash, nullptr);

    const std::vector<u8> data(16, 0x01);
    ASSERT_TRUE(flash->write(0, data.data(), data.size()).has_value());
    read_range(*flash, 0, 32);
    ASSERT_TRUE(flash->erase(0, 8192).has_value());
    EXPECT_FALSE(flash->erase(1, 4096).has_value());

    const auto& stats = flash->get_statistics();
    EXPECT_EQ(stats.write_operations, 1u);
    EXPECT_EQ(stats.bytes_written, 16u);
    EXPECT_EQ(stats.read_operations, 1u);
    EXPECT_EQ(stats.bytes_read, 32u);
    EXPECT_EQ(stats.erase_operations, 1u);
    EXPECT_EQ(stats.bytes_erased, 8192u);
    EXPECT_EQ(stats.rejected_operations, 1u);

    auto info = flash->get_flash_info();
    EXPECT_NE(info.find("Erase Blocks: 8"), std::string::npos);
    EXPECT_NE(info.find("Erase Tracking: strict"), std::string::npos);

    flash->reset_statistics();
    EXPECT_EQ(flash->get_statistics().write_operations, 0u);
}

TEST(FlashEmulatorStoreTest, NullStoreIsRejected) {
    auto result = FlashEmulator::create(nullptr, FlashGeometry{4096, 1, 1, 4096});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::INVALID_PARAMETER);
}

TEST(FlashEmulatorStoreTest, MemoryStoreIsSizedToCapacity) {
    auto store = std::make_unique<MemoryBackingStore>(std::vector<u8>{0x10, 0x20});
    auto* raw = store.get();

    auto result = FlashEmulator::create(std::move(store), FlashGeometry{8192, 1, 1, 4096});
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(raw->size(), 8192u);
    EXPECT_EQ(raw->data()[0], 0x10);
    EXPECT_EQ(raw->data()[2], ERASED_BYTE);
}

TEST(FlashEmulatorStoreTest, WriteFailureIsPropagated) {
    auto store = std::make_unique<FaultyBackingStore>();
    auto* faulty = store.get();
    auto created = FlashEmulator::create(std::move(store), FlashGeometry{8192, 1, 1, 4096});
    ASSERT_TRUE(created.has_value());
    auto& flash = created.value();

    faulty->fail_writes_after(0);
    const std::vector<u8> data(4, 0x00);
    auto write = flash->write(0, data.data(), data.size());
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code(), ErrorCode::BACKING_STORE_WRITE_FAILED);

    auto erase = flash->erase(4096, 4096);
    ASSERT_FALSE(erase.has_value());
    EXPECT_EQ(erase.error().code(), ErrorCode::BACKING_STORE_WRITE_FAILED);

    // A failed write may have reached the store, its range no longer counts as erased
    faulty->heal();
    auto retry = flash->write(0, data.data(), data.size());
    ASSERT_FALSE(retry.has_value());
    EXPECT_EQ(retry.error().code(), ErrorCode::FLASH_NOT_ERASED);

    ASSERT_TRUE(flash->erase(0, 4096).has_value());
    EXPECT_TRUE(flash->write(0, data.data(), data.size()).has_value());
    EXPECT_EQ(flash->get_statistics().write_operations, 1u);
}

TEST(FlashEmulatorStoreTest, ReadFailureIsPropagated) {
    auto store = std::make_unique<FaultyBackingStore>();
    auto* faulty = store.get();
    auto created = FlashEmulator::create(std::move(store), FlashGeometry{8192, 1, 1, 4096},
                                         EraseTracking::ContentEquality);
    ASSERT_TRUE(created.has_value());
    auto& flash = created.value();

    faulty->fail_reads(true);
    u8 buffer[4] = {};
    auto read = flash->read(0, buffer, sizeof(buffer));
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code(), ErrorCode::BACKING_STORE_READ_FAILED);

    // Content tracking has to read the range before writing it
    auto write = flash->write(0, buffer, sizeof(buffer));
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code(), ErrorCode::BACKING_STORE_READ_FAILED);
    EXPECT_EQ(faulty->write_calls(), 0u);
}

TEST(FlashEmulatorStoreTest, EraseTrackingNames) {
    EXPECT_STREQ(erase_tracking_to_string(EraseTracking::Strict), "strict");
    EXPECT_STREQ(erase_tracking_to_string(EraseTracking::ContentEquality), "content");

    auto strict = erase_tracking_from_string("strict");
    ASSERT_TRUE(strict.has_value());
    EXPECT_EQ(strict.value(), EraseTracking::Strict);

    auto unknown = erase_tracking_from_string("lazy");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::CONFIG_INVALID_VALUE);
}

}  // namespace norflash::storage::test
