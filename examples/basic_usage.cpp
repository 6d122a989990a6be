/**
 * @file basic_usage.cpp
 * @brief Basic NOR flash emulator usage
 *
 * Opens ./flash_example.bin as a 32 KiB flash with 4 KiB erase blocks,
 * shows the erase-before-write rule on the raw engine and then rewrites
 * the same bytes through AutoEraseStorage.
 */

#include "norflash/storage/auto_erase_storage.hpp"
#include "norflash/storage/flash_emulator.hpp"
#include "norflash/utils/logging.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace norflash;
using namespace norflash::storage;

namespace {

constexpr Address MESSAGE_OFFSET = 0x100;

/**
 * @brief Erase, write and read back on the raw engine
 */
bool demonstrate_raw_flash(FlashEmulator& flash) {
    std::cout << "\n=== Raw NOR Flash Demo ===" << std::endl;

    auto erased = flash.erase(0, flash.erase_granularity());
    if (!erased) {
        std::cerr << "Erase failed: " << erased.error().to_string() << std::endl;
        return false;
    }
    std::cout << "Erased block 0 (" << flash.erase_granularity() << " bytes)" << std::endl;

    // Includes the terminating NUL, 25 bytes in total
    const char message[] = "Hello, embedded-storage!";
    auto written = flash.write(MESSAGE_OFFSET, message, sizeof(message));
    if (!written) {
        std::cerr << "Write failed: " << written.error().to_string() << std::endl;
        return false;
    }
    std::cout << "Wrote " << sizeof(message) << " bytes at 0x" << std::hex << MESSAGE_OFFSET << std::dec
              << std::endl;

    std::vector<char> buffer(sizeof(message));
    auto read = flash.read(MESSAGE_OFFSET, buffer.data(), buffer.size());
    if (!read) {
        std::cerr << "Read failed: " << read.error().to_string() << std::endl;
        return false;
    }
    std::cout << "Read back: " << buffer.data() << std::endl;

    auto rewrite = flash.write(MESSAGE_OFFSET, "HELLO", 5);
    if (rewrite) {
        std::cerr << "Rewrite without erase unexpectedly succeeded" << std::endl;
        return false;
    }
    std::cout << "Rewrite without erase rejected: " << rewrite.error().to_string() << std::endl;
    return true;
}

/**
 * @brief Overwrite part of the message without erasing first
 */
bool demonstrate_auto_erase(FlashEmulator& flash) {
    std::cout << "\n=== Auto-Erase Storage Demo ===" << std::endl;

    auto storage = AutoEraseStorage::create(flash);
    if (!storage) {
        std::cerr << "Failed to create auto-erase storage: " << storage.error().to_string() << std::endl;
        return false;
    }

    auto written = storage.value()->write(MESSAGE_OFFSET, "HELLO", 5);
    if (!written) {
        std::cerr << "Auto-erase write failed: " << written.error().to_string() << std::endl;
        return false;
    }

    std::vector<char> buffer(25);
    auto read = storage.value()->read(MESSAGE_OFFSET, buffer.data(), buffer.size());
    if (!read) {
        std::cerr << "Read failed: " << read.error().to_string() << std::endl;
        return false;
    }
    std::cout << "Read back: " << buffer.data() << std::endl;
    return true;
}

}  // namespace

int main() {
    auto log_result = Logger::initialize(Logger::LogLevel::INFO);
    if (!log_result) {
        std::cerr << "Failed to initialize logger: " << log_result.error().to_string() << std::endl;
        return 1;
    }

    FlashEmulator::Config config;
    config.image_path = "./flash_example.bin";
    config.geometry = FlashGeometry{32 * KiB, 1, 1, 4 * KiB};

    int status = 0;
    {
        auto flash = FlashEmulator::open(config);
        if (!flash) {
            std::cerr << "Failed to open flash: " << flash.error().to_string() << std::endl;
            Logger::shutdown();
            return 1;
        }

        if (!demonstrate_raw_flash(*flash.value()) || !demonstrate_auto_erase(*flash.value())) {
            status = 1;
        }

        std::cout << "\n" << flash.value()->get_flash_info();
    }

    Logger::shutdown();
    return status;
}
