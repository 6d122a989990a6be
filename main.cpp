#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "norflash/config/configuration.hpp"
#include "norflash/storage/auto_erase_storage.hpp"
#include "norflash/storage/flash_emulator.hpp"
#include "norflash/utils/error.hpp"
#include "norflash/utils/logging.hpp"

using namespace norflash;
using namespace norflash::storage;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FLASH_ERROR = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  info                       Show flash geometry and image information\n"
              << "  read <offset> <length>     Hex dump a range\n"
              << "  erase <offset> <length>    Erase a block-aligned range\n"
              << "  write <offset> <hex>       Raw write of hex bytes (range must be erased)\n"
              << "  program <offset> <text>    Write text, erasing affected blocks as needed\n"
              << "\nOptions:\n"
              << "  -c, --config <file>        Configuration file path\n"
              << "  -i, --image <path>         Flash image file\n"
              << "  -s, --capacity <bytes>     Flash capacity\n"
              << "      --read-size <bytes>    Read granularity\n"
              << "      --write-size <bytes>   Write granularity\n"
              << "      --erase-size <bytes>   Erase granularity\n"
              << "      --tracking <mode>      Erase tracking: strict or content\n"
              << "  -l, --log-level <level>    Set log level (trace, debug, info, warn, error, off)\n"
              << "  -f, --log-file <file>      Log file path\n"
              << "  -h, --help                 Show this help message\n"
              << "\nNumbers accept decimal or 0x-prefixed hex.\n"
              << "\nExamples:\n"
              << "  " << program_name << " -i flash.bin -s 0x8000 info\n"
              << "  " << program_name << " -i flash.bin erase 0 4096\n"
              << "  " << program_name << " -i flash.bin write 0x100 48656c6c6f\n"
              << "  " << program_name << " -i flash.bin program 0x100 \"Hello, embedded-storage!\"\n"
              << "  " << program_name << " -i flash.bin read 0x100 32\n";
}

bool parse_number(const std::string& text, u64& value) {
    try {
        size_t consumed = 0;
        value = std::stoull(text, &consumed, 0);
        return consumed == text.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parse_hex_bytes(const std::string& text, std::vector<u8>& bytes) {
    std::string digits;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    if (digits.size() % 2 != 0) {
        return false;
    }
    bytes.clear();
    for (size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<u8>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return true;
}

void hex_dump(Address base, const std::vector<u8>& data) {
    constexpr size_t row = 16;
    for (size_t i = 0; i < data.size(); i += row) {
        std::cout << std::hex << std::setfill('0') << std::setw(8) << (base + i) << "  ";
        for (size_t j = 0; j < row; ++j) {
            if (i + j < data.size()) {
                std::cout << std::setw(2) << static_cast<unsigned>(data[i + j]) << ' ';
            } else {
                std::cout << "   ";
            }
        }
        std::cout << " |";
        for (size_t j = 0; j < row && i + j < data.size(); ++j) {
            const char c = static_cast<char>(data[i + j]);
            std::cout << (std::isprint(static_cast<unsigned char>(c)) ? c : '.');
        }
        std::cout << "|\n" << std::dec;
    }
}

int report(const Error& error) {
    std::cerr << "Error: " << error.to_string() << std::endl;
    return EXIT_FLASH_ERROR;
}

int run_command(FlashEmulator& flash, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    auto need_args = [&](size_t count) {
        if (args.size() != count + 1) {
            std::cerr << "Error: '" << command << "' takes " << count << " argument(s)" << std::endl;
            return false;
        }
        return true;
    };

    auto need_address = [](const std::string& text, Address& address) {
        u64 value = 0;
        if (!parse_number(text, value) || value > 0xFFFFFFFFull) {
            std::cerr << "Error: Invalid offset '" << text << "'" << std::endl;
            return false;
        }
        address = static_cast<Address>(value);
        return true;
    };

    if (command == "info") {
        if (!need_args(0)) return EXIT_USAGE;
        std::cout << flash.get_flash_info();
        auto erased = flash.is_erased(0, flash.capacity());
        if (!erased) return report(erased.error());
        std::cout << "  Fully Erased: " << (erased.value() ? "yes" : "no") << "\n";
        return 0;
    }

    if (command == "read" || command == "erase") {
        if (!need_args(2)) return EXIT_USAGE;
        Address offset = 0;
        u64 length = 0;
        if (!need_address(args[1], offset)) return EXIT_USAGE;
        if (!parse_number(args[2], length)) {
            std::cerr << "Error: Invalid length '" << args[2] << "'" << std::endl;
            return EXIT_USAGE;
        }
        if (length > flash.capacity()) {
            return report(make_error(ErrorCode::FLASH_OUT_OF_BOUNDS,
                                     "length " + args[2] + " exceeds flash capacity"));
        }

        if (command == "erase") {
            auto result = flash.erase(offset, static_cast<size_t>(length));
            if (!result) return report(result.error());
            std::cout << "Erased " << length << " bytes at 0x" << std::hex << offset << std::dec << "\n";
            return 0;
        }

        std::vector<u8> data(static_cast<size_t>(length));
        auto result = flash.read(offset, data.data(), data.size());
        if (!result) return report(result.error());
        hex_dump(offset, data);
        return 0;
    }

    if (command == "write") {
        if (!need_args(2)) return EXIT_USAGE;
        Address offset = 0;
        std::vector<u8> data;
        if (!need_address(args[1], offset)) return EXIT_USAGE;
        if (!parse_hex_bytes(args[2], data)) {
            std::cerr << "Error: Invalid hex data '" << args[2] << "'" << std::endl;
            return EXIT_USAGE;
        }
        auto result = flash.write(offset, data.data(), data.size());
        if (!result) return report(result.error());
        std::cout << "Wrote " << data.size() << " bytes at 0x" << std::hex << offset << std::dec << "\n";
        return 0;
    }

    if (command == "program") {
        if (!need_args(2)) return EXIT_USAGE;
        Address offset = 0;
        if (!need_address(args[1], offset)) return EXIT_USAGE;

        auto storage = AutoEraseStorage::create(flash);
        if (!storage) return report(storage.error());
        const std::string& text = args[2];
        auto result = storage.value()->write(offset, text.data(), text.size());
        if (!result) return report(result.error());
        std::cout << "Programmed " << text.size() << " bytes at 0x" << std::hex << offset << std::dec << "\n";
        return 0;
    }

    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    return EXIT_USAGE;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/default.json";
    bool config_file_given = false;
    std::string log_level;
    std::string log_file;
    Configuration config;
    auto flash_config = config.getFlashConfig();
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto take_value = [&](std::string& out) {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            std::cerr << "Error: Value required after " << arg << std::endl;
            return false;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (!take_value(config_file)) return EXIT_USAGE;
            config_file_given = true;
        }
        else if (arg == "-l" || arg == "--log-level") {
            if (!take_value(log_level)) return EXIT_USAGE;
        }
        else if (arg == "-f" || arg == "--log-file") {
            if (!take_value(log_file)) return EXIT_USAGE;
        }
        else if (arg == "-i" || arg == "--image" || arg == "-s" || arg == "--capacity" ||
                 arg == "--read-size" || arg == "--write-size" || arg == "--erase-size" ||
                 arg == "--tracking") {
            std::string value;
            if (!take_value(value)) return EXIT_USAGE;
            overrides.emplace_back(arg, value);
        }
        else if (!arg.empty() && arg[0] == '-' && positional.empty()) {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
        else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // Configuration file first, command line flags override it
    if (config_file_given || std::filesystem::exists(config_file)) {
        auto loaded = config.loadFromFile(config_file);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error().to_string() << std::endl;
            return EXIT_USAGE;
        }
        flash_config = config.getFlashConfig();
    }

    for (const auto& [flag, value] : overrides) {
        if (flag == "-i" || flag == "--image") {
            flash_config.image_path = value;
        } else if (flag == "--tracking") {
            flash_config.erase_tracking = value;
        } else {
            u64 number = 0;
            if (!parse_number(value, number)) {
                std::cerr << "Error: Invalid number '" << value << "' for " << flag << std::endl;
                return EXIT_USAGE;
            }
            if (flag == "-s" || flag == "--capacity") flash_config.capacity = static_cast<size_t>(number);
            else if (flag == "--read-size") flash_config.read_size = static_cast<size_t>(number);
            else if (flag == "--write-size") flash_config.write_size = static_cast<size_t>(number);
            else flash_config.erase_size = static_cast<size_t>(number);
        }
    }
    config.setFlashConfig(flash_config);

    auto logging = config.getLoggingConfig();
    if (!log_level.empty()) logging.level = log_level;
    if (!log_file.empty()) logging.file = log_file;

    auto log_result = Logger::initialize(Logger::from_string(logging.level), logging.file,
                                         logging.console || logging.file.empty());
    if (!log_result) {
        std::cerr << "Failed to initialize logger: " << log_result.error().to_string() << std::endl;
        return EXIT_USAGE;
    }

    auto emulator_config = config.toEmulatorConfig();
    if (!emulator_config) {
        std::cerr << "Error: " << emulator_config.error().to_string() << std::endl;
        Logger::shutdown();
        return EXIT_USAGE;
    }

    int status = 0;
    {
        auto flash = FlashEmulator::open(emulator_config.value());
        if (!flash) {
            status = report(flash.error());
        } else {
            status = run_command(*flash.value(), positional);
        }
    }

    Logger::shutdown();
    return status;
}
