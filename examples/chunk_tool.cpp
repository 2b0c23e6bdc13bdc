/**
 * @file chunk_tool.cpp
 * @brief Write a text message into a chunk file and read it back
 *
 * Minimal consumer of the codec: file I/O and argument handling live
 * here, the chunk layout and its validation live in the library.
 *
 *   chunk_tool encode <type> <message> <file>
 *   chunk_tool decode <file>
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {
    void usage(const char* prog) {
        std::cout << "Usage: " << prog << " encode <type> <message> <file>\n";
        std::cout << "       " << prog << " decode <file>\n";
        std::cout << "\n";
        std::cout << "Stores a message in a single chunk, or prints the chunk stored in a file.\n";
    }

    int encode(const std::string& type, const std::string& message, const std::string& path) {
        pngchunk::chunk c(pngchunk::chunk_type(type),
                          std::vector<std::uint8_t>(message.begin(), message.end()));
        auto bytes = c.as_bytes();

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file '" << path << "' for writing\n";
            return 1;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            std::cerr << "Error: Failed writing '" << path << "'\n";
            return 1;
        }

        std::cout << c;
        return 0;
    }

    int decode(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file '" << path << "'\n";
            return 1;
        }
        std::vector<std::uint8_t> raw{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        auto c = pngchunk::chunk::from_bytes(raw, options);
        std::cout << c;
        std::cout << "Critical: " << std::boolalpha << c.type().is_critical()
                  << ", public: " << c.type().is_public()
                  << ", safe to copy: " << c.type().is_safe_to_copy()
                  << ", valid: " << c.type().is_valid() << "\n";

        try {
            std::cout << "Message: " << c.data_as_string() << "\n";
        } catch (const pngchunk::decode_error& e) {
            std::cout << "Message: <binary> (" << e.what() << ")\n";
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "encode" && argc == 5) {
            return encode(argv[2], argv[3], argv[4]);
        }
        if (command == "decode" && argc == 3) {
            return decode(argv[2]);
        }
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    usage(argv[0]);
    return 1;
}
