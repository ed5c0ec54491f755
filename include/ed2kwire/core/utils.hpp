#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ed2kwire::core::utils {

class StringUtils {
public:
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);

    // Upper-case, no separators.
    static std::string to_hex(std::span<const std::uint8_t> bytes);

    // Accepts upper or lower case digits; whitespace between byte pairs is
    // skipped. Returns nullopt on any other character or an odd digit count.
    static std::optional<std::vector<std::uint8_t>> from_hex(const std::string& text);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::vector<std::uint8_t>> read_binary_file(const std::filesystem::path& path);
};

}
