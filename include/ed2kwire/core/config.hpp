#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ed2kwire::core {

// Settings for the command line tools, read from INI-style files:
//
//   # comment
//   [codec]
//   max_payload_size = 65536
//   [log]
//   file = "dump.log"
//
// A key under a [section] is stored as "section.key". Keys before the
// first section are stored as written. The codec itself never reads
// configuration.
class Config {
public:
    static Config& instance();

    // Returns false when the file cannot be opened. Malformed lines are
    // skipped and reported through problems().
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    // "<file>:<line>: <what>" for every line the last load skipped.
    const std::vector<std::string>& problems() const { return problems_; }

    void set(const std::string& key, const std::string& value);

    // Fills in keys that are not already set.
    void set_defaults(const std::map<std::string, std::string>& defaults);

    bool contains(const std::string& key) const { return values_.count(key) != 0; }
    std::optional<std::string> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !(iss >> std::ws).eof()) {
            return std::nullopt;
        }
        return result;
    }

    // true/yes/on/1 and false/no/off/0; anything else yields default_value.
    bool get_bool(const std::string& key, bool default_value = false) const;
    std::uint32_t get_uint32(const std::string& key, std::uint32_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    std::size_t size() const { return values_.size(); }
    void clear();

private:
    Config() = default;

    std::map<std::string, std::string> values_;
    std::vector<std::string> problems_;
};

}
