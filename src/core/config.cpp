#include "ed2kwire/core/config.hpp"
#include "ed2kwire/core/utils.hpp"
#include <fstream>
#include <limits>

namespace ed2kwire::core {

using utils::StringUtils;

namespace {
    // Strips one pair of matching double quotes.
    std::string unquote(const std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    bool needs_quotes(const std::string& value) {
        return value.empty() || value != StringUtils::trim(value) ||
               value.find('#') != std::string::npos;
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    problems_.clear();

    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string raw;
    std::size_t line_number = 0;

    auto report = [&](const std::string& what) {
        problems_.push_back(filename + ":" + std::to_string(line_number) + ": " + what);
    };

    while (std::getline(file, raw)) {
        ++line_number;
        auto line = StringUtils::trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                report("unterminated section header");
                continue;
            }
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto separator = line.find('=');
        if (separator == std::string::npos) {
            report("expected key = value");
            continue;
        }

        auto key = StringUtils::trim(line.substr(0, separator));
        if (key.empty()) {
            report("missing key");
            continue;
        }
        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = unquote(StringUtils::trim(line.substr(separator + 1)));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# ed2kwire settings\n";

    // std::map keeps keys of one section together; unsectioned keys sort
    // wherever they fall, so write them first.
    for (const auto& [key, value] : values_) {
        if (key.find('.') == std::string::npos) {
            file << key << " = " << (needs_quotes(value) ? "\"" + value + "\"" : value) << "\n";
        }
    }

    std::string current;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            continue;
        }
        auto section = key.substr(0, dot);
        if (section != current) {
            file << "\n[" << section << "]\n";
            current = section;
        }
        file << key.substr(dot + 1) << " = "
             << (needs_quotes(value) ? "\"" + value + "\"" : value) << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

void Config::set_defaults(const std::map<std::string, std::string>& defaults) {
    for (const auto& [key, value] : defaults) {
        values_.emplace(key, value);
    }
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = StringUtils::to_lower(*value);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
    return default_value;
}

std::uint32_t Config::get_uint32(const std::string& key, std::uint32_t default_value) const {
    auto value = get(key);
    if (!value || value->empty() || value->front() == '-') {
        return default_value;
    }

    auto parsed = get_as<std::uint64_t>(key);
    if (!parsed || *parsed > std::numeric_limits<std::uint32_t>::max()) {
        return default_value;
    }
    return static_cast<std::uint32_t>(*parsed);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::clear() {
    values_.clear();
    problems_.clear();
}

}
