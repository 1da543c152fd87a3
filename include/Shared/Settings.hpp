// =============================================================================
// VOXSTREAM - SETTINGS
// Flat "section.key" view of a TOML subset: [section] headers, key = value,
// quoted strings, integer lists and # comments
// =============================================================================
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace voxstream {

class Settings {
public:
    // Relative to the working directory, tried in order
    static constexpr const char* SEARCH_DIRS[] = {"config/", "../config/", "../../config/"};

    bool load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            return false;
        }
        std::ostringstream text;
        text << file.rdbuf();
        parse(text.str());

        std::printf("[Settings] %s: %zu values\n", path.c_str(), m_values.size());
        return true;
    }

    bool load_first(const std::string& filename) {
        for (const char* dir : SEARCH_DIRS) {
            if (load(dir + filename)) {
                return true;
            }
        }
        std::printf("[Settings] No %s found, using defaults\n", filename.c_str());
        return false;
    }

    // A repeated key keeps the last value
    void parse(std::string_view text) {
        std::string section;
        std::size_t line_start = 0;

        while (line_start < text.size()) {
            std::size_t line_end = text.find('\n', line_start);
            if (line_end == std::string_view::npos) line_end = text.size();
            std::string_view line = trim(text.substr(line_start, line_end - line_start));
            line_start = line_end + 1;

            if (line.empty() || line.front() == '#') continue;

            if (line.front() == '[') {
                const std::size_t close = line.find(']');
                if (close != std::string_view::npos) {
                    section = std::string(trim(line.substr(1, close - 1)));
                }
                continue;
            }

            const std::size_t eq = line.find('=');
            if (eq == std::string_view::npos) continue;

            const std::string_view key = trim(line.substr(0, eq));
            const std::string_view value = parse_value(line.substr(eq + 1));

            std::string full_key = section.empty() ? std::string(key) : section + "." + std::string(key);
            m_values[std::move(full_key)] = std::string(value);
        }
    }

    [[nodiscard]] bool has(const std::string& key) const { return find(key) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }

    [[nodiscard]] std::string get_string(const std::string& key, const std::string& fallback = "") const {
        const std::string* value = find(key);
        return value ? *value : fallback;
    }

    [[nodiscard]] int get_int(const std::string& key, int fallback = 0) const {
        const std::string* value = find(key);
        if (!value) return fallback;
        char* end = nullptr;
        const long parsed = std::strtol(value->c_str(), &end, 10);
        return end != value->c_str() ? static_cast<int>(parsed) : fallback;
    }

    [[nodiscard]] float get_float(const std::string& key, float fallback = 0.0f) const {
        const std::string* value = find(key);
        if (!value) return fallback;
        char* end = nullptr;
        const float parsed = std::strtof(value->c_str(), &end);
        return end != value->c_str() ? parsed : fallback;
    }

    [[nodiscard]] bool get_bool(const std::string& key, bool fallback = false) const {
        const std::string* value = find(key);
        if (!value) return fallback;
        return *value == "true" || *value == "1" || *value == "yes";
    }

    // "[a, b, c]". A trailing comma is allowed; any other malformed element
    // returns the fallback.
    [[nodiscard]] std::vector<int> get_int_list(const std::string& key,
                                                const std::vector<int>& fallback = {}) const {
        const std::string* value = find(key);
        if (!value || value->size() < 2 || value->front() != '[' || value->back() != ']') {
            return fallback;
        }

        const std::string_view body = std::string_view(*value).substr(1, value->size() - 2);
        std::vector<int> out;
        std::size_t pos = 0;
        while (pos <= body.size()) {
            std::size_t comma = body.find(',', pos);
            const bool last = comma == std::string_view::npos;
            if (last) comma = body.size();

            const std::string element(trim(body.substr(pos, comma - pos)));
            pos = comma + 1;

            if (element.empty()) {
                if (last) break;
                return fallback;
            }
            char* end = nullptr;
            const long parsed = std::strtol(element.c_str(), &end, 10);
            if (end != element.c_str() + element.size()) {
                return fallback;
            }
            out.push_back(static_cast<int>(parsed));
        }
        return out;
    }

private:
    [[nodiscard]] const std::string* find(const std::string& key) const {
        auto it = m_values.find(key);
        return it != m_values.end() ? &it->second : nullptr;
    }

    [[nodiscard]] static std::string_view trim(std::string_view s) noexcept {
        const std::size_t first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const std::size_t last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    // Quoted strings keep '#'; anything else loses a trailing comment
    [[nodiscard]] static std::string_view parse_value(std::string_view raw) noexcept {
        std::string_view value = trim(raw);
        if (!value.empty() && value.front() == '"') {
            const std::size_t close = value.find('"', 1);
            return close == std::string_view::npos ? value.substr(1) : value.substr(1, close - 1);
        }
        const std::size_t hash = value.find('#');
        if (hash != std::string_view::npos) {
            value = trim(value.substr(0, hash));
        }
        return value;
    }

    std::unordered_map<std::string, std::string> m_values;
};

} // namespace voxstream
