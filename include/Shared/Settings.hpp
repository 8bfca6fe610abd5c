// =============================================================================
// SKYROAM - SETTINGS LOADER
// Simple TOML-like config parser ([section], key = value, # comments)
// =============================================================================
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <vector>
#include <cstdio>
#include <cstdlib>

namespace skyroam {

class Settings {
public:
    // Load settings from file
    bool load(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        parse(content.str());
        m_source = filepath;
        return true;
    }

    // Try each path in order, stop at the first that opens
    bool load_first_of(const std::vector<std::string>& paths) {
        for (const auto& path : paths) {
            if (load(path)) {
                return true;
            }
        }
        return false;
    }

    // Parse settings text directly (used for inline overrides and tests)
    void parse(std::string_view text) {
        std::string current_section;
        std::size_t pos = 0;

        while (pos <= text.size()) {
            std::size_t eol = text.find('\n', pos);
            if (eol == std::string_view::npos) eol = text.size();
            std::string line(text.substr(pos, eol - pos));
            pos = eol + 1;

            size_t start = line.find_first_not_of(" \t\r");
            if (start == std::string::npos || line[start] == '#') continue;
            line = line.substr(start);

            // Section header [section]
            if (line[0] == '[') {
                size_t end = line.find(']');
                if (end != std::string::npos) {
                    current_section = line.substr(1, end - 1);
                }
                continue;
            }

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(strip_comment(line.substr(eq_pos + 1)));

            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }

            std::string full_key = current_section.empty() ? key : current_section + "." + key;
            m_values[full_key] = value;
        }
    }

    std::string get_string(const std::string& key, const std::string& default_val = "") const {
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            return it->second;
        }
        return default_val;
    }

    float get_float(const std::string& key, float default_val = 0.0f) const {
        return static_cast<float>(get_double(key, static_cast<double>(default_val)));
    }

    // Geographic origins need more than float precision
    double get_double(const std::string& key, double default_val = 0.0) const {
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            char* end = nullptr;
            double val = std::strtod(it->second.c_str(), &end);
            if (end != it->second.c_str()) {
                return val;
            }
        }
        return default_val;
    }

    int get_int(const std::string& key, int default_val = 0) const {
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            char* end = nullptr;
            long val = std::strtol(it->second.c_str(), &end, 10);
            if (end != it->second.c_str()) {
                return static_cast<int>(val);
            }
        }
        return default_val;
    }

    bool get_bool(const std::string& key, bool default_val = false) const {
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            const std::string& v = it->second;
            return v == "true" || v == "1" || v == "yes";
        }
        return default_val;
    }

    bool has(const std::string& key) const {
        return m_values.find(key) != m_values.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }
    [[nodiscard]] const std::string& source() const noexcept { return m_source; }

private:
    static std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    // Drop a trailing "# ..." unless it sits inside a quoted string
    static std::string strip_comment(const std::string& s) {
        bool in_quotes = false;
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '"') in_quotes = !in_quotes;
            if (s[i] == '#' && !in_quotes) return s.substr(0, i);
        }
        return s;
    }

    std::unordered_map<std::string, std::string> m_values;
    std::string m_source;
};

} // namespace skyroam
