// =============================================================================
// SKYROAM - FILE LOGGER
// Thread-safe; written from both the ingestion worker and the main loop
// =============================================================================
#pragma once

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

namespace skyroam {

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    bool open(const std::string& filename) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
        m_file.open(filename, std::ios::out | std::ios::trunc);
        if (m_file.is_open()) {
            m_file << "=== SKYROAM LOG ===\n\n";
            m_file.flush();
            return true;
        }
        return false;
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
    }

    // Mirror every line to stdout
    void set_echo(bool echo) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_echo = echo;
    }

    template<typename... Args>
    void log(const char* category, Args&&... args) {
        std::ostringstream line;
        line << "[" << category << "] ";
        ((line << args), ...);
        line << "\n";

        std::lock_guard<std::mutex> lock(m_mutex);
        write_locked(line.str());
    }

    void log_separator() {
        std::lock_guard<std::mutex> lock(m_mutex);
        write_locked("----------------------------------------\n");
    }

    void log_timing(const char* category, const char* what, double ms) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f ms", ms);
        log(category, what, " took ", buf);
    }

private:
    Logger() = default;
    ~Logger() { close(); }

    void write_locked(const std::string& text) {
        if (m_echo) {
            std::cout << text;
        }
        if (!m_file.is_open()) return;
        m_file << text;
        m_file.flush();
    }

    std::ofstream m_file;
    std::mutex m_mutex;
    bool m_echo = false;
};

// Convenience macros
#define LOG(...) skyroam::Logger::instance().log(__VA_ARGS__)
#define LOG_SEP() skyroam::Logger::instance().log_separator()
#define LOG_TIMING(cat, what, ms) skyroam::Logger::instance().log_timing(cat, what, ms)

} // namespace skyroam
