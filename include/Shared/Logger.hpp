// =============================================================================
// VOXSTREAM - FILE LOGGER
// Shared by the client and the integrated server thread. Silent until opened.
// Lines read: "<seconds since open> <thread> [Category] message".
// =============================================================================
#pragma once

#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace voxstream {

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    bool open(const std::string& filename) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_file.close();
        m_file.clear();
        m_file.open(filename, std::ios::out | std::ios::trunc);
        m_opened_at = std::chrono::steady_clock::now();
        return m_file.is_open();
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_file.close();
    }

    // Label for lines written from the calling thread
    static void set_thread_name(const char* name) { thread_name() = name; }

    template<typename... Args>
    void log(const char* category, Args&&... args) {
        std::ostringstream body;
        ((body << args), ...);
        write(category, body.str());
    }

    void log_separator() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open()) return;
        m_file << std::string(60, '-') << '\n';
        m_file.flush();
    }

    // Column-major 4x4 matrix printed row by row
    void log_mat4(const char* category, const char* label, const float* m) {
        std::string body = label;
        for (int row = 0; row < 4; ++row) {
            char line[64];
            std::snprintf(line, sizeof(line), "\n    %9.4f %9.4f %9.4f %9.4f",
                          static_cast<double>(m[row]), static_cast<double>(m[4 + row]),
                          static_cast<double>(m[8 + row]), static_cast<double>(m[12 + row]));
            body += line;
        }
        write(category, body);
    }

private:
    Logger() = default;
    ~Logger() { close(); }

    static const char*& thread_name() {
        thread_local const char* name = "main";
        return name;
    }

    void write(const char* category, const std::string& body) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open()) return;

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - m_opened_at;
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "%10.3f ", elapsed.count());

        m_file << stamp << thread_name() << " [" << category << "] " << body << '\n';
        m_file.flush();
    }

    std::ofstream m_file;
    std::mutex m_mutex;
    std::chrono::steady_clock::time_point m_opened_at = std::chrono::steady_clock::now();
};

#define LOG(...) voxstream::Logger::instance().log(__VA_ARGS__)
#define LOG_SEP() voxstream::Logger::instance().log_separator()
#define LOG_MAT4(cat, label, m) voxstream::Logger::instance().log_mat4(cat, label, m)

} // namespace voxstream
