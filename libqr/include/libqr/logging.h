//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <source_location>

namespace qr::log {

    inline std::atomic<bool>& verbose_flag() {
        static std::atomic<bool> flag{false};
        return flag;
    }

    // Builds run on worker threads, so every line goes out under one lock.
    inline std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    inline void set_verbose(bool enabled) {
        verbose_flag().store(enabled);
    }

    inline void print(const std::string& level, const std::string& color_code, const std::string& msg) {
        std::lock_guard<std::mutex> lock(output_mutex());
        std::cout << color_code << "[  " << level << "  ] > " << "\033[0m" << msg << std::endl;
    }

    inline void ok(const std::string& msg) {
        print("OKY", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print("ERR", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print("LOG", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print("WRN", "\033[1;33m", msg); // Bold Yellow
    }

    // Resolver decisions and per-file transaction steps; silent unless --verbose.
    inline void debug(const std::string& msg) {
        if (verbose_flag().load()) {
            print("DBG", "\033[0;36m", msg); // Cyan
        }
    }

    // Prints a progress message without a newline, and flushes the output.
    inline void progress(const std::string& msg) {
        std::lock_guard<std::mutex> lock(output_mutex());
        // \r: back to column 0, \033[K: erase to end of line
        std::cout << "\r\033[K"
                  << "\033[1;34m" << "[..] > " << "\033[0m"
                  << msg << std::flush;
    }

    // Closes a progress line with a green OKY marker.
    inline void progress_ok() {
        std::lock_guard<std::mutex> lock(output_mutex());
        std::cout << " [" << "\033[1;32m" << "  OKY  " << "\033[0m" << "]" << std::endl;
    }

} // namespace qr::log
