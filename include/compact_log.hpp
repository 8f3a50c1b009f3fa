#pragma once

#include <unistd.h>
#include <string>
#include <string_view>
#include <mutex>
#include <atomic>

namespace compact {

// Lightweight unbuffered writer shared by the CLI and the scan workers
class Writer {
public:
    static void print(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    // Diagnostic line on stderr, emitted only in verbose mode
    static void debug(std::string_view s) {
        if (!verbose()) return;
        std::string line;
        line.reserve(s.size() + 11);
        line += "[doclint] ";
        line += s;
        line += '\n';
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, line);
    }

    static void set_verbose(bool on) { verbose_flag().store(on); }
    static bool verbose() { return verbose_flag().load(); }

private:
    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            auto n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }

    static std::atomic<bool>& verbose_flag() {
        static std::atomic<bool> flag{false};
        return flag;
    }
};

} // namespace compact
