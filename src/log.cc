#include "log.hpp"

std::mutex g_output_mutex;
std::ofstream g_log_file;
std::atomic<bool> g_console_enabled{true};

namespace out {

bool init_log_file(const std::filesystem::path& path) {
    LOG_LOCK();
    if (g_log_file.is_open()) {
        g_log_file.close();
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }

    g_log_file.open(path, std::ios::out | std::ios::app);
    return g_log_file.is_open();
}

void close_log_file() {
    LOG_LOCK();
    if (g_log_file.is_open()) {
        g_log_file.flush();
        g_log_file.close();
    }
}

} // namespace out
