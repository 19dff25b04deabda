#include "log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::string g_log_path;

std::string default_log_path() {
    return (platform::temp_dir() / DEBUG_LOG_NAME).string();
}

} // namespace

std::string depsweep_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_path.empty() ? default_log_path() : g_log_path;
}

void set_log_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path.string();
}

void depsweep_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(g_log_path.empty() ? default_log_path() : g_log_path,
                      std::ios::app);
    if (!out) return;
    out << line;
}
