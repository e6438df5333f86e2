#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <chrono>
#include <ctime>

static std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "sshkit_debug.log").string();
    return path;
}

std::string sshkit_log_path() {
    return log_path_storage();
}

void set_log_path(const std::string& path) {
    if (!path.empty()) log_path_storage() = path;
}

void sshkit_log(const std::string& msg) {
    std::ofstream out(sshkit_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

void sshkit_log_ssh(const std::string& label, const std::string& cmd,
                    const SSHResult& r) {
    sshkit_log(fmt::format("{} CMD: {}", label, cmd));
    sshkit_log(fmt::format("{} exit={} signal={} stdout({})={}", label, r.exit_code,
                           r.exit_signal.empty() ? "-" : r.exit_signal,
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        sshkit_log(fmt::format("{} stderr({})={}", label, r.stderr_data.size(),
                               r.stderr_data.substr(0, 500)));
}
