#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    long long total = dur.count();
    if (total < 0)
        total = 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld.%03llds", total / 1000, total % 1000);
    return std::string(buf);
}
