#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format an elapsed time as seconds with millisecond precision, e.g. `1.042s`.
 */
std::string format_elapsed(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
