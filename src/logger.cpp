#include "logger.hpp"
#include <zlib.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LoggerState {
    std::ofstream ofs;
    std::string path;
    LogLevel min_level = LogLevel::INFO;
    size_t max_size = 0;
    size_t max_files = 1;
    bool json = false;
    bool compress = false;
    bool console = false;
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string format_line(LogLevel level, const std::string& msg,
                        const std::map<std::string, std::string>& fields) {
    const LoggerState& s = state();
    std::string ts = timestamp();
    std::string line;
    if (s.json) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(level) +
               "\",\"msg\":\"" + json_escape(msg) + "\"";
        for (const auto& [k, v] : fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(level) + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    return line;
}

// Shift <path>.N to <path>.N+1, dropping the oldest, then move the active
// file to <path>.1 (gzipped when compression is on).
void rotate() {
    LoggerState& s = state();
    s.ofs.close();
    std::error_code ec;
    if (s.max_files > 0) {
        const std::string suffix = s.compress ? ".gz" : "";
        for (size_t i = s.max_files; i > 0; --i) {
            fs::path src = s.path + "." + std::to_string(i) + suffix;
            if (i == s.max_files) {
                fs::remove(src, ec);
            } else {
                fs::path dst = s.path + "." + std::to_string(i + 1) + suffix;
                fs::rename(src, dst, ec);
            }
        }
        fs::path first = s.path + ".1";
        fs::rename(s.path, first, ec);
        if (s.compress) {
            fs::path gz = first;
            gz += ".gz";
            if (gzip_file(first.string(), gz.string()))
                fs::remove(first, ec);
        }
    }
    s.ofs.open(s.path, std::ios::trunc);
}

void write_entry(LogLevel level, const std::string& msg,
                 const std::map<std::string, std::string>& fields) {
    LoggerState& s = state();
    if (level < s.min_level || (!s.ofs.is_open() && !s.console))
        return;
    std::string line = format_line(level, msg, fields);
    if (s.console)
        std::cerr << line << '\n';
    if (!s.ofs.is_open())
        return;
    s.ofs << line << '\n';
    if (s.max_size > 0) {
        s.ofs.flush();
        std::error_code ec;
        auto size = fs::file_size(s.path, ec);
        if (!ec && size > s.max_size)
            rotate();
    }
}

} // namespace

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    LoggerState& s = state();
    if (s.ofs.is_open()) {
        s.ofs.flush();
        s.ofs.close();
    }
    s.ofs.clear();
    s.max_size = max_size;
    s.max_files = max_files;
    s.min_level = level;
    s.ofs.open(path, std::ios::app);
    if (!s.ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        s.path.clear();
        return false;
    }
    s.path = path;
    return true;
}

void set_log_level(LogLevel level) { state().min_level = level; }

void set_json_logging(bool enable) { state().json = enable; }

void set_log_compression(bool enable) { state().compress = enable; }

void set_console_logging(bool enable) { state().console = enable; }

bool logger_initialized() { return state().ofs.is_open(); }

void log_event(LogLevel level, const std::string& message) { write_entry(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    write_entry(level, message, fields);
}

void log_debug(const std::string& msg) { write_entry(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { write_entry(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { write_entry(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { write_entry(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::ERR, msg, fields);
}

void flush_logger() {
    LoggerState& s = state();
    if (s.ofs.is_open())
        s.ofs.flush();
    if (s.console)
        std::cerr.flush();
}

void shutdown_logger() {
    LoggerState& s = state();
    if (s.ofs.is_open()) {
        s.ofs.flush();
        s.ofs.close();
    }
    s = LoggerState{};
}
