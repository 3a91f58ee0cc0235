#include "logger.hpp"
#include <zlib.h>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <syslog.h>
#include "time_utils.hpp"

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_syslog{false};
static std::mutex g_log_mtx;

/**
 * @brief Initialize file-based logging.
 *
 * Opens @p path for append, sets the minimum @ref LogLevel, and
 * configures size-based log rotation. When the file cannot be opened the
 * previous sink, if any, stays active.
 */
void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::string prev_path = g_log_path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
}

void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_syslog.store(true);
    openlog("syncguard", LOG_PID | LOG_CONS, facility);
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0)
            ok = false;
    }
    return gzclose(out) == Z_OK && ok;
}

static std::string json_escape(const std::string& in) {
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
            if (static_cast<unsigned char>(c) < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                out += esc;
            } else {
                out += c;
            }
            break;
        }
    }
    return out;
}

static std::string format_extra_json(const std::map<std::string, std::string>& fields) {
    std::string out;
    bool first = true;
    for (const auto& [k, v] : fields) {
        if (!first)
            out += ",";
        out += "\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        first = false;
    }
    return out;
}

// Shift name.1 .. name.N up by one, dropping the oldest, then move the active
// file to name.1 (gzipped when compression is on).
static void rotate_files() {
    namespace fs = std::filesystem;
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs.load()) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

static int syslog_priority(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return LOG_DEBUG;
    case LogLevel::INFO:
        return LOG_INFO;
    case LogLevel::WARNING:
        return LOG_WARNING;
    case LogLevel::ERR:
        return LOG_ERR;
    }
    return LOG_INFO;
}

/**
 * @brief Core logging routine.
 *
 * Formats the message, writes it to the file sink, rotates the file when it
 * grew past the configured size, and optionally forwards it to syslog.
 */
static void write_log_entry(LogLevel level, const std::string& label, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open() && !g_syslog.load())
        return;
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(timestamp()) + "\",\"level\":\"" + label +
               "\",\"msg\":\"" + json_escape(msg) + "\"";
        std::string extras = format_extra_json(fields);
        if (!extras.empty())
            line += "," + extras;
        line += "}";
    } else {
        line = "[" + timestamp() + "] [" + label + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << std::endl;
        if (g_max_size.load() > 0) {
            std::error_code ec;
            auto size = std::filesystem::file_size(g_log_path, ec);
            if (!ec && size > g_max_size.load()) {
                g_log_ofs.close();
                if (g_max_files.load() > 0)
                    rotate_files();
                g_log_ofs.open(g_log_path, std::ios::trunc);
            }
        }
    }
    if (g_syslog.load())
        syslog(syslog_priority(level), "%s", line.c_str());
}

void log_debug(const std::string& msg) { write_log_entry(LogLevel::DEBUG, "DEBUG", msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::DEBUG, "DEBUG", msg, fields);
}
void log_info(const std::string& msg) { write_log_entry(LogLevel::INFO, "INFO", msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::INFO, "INFO", msg, fields);
}
void log_warning(const std::string& msg) {
    write_log_entry(LogLevel::WARNING, "WARNING", msg, {});
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::WARNING, "WARNING", msg, fields);
}
void log_error(const std::string& msg) { write_log_entry(LogLevel::ERR, "ERROR", msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_log_entry(LogLevel::ERR, "ERROR", msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
}
