#pragma once

/**
 * @file logger.hxx
 * @brief Diagnostic logger used by the sniffer library
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace sniffer {

namespace logger_detail {
/// Seconds elapsed since the first call (program-relative wall time).
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    using dseconds = std::chrono::duration<double>;
    static const auto start = clock::now();
    return std::chrono::duration_cast<dseconds>(clock::now() - start).count();
}

struct Colors {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *cyan = "\033[36m";
    static constexpr const char *magenta = "\033[35m";
    static constexpr const char *blue = "\033[34m";
    static constexpr const char *bright_blue = "\033[94m";
    static constexpr const char *bright_yellow = "\033[93m";
    static constexpr const char *bright_red = "\033[91m";
};
}  // namespace logger_detail

/**
 * @brief Singleton, thread-safe logger for library diagnostics.
 *
 * The logger is usable without explicit initialization: the first message
 * goes to the console with default settings. initialize() may be called once,
 * before any message, to redirect output to a file or change the defaults.
 *
 * Messages below the minimum level are discarded without taking a lock, so
 * DEBUG statements on the statement-recording path cost one atomic load when
 * disabled. Emission never throws; a write failure is reported once on
 * stderr and otherwise ignored.
 */
class Logger {
   public:
    enum class level : int { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

    /**
     * @brief Accumulates tokens via `operator<<` and hands the full message
     *        to the Logger on destruction.
     */
    class log_stream {
       public:
        log_stream(Logger &logger_obj, level lvl) : lg_(logger_obj), level_(lvl), enabled_(logger_obj.enabled(lvl)) {}

        log_stream(log_stream &&logstr) noexcept
            : lg_(logstr.lg_), level_(logstr.level_), enabled_(logstr.enabled_), buf_(std::move(logstr.buf_)) {
            logstr.moved_ = true;
        }

        log_stream(const log_stream &) = delete;
        auto operator=(const log_stream &) -> log_stream & = delete;
        auto operator=(log_stream &&) -> log_stream & = delete;

        template <typename T>
        auto operator<<(const T &val) -> log_stream & {
            if (enabled_) {
                buf_ << val;
            }
            return *this;
        }

        ~log_stream() {
            if (moved_ || !enabled_) {
                return;
            }
            std::string msg = buf_.str();
            if (msg.empty()) {
                return;
            }
            lg_.emit(msg, level_);
        }

       private:
        Logger &lg_;
        level level_;
        bool enabled_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    static auto get_instance() -> Logger & {
        static Logger instance;
        return instance;
    }

    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;

    /**
     * @brief Configure output. Must precede the first emitted message.
     *
     * @param file_path    Append plain-text lines to this file; console when empty.
     * @param use_colors   Emit ANSI escape codes on console output.
     * @param show_thread  Prefix each line with a short thread ID.
     * @param min_level    Discard messages below this severity.
     *
     * @throws std::runtime_error if already initialized (explicitly or by a
     *         previous message), or if the file cannot be opened.
     */
    void initialize(const std::string &file_path = "", bool use_colors = true, bool show_thread = true, level min_level = level::WARNING) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("Logger already initialized!");
        }
        use_colors_ = use_colors;
        show_thread_ = show_thread;
        min_level_.store(min_level, std::memory_order_relaxed);
        if (!file_path.empty()) {
            file_.open(file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + file_path);
            }
        }
        initialized_ = true;
    }

    /// Lock-free; takes effect for the next message.
    void set_min_level(level lvl) noexcept { min_level_.store(lvl, std::memory_order_relaxed); }
    [[nodiscard]] auto min_level() const noexcept -> level { return min_level_.load(std::memory_order_relaxed); }
    [[nodiscard]] auto enabled(level lvl) const noexcept -> bool { return lvl >= min_level(); }

    void flush() {
        std::lock_guard lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }

    void debug(const std::string &msg) noexcept { emit(msg, level::DEBUG); }
    void info(const std::string &msg) noexcept { emit(msg, level::INFO); }
    void warning(const std::string &msg) noexcept { emit(msg, level::WARNING); }
    void error(const std::string &msg) noexcept { emit(msg, level::ERROR); }

    /**
     * @brief Streams @p parts into one message, for callers that must not throw.
     *
     * The message is built inside the logger's failure handling: an allocation
     * failure while formatting is reported like a write failure.
     */
    template <typename... Parts>
    void log(level lvl, const Parts &...parts) noexcept {
        if (!enabled(lvl)) {
            return;
        }
        try {
            std::ostringstream oss;
            (oss << ... << parts);
            emit(oss.str(), lvl);
        } catch (const std::exception &e) {
            report_write_failure(e);
        }
    }

    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    ~Logger() {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

   private:
    Logger() = default;

    struct level_meta {
        const char *label;  // fixed-width, 7 chars
        const char *color;
        bool use_err;
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        using logger_detail::Colors;
        switch (lvl) {
            case level::DEBUG:
                return {.label = " DEBUG ", .color = Colors::blue, .use_err = false};
            case level::INFO:
                return {.label = "  INFO ", .color = Colors::bright_blue, .use_err = false};
            case level::WARNING:
                return {.label = "WARNING", .color = Colors::bright_yellow, .use_err = true};
            case level::ERROR:
                return {.label = " ERROR ", .color = Colors::bright_red, .use_err = true};
        }
        return {.label = "       ", .color = Colors::reset, .use_err = false};
    }

    static auto format_time(double elapsed) -> std::string {
        constexpr int MS_PER_SECOND = 1000;
        constexpr int MS_PER_MINUTE = 60000;
        constexpr int MS_PER_HOUR = 3600000;
        constexpr int TIME_BUFFER_SIZE = 32;

        int total_ms = static_cast<int>(elapsed * MS_PER_SECOND);
        int hours = total_ms / MS_PER_HOUR;
        int minutes = (total_ms % MS_PER_HOUR) / MS_PER_MINUTE;
        int seconds = (total_ms % MS_PER_MINUTE) / MS_PER_SECOND;
        int millis = total_ms % MS_PER_SECOND;

        char buf[TIME_BUFFER_SIZE];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", hours, minutes, seconds, millis);
        return buf;
    }

    static auto current_thread_id() -> std::string {
        std::ostringstream strstream;
        strstream << std::this_thread::get_id();
        std::string str = strstream.str();
        if (str.size() > 4) {
            str = str.substr(str.size() - 4);
        }
        return str;
    }

    // Called with mutex_ held.
    void write_line(const std::string &message, level lvl, double elapsed, const std::string &thread_id) {
        const auto [label, color, use_err] = meta_of(lvl);
        std::ostream &ostr = use_err ? std::cerr : std::cout;

        std::string time_tag = "[" + format_time(elapsed) + "] ";
        std::string thread_tag = show_thread_ ? "[T:" + thread_id + "] " : "";
        std::string level_tag = std::string("[") + label + "] [sniffer] ";

        if (file_.is_open()) {
            file_ << time_tag << thread_tag << level_tag << message << '\n';
            file_.flush();
        } else if (use_colors_) {
            using logger_detail::Colors;
            ostr << Colors::cyan << time_tag << Colors::reset << Colors::magenta << thread_tag << Colors::reset << color << level_tag << Colors::reset
                 << message << '\n';
        } else {
            ostr << time_tag << thread_tag << level_tag << message << '\n';
        }
    }

    void emit(const std::string &message, level lvl) noexcept {
        if (!enabled(lvl)) {
            return;
        }
        try {
            const double elapsed = logger_detail::elapsed_seconds();
            const std::string thread_id = current_thread_id();
            std::lock_guard lock(mutex_);
            initialized_ = true;
            write_line(message, lvl, elapsed, thread_id);
        } catch (const std::exception &e) {
            report_write_failure(e);
        }
    }

    void report_write_failure(const std::exception &e) noexcept {
        if (!write_failed_.exchange(true)) {
            std::fprintf(stderr, "[sniffer] logger write failed: %s\n", e.what());
        }
    }

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool use_colors_ = true;
    bool show_thread_ = true;
    std::atomic<level> min_level_{level::WARNING};
    std::atomic<bool> write_failed_{false};

    std::ofstream file_;
};

}  // namespace sniffer

#define SNIFFER_LOG_DEBUG ::sniffer::Logger::get_instance().debug()
#define SNIFFER_LOG_INFO ::sniffer::Logger::get_instance().info()
#define SNIFFER_LOG_WARN ::sniffer::Logger::get_instance().warning()
#define SNIFFER_LOG_ERROR ::sniffer::Logger::get_instance().error()
