#pragma once

/**
 * @file logger.hxx
 * @brief Logger class and macros used by the profiling headers
 * @version 1.1.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

// ── Internal clock ────────────────────────────────────────────────────────────

namespace reqprof::logger_detail {
/// Returns seconds elapsed since the first call (program-relative wall time).
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    using dseconds = std::chrono::duration<double>;
    static const auto start = clock::now();
    return std::chrono::duration_cast<dseconds>(clock::now() - start).count();
}

struct colors {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *cyan = "\033[36m";
    static constexpr const char *magenta = "\033[35m";
    static constexpr const char *white = "\033[37m";
    static constexpr const char *blue = "\033[34m";
    static constexpr const char *bright_blue = "\033[94m";
    static constexpr const char *bright_green = "\033[92m";
    static constexpr const char *bright_yellow = "\033[93m";
    static constexpr const char *bright_red = "\033[91m";
};
}  // namespace reqprof::logger_detail

namespace reqprof {

// ── Options ──────────────────────────────────────────────────────────────────

enum class log_level : int { BASIC = 0, DEBUG = 1, INFO = 2, SUCCESS = 3, WARNING = 4, ERROR = 5 };

/**
 * @brief Settings applied by logger::initialize().
 *
 * @var file_path    Append plain-text lines to this file instead of the console (empty = console).
 * @var use_colors   Emit ANSI escape codes on console output.
 * @var show_thread  Prefix each line with a short thread ID.
 * @var async_mode   Hand records to a background worker so callers never block on I/O.
 * @var min_level    Discard messages below this severity.
 * @var console      Console sink override. nullptr routes BASIC..SUCCESS to stdout and WARNING/ERROR to stderr.
 */
struct logger_options {
    std::string file_path;
    bool use_colors = true;
    bool show_thread = true;
    bool async_mode = false;
    log_level min_level = log_level::BASIC;
    std::ostream *console = nullptr;
};

// ── Logger ───────────────────────────────────────────────────────────────────

/**
 * @brief Singleton, thread-safe logger.
 *
 * Library code logs through it unconditionally, so the logger is usable
 * before initialize(): records are then written with default options.
 * initialize() may be called once; shutdown() returns it to the
 * uninitialized state (flushing and joining the async worker first).
 */
class logger {
   public:
    using level = log_level;

    /**
     * @brief RAII stream wrapper — accumulates tokens via `operator<<` and
     *        flushes the full message to the logger on destruction.
     *
     * @code
     *   REQPROF_LOG_INFO << "Value = " << x;
     * @endcode
     */
    class log_stream {
       public:
        log_stream(logger &logger_obj, level lvl) : lg_(logger_obj), level_(lvl) {}

        log_stream(log_stream &&logstr) noexcept : lg_(logstr.lg_), level_(logstr.level_), buf_(std::move(logstr.buf_)) { logstr.moved_ = true; }

        log_stream(const log_stream &) = delete;
        auto operator=(const log_stream &) -> log_stream & = delete;
        auto operator=(log_stream &&) -> log_stream & = delete;

        template <typename T>
        auto operator<<(const T &val) -> log_stream & {
            buf_ << val;
            return *this;
        }

        ~log_stream() {
            if (moved_) {
                return;
            }
            std::string msg = buf_.str();
            if (msg.empty()) {
                return;
            }
            lg_.emit(msg, level_);
        }

       private:
        logger &lg_;
        level level_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    static auto get_instance() -> logger & {
        static logger instance;
        return instance;
    }

    logger(const logger &) = delete;
    auto operator=(const logger &) -> logger & = delete;

    /**
     * @throws std::runtime_error if already initialized, or if the log file cannot be opened.
     */
    void initialize(logger_options options = {}) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("Logger already initialized!");
        }

        if (!options.file_path.empty()) {
            file_.open(options.file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + options.file_path);
            }
        }

        use_colors_ = options.use_colors;
        show_thread_ = options.show_thread;
        console_ = options.console;
        min_level_.store(options.min_level, std::memory_order_relaxed);
        async_mode_.store(options.async_mode, std::memory_order_release);

        if (options.async_mode) {
            start_worker();
        }

        initialized_ = true;
    }

    /// Drains pending records, closes the file and returns to default settings.
    void shutdown() {
        if (async_mode_.exchange(false, std::memory_order_acq_rel)) {
            stop_worker();
        }
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        use_colors_ = true;
        show_thread_ = true;
        console_ = nullptr;
        min_level_.store(level::BASIC, std::memory_order_relaxed);
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool {
        std::lock_guard lock(mutex_);
        return initialized_;
    }

    // ── Runtime controls ─────────────────────────────────────────────────────

    void set_colors(bool flag) {
        std::lock_guard lock(mutex_);
        use_colors_ = flag;
    }
    void set_thread(bool flag) {
        std::lock_guard lock(mutex_);
        show_thread_ = flag;
    }
    /// Lock-free; takes effect for the next emitted record.
    void set_min_level(level lvl) { min_level_.store(lvl, std::memory_order_relaxed); }
    [[nodiscard]] auto min_level() const -> level { return min_level_.load(std::memory_order_relaxed); }

    void flush() {
        std::lock_guard lock(mutex_);
        if (console_ != nullptr) {
            console_->flush();
        }
        std::cout.flush();
        std::cerr.flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }

    // ── String overloads ─────────────────────────────────────────────────────

    void log(const std::string &msg) { emit(msg, level::BASIC); }
    void debug(const std::string &msg) { emit(msg, level::DEBUG); }
    void info(const std::string &msg) { emit(msg, level::INFO); }
    void success(const std::string &msg) { emit(msg, level::SUCCESS); }
    void warning(const std::string &msg) { emit(msg, level::WARNING); }
    void error(const std::string &msg) { emit(msg, level::ERROR); }

    // ── Stream-style factory methods ─────────────────────────────────────────

    log_stream log() { return {*this, level::BASIC}; }
    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream success() { return {*this, level::SUCCESS}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    ~logger() {
        if (async_mode_.load(std::memory_order_acquire)) {
            stop_worker();
        }
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    friend class log_stream;

   private:
    struct record {
        std::string message;
        level lvl;
        double elapsed;         // captured at emit() call time
        std::string thread_id;  // captured at emit() call time
    };

    logger() = default;

    struct level_meta {
        const char *label;  // fixed-width, 7 chars
        const char *color;
        bool use_err;  // route to stderr?
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        using logger_detail::colors;
        switch (lvl) {
            case level::BASIC:
                return {.label = "       ", .color = colors::white, .use_err = false};
            case level::DEBUG:
                return {.label = " DEBUG ", .color = colors::blue, .use_err = false};
            case level::INFO:
                return {.label = "  INFO ", .color = colors::bright_blue, .use_err = false};
            case level::SUCCESS:
                return {.label = "SUCCESS", .color = colors::bright_green, .use_err = false};
            case level::WARNING:
                return {.label = "WARNING", .color = colors::bright_yellow, .use_err = true};
            case level::ERROR:
                return {.label = " ERROR ", .color = colors::bright_red, .use_err = true};
        }
        return {.label = "       ", .color = colors::white, .use_err = false};
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
        // Keep only the last 4 characters for brevity
        if (str.size() > 4) {
            str = str.substr(str.size() - 4);
        }
        return str;
    }

    // Called with mutex_ held.
    void write_record(const record &rec) {
        const auto [label, color, use_err] = meta_of(rec.lvl);
        std::ostream &ostr = console_ != nullptr ? *console_ : (use_err ? std::cerr : std::cout);

        std::string time_tag = "[" + format_time(rec.elapsed) + "] ";
        std::string thread_tag = show_thread_ ? "[T:" + rec.thread_id + "] " : "";
        std::string level_tag = rec.lvl == level::BASIC ? "" : std::string("[") + label + "] ";

        if (file_.is_open()) {
            // File output — never colored
            file_ << time_tag << thread_tag << level_tag << rec.message << '\n';
            file_.flush();
        } else if (use_colors_) {
            using logger_detail::colors;
            ostr << colors::cyan << time_tag << colors::reset << colors::magenta << thread_tag << colors::reset << color << level_tag << colors::reset
                 << rec.message << '\n';
        } else {
            ostr << time_tag << thread_tag << level_tag << rec.message << '\n';
        }
    }

    void emit(const std::string &message, level lvl) {
        // Fast path: skip below-threshold messages without locking
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        record rec{.message = message, .lvl = lvl, .elapsed = logger_detail::elapsed_seconds(), .thread_id = current_thread_id()};

        if (async_mode_.load(std::memory_order_acquire)) {
            bool queued = false;
            {
                std::lock_guard lock(queue_mutex_);
                // The worker may have been stopped since async_mode_ was read
                if (worker_running_) {
                    queue_.push(std::move(rec));
                    queued = true;
                }
            }
            if (queued) {
                queue_cv_.notify_one();
                return;
            }
        }

        std::lock_guard lock(mutex_);
        write_record(rec);
    }

    // ── Async worker ─────────────────────────────────────────────────────────

    void start_worker() {
        worker_running_ = true;
        worker_ = std::thread([this] {
            while (true) {
                std::unique_lock lock(queue_mutex_);
                queue_cv_.wait(lock, [this] { return !queue_.empty() || !worker_running_; });

                // Drain everything currently in the queue
                while (!queue_.empty()) {
                    record rec = std::move(queue_.front());
                    queue_.pop();
                    lock.unlock();

                    {
                        std::lock_guard writelock(mutex_);
                        write_record(rec);
                    }

                    lock.lock();
                }

                if (!worker_running_ && queue_.empty()) {
                    break;
                }
            }
        });
    }

    void stop_worker() {
        {
            std::lock_guard lock(queue_mutex_);
            worker_running_ = false;
        }
        queue_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    // ── Data members ─────────────────────────────────────────────────────────

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool use_colors_ = true;
    bool show_thread_ = true;
    std::ostream *console_ = nullptr;
    std::atomic<bool> async_mode_{false};
    std::atomic<level> min_level_{level::BASIC};

    std::ofstream file_;

    // Async support
    std::thread worker_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<record> queue_;
    std::atomic<bool> worker_running_{false};
};

/// Initialize with default settings (stdout, colors, sync).
inline void log_init() { logger::get_instance().initialize(); }

/// Initialize with file output.
inline void log_init_file(const std::string &path) { logger::get_instance().initialize({.file_path = path}); }

/// Initialize in async (non-blocking) mode.
inline void log_init_async() { logger::get_instance().initialize({.async_mode = true}); }

}  // namespace reqprof

// ── Convenience macros ────────────────────────────────────────────────────────

#define REQPROF_LOG ::reqprof::logger::get_instance().log()
#define REQPROF_LOG_DEBUG ::reqprof::logger::get_instance().debug()
#define REQPROF_LOG_INFO ::reqprof::logger::get_instance().info()
#define REQPROF_LOG_SUCCESS ::reqprof::logger::get_instance().success()
#define REQPROF_LOG_WARN ::reqprof::logger::get_instance().warning()
#define REQPROF_LOG_ERROR ::reqprof::logger::get_instance().error()

/// Stamp the current source location then continue the stream.
#define REQPROF_LOG_HERE REQPROF_LOG_DEBUG << __FILE__ ":" << __LINE__ << " | "
