// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if FILE_ORG_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::file_organizer {

/**
 * @brief Log categories for file organizer system
 */
struct log_category {
    static constexpr std::string_view engine = "file_organizer.engine";
    static constexpr std::string_view resolver = "file_organizer.resolver";
    static constexpr std::string_view ledger = "file_organizer.ledger";
    static constexpr std::string_view sweeper = "file_organizer.sweeper";
    static constexpr std::string_view scanner = "file_organizer.scanner";
    static constexpr std::string_view pool = "file_organizer.pool";
};

/**
 * @brief Log levels for file organizer system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured context attached to a transfer log line
 */
struct transfer_log_context {
    std::string source;
    std::string destination;
    std::optional<uint64_t> file_size;
    std::optional<int> progress;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Render the populated fields as a flat JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto separator = [&]() {
            if (!first) oss << ",";
            first = false;
        };

        if (!source.empty()) {
            separator();
            oss << "\"source\":\"" << escape_json(source) << "\"";
        }
        if (!destination.empty()) {
            separator();
            oss << "\"destination\":\"" << escape_json(destination) << "\"";
        }
        if (file_size) {
            separator();
            oss << "\"size\":" << *file_size;
        }
        if (progress) {
            separator();
            oss << "\"progress\":" << *progress;
        }
        if (duration_ms) {
            separator();
            oss << "\"duration_ms\":" << *duration_ms;
        }
        if (error_message) {
            separator();
            oss << "\"error_message\":\"" << escape_json(*error_message) << "\"";
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(std::string_view input) -> std::string {
        std::string output;
        output.reserve(input.size() + 8);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable single line
    json    ///< One JSON object per line
};

/**
 * @brief File organizer logging facade
 *
 * Routes to kcenon logger_system when the library was built with it,
 * otherwise writes to stderr. A callback can be installed to observe
 * every record that passes the level filter.
 */
class file_organizer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    file_organizer_logger() = default;
    ~file_organizer_logger() = default;

    file_organizer_logger(const file_organizer_logger&) = delete;
    file_organizer_logger& operator=(const file_organizer_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times; only the first call has an effect.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if FILE_ORG_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if FILE_ORG_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if FILE_ORG_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Install a callback receiving every emitted record
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        const std::string formatted = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context)
            : format_text(category, message, context);

#if FILE_ORG_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::json) {
            output_to_stderr(formatted);
        } else {
            output_to_stderr(get_timestamp() + " [" +
                             std::string(log_level_to_string(level)) + "] " + formatted);
        }
    }

    void flush() {
#if FILE_ORG_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << transfer_log_context::escape_json(message) << "\"";
        if (context) {
            auto ctx = context->to_json();
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if FILE_ORG_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline file_organizer_logger& get_logger() {
    static file_organizer_logger instance;
    return instance;
}

#define FO_LOG(level, category, message) \
    kcenon::file_organizer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FO_LOG_CTX(level, category, message, context) \
    kcenon::file_organizer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FO_LOG_TRACE(category, message) \
    FO_LOG(kcenon::file_organizer::log_level::trace, category, message)

#define FO_LOG_DEBUG(category, message) \
    FO_LOG(kcenon::file_organizer::log_level::debug, category, message)

#define FO_LOG_INFO(category, message) \
    FO_LOG(kcenon::file_organizer::log_level::info, category, message)

#define FO_LOG_WARN(category, message) \
    FO_LOG(kcenon::file_organizer::log_level::warn, category, message)

#define FO_LOG_ERROR(category, message) \
    FO_LOG(kcenon::file_organizer::log_level::error, category, message)

#define FO_LOG_DEBUG_CTX(category, message, ctx) \
    FO_LOG_CTX(kcenon::file_organizer::log_level::debug, category, message, ctx)

#define FO_LOG_INFO_CTX(category, message, ctx) \
    FO_LOG_CTX(kcenon::file_organizer::log_level::info, category, message, ctx)

#define FO_LOG_WARN_CTX(category, message, ctx) \
    FO_LOG_CTX(kcenon::file_organizer::log_level::warn, category, message, ctx)

#define FO_LOG_ERROR_CTX(category, message, ctx) \
    FO_LOG_CTX(kcenon::file_organizer::log_level::error, category, message, ctx)

} // namespace kcenon::file_organizer
