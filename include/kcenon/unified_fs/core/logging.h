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

#if UNIFIED_FS_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::unified_fs {

/**
 * @brief Log categories, one per component
 */
struct log_category {
    static constexpr std::string_view provider = "unified_fs.provider";
    static constexpr std::string_view session = "unified_fs.session";
    static constexpr std::string_view lister = "unified_fs.lister";
    static constexpr std::string_view transfer = "unified_fs.transfer";
    static constexpr std::string_view queue = "unified_fs.queue";
    static constexpr std::string_view events = "unified_fs.events";
};

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
 * @brief Which parts of a record are masked before output
 *
 * Remote paths and host names identify customer systems; masking keeps
 * them out of shared log files.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_hosts = false;
    char mask_char = '*';
    std::size_t visible_chars = 3;

    static masking_config all_masked() {
        return {true, true, '*', 3};
    }

    static masking_config none() {
        return {false, false, '*', 3};
    }
};

class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Mask every directory component, keep the leaf name
     *
     * For "/home/alice/report.pdf" every character of "home" and "alice"
     * becomes '*' and "report.pdf" is kept.
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked = path.substr(0, last_sep);
        std::replace_if(
            masked.begin(), masked.end(), [](char c) { return c != '/'; },
            config_.mask_char);
        return masked + path.substr(last_sep);
    }

    /**
     * @brief Keep the first characters of a host name
     */
    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.size() <= config_.visible_chars) {
            return host;
        }
        return host.substr(0, config_.visible_chars) +
               std::string(host.size() - config_.visible_chars, config_.mask_char);
    }

    /**
     * @brief Mask "user@host" in sftp:// locations embedded in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_hosts) {
            return input;
        }

        static constexpr std::string_view scheme = "sftp://";
        std::string output;
        std::size_t pos = 0;
        while (true) {
            auto start = input.find(scheme, pos);
            if (start == std::string::npos) {
                output += input.substr(pos);
                break;
            }
            start += scheme.size();
            output += input.substr(pos, start - pos);

            auto end = input.find_first_of("/ ", start);
            if (end == std::string::npos) {
                end = input.size();
            }
            output += mask_host(input.substr(start, end - start));
            pos = end;
        }
        return output;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = config;
    }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to a log record
 */
struct operation_log_context {
    std::string request_id;
    std::string path;
    std::optional<std::string> provider;
    std::optional<std::string> remote_host;
    std::optional<uint64_t> size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!request_id.empty()) add_field("request_id", request_id);
        if (!path.empty()) add_field("path", masker ? masker->mask_path(path) : path);
        if (provider) add_field("provider", *provider);
        if (remote_host) {
            add_field("remote_host", masker ? masker->mask_host(*remote_host) : *remote_host);
        }
        if (size) add_uint("size", *size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (attempt) add_uint("attempt", *attempt);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 16);
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

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for unified_fs components
 *
 * Routes to logger_system when available, otherwise writes to stderr.
 * A callback may be installed to observe records (tests, embedding UIs).
 */
class unified_fs_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const operation_log_context*)>;

    unified_fs_logger() = default;
    ~unified_fs_logger() = default;

    unified_fs_logger(const unified_fs_logger&) = delete;
    unified_fs_logger& operator=(const unified_fs_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; only the first call has an effect.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if UNIFIED_FS_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if UNIFIED_FS_USE_LOGGER_SYSTEM
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
#if UNIFIED_FS_USE_LOGGER_SYSTEM
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

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

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
             const operation_log_context* context = nullptr,
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

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string record = format == log_output_format::json
            ? format_json(level, category, message, context, masker)
            : format_text(category, message, context, masker);

#if UNIFIED_FS_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), record, file, line, function);
            } else {
                logger_->log(to_logger_level(level), record);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            record = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                     record;
        }
        output_to_stderr(record);
    }

    void flush() {
#if UNIFIED_FS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const operation_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const operation_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << operation_log_context::escape_json_string(masker.mask(std::string(message)))
            << "\"";
        if (context) {
            auto ctx = context->to_json_with_masking(&masker);
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
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if UNIFIED_FS_USE_LOGGER_SYSTEM
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
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline unified_fs_logger& get_logger() {
    static unified_fs_logger instance;
    return instance;
}

#define UFS_LOG(level, category, message) \
    kcenon::unified_fs::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define UFS_LOG_CTX(level, category, message, context) \
    kcenon::unified_fs::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define UFS_LOG_TRACE(category, message) \
    UFS_LOG(kcenon::unified_fs::log_level::trace, category, message)
#define UFS_LOG_DEBUG(category, message) \
    UFS_LOG(kcenon::unified_fs::log_level::debug, category, message)
#define UFS_LOG_INFO(category, message) \
    UFS_LOG(kcenon::unified_fs::log_level::info, category, message)
#define UFS_LOG_WARN(category, message) \
    UFS_LOG(kcenon::unified_fs::log_level::warn, category, message)
#define UFS_LOG_ERROR(category, message) \
    UFS_LOG(kcenon::unified_fs::log_level::error, category, message)

#define UFS_LOG_DEBUG_CTX(category, message, context) \
    UFS_LOG_CTX(kcenon::unified_fs::log_level::debug, category, message, context)
#define UFS_LOG_INFO_CTX(category, message, context) \
    UFS_LOG_CTX(kcenon::unified_fs::log_level::info, category, message, context)
#define UFS_LOG_WARN_CTX(category, message, context) \
    UFS_LOG_CTX(kcenon::unified_fs::log_level::warn, category, message, context)
#define UFS_LOG_ERROR_CTX(category, message, context) \
    UFS_LOG_CTX(kcenon::unified_fs::log_level::error, category, message, context)

}  // namespace kcenon::unified_fs
