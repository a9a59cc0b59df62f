// File: common/logging/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// NOTE: Logger MUST NOT depend on config::Configuration, as it will cause a circular dependency
namespace common::logging {

    struct LoggerSettings {
        std::string directory = "./logs";
        std::string filename = "rangefinder.log";
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%# %!] %v";
        bool file_sink = true;
    };

    class Logger {
    public:
        Logger(const Logger &) = delete;

        Logger &operator=(const Logger &) = delete;

        ~Logger() = default;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                        Args &&...args);

        // Rebuilds the sinks when the directory, file or file_sink setting changes.
        static void configure(const LoggerSettings &settings);

        static void setLogLevel(const std::string &level);

        static void setPattern(const std::string &pattern);

        static spdlog::level::level_enum getLogLevel(const std::string &level);

        static std::shared_ptr<spdlog::logger> getLogger();

    private:
        static std::shared_ptr<spdlog::logger> logger_;
        static LoggerSettings settings_;
        static std::once_flag init_flag_;
        static std::mutex mutex_;

        static void init();

        [[nodiscard]] static std::shared_ptr<spdlog::logger> createLogger(const LoggerSettings &settings);

        static void install(std::shared_ptr<spdlog::logger> logger);
    };

#define LOG_(level, fmt, ...)                                                                                          \
    common::logging::Logger::log(common::logging::Logger::getLogLevel(level), __FILE__, __LINE__, __FUNCTION__, fmt,   \
                                 ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_("trace", fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_("debug", fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_("info", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_("warn", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_("error", fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) LOG_("critical", fmt, ##__VA_ARGS__)

    template<typename... Args>
    void Logger::log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                     Args &&...args) {
        const auto logger = getLogger();
        if (logger) {
            if (!logger->should_log(level)) {
                return;
            }
            spdlog::source_loc source{file, line, func};
            if constexpr (sizeof...(args) > 0) {
                auto formatted_string = fmt::vformat(fmt, fmt::make_format_args(args...));
                logger->log(source, level, formatted_string);
            } else {
                logger->log(source, level, fmt);
            }
        } else {
            std::cerr << "Logger not initialized!" << std::endl;
        }
    }

} // namespace common::logging

#endif // LOGGER_HPP
