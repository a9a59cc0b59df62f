// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <string_view>
#include <vector>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    LoggerSettings Logger::settings_{};
    std::once_flag Logger::init_flag_;
    std::mutex Logger::mutex_;

    void Logger::configure(const LoggerSettings &settings) {
        bool created = false;
        std::call_once(init_flag_, [&settings, &created]() {
            {
                std::lock_guard lock(mutex_);
                settings_ = settings;
            }
            init();
            created = true;
        });
        if (created) {
            return;
        }

        std::lock_guard lock(mutex_);
        const bool sinks_changed = settings.file_sink != settings_.file_sink ||
                                   settings.directory != settings_.directory || settings.filename != settings_.filename;
        settings_ = settings;
        if (sinks_changed || !logger_) {
            if (auto replacement = createLogger(settings_)) {
                install(std::move(replacement));
            }
        } else {
            logger_->set_level(getLogLevel(settings_.level));
            logger_->set_pattern(settings_.pattern);
        }
    }

    void Logger::init() {
        std::lock_guard lock(mutex_);
        if (auto logger = createLogger(settings_)) {
            install(std::move(logger));
        }
    }

    std::shared_ptr<spdlog::logger> Logger::createLogger(const LoggerSettings &settings) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

            if (settings.file_sink) {
                if (!std::filesystem::exists(settings.directory)) {
                    std::filesystem::create_directories(settings.directory);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        settings.directory + "/" + settings.filename, true));
            }

            auto logger = std::make_shared<spdlog::logger>("rangefinder", sinks.begin(), sinks.end());
            logger->set_level(getLogLevel(settings.level));
            logger->set_pattern(settings.pattern);
            return logger;
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory could not be created: " << ex.what() << std::endl;
        }
        return nullptr;
    }

    // Callers hold mutex_.
    void Logger::install(std::shared_ptr<spdlog::logger> logger) {
        if (logger_) {
            logger_->flush();
        }
        spdlog::drop(logger->name());
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        logger_ = std::move(logger);
    }

    void Logger::setLogLevel(const std::string &level) {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(mutex_);
        settings_.level = level;
        if (logger_) {
            logger_->set_level(getLogLevel(level));
        }
    }

    void Logger::setPattern(const std::string &pattern) {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(mutex_);
        settings_.pattern = pattern;
        if (logger_) {
            logger_->set_pattern(pattern);
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace},
                {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},
                {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},
                {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}
        };
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> Logger::getLogger() {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(mutex_);
        return logger_;
    }

} // namespace common::logging
