// File: config/configuration.hpp

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/logging/logger.hpp"

namespace config {
    class Configuration {
    public:
        using ChangeCallback = std::function<void(const std::string &, const YAML::Node &)>;

        Configuration(const Configuration &) = delete;

        Configuration &operator=(const Configuration &) = delete;

        Configuration(Configuration &&) = delete;

        Configuration &operator=(Configuration &&) = delete;

        ~Configuration() = default;

        // A missing file leaves the map empty so every lookup falls back to its default.
        explicit Configuration(std::string filename);

        // Initialize the configuration with a custom filepath
        static void initialize(const std::string &filename);

        // Get the singleton instance with optional filename
        static Configuration &getInstance(const std::string &filename = "");

        // Check if a key exists in the configuration
        [[nodiscard]] bool contains(const std::string &key) const;

        // Helper function to log entire configuration
        void show() const;

        [[nodiscard]] const std::string &filename() const noexcept { return filename_; }

        // Get a value of type T from the configuration
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        // Get a value of type T from the configuration with a default value
        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        // Specialization to handle const char* as std::string
        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

        template<typename T>
        bool set(const std::string &key, const T &value);

        // Re-read the backing file, replacing every loaded key
        void reload();

        void registerChangeCallback(ChangeCallback callback);

    private:
        std::unordered_map<std::string, YAML::Node> config_map_;
        static constexpr std::string_view default_filename_ = "configuration.yaml";
        static std::shared_ptr<Configuration> instance_;
        static std::once_flag init_flag_;
        std::string filename_;
        mutable std::shared_mutex mutex_;
        std::vector<ChangeCallback> change_callbacks_;

        // Parse the backing file into a fresh map. Throws std::runtime_error on malformed YAML.
        [[nodiscard]] std::unordered_map<std::string, YAML::Node> parse() const;

        // Flatten nested maps into dotted keys
        static void load(const YAML::Node &node, const std::string &prefix,
                         std::unordered_map<std::string, YAML::Node> &target);

        void notifyChangeCallbacks(const std::string &key, const YAML::Node &value) const;
    };

    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        std::shared_lock lock(mutex_);
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_DEBUG("Key '{}' not found in configuration", key);
            return std::nullopt;
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML parsing exception for key '{}': {}", key, e.what());
            return std::nullopt;
        }
    }

    template<typename T>
    T Configuration::get(const std::string &key, T default_value) const {
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    // Specialization to force const char* to std::string
    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

    template<typename T>
    bool Configuration::set(const std::string &key, const T &value) {
        YAML::Node node;
        {
            std::unique_lock lock(mutex_);
            try {
                node = value;
                config_map_[key] = node;
            } catch (const YAML::Exception &e) {
                LOG_ERROR("Error setting value for key '{}': {}", key, e.what());
                return false;
            }
        }
        notifyChangeCallbacks(key, node);
        return true;
    }

    inline void initialize(const std::string &filename = {}) { Configuration::initialize(filename); }

    inline bool Configuration::contains(const std::string &key) const {
        std::shared_lock lock(mutex_);
        return config_map_.contains(key);
    }

    // Convenience functions for getting configuration values
    template<typename T>
    std::optional<T> get(const std::string &key) {
        return Configuration::getInstance().get<T>(key);
    }

    template<typename T>
    T get(const std::string &key, T default_value) {
        return Configuration::getInstance().get<T>(key, default_value);
    }

    // yaml-cpp misbehaves with const char*
    inline std::string get(const std::string &key, const char *default_value) {
        return Configuration::getInstance().get(key, default_value);
    }

    template<typename T>
    bool set(const std::string &key, const T &value) {
        return Configuration::getInstance().set<T>(key, value);
    }

    inline bool contains(const std::string &key) { return Configuration::getInstance().contains(key); }

    inline void reload() { Configuration::getInstance().reload(); }

    inline void show() { Configuration::getInstance().show(); }

    inline void registerChangeCallback(Configuration::ChangeCallback callback) {
        Configuration::getInstance().registerChangeCallback(std::move(callback));
    }
} // namespace config

#endif // CONFIGURATION_HPP
