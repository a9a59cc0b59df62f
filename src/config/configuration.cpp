// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <filesystem>

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            instance_ = std::make_shared<Configuration>(filename.empty() ? std::string(default_filename_) : filename);
        });
        return *instance_;
    }

    Configuration::Configuration(std::string filename) : filename_(std::move(filename)) {
        LOG_INFO("Loading configuration from file: {}", filename_);
        config_map_ = parse();
    }

    std::unordered_map<std::string, YAML::Node> Configuration::parse() const {
        std::unordered_map<std::string, YAML::Node> parsed;

        if (!std::filesystem::exists(filename_)) {
            LOG_WARN("Configuration file '{}' not found, using built-in defaults.", filename_);
            return parsed;
        }

        try {
            const YAML::Node root = YAML::LoadFile(filename_);
            if (root.IsMap()) {
                load(root, "", parsed);
            } else if (!root.IsNull()) {
                LOG_CRITICAL("Configuration root in '{}' is not a map", filename_);
                throw std::runtime_error("Configuration root must be a map");
            }
            LOG_INFO("Configuration file '{}' loaded successfully ({} keys).", filename_, parsed.size());
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration: {}", e.what());
            throw std::runtime_error("YAML exception");
        }

        return parsed;
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix,
                             std::unordered_map<std::string, YAML::Node> &target) {
        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                LOG_TRACE("Loading nested map for key: '{}'", key);
                load(it.second, key, target);
            } else {
                target[key] = it.second;
                LOG_TRACE("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    void Configuration::reload() {
        auto parsed = parse();
        {
            std::unique_lock lock(mutex_);
            config_map_ = std::move(parsed);
        }
        LOG_INFO("Configuration reloaded from '{}'", filename_);

        std::unordered_map<std::string, YAML::Node> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot = config_map_;
        }
        for (const auto &[key, value]: snapshot) {
            notifyChangeCallbacks(key, value);
        }
    }

    void Configuration::registerChangeCallback(ChangeCallback callback) {
        std::unique_lock lock(mutex_);
        change_callbacks_.push_back(std::move(callback));
    }

    void Configuration::notifyChangeCallbacks(const std::string &key, const YAML::Node &value) const {
        std::vector<ChangeCallback> callbacks;
        {
            std::shared_lock lock(mutex_);
            callbacks = change_callbacks_;
        }
        for (const auto &callback: callbacks) {
            callback(key, value);
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details:");
        for (const auto &entry: config_map_) {
            if (entry.second.IsScalar()) {
                LOG_INFO("{}: {}", entry.first, entry.second.as<std::string>());
            } else {
                LOG_INFO("{}: [non-scalar]", entry.first);
            }
        }
    }
} // namespace config
