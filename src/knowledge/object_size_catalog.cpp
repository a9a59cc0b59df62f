// File: knowledge/object_size_catalog.cpp

#include "knowledge/object_size_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"

namespace knowledge {

    ObjectSizeCatalog ObjectSizeCatalog::fromFile(const std::string &filename) {
        LOG_INFO("Loading object size catalog from file: {}", filename);
        try {
            return fromYaml(YAML::LoadFile(filename));
        } catch (const YAML::Exception &e) {
            LOG_ERROR("Failed to load object size catalog '{}': {}", filename, e.what());
            throw std::runtime_error("Unable to load object size catalog: " + filename);
        }
    }

    ObjectSizeCatalog ObjectSizeCatalog::fromYaml(const YAML::Node &root) {
        ObjectSizeCatalog catalog;

        const YAML::Node objects = root.IsSequence() ? root : root["objects"];
        if (!objects || !objects.IsSequence()) {
            LOG_WARN("Object size catalog has no 'objects' sequence; catalog is empty");
            return catalog;
        }

        for (const auto &node: objects) {
            auto entry = parseEntry(node);
            if (!entry) {
                continue;
            }

            std::vector<std::string> aliases;
            if (const auto alias_node = node["aliases"]; alias_node && alias_node.IsSequence()) {
                for (const auto &alias: alias_node) {
                    if (alias.IsScalar()) {
                        aliases.push_back(alias.as<std::string>());
                    } else {
                        LOG_WARN("Ignoring non-scalar alias for '{}'", entry->label);
                    }
                }
            }
            catalog.add(*entry, aliases);
        }

        LOG_INFO("Object size catalog loaded with {} entries", catalog.size());
        return catalog;
    }

    ObjectSizeCatalog::ObjectSizeCatalog(const ObjectSizeCatalog &other) {
        std::shared_lock lock(other.mutex_);
        entries_ = other.entries_;
        index_ = other.index_;
    }

    ObjectSizeCatalog &ObjectSizeCatalog::operator=(const ObjectSizeCatalog &other) {
        if (this != &other) {
            std::scoped_lock lock(mutex_, other.mutex_);
            entries_ = other.entries_;
            index_ = other.index_;
        }
        return *this;
    }

    std::optional<types::KnownObjectSize> ObjectSizeCatalog::lookup(const std::string &label) const {
        std::shared_lock lock(mutex_);
        const auto it = index_.find(key(label));
        if (it == index_.end()) {
            LOG_TRACE("No known size for label '{}'", label);
            return std::nullopt;
        }
        return entries_[it->second];
    }

    void ObjectSizeCatalog::add(const types::KnownObjectSize &entry, const std::vector<std::string> &aliases) {
        std::unique_lock lock(mutex_);

        std::size_t position;
        if (const auto it = index_.find(key(entry.label)); it != index_.end()) {
            position = it->second;
            entries_[position] = entry;
        } else {
            position = entries_.size();
            entries_.push_back(entry);
        }

        index_[key(entry.label)] = position;
        for (const auto &alias: aliases) {
            index_[key(alias)] = position;
        }
    }

    std::vector<types::KnownObjectSize> ObjectSizeCatalog::sizesFor(const types::ObjectCategory category) const {
        std::shared_lock lock(mutex_);
        std::vector<types::KnownObjectSize> sizes;
        std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(sizes),
                     [category](const types::KnownObjectSize &entry) { return entry.category == category; });
        return sizes;
    }

    std::size_t ObjectSizeCatalog::size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    std::optional<types::KnownObjectSize> ObjectSizeCatalog::parseEntry(const YAML::Node &node) {
        try {
            types::KnownObjectSize entry;
            entry.label = node["label"].as<std::string>("");
            if (entry.label.empty()) {
                LOG_ERROR("Skipping catalog entry without a label");
                return std::nullopt;
            }
            entry.display_name = node["display_name"].as<std::string>(entry.label);

            const auto category = types::parseObjectCategory(node["category"].as<std::string>(""));
            const auto axis = types::parseMeasurementAxis(node["axis"].as<std::string>("height"));
            if (!category || !axis) {
                LOG_ERROR("Skipping catalog entry '{}': unknown category or measurement axis", entry.label);
                return std::nullopt;
            }
            entry.category = *category;
            entry.axis = *axis;

            entry.size_meters = node["size"].as<double>(0.0);
            entry.variability = node["variability"].as<double>(0.0);
            entry.reliability = node["reliability"].as<double>(1.0);
            entry.aspect_ratio = node["aspect_ratio"].as<double>(1.0);

            if (entry.size_meters <= 0.0 || entry.aspect_ratio <= 0.0 || entry.variability < 0.0 ||
                entry.variability > 1.0 || entry.reliability < 0.0 || entry.reliability > 1.0) {
                LOG_ERROR("Skipping catalog entry '{}': size={}, variability={}, reliability={}, aspect={}",
                          entry.label, entry.size_meters, entry.variability, entry.reliability, entry.aspect_ratio);
                return std::nullopt;
            }

            LOG_DEBUG("Catalog entry '{}' ({}, {}): {:.2f}m", entry.label, entry.category, entry.axis,
                      entry.size_meters);
            return entry;
        } catch (const YAML::Exception &e) {
            LOG_ERROR("Skipping malformed catalog entry: {}", e.what());
            return std::nullopt;
        }
    }

    std::string ObjectSizeCatalog::key(const std::string &label) {
        std::string normalized;
        normalized.reserve(label.size());
        for (const unsigned char c: label) {
            if (!std::isspace(c)) {
                normalized.push_back(static_cast<char>(std::tolower(c)));
            }
        }
        return normalized;
    }

} // namespace knowledge
