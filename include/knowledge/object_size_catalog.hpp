// File: knowledge/object_size_catalog.hpp

#ifndef OBJECT_SIZE_CATALOG_HPP
#define OBJECT_SIZE_CATALOG_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "knowledge/object_size_lookup.hpp"
#include "types/known_object_size.hpp"

namespace knowledge {

    /*
     * Lookup backed by a YAML list of entries:
     *
     *   objects:
     *     - label: person
     *       display_name: Adult Human
     *       category: human
     *       axis: height
     *       size: 1.70
     *       variability: 0.08
     *       reliability: 0.9
     *       aspect_ratio: 0.4
     *       aliases: [pedestrian, man, woman]
     *
     * Labels and aliases match case-insensitively. Malformed entries are skipped and logged.
     */
    class ObjectSizeCatalog : public ObjectSizeLookup {
    public:
        ObjectSizeCatalog() = default;

        // Throws std::runtime_error if the file cannot be read or parsed.
        [[nodiscard]] static ObjectSizeCatalog fromFile(const std::string &filename);

        [[nodiscard]] static ObjectSizeCatalog fromYaml(const YAML::Node &root);

        ObjectSizeCatalog(const ObjectSizeCatalog &other);

        ObjectSizeCatalog &operator=(const ObjectSizeCatalog &other);

        [[nodiscard]] std::optional<types::KnownObjectSize> lookup(const std::string &label) const override;

        // Replaces any entry with the same label.
        void add(const types::KnownObjectSize &entry, const std::vector<std::string> &aliases = {});

        [[nodiscard]] std::vector<types::KnownObjectSize> sizesFor(types::ObjectCategory category) const;

        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::vector<types::KnownObjectSize> entries_;
        std::unordered_map<std::string, std::size_t> index_;

        [[nodiscard]] static std::optional<types::KnownObjectSize> parseEntry(const YAML::Node &node);

        [[nodiscard]] static std::string key(const std::string &label);
    };

} // namespace knowledge

#endif // OBJECT_SIZE_CATALOG_HPP
