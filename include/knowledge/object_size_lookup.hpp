// File: knowledge/object_size_lookup.hpp

#ifndef OBJECT_SIZE_LOOKUP_HPP
#define OBJECT_SIZE_LOOKUP_HPP

#include <optional>
#include <string>

#include "types/known_object_size.hpp"

namespace knowledge {

    // Maps a detector label to a known real-world size. How labels are matched is up to the implementation.
    class ObjectSizeLookup {
    public:
        virtual ~ObjectSizeLookup() = default;

        [[nodiscard]] virtual std::optional<types::KnownObjectSize> lookup(const std::string &label) const = 0;
    };

} // namespace knowledge

#endif // OBJECT_SIZE_LOOKUP_HPP
