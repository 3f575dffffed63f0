#pragma once

#include <string>
#include <optional>

namespace erebus {

// Colon-joined address of a (project, resource, resourceType, version[, location]) tuple.
// Shard instances are always addressed by the 5-segment form.
struct DistributedKeyParts {
    std::string project_id;
    std::string resource;
    std::string resource_type;
    std::string version;
    std::optional<std::string> location_hint;
};

class DistributedKey {
public:
    static constexpr char SEPARATOR = ':';

    static std::string stringify(const std::string& project_id, const std::string& resource,
                                 const std::string& resource_type, const std::string& version);

    // Replaces any existing location segment.
    static std::string append_location_hint(const std::string& key, const std::string& location_hint);
    static std::string remove_location_hint(const std::string& key);

    // Throws std::invalid_argument unless the key has 4 or 5 segments.
    static DistributedKeyParts parse(const std::string& key);
    static bool is_valid(const std::string& key);

    // Throws std::invalid_argument unless the key has a location segment.
    static std::string get_region(const std::string& key);

    // Key of the channel shard for this grant, e.g. "proj:chat:channel:v1:eu-west".
    static std::string channel_shard(const std::string& project_id, const std::string& channel,
                                     const std::string& location_hint);
};

}
