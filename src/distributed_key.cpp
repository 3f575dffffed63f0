#include "distributed_key.hpp"
#include <stdexcept>
#include <vector>

namespace erebus {

namespace {

std::vector<std::string> split(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = key.find(DistributedKey::SEPARATOR, start);
        if (pos == std::string::npos) {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const DistributedKeyParts& p) {
    std::string out = p.project_id + DistributedKey::SEPARATOR + p.resource + DistributedKey::SEPARATOR +
                      p.resource_type + DistributedKey::SEPARATOR + p.version;
    if (p.location_hint) {
        out += DistributedKey::SEPARATOR;
        out += *p.location_hint;
    }
    return out;
}

}

std::string DistributedKey::stringify(const std::string& project_id, const std::string& resource,
                                      const std::string& resource_type, const std::string& version) {
    return join({project_id, resource, resource_type, version, std::nullopt});
}

std::string DistributedKey::append_location_hint(const std::string& key, const std::string& location_hint) {
    auto parts = parse(key);
    parts.location_hint = location_hint;
    return join(parts);
}

std::string DistributedKey::remove_location_hint(const std::string& key) {
    auto parts = parse(key);
    parts.location_hint.reset();
    return join(parts);
}

DistributedKeyParts DistributedKey::parse(const std::string& key) {
    auto parts = split(key);
    if (parts.size() < 4 || parts.size() > 5) {
        throw std::invalid_argument("Invalid DistributedKey: \"" + key + "\"");
    }

    DistributedKeyParts out{parts[0], parts[1], parts[2], parts[3], std::nullopt};
    if (parts.size() == 5) out.location_hint = parts[4];
    return out;
}

bool DistributedKey::is_valid(const std::string& key) {
    auto n = split(key).size();
    return n == 4 || n == 5;
}

std::string DistributedKey::get_region(const std::string& key) {
    auto parts = split(key);
    if (parts.size() != 5) {
        throw std::invalid_argument("Invalid key: no region found");
    }
    return parts[4];
}

std::string DistributedKey::channel_shard(const std::string& project_id, const std::string& channel,
                                          const std::string& location_hint) {
    return append_location_hint(stringify(project_id, channel, "channel", "v1"), location_hint);
}

}
